/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "osm_objects.h"

#include "misc.h"

#include <cstdio>
#include <cstring>
#include <waysplit_annotations.h>

tag_list_t::tag_list_t(const tag_list_t &other)
{
  if(!other.empty())
    contents.reset(new std::vector<tag_t>(*other.contents));
}

tag_list_t &tag_list_t::operator=(const tag_list_t &other)
{
  if(this != &other) {
    if(other.empty())
      clear();
    else
      contents.reset(new std::vector<tag_t>(*other.contents));
  }
  return *this;
}

bool
tag_list_t::operator==(const tag_list_t &other) const
{
  if (other.empty())
    return empty();
  if (empty())
    return false;

  // tag order is not significant
  return asMap() == other.asMap();
}

bool tag_list_t::empty() const noexcept
{
  return !contents || contents->empty();
}

namespace {

class key_match_functor {
  const char * const key;
public:
  explicit inline key_match_functor(const char *k) : key(k) {}
  inline bool operator()(const tag_t &tag) const {
    return tag.key_compare(key);
  }
};

} // namespace

const char* tag_list_t::get_value(const char *key) const
{
  if(empty())
    return nullptr;

  const std::vector<tag_t>::const_iterator itEnd = contents->end();
  const std::vector<tag_t>::const_iterator it = std::find_if(std::cbegin(*contents),
                                                             itEnd, key_match_functor(key));
  if(it != itEnd)
    return it->value.c_str();

  return nullptr;
}

void tag_list_t::clear()
{
  contents.reset();
}

osm_t::TagMap tag_list_t::asMap() const
{
  osm_t::TagMap new_tags;

  if(!empty())
    for(const tag_t &tag : *contents)
      new_tags[tag.key] = tag.value;

  return new_tags;
}

void tag_list_t::replace(std::vector<tag_t> &&ntags)
{
  if(ntags.empty()) {
    clear();
    return;
  }

  if(!contents)
    contents.reset(new std::vector<tag_t>(std::move(ntags)));
  else
    *contents = std::move(ntags);

  contents->shrink_to_fit();
}

void tag_list_t::replace(const osm_t::TagMap &ntags)
{
  clear();
  if(ntags.empty())
    return;

  contents.reset(new std::vector<tag_t>());
  contents->reserve(ntags.size());
  for(const osm_t::TagMap::value_type &p : ntags)
    contents->push_back(tag_t(p.first, p.second));
}

bool tag_list_t::operator!=(const osm_t::TagMap &t2) const
{
  if(empty())
    return !t2.empty();

  return asMap() != t2;
}

base_object_t::base_object_t(const base_attributes &attr) noexcept
  : base_attributes(attr)
  , flags(id <= ID_ILLEGAL ? OSM_FLAG_DIRTY : 0)
{
}

namespace {

class tag_to_xml {
  xmlNodePtr const node;
public:
  explicit inline tag_to_xml(xmlNodePtr n) : node(n) {}
  void operator()(const tag_t &tag) {
    xmlNodePtr tag_node = xmlNewChild(node, nullptr, BAD_CAST "tag", nullptr);
    xmlNewProp(tag_node, BAD_CAST "k", BAD_CAST tag.key.c_str());
    xmlNewProp(tag_node, BAD_CAST "v", BAD_CAST tag.value.c_str());
  }
};

} // namespace

void base_object_t::generate_xml(xmlNodePtr parent) const
{
  char str[32];
  xmlNodePtr xml_node = xmlNewChild(parent, nullptr, BAD_CAST apiString(), nullptr);

  snprintf(str, sizeof(str), ITEM_ID_FORMAT, id);
  xmlNewProp(xml_node, BAD_CAST "id", BAD_CAST str);

  // new objects have no version until they are uploaded
  if(!isNew()) {
    snprintf(str, sizeof(str), "%u", version);
    xmlNewProp(xml_node, BAD_CAST "version", BAD_CAST str);
    if(isDirty())
      xmlNewProp(xml_node, BAD_CAST "action", BAD_CAST "modify");
  }

  // save the information specific to the given object type
  generate_xml_custom(xml_node);

  // save tags
  tags.for_each(tag_to_xml(xml_node));
}

/* build xml representation for a node */
void node_t::generate_xml_custom(xmlNodePtr xml_node) const {
  pos.toXmlProperties(xml_node);
}

void way_t::append_node(item_id_t node) {
  node_chain.push_back(node);
}

bool way_t::ends_with_node(item_id_t node) const noexcept
{
  if(unlikely(node_chain.empty()))
    return false;

  return node_chain.front() == node ||
         node_chain.back()  == node;
}

bool way_t::is_closed() const noexcept {
  if(node_chain.empty())
    return false;
  return node_chain.front() == node_chain.back();
}

item_id_t way_t::last_node() const noexcept {
  if(node_chain.empty())
    return ID_ILLEGAL;

  return node_chain.back();
}

item_id_t way_t::first_node() const noexcept {
  if(node_chain.empty())
    return ID_ILLEGAL;

  return node_chain.front();
}

namespace {

class add_xml_node_refs {
  xmlNodePtr const way_node;
public:
  explicit inline add_xml_node_refs(xmlNodePtr n) : way_node(n) {}
  void operator()(item_id_t node);
};

void add_xml_node_refs::operator()(item_id_t node)
{
  xmlNodePtr nd_node = xmlNewChild(way_node, nullptr, BAD_CAST "nd", nullptr);
  xmlNewProp(nd_node, BAD_CAST "ref", BAD_CAST std::to_string(node).c_str());
}

} // namespace

/**
 * @brief write the referenced nodes of a way to XML
 * @param way_node the XML node of the way to append to
 */
void way_t::write_node_chain(xmlNodePtr way_node) const {
  std::for_each(node_chain.begin(), node_chain.end(), add_xml_node_refs(way_node));
}

namespace {

class gen_xml_relation_functor {
  xmlNodePtr const xml_node;
public:
  explicit inline gen_xml_relation_functor(xmlNodePtr n) : xml_node(n) {}
  void operator()(const member_t &member);
};

void gen_xml_relation_functor::operator()(const member_t &member)
{
  xmlNodePtr m_node = xmlNewChild(xml_node, nullptr, BAD_CAST "member", nullptr);

  const char *typestr = member.object.type_string();
  if(unlikely(typestr == nullptr))
    assert_unreachable();

  xmlNewProp(m_node, BAD_CAST "type", BAD_CAST typestr);
  xmlNewProp(m_node, BAD_CAST "ref", BAD_CAST member.object.id_string().c_str());
  xmlNewProp(m_node, BAD_CAST "role", BAD_CAST member.role.c_str());
}

} // namespace

void relation_t::generate_member_xml(xmlNodePtr xml_node) const
{
  std::for_each(members.begin(), members.end(), gen_xml_relation_functor(xml_node));
}

bool relation_t::is_type(const char *type) const
{
  const char *tp = tags.get_value("type");
  return tp != nullptr && strcmp(tp, type) == 0;
}
