/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "osm.h"

#include "misc.h"
#include "osm_objects.h"
#include "split_way_action.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <libxml/tree.h>
#include <waysplit_annotations.h>

const char *object_t::type_string() const noexcept
{
  switch(type) {
  case NODE:
    return node_t::api_string();
  case WAY:
    return way_t::api_string();
  case RELATION:
    return relation_t::api_string();
  default:
    return nullptr;
  }
}

std::string object_t::id_string() const {
  assert_cmpnum_op(type, !=, ILLEGAL);

  return std::to_string(id);
}

object_t::type_t object_t::type_from_string(const char *str) noexcept
{
  if(strcmp(str, node_t::api_string()) == 0)
    return NODE;
  if(strcmp(str, way_t::api_string()) == 0)
    return WAY;
  if(strcmp(str, relation_t::api_string()) == 0)
    return RELATION;
  return ILLEGAL;
}

const node_t *way_complete_t::node(item_id_t id) const
{
  const std::unordered_map<item_id_t, const node_t *>::const_iterator it = nodes.find(id);
  if(it == nodes.end())
    return nullptr;
  return it->second;
}

bool way_complete_t::positions(std::vector<pos_t> &positions) const
{
  positions.clear();
  positions.reserve(way->node_chain.size());

  for(node_chain_t::const_iterator it = way->node_chain.begin(); it != way->node_chain.end(); it++) {
    const node_t *n = node(*it);
    if(unlikely(n == nullptr))
      return false;
    positions.push_back(n->pos);
  }

  return true;
}

osm_t::osm_t()
  : lastNewNodeId(ID_ILLEGAL)
  , lastNewWayId(ID_ILLEGAL)
{
}

namespace {

template<typename T> inline void
pairfree(std::pair<item_id_t, T *> pair)
{
  delete pair.second;
}

template<typename T>
inline void object_insert(std::map<item_id_t, T *> &map, T *o)
{
  bool b = map.insert(std::make_pair(o->id, o)).second;
  assert(b); (void)b;
}

} // namespace

osm_t::~osm_t()
{
  std::for_each(relations.begin(), relations.end(), pairfree<relation_t>);
  std::for_each(ways.begin(), ways.end(), pairfree<way_t>);
  std::for_each(nodes.begin(), nodes.end(), pairfree<node_t>);
}

template<typename T> T *osm_t::object_by_id(item_id_t id) const
{
  const std::map<item_id_t, T *> &map = objects<T>();
  const typename std::map<item_id_t, T *>::const_iterator it = map.find(id);
  if(it != map.end())
    return it->second;

  return nullptr;
}

template node_t *osm_t::object_by_id<node_t>(item_id_t id) const;
template way_t *osm_t::object_by_id<way_t>(item_id_t id) const;
template relation_t *osm_t::object_by_id<relation_t>(item_id_t id) const;

void osm_t::insert(node_t *node)
{
  object_insert(nodes, node);
}

void osm_t::insert(way_t *way)
{
  object_insert(ways, way);
}

void osm_t::insert(relation_t *relation)
{
  object_insert(relations, relation);
}

template<typename T> void osm_t::storeObject(const T &obj)
{
  std::map<item_id_t, T *> &map = objects<T>();
  const typename std::map<item_id_t, T *>::iterator it = map.find(obj.id);

  if(it == map.end()) {
    T *n = new T(obj);
    if(n->isNew())
      n->flags |= OSM_FLAG_DIRTY;
    map[n->id] = n;
  } else {
    *it->second = obj;
    it->second->flags |= OSM_FLAG_DIRTY;
  }
}

void osm_t::store(const node_t &node)
{
  storeObject(node);
}

void osm_t::store(const way_t &way)
{
  storeObject(way);
}

void osm_t::store(const relation_t &relation)
{
  storeObject(relation);
}

void osm_t::apply_result(const split_way_result &result)
{
  // nodes first so the ways never reference missing nodes
  for(std::vector<node_t>::const_iterator it = result.nodes.begin(); it != result.nodes.end(); it++)
    store(*it);
  for(std::vector<way_t>::const_iterator it = result.ways.begin(); it != result.ways.end(); it++)
    store(*it);
  for(std::vector<relation_t>::const_iterator it = result.relations.begin(); it != result.relations.end(); it++)
    store(*it);
}

std::optional<way_complete_t> osm_t::way_complete(item_id_t id) const
{
  const way_t *way = object_by_id<way_t>(id);
  if(way == nullptr)
    return std::optional<way_complete_t>();

  way_complete_t ret(way);
  for(node_chain_t::const_iterator it = way->node_chain.begin(); it != way->node_chain.end(); it++) {
    const node_t *node = object_by_id<node_t>(*it);
    if(likely(node != nullptr))
      ret.nodes[node->id] = node;
    else
      printf("way #" ITEM_ID_FORMAT " references missing node #" ITEM_ID_FORMAT "\n", id, *it);
  }

  return ret;
}

const way_t *osm_t::way_by_id(item_id_t id) const
{
  return object_by_id<way_t>(id);
}

namespace {

class relation_way_member {
  const object_t way;
public:
  explicit inline relation_way_member(item_id_t id) : way(object_t::WAY, id) {}
  inline bool operator()(const member_t &member) const {
    return member.object == way;
  }
};

} // namespace

std::vector<const relation_t *> osm_t::relations_for_way(item_id_t id) const
{
  std::vector<const relation_t *> ret;
  const relation_way_member fc(id);

  for(std::map<item_id_t, relation_t *>::const_iterator it = relations.begin(); it != relations.end(); it++)
    if(std::any_of(it->second->members.begin(), it->second->members.end(), fc))
      ret.push_back(it->second);

  return ret;
}

template<typename T> item_id_t osm_t::nextId(item_id_t &last) const
{
  // new objects get negative ids, continue below all ids already in use
  const std::map<item_id_t, T *> &map = objects<T>();
  item_id_t id = last;
  if(!map.empty() && map.begin()->first < id)
    id = map.begin()->first;

  last = id - 1;
  return last;
}

item_id_t osm_t::next_node_id()
{
  return nextId<node_t>(lastNewNodeId);
}

item_id_t osm_t::next_way_id()
{
  return nextId<way_t>(lastNewWayId);
}

namespace {

class way_node_check {
  const osm_t &osm;
public:
  explicit inline way_node_check(const osm_t &o) : osm(o) {}
  bool operator()(const std::pair<item_id_t, way_t *> &pair) const;
};

bool way_node_check::operator()(const std::pair<item_id_t, way_t *> &pair) const
{
  const node_chain_t &chain = pair.second->node_chain;
  if(chain.size() < 2)
    return true;
  for(node_chain_t::const_iterator it = chain.begin(); it != chain.end(); it++)
    if(osm.object_by_id<node_t>(*it) == nullptr)
      return true;
  return false;
}

template<typename T> inline bool is_modified(const std::pair<item_id_t, T *> &pair)
{
  return pair.second->isDirty();
}

template<typename T>
class object_xml_functor {
  xmlNodePtr const parent;
public:
  explicit inline object_xml_functor(xmlNodePtr p) : parent(p) {}
  inline void operator()(const std::pair<item_id_t, T *> &pair) const {
    pair.second->generate_xml(parent);
  }
};

} // namespace

trstring::native_type osm_t::sanity_check() const
{
  if(unlikely(ways.empty()))
    return _("Invalid data in OSM file:\nNo ways found!");

  if(unlikely(std::any_of(ways.begin(), ways.end(), way_node_check(*this))))
    return _("Invalid data in OSM file:\nWay with missing or too few nodes found!");

  return trstring::native_type();
}

bool osm_t::is_clean() const
{
  return std::none_of(nodes.begin(), nodes.end(), is_modified<node_t>) &&
         std::none_of(ways.begin(), ways.end(), is_modified<way_t>) &&
         std::none_of(relations.begin(), relations.end(), is_modified<relation_t>);
}

xmlDocPtr osm_t::generate_xml() const
{
  xmlDocPtr doc = xmlNewDoc(BAD_CAST "1.0");
  xmlNodePtr root_node = xmlNewNode(nullptr, BAD_CAST "osm");
  xmlNewProp(root_node, BAD_CAST "version", BAD_CAST "0.6");
  xmlNewProp(root_node, BAD_CAST "generator", BAD_CAST "waysplit");
  xmlDocSetRootElement(doc, root_node);

  if(bounds.valid()) {
    xmlNodePtr bounds_node = xmlNewChild(root_node, nullptr, BAD_CAST "bounds", nullptr);
    bounds.min.toXmlProperties(bounds_node, "minlat", "minlon");
    bounds.max.toXmlProperties(bounds_node, "maxlat", "maxlon");
  }

  std::for_each(nodes.begin(), nodes.end(), object_xml_functor<node_t>(root_node));
  std::for_each(ways.begin(), ways.end(), object_xml_functor<way_t>(root_node));
  std::for_each(relations.begin(), relations.end(), object_xml_functor<relation_t>(root_node));

  return doc;
}

bool osm_t::save(const std::string &filename) const
{
  xmlDocGuard doc(generate_xml());

  if(xmlSaveFormatFileEnc(filename.c_str(), doc.get(), "UTF-8", 1) < 0) {
    fprintf(stderr, "failed to write OSM data to %s\n", filename.c_str());
    return false;
  }

  printf("OSM data written to %s\n", filename.c_str());
  return true;
}
