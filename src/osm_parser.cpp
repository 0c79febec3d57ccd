/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "osm.h"

#include "osm_objects.h"
#include "misc.h"
#include "pos.h"

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlreader.h>

#include <waysplit_annotations.h>
#include <waysplit_stl.h>

namespace {

bool parse_id(const xmlString &prop, item_id_t &id)
{
  if(unlikely(prop.empty()))
    return false;

  char *endp;
  id = strtoll(prop, &endp, 10);
  return *endp == '\0' && id != ID_ILLEGAL;
}

inline int __attribute__((nonnull(2))) my_strcmp(const xmlChar *a, const xmlChar *b) {
  if(a == nullptr)
    return -1;
  return strcmp(reinterpret_cast<const char *>(a), reinterpret_cast<const char *>(b));
}

/* skip current element incl. everything below */
void skip_element(xmlTextReaderPtr reader) {
  assert_cmpnum(xmlTextReaderNodeType(reader), XML_READER_TYPE_ELEMENT);
  if(xmlTextReaderIsEmptyElement(reader))
    return;

  int depth = xmlTextReaderDepth(reader);
  const xmlChar *name = xmlTextReaderConstName(reader);
  assert(name != nullptr);

  int ret = xmlTextReaderRead(reader);
  while(ret == 1 &&
        (xmlTextReaderNodeType(reader) != XML_READER_TYPE_END_ELEMENT ||
         xmlTextReaderDepth(reader) > depth ||
         my_strcmp(xmlTextReaderConstName(reader), name) != 0)) {
    ret = xmlTextReaderRead(reader);
  }
}

/* parse bounds */
bool process_bounds(xmlTextReaderPtr reader, pos_area &bounds) {
  bounds = pos_area(pos_t::fromXmlProperties(reader, "minlat", "minlon"),
                    pos_t::fromXmlProperties(reader, "maxlat", "maxlon"));
  if(unlikely(!bounds.valid())) {
    fprintf(stderr, "Invalid coordinate in bounds (%f/%f/%f/%f)\n",
            bounds.min.lat, bounds.min.lon,
            bounds.max.lat, bounds.max.lon);

    return false;
  }

  /* skip everything below */
  skip_element(reader);

  return true;
}

void process_tag(xmlTextReaderPtr reader, std::vector<tag_t> &tags) {
  xmlString k(xmlTextReaderGetAttribute(reader, BAD_CAST "k"));
  xmlString v(xmlTextReaderGetAttribute(reader, BAD_CAST "v"));

  if(likely(!k.empty() && !v.empty()))
    tags.push_back(tag_t(static_cast<const char *>(k), static_cast<const char *>(v)));
  else
    printf("incomplete tag key/value %s/%s\n", k.get(), v.get());
}

bool process_base_attributes(base_object_t *obj, xmlTextReaderPtr reader)
{
  xmlString prop(xmlTextReaderGetAttribute(reader, BAD_CAST "id"));
  if(unlikely(!parse_id(prop, obj->id))) {
    printf("invalid id '%s' for %s\n", prop.get(), obj->apiString());
    return false;
  }

  prop.reset(xmlTextReaderGetAttribute(reader, BAD_CAST "version"));
  if(likely(prop))
    obj->version = strtoul(prop, nullptr, 10);

  // objects with a positive id come from upstream, unless changed locally
  prop.reset(xmlTextReaderGetAttribute(reader, BAD_CAST "action"));
  if(obj->isNew() || (prop && strcmp(prop, "modify") == 0))
    obj->flags = OSM_FLAG_DIRTY;
  else
    obj->flags = 0;

  return true;
}

/**
 * @brief read the children of the current element
 * @param child the functor called for every child element
 */
template<typename _Functor>
void process_children(xmlTextReaderPtr reader, _Functor child)
{
  /* just an empty element? */
  if(xmlTextReaderIsEmptyElement(reader))
    return;

  int depth = xmlTextReaderDepth(reader);

  /* scan all elements on same level or its children */
  int ret = xmlTextReaderRead(reader);
  while(ret == 1 &&
        (xmlTextReaderNodeType(reader) != XML_READER_TYPE_END_ELEMENT ||
         xmlTextReaderDepth(reader) != depth)) {
    if(xmlTextReaderNodeType(reader) == XML_READER_TYPE_ELEMENT) {
      child(reinterpret_cast<const char *>(xmlTextReaderConstName(reader)));
      skip_element(reader);
    }
    ret = xmlTextReaderRead(reader);
  }
}

class node_child {
  xmlTextReaderPtr const reader;
  std::vector<tag_t> &tags;
public:
  inline node_child(xmlTextReaderPtr r, std::vector<tag_t> &t) : reader(r), tags(t) {}
  void operator()(const char *subname) {
    if(likely(strcmp(subname, "tag") == 0))
      process_tag(reader, tags);
  }
};

void process_node(xmlTextReaderPtr reader, osm_t &osm) {
  std::unique_ptr<node_t> node(new node_t(base_attributes(), pos_t::fromXmlProperties(reader)));

  if(unlikely(!process_base_attributes(node.get(), reader))) {
    skip_element(reader);
    return;
  }

  if(unlikely(!node->pos.valid())) {
    printf("node #" ITEM_ID_FORMAT " has invalid position\n", node->id);
    skip_element(reader);
    return;
  }

  std::vector<tag_t> tags;
  process_children(reader, node_child(reader, tags));
  node->tags.replace(std::move(tags));

  if(unlikely(osm.object_by_id<node_t>(node->id) != nullptr)) {
    printf("duplicate node #" ITEM_ID_FORMAT "\n", node->id);
    return;
  }

  osm.insert(node.release());
}

class way_child {
  xmlTextReaderPtr const reader;
  const osm_t &osm;
  way_t &way;
  std::vector<tag_t> &tags;
public:
  inline way_child(xmlTextReaderPtr r, const osm_t &o, way_t &w, std::vector<tag_t> &t)
    : reader(r), osm(o), way(w), tags(t) {}
  void operator()(const char *subname);
};

void way_child::operator()(const char *subname)
{
  if(strcmp(subname, "nd") == 0) {
    xmlString prop(xmlTextReaderGetAttribute(reader, BAD_CAST "ref"));
    item_id_t id;
    if(unlikely(!parse_id(prop, id)))
      printf("invalid node reference '%s' in way #" ITEM_ID_FORMAT "\n", prop.get(), way.id);
    else if(unlikely(osm.object_by_id<node_t>(id) == nullptr))
      printf("Node id " ITEM_ID_FORMAT " not found\n", id);
    else
      way.append_node(id);
  } else if(likely(strcmp(subname, "tag") == 0)) {
    process_tag(reader, tags);
  }
}

void process_way(xmlTextReaderPtr reader, osm_t &osm) {
  std::unique_ptr<way_t> way(new way_t());

  if(unlikely(!process_base_attributes(way.get(), reader))) {
    skip_element(reader);
    return;
  }

  std::vector<tag_t> tags;
  process_children(reader, way_child(reader, osm, *way, tags));
  way->tags.replace(std::move(tags));

  if(unlikely(osm.object_by_id<way_t>(way->id) != nullptr)) {
    printf("duplicate way #" ITEM_ID_FORMAT "\n", way->id);
    return;
  }

  osm.insert(way.release());
}

bool process_member(xmlTextReaderPtr reader, std::vector<member_t> &members) {
  xmlString tp(xmlTextReaderGetAttribute(reader, BAD_CAST "type"));
  xmlString refstr(xmlTextReaderGetAttribute(reader, BAD_CAST "ref"));
  xmlString role(xmlTextReaderGetAttribute(reader, BAD_CAST "role"));

  if(unlikely(tp.empty())) {
    printf("missing type for relation member\n");
    return false;
  }

  const object_t::type_t type = object_t::type_from_string(tp);
  if(unlikely(type == object_t::ILLEGAL)) {
    printf("Unable to store illegal type '%s'\n", tp.get());
    return false;
  }

  item_id_t id;
  if(unlikely(!parse_id(refstr, id))) {
    printf("Illegal ref '%s' for relation member\n", refstr.get());
    return false;
  }

  // members may reference objects not contained in the file
  members.push_back(member_t(object_t(type, id), role ? std::string(role) : std::string()));
  return true;
}

class relation_child {
  xmlTextReaderPtr const reader;
  relation_t &relation;
  std::vector<tag_t> &tags;
public:
  inline relation_child(xmlTextReaderPtr r, relation_t &rel, std::vector<tag_t> &t)
    : reader(r), relation(rel), tags(t) {}
  void operator()(const char *subname) {
    if(strcmp(subname, "member") == 0)
      process_member(reader, relation.members);
    else if(likely(strcmp(subname, "tag") == 0))
      process_tag(reader, tags);
  }
};

void process_relation(xmlTextReaderPtr reader, osm_t &osm) {
  std::unique_ptr<relation_t> relation(new relation_t());

  if(unlikely(!process_base_attributes(relation.get(), reader))) {
    skip_element(reader);
    return;
  }

  std::vector<tag_t> tags;
  process_children(reader, relation_child(reader, *relation, tags));
  relation->tags.replace(std::move(tags));

  if(unlikely(osm.object_by_id<relation_t>(relation->id) != nullptr)) {
    printf("duplicate relation #" ITEM_ID_FORMAT "\n", relation->id);
    return;
  }

  osm.insert(relation.release());
}

osm_t *process_osm(xmlTextReaderPtr reader) {
  std::unique_ptr<osm_t> osm(std::make_unique<osm_t>());

  /* the objects come in exactly this order, a node after a way can't be
   * referenced by any way anymore. */
  enum blocks {
    BLOCK_OSM = 0,
    BLOCK_NODES,
    BLOCK_WAYS,
    BLOCK_RELATIONS
  };
  enum blocks block = BLOCK_OSM;

  int ret = xmlTextReaderRead(reader);
  while(ret == 1) {

    switch(xmlTextReaderNodeType(reader)) {
    case XML_READER_TYPE_ELEMENT: {

      assert_cmpnum(xmlTextReaderDepth(reader), 1);
      const char *name = reinterpret_cast<const char *>(xmlTextReaderConstName(reader));
      if(block == BLOCK_OSM && strcmp(name, "bounds") == 0) {
        if(unlikely(!process_bounds(reader, osm->bounds)))
          return nullptr;
        block = BLOCK_NODES; // next must be nodes, there must not be more than one bounds
      } else if(block <= BLOCK_NODES && strcmp(name, node_t::api_string()) == 0) {
        process_node(reader, *osm);
        block = BLOCK_NODES;
      } else if(block <= BLOCK_WAYS && strcmp(name, way_t::api_string()) == 0) {
        process_way(reader, *osm);
        block = BLOCK_WAYS;
      } else if(likely(block <= BLOCK_RELATIONS && strcmp(name, relation_t::api_string()) == 0)) {
        process_relation(reader, *osm);
        block = BLOCK_RELATIONS;
      } else {
        printf("something unknown found: %s\n", name);
        skip_element(reader);
      }
      break;
    }

    case XML_READER_TYPE_END_ELEMENT:
      /* end element must be for the current element */
      assert_cmpnum(xmlTextReaderDepth(reader), 0);
      return osm.release();

    default:
      break;
    }
    ret = xmlTextReaderRead(reader);
  }

  // no end tag for </osm> found in file, so assume it's invalid
  return nullptr;
}

osm_t *process_file(const std::string &filename) {
  std::unique_ptr<osm_t> osm;
  xmlTextReaderPtr reader;

  reader = xmlReaderForFile(filename.c_str(), nullptr, XML_PARSE_NONET);
  if (likely(reader != nullptr)) {
    if(likely(xmlTextReaderRead(reader) == 1)) {
      const char *name = reinterpret_cast<const char *>(xmlTextReaderConstName(reader));
      if(likely(name && strcmp(name, "osm") == 0))
        osm.reset(process_osm(reader));
      else
        fprintf(stderr, "%s is no OSM file\n", filename.c_str());
    } else
      printf("file empty\n");

    xmlFreeTextReader(reader);
  } else {
    fprintf(stderr, "Unable to open %s\n", filename.c_str());
  }
  return osm.release();
}

} // namespace

osm_t *osm_t::parse(const std::string &path, const std::string &filename) {
  if(filename.find('/') != std::string::npos || path.empty())
    return process_file(filename);
  else if(ends_with(path, '/'))
    return process_file(path + filename);
  else
    return process_file(path + '/' + filename);
}
