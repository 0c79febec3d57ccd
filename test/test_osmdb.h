/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <osm.h>
#include <osm_objects.h>
#include <split_way_action.h>

#include <cassert>
#include <iterator>
#include <set>
#include <vector>

#include <waysplit_annotations.h>

/**
 * @brief the position used for the test node with the given id
 *
 * All test nodes are on a grid so every id has a distinct position.
 */
static inline pos_t test_pos(item_id_t id)
{
  return pos_t(52.25 + static_cast<pos_float_t>(id % 10) * 0.001,
               9.5 + static_cast<pos_float_t>(id / 10) * 0.001);
}

static inline node_t *create_node(osm_t &osm, item_id_t id)
{
  node_t *node = new node_t(base_attributes(id, 1), test_pos(id));
  osm.insert(node);
  return node;
}

static inline way_t make_way(item_id_t id, const node_chain_t &chain)
{
  way_t way(base_attributes(id, id > 0 ? 1 : 0));
  way.node_chain = chain;
  return way;
}

static inline way_t *create_way(osm_t &osm, item_id_t id, const node_chain_t &chain)
{
  way_t *way = new way_t(make_way(id, chain));
  osm.insert(way);
  return way;
}

static inline relation_t *create_relation(osm_t &osm, item_id_t id, const char *type,
                                          const std::vector<member_t> &members)
{
  relation_t *relation = new relation_t(base_attributes(id, 1));
  osm_t::TagMap tags;
  tags["type"] = type;
  relation->tags.replace(tags);
  relation->members = members;
  osm.insert(relation);
  return relation;
}

static inline member_t way_member(item_id_t id, const char *role = "")
{
  return member_t(object_t(object_t::WAY, id), role);
}

static inline member_t node_member(item_id_t id, const char *role = "")
{
  return member_t(object_t(object_t::NODE, id), role);
}

class verify_split_result {
  verify_split_result() = delete;
  ~verify_split_result() = delete;

public:
  /**
   * @brief check the invariants every successful split must fulfill
   * @param way the way before the split
   * @param result the result of the split
   */
  static void
  run(const way_t &way, const split_way_result &result)
  {
    assert_cmpnum_op(result.ways.size(), >=, 2);

    std::set<item_id_t> ids;
    unsigned int kept = 0;
    for(std::vector<way_t>::const_iterator it = result.ways.begin(); it != result.ways.end(); it++) {
      assert_cmpnum_op(it->node_chain.size(), >=, 2);
      assert(ids.insert(it->id).second);
      assert(it->isDirty());
      if(it->id == way.id) {
        kept++;
        assert_cmpnum(it->version, way.version);
      } else {
        assert_cmpnum_op(it->id, <, 0);
      }

      // consecutive parts share their connecting node
      if(it != result.ways.begin())
        assert_cmpnum(std::prev(it)->last_node(), it->first_node());
    }
    assert_cmpnum(kept, 1);

    if(way.is_closed()) {
      assert_cmpnum(result.ways.back().last_node(), result.ways.front().first_node());
    } else {
      assert_cmpnum(result.ways.front().first_node(), way.first_node());
      assert_cmpnum(result.ways.back().last_node(), way.last_node());
    }

    for(std::vector<node_t>::const_iterator it = result.nodes.begin(); it != result.nodes.end(); it++) {
      assert_cmpnum_op(it->id, <, 0);
      assert(it->isDirty());
    }
  }
};
