/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "test_osmdb.h"

#include <osm.h>
#include <osm_objects.h>
#include <split_position.h>
#include <split_way_action.h>

#include <cassert>
#include <memory>
#include <vector>

#include <waysplit_annotations.h>

namespace {

/**
 * @brief create the test database
 *
 * Way 10 is a staircase from node 1 to node 5, way 20 is a closed way
 * 6-7-8-9-6. Relation 100 is a route containing way 10, relation 101 a
 * restriction from way 10 via node 5.
 */
std::unique_ptr<osm_t> create_db()
{
  std::unique_ptr<osm_t> osm(std::make_unique<osm_t>());

  for(item_id_t id = 1; id <= 9; id++)
    create_node(*osm, id);

  way_t *w = create_way(*osm, 10, node_chain_t({1, 2, 3, 4, 5}));
  osm_t::TagMap tags;
  tags["highway"] = "steps";
  tags["step_count"] = "20";
  w->tags.replace(tags);

  create_way(*osm, 20, node_chain_t({6, 7, 8, 9, 6}));

  create_relation(*osm, 100, "route", std::vector<member_t>({way_member(10)}));
  create_relation(*osm, 101, "restriction", std::vector<member_t>({
                  way_member(10, "from"), node_member(5, "via"), way_member(20, "to")}));

  return osm;
}

std::vector<split_polyline_at_position> at_nodes(item_id_t n1, item_id_t n2 = ID_ILLEGAL)
{
  std::vector<split_polyline_at_position> ret;
  ret.push_back(split_polyline_at_position::at_point(test_pos(n1)));
  if(n2 != ID_ILLEGAL)
    ret.push_back(split_polyline_at_position::at_point(test_pos(n2)));
  return ret;
}

void test_count()
{
  std::vector<split_polyline_at_position> splits = at_nodes(2, 3);
  splits.push_back(split_polyline_at_position::at_line(test_pos(3), test_pos(4), 0.5));

  const split_way_action action(splits, 1, 5);
  const new_elements_count_t count = action.new_elements_count();
  assert_cmpnum(count.nodes, 1);
  assert_cmpnum(count.ways, 3);
  assert_cmpnum(count.relations, 0);

  assert(action == split_way_action(splits, 1, 5));
  assert(action != split_way_action(splits, 1, 4));
  assert(action != split_way_action(at_nodes(2), 1, 5));

  // identical requests are counted once
  splits.push_back(split_polyline_at_position::at_point(test_pos(2)));
  splits.push_back(split_polyline_at_position::at_line(test_pos(3), test_pos(4), 0.5));
  const new_elements_count_t dcount = split_way_action(splits, 1, 5).new_elements_count();
  assert_cmpnum(dcount.nodes, 1);
  assert_cmpnum(dcount.ways, 3);
}

void test_split_at_node()
{
  std::unique_ptr<osm_t> osm = create_db();
  const way_t orig = *osm->way_by_id(10);

  const split_way_action action(at_nodes(3), 1, 5);
  split_way_result result;
  trstring err = action.apply(10, *osm, *osm, result);
  assert(err.isEmpty());

  verify_split_result::run(orig, result);
  assert(result.nodes.empty());
  assert_cmpnum(result.ways.size(), 2);

  // equal length, the first part keeps the id
  assert_cmpnum(result.ways[0].id, 10);
  assert_cmpnum(result.ways[0].node_chain.size(), 3);
  assert_cmpnum(result.ways[1].id, -1);
  assert_cmpnum(result.ways[1].node_chain.size(), 3);

  osm_t::TagMap expected;
  expected["highway"] = "steps";
  assert(result.ways[0].tags == expected);
  assert(result.ways[1].tags == expected);

  assert_cmpnum(result.relations.size(), 2);
  assert_cmpnum(result.relations[0].id, 100);
  assert_cmpnum(result.relations[0].members.size(), 2);
  assert(result.relations[0].members[0] == way_member(10));
  assert(result.relations[0].members[1] == way_member(-1));
  assert_cmpnum(result.relations[1].id, 101);
  assert(result.relations[1].members[0] == way_member(-1, "from"));

  // nothing is changed before the result is applied
  assert(*osm->way_by_id(10) == orig);
  assert(osm->is_clean());

  osm->apply_result(result);

  assert(!osm->is_clean());
  assert_cmpnum(osm->ways.size(), 3);
  assert(*osm->way_by_id(10) == result.ways[0]);
  assert(osm->way_by_id(10)->isDirty());
  assert(*osm->way_by_id(-1) == result.ways[1]);
  assert(osm->relations[100]->isDirty());
  assert_cmpnum(osm->relations[100]->members.size(), 2);
  assert(osm->relations[101]->members[0] == way_member(-1, "from"));
  assert(!osm->way_by_id(20)->isDirty());

  // the way does not end at node 5 anymore
  result.clear();
  err = action.apply(10, *osm, *osm, result);
  assert_cmpstr(err, "Way #10 has been changed and the conflict cannot be solved automatically");
  assert(result.empty());
}

void test_split_at_line()
{
  std::unique_ptr<osm_t> osm = create_db();
  const way_t orig = *osm->way_by_id(10);

  std::vector<split_polyline_at_position> splits;
  splits.push_back(split_polyline_at_position::at_line(test_pos(2), test_pos(3), 0.5));
  splits.push_back(split_polyline_at_position::at_point(test_pos(4)));

  split_way_result result;
  trstring err = split_way_action(splits, 1, 5).apply(10, *osm, *osm, result);
  assert(err.isEmpty());

  verify_split_result::run(orig, result);

  assert_cmpnum(result.nodes.size(), 1);
  const node_t &node = result.nodes.front();
  assert_cmpnum(node.id, -1);
  assert(node.pos.same_in_osm(splits.front().position()));
  assert(node.tags.empty());

  // 1-2-(-1), (-1)-3-4, 4-5
  assert_cmpnum(result.ways.size(), 3);
  assert_cmpnum(result.ways[0].id, 10);
  assert_cmpnum(result.ways[0].node_chain.size(), 3);
  assert_cmpnum(result.ways[0].last_node(), -1);
  assert_cmpnum(result.ways[1].id, -1);
  assert_cmpnum(result.ways[1].first_node(), -1);
  assert_cmpnum(result.ways[1].last_node(), 4);
  assert_cmpnum(result.ways[2].id, -2);
  assert_cmpnum(result.ways[2].node_chain.size(), 2);

  osm->apply_result(result);
  assert(osm->object_by_id<node_t>(-1) != nullptr);
  assert(osm->object_by_id<node_t>(-1)->isDirty());
  assert(osm->sanity_check().isEmpty());

  // new ids do not collide with the ones just stored
  assert_cmpnum(osm->next_node_id(), -2);
  assert_cmpnum(osm->next_way_id(), -3);
}

void test_reversed_way()
{
  std::unique_ptr<osm_t> osm = create_db();

  // the way has been reversed since the split was requested
  split_way_result result;
  trstring err = split_way_action(at_nodes(3), 5, 1).apply(10, *osm, *osm, result);
  assert(err.isEmpty());
  assert_cmpnum(result.ways.size(), 2);

  // only one end matches
  result.clear();
  err = split_way_action(at_nodes(3), 1, 4).apply(10, *osm, *osm, result);
  assert_cmpstr(err, "Way #10 has been changed and the conflict cannot be solved automatically");
  assert(result.empty());

  err = split_way_action(at_nodes(3), 2, 5).apply(10, *osm, *osm, result);
  assert_cmpstr(err, "Way #10 has been changed and the conflict cannot be solved automatically");
  assert(result.empty());
}

void test_conflicts()
{
  std::unique_ptr<osm_t> osm = create_db();
  const way_t orig = *osm->way_by_id(10);

  split_way_result result;
  trstring err = split_way_action(at_nodes(3), 1, 5).apply(42, *osm, *osm, result);
  assert_cmpstr(err, "Way #42 has been deleted");
  assert(result.empty());

  err = split_way_action(at_nodes(1), 1, 5).apply(10, *osm, *osm, result);
  assert_cmpstr(err, "Unable to split: the split position is at the start or end of the way");
  assert(result.empty());

  // one of the positions is not on the way
  err = split_way_action(at_nodes(3, 8), 1, 5).apply(10, *osm, *osm, result);
  assert_cmpstr(err, "Unable to split: the split point has been moved");
  assert(result.empty());

  // a result of an earlier run is kept on error
  err = split_way_action(at_nodes(3), 1, 5).apply(10, *osm, *osm, result);
  assert(err.isEmpty());
  const split_way_result first = result;
  err = split_way_action(at_nodes(3), 1, 5).apply(42, *osm, *osm, result);
  assert(!err.isEmpty());
  assert_cmpnum(result.ways.size(), first.ways.size());
  assert(result.ways[0] == first.ways[0]);

  assert(*osm->way_by_id(10) == orig);
  assert(osm->is_clean());
}

void test_duplicate_splits()
{
  std::unique_ptr<osm_t> osm = create_db();
  const way_t orig = *osm->way_by_id(10);

  std::vector<split_polyline_at_position> splits = at_nodes(3, 3);
  splits.push_back(split_polyline_at_position::at_line(test_pos(4), test_pos(5), 0.5));
  splits.push_back(split_polyline_at_position::at_line(test_pos(4), test_pos(5), 0.5));

  split_way_result result;
  trstring err = split_way_action(splits, 1, 5).apply(10, *osm, *osm, result);
  assert(err.isEmpty());

  verify_split_result::run(orig, result);

  // 1-2-3, 3-4-(-1), (-1)-5
  assert_cmpnum(result.nodes.size(), 1);
  assert_cmpnum(result.ways.size(), 3);
  assert_cmpnum(result.ways[0].last_node(), 3);
  assert_cmpnum(result.ways[1].last_node(), -1);
  assert_cmpnum(result.ways[2].first_node(), -1);
}

/**
 * Way 10 is 1-2-3-4-5-6-7 and used backwards in a route: the preceding way
 * 11 ends at node 7, the following way 12 starts at node 1.
 */
void test_route_backwards()
{
  std::unique_ptr<osm_t> osm(std::make_unique<osm_t>());
  for(item_id_t id = 1; id <= 9; id++)
    create_node(*osm, id);

  create_way(*osm, 10, node_chain_t({1, 2, 3, 4, 5, 6, 7}));
  create_way(*osm, 11, node_chain_t({8, 7}));
  create_way(*osm, 12, node_chain_t({1, 9}));
  create_relation(*osm, 100, "route", std::vector<member_t>({way_member(11), way_member(10), way_member(12)}));

  const way_t orig = *osm->way_by_id(10);

  split_way_result result;
  trstring err = split_way_action(at_nodes(3, 5), 1, 7).apply(10, *osm, *osm, result);
  assert(err.isEmpty());

  verify_split_result::run(orig, result);

  // all parts have the same length, so the first one keeps the id
  assert_cmpnum(result.ways.size(), 3);
  assert_cmpnum(result.ways[0].id, 10);
  assert_cmpnum(result.ways[1].id, -1);
  assert_cmpnum(result.ways[2].id, -2);

  // the part touching way 11 comes first
  assert_cmpnum(result.relations.size(), 1);
  const std::vector<member_t> &members = result.relations.front().members;
  assert_cmpnum(members.size(), 5);
  assert(members[0] == way_member(11));
  assert(members[1] == way_member(-2));
  assert(members[2] == way_member(-1));
  assert(members[3] == way_member(10));
  assert(members[4] == way_member(12));
}

void test_closed_way()
{
  std::unique_ptr<osm_t> osm = create_db();
  const way_t orig = *osm->way_by_id(20);

  split_way_result result;
  trstring err = split_way_action(at_nodes(8), 6, 6).apply(20, *osm, *osm, result);
  assert_cmpstr(err, "Must specify at least two split positions for a closed way");
  assert(result.empty());

  // the same position twice is only one split
  err = split_way_action(at_nodes(7, 7), 6, 6).apply(20, *osm, *osm, result);
  assert_cmpstr(err, "Must specify at least two split positions for a closed way");
  assert(result.empty());
  assert(!osm->way_by_id(20)->isDirty());

  err = split_way_action(at_nodes(7, 9), 6, 6).apply(20, *osm, *osm, result);
  assert(err.isEmpty());

  verify_split_result::run(orig, result);

  // 9-6-7 and 7-8-9
  assert_cmpnum(result.ways.size(), 2);
  assert_cmpnum(result.ways[0].id, 20);
  assert_cmpnum(result.ways[0].node_chain.size(), 3);
  assert_cmpnum(result.ways[0].first_node(), 9);
  assert_cmpnum(result.ways[0].node_chain[1], 6);
  assert_cmpnum(result.ways[0].last_node(), 7);
  assert_cmpnum(result.ways[1].id, -1);
  assert_cmpnum(result.ways[1].first_node(), 7);
  assert_cmpnum(result.ways[1].last_node(), 9);

  // the "to" member is connected to the via node 5 by no part
  assert(result.relations.empty());
}

} // namespace

int main()
{
  test_count();
  test_split_at_node();
  test_split_at_line();
  test_reversed_way();
  test_conflicts();
  test_duplicate_splits();
  test_route_backwards();
  test_closed_way();

  return 0;
}
