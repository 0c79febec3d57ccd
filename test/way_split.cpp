/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "test_osmdb.h"

#include <osm.h>
#include <osm_objects.h>
#include <way_split.h>

#include <cassert>
#include <memory>
#include <vector>

#include <waysplit_annotations.h>

namespace {

void test_tag_filter()
{
  osm_t::TagMap tags;
  tags["highway"] = "steps";
  tags["name"] = "Long Stairs";
  tags["step_count"] = "42";
  tags["steps"] = "42";
  tags["incline"] = "10%";
  tags["seats"] = "4";
  tags["capacity"] = "12";
  tags["capacity:disabled"] = "2";
  tags["parking:capacity"] = "30";
  tags["parking:capacity:women"] = "3";
  tags["capacityfoo"] = "1";
  tags["foocapacity"] = "1";

  remove_tags_wrong_after_split(tags);

  osm_t::TagMap expected;
  expected["highway"] = "steps";
  expected["name"] = "Long Stairs";
  expected["capacityfoo"] = "1";
  expected["foocapacity"] = "1";
  assert(tags == expected);

  // values that describe every part of the way stay
  tags.clear();
  tags["steps"] = "spiral";
  tags["incline"] = "up";
  expected = tags;
  remove_tags_wrong_after_split(tags);
  assert(tags == expected);

  tags.clear();
  tags["step_count"] = "5";
  tags["steps"] = "5";
  tags["incline"] = "10%";
  tags["seats"] = "4";
  tags["capacity"] = "2";
  tags["parking:lane:both:capacity"] = "1";
  tags["name"] = "Main St";
  remove_tags_wrong_after_split(tags);
  assert_cmpnum(tags.size(), 1);
  assert_cmpstr(tags["name"], "Main St");

  tags.clear();
  tags["steps"] = "-3";
  tags["incline"] = "-5°";
  remove_tags_wrong_after_split(tags);
  assert(tags.empty());
}

void test_insert_nodes()
{
  std::unique_ptr<osm_t> osm(std::make_unique<osm_t>());
  for(item_id_t id = 1; id <= 4; id++)
    create_node(*osm, id);

  node_chain_t chain;
  for(item_id_t id = 1; id <= 4; id++)
    chain.push_back(id);

  std::vector<split_way_at> plan;
  plan.push_back(split_way_at::at_index(1, test_pos(2)));
  plan.push_back(split_way_at::at_line_position(2, 0.25, test_pos(3)));
  plan.push_back(split_way_at::at_line_position(2, 0.75, test_pos(4)));

  std::vector<node_t> nodes;
  const std::vector<unsigned int> indexes = insert_split_nodes(chain, plan, *osm, nodes);

  assert_cmpnum(nodes.size(), 2);
  assert_cmpnum(nodes[0].id, -1);
  assert_cmpnum(nodes[1].id, -2);
  assert(nodes[0].isDirty());
  assert_cmpnum(nodes[0].version, 0);
  assert(nodes[0].pos == test_pos(3));
  assert(nodes[1].pos == test_pos(4));

  assert_cmpnum(chain.size(), 6);
  assert_cmpnum(chain[0], 1);
  assert_cmpnum(chain[1], 2);
  assert_cmpnum(chain[2], 3);
  assert_cmpnum(chain[3], -1);
  assert_cmpnum(chain[4], -2);
  assert_cmpnum(chain[5], 4);

  assert_cmpnum(indexes.size(), 3);
  assert_cmpnum(indexes[0], 1);
  assert_cmpnum(indexes[1], 3);
  assert_cmpnum(indexes[2], 4);
}

void test_split_open()
{
  node_chain_t chain;
  for(item_id_t id = 1; id <= 5; id++)
    chain.push_back(id);

  std::vector<unsigned int> indexes;
  indexes.push_back(1);
  indexes.push_back(3);

  const std::vector<node_chain_t> chunks = split_node_chain(chain, indexes);
  assert_cmpnum(chunks.size(), 3);

  assert_cmpnum(chunks[0].size(), 2);
  assert_cmpnum(chunks[0].front(), 1);
  assert_cmpnum(chunks[0].back(), 2);
  assert_cmpnum(chunks[1].size(), 3);
  assert_cmpnum(chunks[1].front(), 2);
  assert_cmpnum(chunks[1].back(), 4);
  assert_cmpnum(chunks[2].size(), 2);
  assert_cmpnum(chunks[2].front(), 4);
  assert_cmpnum(chunks[2].back(), 5);
}

void test_split_closed()
{
  node_chain_t chain;
  for(item_id_t id = 1; id <= 4; id++)
    chain.push_back(id);
  chain.push_back(1);

  std::vector<unsigned int> indexes;
  indexes.push_back(1);
  indexes.push_back(3);

  // the part after the last split continues through the closing node
  const std::vector<node_chain_t> chunks = split_node_chain(chain, indexes);
  assert_cmpnum(chunks.size(), 2);

  assert_cmpnum(chunks[0].size(), 3);
  assert_cmpnum(chunks[0][0], 4);
  assert_cmpnum(chunks[0][1], 1);
  assert_cmpnum(chunks[0][2], 2);
  assert_cmpnum(chunks[1].size(), 3);
  assert_cmpnum(chunks[1][0], 2);
  assert_cmpnum(chunks[1][1], 3);
  assert_cmpnum(chunks[1][2], 4);
}

void test_create_ways()
{
  std::unique_ptr<osm_t> osm(std::make_unique<osm_t>());

  way_t way = make_way(10, node_chain_t());
  way.version = 3;
  osm_t::TagMap tags;
  tags["highway"] = "footway";
  tags["step_count"] = "12";
  way.tags.replace(tags);
  for(item_id_t id = 1; id <= 5; id++)
    way.append_node(id);

  std::vector<node_chain_t> chunks;
  chunks.push_back(node_chain_t(way.node_chain.begin(), way.node_chain.begin() + 2));
  chunks.push_back(node_chain_t(way.node_chain.begin() + 1, way.node_chain.begin() + 4));
  chunks.push_back(node_chain_t(way.node_chain.begin() + 3, way.node_chain.end()));

  const std::vector<way_t> ways = create_split_ways(way, chunks, *osm);
  assert_cmpnum(ways.size(), 3);

  // the longest part keeps the identity of the way
  assert_cmpnum(ways[0].id, -1);
  assert_cmpnum(ways[1].id, 10);
  assert_cmpnum(ways[1].version, 3);
  assert_cmpnum(ways[2].id, -2);

  osm_t::TagMap expected;
  expected["highway"] = "footway";
  for(std::vector<way_t>::const_iterator it = ways.begin(); it != ways.end(); it++) {
    assert(it->isDirty());
    assert(it->tags == expected);
  }

  assert(ways[0].node_chain == chunks[0]);
  assert(ways[1].node_chain == chunks[1]);
  assert(ways[2].node_chain == chunks[2]);

  split_way_result result;
  result.ways = ways;
  verify_split_result::run(way, result);

  // the original is not touched
  assert_cmpnum(way.node_chain.size(), 5);
  assert(way.tags == tags);
}

void test_create_ways_tie()
{
  std::unique_ptr<osm_t> osm(std::make_unique<osm_t>());

  way_t way = make_way(10, node_chain_t());
  for(item_id_t id = 1; id <= 5; id++)
    way.append_node(id);

  std::vector<node_chain_t> chunks;
  chunks.push_back(node_chain_t(way.node_chain.begin(), way.node_chain.begin() + 3));
  chunks.push_back(node_chain_t(way.node_chain.begin() + 2, way.node_chain.end()));

  // with equal length the first part wins
  const std::vector<way_t> ways = create_split_ways(way, chunks, *osm);
  assert_cmpnum(ways.size(), 2);
  assert_cmpnum(ways[0].id, 10);
  assert_cmpnum(ways[1].id, -1);
  assert(ways[1].tags.empty());
}

} // namespace

int main()
{
  test_tag_filter();
  test_insert_nodes();
  test_split_open();
  test_split_closed();
  test_create_ways();
  test_create_ways_tie();

  return 0;
}
