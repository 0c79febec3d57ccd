/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "way_split.h"

#include "misc.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <waysplit_annotations.h>
#include <waysplit_stl.h>

namespace {

/**
 * @brief check if the key is "capacity" or a "capacity" subkey, or namespaced like "parking:capacity"
 */
bool is_capacity_key(const std::string &key)
{
  static const std::string capacity = "capacity";

  for(std::string::size_type pos = key.find(capacity); pos != std::string::npos;
      pos = key.find(capacity, pos + 1)) {
    const std::string::size_type end = pos + capacity.size();
    if((pos == 0 || key[pos - 1] == ':') && (end == key.size() || key[end] == ':'))
      return true;
  }

  return false;
}

inline bool is_digit(char c)
{
  return isdigit(static_cast<unsigned char>(c)) != 0;
}

bool contains_digit(const std::string &value)
{
  return std::any_of(value.begin(), value.end(), is_digit);
}

bool is_wrong_after_split(const osm_t::TagMap::value_type &tag)
{
  if(tag.first == "step_count" || tag.first == "seats")
    return true;
  // "steps=yes" or "steps=spiral" are still valid for all parts
  if(tag.first == "steps")
    return is_integer(tag.second);
  // "incline=up" stays valid, "incline=10%" may not
  if(tag.first == "incline")
    return contains_digit(tag.second);
  return is_capacity_key(tag.first);
}

class chunk_size_compare {
public:
  inline bool operator()(const node_chain_t &a, const node_chain_t &b) const {
    return a.size() < b.size();
  }
};

} // namespace

void remove_tags_wrong_after_split(osm_t::TagMap &tags)
{
  osm_t::TagMap::iterator it = tags.begin();
  while(it != tags.end()) {
    if(is_wrong_after_split(*it))
      it = tags.erase(it);
    else
      it++;
  }
}

std::vector<unsigned int> insert_split_nodes(node_chain_t &chain, const std::vector<split_way_at> &plan,
                                             element_id_provider &ids, std::vector<node_t> &new_nodes)
{
  std::vector<unsigned int> indexes;
  indexes.reserve(plan.size());
  unsigned int inserted = 0;

  for(std::vector<split_way_at>::const_iterator it = plan.begin(); it != plan.end(); it++) {
    switch(it->type) {
    case split_way_at::AtIndex:
      indexes.push_back(it->index + inserted);
      break;
    case split_way_at::AtLinePosition: {
      const unsigned int idx = it->index2 + inserted;
      assert_cmpnum_op(idx, <, chain.size());

      node_t node(base_attributes(ids.next_node_id()), it->pos);
      printf("  inserting split node #" ITEM_ID_FORMAT " at position %u\n", node.id, idx);
      chain.insert(std::next(chain.begin(), idx), node.id);
      new_nodes.push_back(node);

      indexes.push_back(idx);
      inserted++;
      break;
    }
    }
  }

  return indexes;
}

std::vector<node_chain_t> split_node_chain(const node_chain_t &chain, const std::vector<unsigned int> &indexes)
{
  std::vector<node_chain_t> chunks = split_into_chunks(chain, indexes);

  // for closed ways the part after the last split continues with the first part
  if(chunks.size() > 1 && chunks.front().front() == chunks.back().back()) {
    node_chain_t &first = chunks.front();
    node_chain_t &last = chunks.back();
    first.insert(first.begin(), last.begin(), std::prev(last.end()));
    chunks.pop_back();
  }

  return chunks;
}

std::vector<way_t> create_split_ways(const way_t &way, const std::vector<node_chain_t> &chunks,
                                     element_id_provider &ids)
{
  assert(!chunks.empty());

  osm_t::TagMap tags = way.tags.asMap();
  remove_tags_wrong_after_split(tags);

  // max_element returns the first of several equally sized chunks
  const std::vector<node_chain_t>::const_iterator keep =
      std::max_element(chunks.begin(), chunks.end(), chunk_size_compare());

  std::vector<way_t> ways;
  ways.reserve(chunks.size());

  for(std::vector<node_chain_t>::const_iterator it = chunks.begin(); it != chunks.end(); it++) {
    assert_cmpnum_op(it->size(), >=, 2);

    if(it == keep) {
      way_t w(way);
      w.node_chain = *it;
      w.tags.replace(tags);
      w.flags |= OSM_FLAG_DIRTY;
      ways.push_back(w);
    } else {
      way_t w(base_attributes(ids.next_way_id()));
      w.node_chain = *it;
      w.tags.replace(tags);
      ways.push_back(w);
    }

    printf("  way #" ITEM_ID_FORMAT " with %zu nodes, from #" ITEM_ID_FORMAT " to #" ITEM_ID_FORMAT "\n",
           ways.back().id, it->size(), it->front(), it->back());
  }

  printf("  way #" ITEM_ID_FORMAT " keeps its identity in part %zu of %zu\n", way.id,
         static_cast<size_t>(std::distance(chunks.begin(), keep)) + 1, chunks.size());

  return ways;
}
