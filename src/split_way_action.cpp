/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "split_way_action.h"

#include "relation_split.h"
#include "way_split.h"

#include <algorithm>
#include <cstdio>
#include <waysplit_annotations.h>

void split_way_result::clear()
{
  nodes.clear();
  ways.clear();
  relations.clear();
}

split_way_action::split_way_action(const std::vector<split_polyline_at_position> &splits,
                                   item_id_t firstNode, item_id_t lastNode)
  : m_splits(splits)
  , m_firstNode(firstNode)
  , m_lastNode(lastNode)
{
}

namespace {

inline bool is_line_split(const split_polyline_at_position &split)
{
  return split.type == split_polyline_at_position::AtLine;
}

} // namespace

new_elements_count_t split_way_action::new_elements_count() const
{
  // identical requests result in a single split
  std::vector<split_polyline_at_position> splits;
  splits.reserve(m_splits.size());
  for(const split_polyline_at_position &split : m_splits)
    if(std::find(splits.begin(), splits.end(), split) == splits.end())
      splits.push_back(split);

  new_elements_count_t ret;
  ret.nodes = std::count_if(splits.begin(), splits.end(), is_line_split);
  ret.ways = splits.size();
  ret.relations = 0;
  return ret;
}

bool split_way_action::operator==(const split_way_action &other) const
{
  return m_firstNode == other.m_firstNode && m_lastNode == other.m_lastNode &&
         m_splits == other.m_splits;
}

trstring split_way_action::check_for_conflicts(item_id_t way_id, const std::optional<way_complete_t> &complete) const
{
  if(!complete)
    return trstring(_("Way #%1 has been deleted")).arg(way_id);

  const way_t * const way = complete->way;
  const item_id_t first = way->first_node();
  const item_id_t last = way->last_node();

  // a reversed way is fine, a shortened or extended one may already contain a similar split
  if(!((first == m_firstNode && last == m_lastNode) || (first == m_lastNode && last == m_firstNode)))
    return trstring(_("Way #%1 has been changed and the conflict cannot be solved automatically")).arg(way_id);

  if(way->is_closed() && m_splits.size() < 2)
    return trstring(_("Must specify at least two split positions for a closed way"));

  return trstring();
}

trstring split_way_action::apply(item_id_t way_id, const map_data_repository &repo, element_id_provider &ids,
                                 split_way_result &result) const
{
  printf("splitting way #" ITEM_ID_FORMAT " at %zu positions\n", way_id, m_splits.size());

  const std::optional<way_complete_t> complete = repo.way_complete(way_id);
  trstring err = check_for_conflicts(way_id, complete);
  if(!err.isEmpty()) {
    printf("  conflict: %s\n", err.toStdString().c_str());
    return err;
  }

  const way_t &way = *complete->way;

  std::vector<pos_t> positions;
  if(!complete->positions(positions)) {
    err = trstring(_("Way #%1 has been changed and the conflict cannot be solved automatically")).arg(way_id);
    printf("  conflict: not all nodes of the way are present\n");
    return err;
  }

  std::vector<split_way_at> plan;
  err = split_plan(positions, m_splits, plan);
  if(!err.isEmpty()) {
    printf("  conflict: %s\n", err.toStdString().c_str());
    return err;
  }

  // identical requests are merged by the plan, so the count has to be checked again
  if(way.is_closed() && plan.size() < 2) {
    err = trstring(_("Must specify at least two split positions for a closed way"));
    printf("  conflict: only %zu distinct split positions on closed way\n", plan.size());
    return err;
  }

  split_way_result ret;

  node_chain_t chain = way.node_chain;
  const std::vector<unsigned int> indexes = insert_split_nodes(chain, plan, ids, ret.nodes);
  const std::vector<node_chain_t> chunks = split_node_chain(chain, indexes);
  ret.ways = create_split_ways(way, chunks, ids);
  ret.relations = relations_update_split_way(way, ret.ways, repo);

  printf("  created %zu nodes and %zu ways, updated %zu relations\n",
         ret.nodes.size(), ret.ways.size() - 1, ret.relations.size());

  std::swap(result, ret);
  return trstring();
}
