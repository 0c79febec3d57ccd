/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "osm.h"
#include "osm_objects.h"
#include "split_position.h"

#include <vector>
#include <waysplit_i18n.h>

/**
 * @brief the objects created or modified by splitting a way
 */
struct split_way_result {
  std::vector<node_t> nodes;          ///< the new nodes
  std::vector<way_t> ways;            ///< all parts of the split way, in order along the way
  std::vector<relation_t> relations;  ///< the modified relations

  inline bool empty() const
  { return nodes.empty() && ways.empty() && relations.empty(); }
  void clear();
};

struct new_elements_count_t {
  unsigned int nodes;
  unsigned int ways;
  unsigned int relations;
};

/**
 * @brief split a way at the given positions
 *
 * The first and last node of the way are stored when the split is
 * requested. If they have changed when the action is applied the way has
 * been edited in a way that makes the split positions unreliable and the
 * split is rejected.
 */
class split_way_action {
public:
  /**
   * @brief constructor
   * @param splits the positions to split at
   * @param firstNode the first node of the way when the split was requested
   * @param lastNode the last node of the way when the split was requested
   */
  split_way_action(const std::vector<split_polyline_at_position> &splits,
                   item_id_t firstNode, item_id_t lastNode);

  /**
   * @brief the number of objects the split will create
   */
  new_elements_count_t new_elements_count() const;

  /**
   * @brief split the way
   * @param way_id the way to split
   * @param repo the current map data
   * @param ids the provider for the ids of new objects
   * @param result the created and modified objects
   * @returns the reason why the split could not be done, empty on success
   *
   * Neither repo nor result are modified if the split fails.
   */
  trstring apply(item_id_t way_id, const map_data_repository &repo, element_id_provider &ids,
                 split_way_result &result) const;

  inline const std::vector<split_polyline_at_position> &splits() const
  { return m_splits; }

  bool operator==(const split_way_action &other) const;
  inline bool operator!=(const split_way_action &other) const
  { return !operator==(other); }

private:
  std::vector<split_polyline_at_position> m_splits;
  item_id_t m_firstNode;
  item_id_t m_lastNode;

  /**
   * @brief check that the way has not been modified in a way that conflicts with the split
   * @returns error message, empty if the split can be done
   */
  trstring check_for_conflicts(item_id_t way_id, const std::optional<way_complete_t> &complete) const;
};
