/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "osm.h"
#include "osm_objects.h"

#include <optional>
#include <set>
#include <vector>

/**
 * @brief the nodes connecting the "from" and "to" members of a restriction like relation
 */
struct via_nodes_t {
  enum type_t {
    NoVia,
    ViaNodes
  };

  explicit inline via_nodes_t(type_t t = NoVia) : type(t) {}

  type_t type;
  std::set<item_id_t> nodes;
};

/**
 * @brief find the via nodes of the relation
 *
 * For "destination_sign" relations these are the members with role
 * "intersection", or "sign" if there is no intersection. For all other
 * relations the members with role "via" are used. A via node is used
 * directly, for a via way its first and last node are used.
 */
via_nodes_t relation_via_nodes(const relation_t &relation, const map_data_repository &repo);

/**
 * @brief check in which direction the way is used in an ordered relation
 * @param relation the relation
 * @param index the position of the way in the member list
 * @param way the way referenced at index
 * @param repo the map data to look up neighboring ways
 * @retval true the way is oriented forward
 * @retval false the way is oriented backward
 * @returns an empty value if the orientation can't be determined
 */
std::optional<bool> way_orientation(const relation_t &relation, unsigned int index, const way_t &way,
                                    const map_data_repository &repo);

/**
 * @brief replace the member at index by the parts of the split way
 * @param relation the relation to modify
 * @param index the index of the member referencing the split way
 * @param way the way before the split
 * @param ways the ways the original way was split into
 * @param repo the map data to look up vias and neighboring ways
 * @returns if the member was replaced
 */
bool relation_replace_split_way(relation_t &relation, unsigned int index, const way_t &way,
                                const std::vector<way_t> &ways, const map_data_repository &repo);

/**
 * @brief update all relations the split way is member of
 * @param way the way before the split
 * @param ways the ways the original way was split into
 * @param repo the map data
 * @returns the modified relations
 */
std::vector<relation_t> relations_update_split_way(const way_t &way, const std::vector<way_t> &ways,
                                                   const map_data_repository &repo);
