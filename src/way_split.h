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

/**
 * @brief remove the tags that are likely wrong for the parts of a split way
 *
 * These are tags that describe the whole way, like the number of steps or
 * the capacity, and can't be distributed among the parts.
 */
void remove_tags_wrong_after_split(osm_t::TagMap &tags);

/**
 * @brief create the nodes for the split positions and insert them into the node chain
 * @param chain the node chain of the way, will be extended
 * @param plan the sorted split positions
 * @param ids the id provider for the new nodes
 * @param new_nodes the created nodes are appended here
 * @returns the indexes into the extended chain to split at
 */
std::vector<unsigned int> insert_split_nodes(node_chain_t &chain, const std::vector<split_way_at> &plan,
                                             element_id_provider &ids, std::vector<node_t> &new_nodes);

/**
 * @brief split a node chain at the given indexes
 *
 * If the chain is closed the part after the last split and the part before
 * the first split are joined, so a closed chain split at n positions gives n
 * chains.
 */
std::vector<node_chain_t> split_node_chain(const node_chain_t &chain, const std::vector<unsigned int> &indexes);

/**
 * @brief create the ways for the given node chains
 * @param way the way that is split
 * @param chunks the parts of the node chain in order
 * @param ids the id provider for the new ways
 * @returns the ways in chunk order
 *
 * The longest chunk keeps id and version of the original way, if several
 * chunks have the same length the first one wins. All ways get the tags of
 * the original way except those removed by remove_tags_wrong_after_split().
 */
std::vector<way_t> create_split_ways(const way_t &way, const std::vector<node_chain_t> &chunks,
                                     element_id_provider &ids);
