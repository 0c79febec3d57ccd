/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "pos.h"

#include <optional>
#include <string>
#include <vector>
#include <waysplit_i18n.h>

class split_way_at;

/**
 * @brief a position where a way should be split, as geographic coordinates
 *
 * The way may have changed since the split was requested, so the position
 * is stored by coordinates and only later mapped back to the node chain.
 */
class split_polyline_at_position {
public:
  enum type_t {
    AtPoint,  ///< split at the existing node at pos1
    AtLine    ///< split on the line between the nodes at pos1 and pos2
  };

  static inline split_polyline_at_position at_point(const pos_t &pos)
  { return split_polyline_at_position(AtPoint, pos, pos_t(), 0); }

  /**
   * @brief split between 2 nodes
   * @param p1 position of the first node of the line
   * @param p2 position of the second node of the line
   * @param d the fraction of the line from p1 to p2 where the new node is created
   */
  static inline split_polyline_at_position at_line(const pos_t &p1, const pos_t &p2, pos_float_t d)
  { return split_polyline_at_position(AtLine, p1, p2, d); }

  type_t type;
  pos_t pos1;
  pos_t pos2;
  pos_float_t delta;

  bool operator==(const split_polyline_at_position &other) const noexcept;
  inline bool operator!=(const split_polyline_at_position &other) const noexcept
  { return !operator==(other); }

  /**
   * @brief the position the way is split at
   */
  pos_t position() const;

  /**
   * @brief map this request onto the given way geometry
   * @param positions the positions of the way nodes in node chain order
   * @param result the resolved split
   * @returns error message, empty on success
   */
  trstring resolve(const std::vector<pos_t> &positions, split_way_at &result) const;

  /**
   * @brief parse the textual representation of a split position
   *
   * The accepted forms are "node:LAT,LON" and "line:LAT1,LON1:LAT2,LON2:DELTA"
   * with a delta between 0 and 1, both exclusive.
   *
   * @returns the parsed position or an empty value if str is invalid
   */
  static std::optional<split_polyline_at_position> fromString(const std::string &str);

private:
  inline split_polyline_at_position(type_t t, const pos_t &p1, const pos_t &p2, pos_float_t d) noexcept
    : type(t), pos1(p1), pos2(p2), delta(d) {}
};

/**
 * @brief a split position expressed as index into the node chain of a way
 */
class split_way_at {
public:
  enum type_t {
    AtIndex,          ///< split at the node at index
    AtLinePosition    ///< split between the nodes at index and index2
  };

  inline split_way_at() noexcept
    : type(AtIndex), index(0), index2(0), delta(0) {}

  static inline split_way_at at_index(unsigned int idx, const pos_t &p)
  { return split_way_at(AtIndex, idx, idx, 0, p); }

  /**
   * @brief split on the line between 2 successive nodes
   * @param idx1 the index of the first node of the line
   * @param d fraction of the line from idx1 to idx1 + 1
   * @param p the position of the new node
   */
  static inline split_way_at at_line_position(unsigned int idx1, pos_float_t d, const pos_t &p)
  { return split_way_at(AtLinePosition, idx1, idx1 + 1, d, p); }

  type_t type;
  unsigned int index;   ///< the split node or the first node of the line
  unsigned int index2;  ///< the second node of the line, same as index for AtIndex
  pos_float_t delta;    ///< always 0 for AtIndex
  pos_t pos;            ///< position of the split node

  /**
   * @brief order along the way: by index, then by delta
   */
  inline bool operator<(const split_way_at &other) const noexcept
  {
    if(index != other.index)
      return index < other.index;
    return delta < other.delta;
  }

  inline bool operator==(const split_way_at &other) const noexcept
  { return type == other.type && index == other.index && delta == other.delta; }
  inline bool operator!=(const split_way_at &other) const noexcept
  { return !operator==(other); }

private:
  inline split_way_at(type_t t, unsigned int i1, unsigned int i2, pos_float_t d, const pos_t &p) noexcept
    : type(t), index(i1), index2(i2), delta(d), pos(p) {}
};

/**
 * @brief resolve all split requests and sort them along the way
 * @param positions the positions of the way nodes in node chain order
 * @param splits the requested split positions
 * @param plan the resulting split positions, front to back, without duplicates
 * @returns error message of the first request that could not be resolved, empty on success
 */
trstring split_plan(const std::vector<pos_t> &positions,
                    const std::vector<split_polyline_at_position> &splits,
                    std::vector<split_way_at> &plan);
