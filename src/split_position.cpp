/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "split_position.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <waysplit_annotations.h>

bool split_polyline_at_position::operator==(const split_polyline_at_position &other) const noexcept
{
  if(type != other.type || pos1 != other.pos1)
    return false;
  return type == AtPoint || (pos2 == other.pos2 && delta == other.delta);
}

pos_t split_polyline_at_position::position() const
{
  switch(type) {
  case AtPoint:
    return pos1;
  case AtLine:
    return pos1.interpolate(pos2, delta);
  }

  assert_unreachable();
}

namespace {

/**
 * @brief find all indexes of nodes at the given position
 */
std::vector<unsigned int> indexes_of(const std::vector<pos_t> &positions, const pos_t &pos)
{
  std::vector<unsigned int> ret;
  for(unsigned int i = 0; i < positions.size(); i++)
    if(positions[i].same_in_osm(pos))
      ret.push_back(i);
  return ret;
}

class way_end_index {
  const unsigned int lastIndex;
public:
  explicit inline way_end_index(unsigned int l) : lastIndex(l) {}
  inline bool operator()(unsigned int i) const {
    return i == 0 || i == lastIndex;
  }
};

} // namespace

trstring split_polyline_at_position::resolve(const std::vector<pos_t> &positions, split_way_at &result) const
{
  assert_cmpnum_op(positions.size(), >=, 2);

  switch(type) {
  case AtPoint: {
    std::vector<unsigned int> indexes = indexes_of(positions, pos1);
    if(indexes.empty())
      return trstring(_("Unable to split: the split point has been moved"));

    // a way can't be split at its ends
    indexes.erase(std::remove_if(indexes.begin(), indexes.end(), way_end_index(positions.size() - 1)),
                  indexes.end());
    if(indexes.empty())
      return trstring(_("Unable to split: the split position is at the start or end of the way"));

    result = split_way_at::at_index(indexes.front(), positions[indexes.front()]);
    return trstring();
  }
  case AtLine: {
    const std::vector<unsigned int> indexes1 = indexes_of(positions, pos1);
    const std::vector<unsigned int> indexes2 = indexes_of(positions, pos2);
    if(indexes1.empty() || indexes2.empty())
      return trstring(_("Unable to split: the split line has been moved"));

    for(unsigned int i1 : indexes1) {
      for(unsigned int i2 : indexes2) {
        if(i1 + 1 == i2) {
          result = split_way_at::at_line_position(i1, delta, positions[i1].interpolate(positions[i2], delta));
          return trstring();
        }
        // the line is stored in the opposite direction than the way
        if(i2 + 1 == i1) {
          result = split_way_at::at_line_position(i2, 1 - delta, positions[i2].interpolate(positions[i1], 1 - delta));
          return trstring();
        }
      }
    }

    return trstring(_("Unable to split: the end points of the split line are not directly successive anymore"));
  }
  }

  assert_unreachable();
}

namespace {

/**
 * @brief parse a floating point number followed by the given separator
 * @param str the string to parse, is moved behind the separator on success
 * @param sep the expected separator, '\0' for the end of the string
 */
bool parse_float_sep(const char *&str, char sep, pos_float_t &value)
{
  char *endp;
  value = strtod(str, &endp);
  if(endp == str || *endp != sep)
    return false;
  str = sep == '\0' ? endp : endp + 1;
  return true;
}

bool parse_pos(const char *&str, char sep, pos_t &pos)
{
  return parse_float_sep(str, ',', pos.lat) && parse_float_sep(str, sep, pos.lon) && pos.valid();
}

} // namespace

std::optional<split_polyline_at_position> split_polyline_at_position::fromString(const std::string &str)
{
  static const char node_prefix[] = "node:";
  static const char line_prefix[] = "line:";

  const char *s = str.c_str();
  if(strncmp(s, node_prefix, strlen(node_prefix)) == 0) {
    s += strlen(node_prefix);
    pos_t pos;
    if(parse_pos(s, '\0', pos))
      return at_point(pos);
  } else if(strncmp(s, line_prefix, strlen(line_prefix)) == 0) {
    s += strlen(line_prefix);
    pos_t pos1, pos2;
    pos_float_t delta;
    if(parse_pos(s, ':', pos1) && parse_pos(s, ':', pos2) && parse_float_sep(s, '\0', delta) &&
       delta > 0 && delta < 1)
      return at_line(pos1, pos2, delta);
  }

  return std::optional<split_polyline_at_position>();
}

trstring split_plan(const std::vector<pos_t> &positions,
                    const std::vector<split_polyline_at_position> &splits,
                    std::vector<split_way_at> &plan)
{
  plan.clear();
  plan.reserve(splits.size());

  for(const split_polyline_at_position &split : splits) {
    split_way_at at;
    trstring err = split.resolve(positions, at);
    if(!err.isEmpty()) {
      plan.clear();
      return err;
    }
    plan.push_back(at);
  }

  std::stable_sort(plan.begin(), plan.end());
  plan.erase(std::unique(plan.begin(), plan.end()), plan.end());

  return trstring();
}
