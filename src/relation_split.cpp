/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "relation_split.h"

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <waysplit_annotations.h>
#include <waysplit_stl.h>

namespace {

class via_role_match {
  const char * const role;
public:
  explicit inline via_role_match(const char *r) : role(r) {}
  inline bool operator()(const member_t &member) const {
    return (member.object.type == object_t::NODE || member.object.type == object_t::WAY) &&
           member.has_role(role);
  }
};

std::vector<member_t> find_vias(const relation_t &relation)
{
  std::vector<member_t> vias;

  if(relation.is_type("destination_sign")) {
    std::copy_if(relation.members.begin(), relation.members.end(), std::back_inserter(vias),
                 via_role_match("intersection"));
    if(vias.empty())
      std::copy_if(relation.members.begin(), relation.members.end(), std::back_inserter(vias),
                   via_role_match("sign"));
  } else {
    std::copy_if(relation.members.begin(), relation.members.end(), std::back_inserter(vias),
                 via_role_match("via"));
  }

  return vias;
}

inline bool is_way_member(const member_t &member)
{
  return member.object.type == object_t::WAY;
}

/**
 * @brief check if way continues after other in a chain of ways
 */
inline bool is_after_way_in_chain(const way_t &way, const way_t &other)
{
  return other.ends_with_node(way.first_node());
}

/**
 * @brief check if way is continued by other in a chain of ways
 */
inline bool is_before_way_in_chain(const way_t &way, const way_t &other)
{
  return other.ends_with_node(way.last_node());
}

class chunk_touches_via {
  const std::set<item_id_t> &nodes;
public:
  explicit inline chunk_touches_via(const std::set<item_id_t> &n) : nodes(n) {}
  inline bool operator()(const way_t &way) const {
    return nodes.find(way.first_node()) != nodes.end() ||
           nodes.find(way.last_node()) != nodes.end();
  }
};

class way_member_creator {
  const std::string &role;
public:
  explicit inline way_member_creator(const std::string &r) : role(r) {}
  inline member_t operator()(const way_t &way) const {
    return member_t(object_t(object_t::WAY, way.id), role);
  }
};

} // namespace

via_nodes_t relation_via_nodes(const relation_t &relation, const map_data_repository &repo)
{
  const std::vector<member_t> vias = find_vias(relation);
  via_nodes_t ret(via_nodes_t::ViaNodes);

  for(std::vector<member_t>::const_iterator it = vias.begin(); it != vias.end(); it++) {
    if(it->object.type == object_t::NODE) {
      ret.nodes.insert(it->object.id);
    } else {
      const way_t *via = repo.way_by_id(it->object.id);
      if(via == nullptr) {
        printf("  via way #" ITEM_ID_FORMAT " of relation #" ITEM_ID_FORMAT " not found\n",
               it->object.id, relation.id);
        continue;
      }
      ret.nodes.insert(via->first_node());
      ret.nodes.insert(via->last_node());
    }
  }

  if(ret.nodes.empty())
    ret.type = via_nodes_t::NoVia;

  return ret;
}

std::optional<bool> way_orientation(const relation_t &relation, unsigned int index, const way_t &way,
                                    const map_data_repository &repo)
{
  const unsigned int prevIdx = find_previous(relation.members, index, is_way_member);
  if(prevIdx < relation.members.size()) {
    const way_t *before = repo.way_by_id(relation.members[prevIdx].object.id);
    if(before != nullptr) {
      if(is_after_way_in_chain(way, *before))
        return true;
      if(is_before_way_in_chain(way, *before))
        return false;
    }
  }

  const unsigned int nextIdx = find_next(relation.members, index, is_way_member);
  if(nextIdx < relation.members.size()) {
    const way_t *after = repo.way_by_id(relation.members[nextIdx].object.id);
    if(after != nullptr) {
      if(is_before_way_in_chain(way, *after))
        return true;
      if(is_after_way_in_chain(way, *after))
        return false;
    }
  }

  return std::optional<bool>();
}

bool relation_replace_split_way(relation_t &relation, unsigned int index, const way_t &way,
                                const std::vector<way_t> &ways, const map_data_repository &repo)
{
  assert_cmpnum_op(index, <, relation.members.size());
  const member_t &member = relation.members[index];
  assert_cmpnum(member.object.type, object_t::WAY);
  assert_cmpnum(member.object.id, way.id);

  // only the part connected to the via belongs to a restriction
  if(member.has_role("from") || member.has_role("to")) {
    const via_nodes_t vias = relation_via_nodes(relation, repo);
    if(vias.type == via_nodes_t::ViaNodes) {
      const std::vector<way_t>::const_iterator it = std::find_if(ways.begin(), ways.end(),
                                                                 chunk_touches_via(vias.nodes));
      if(it != ways.end()) {
        printf("  relation #" ITEM_ID_FORMAT ": replacing %s way #" ITEM_ID_FORMAT " by way #" ITEM_ID_FORMAT "\n",
               relation.id, member.role.c_str(), way.id, it->id);
        relation.members[index] = member_t(object_t(object_t::WAY, it->id), member);
        return true;
      }

      printf("  WARNING: relation #" ITEM_ID_FORMAT ": no part of way #" ITEM_ID_FORMAT
             " connects to the via of the %s member, leaving it unchanged\n",
             relation.id, way.id, member.role.c_str());
    } else {
      printf("  WARNING: relation #" ITEM_ID_FORMAT " has no via, leaving %s member way #" ITEM_ID_FORMAT
             " unchanged\n", relation.id, member.role.c_str(), way.id);
    }

    return false;
  }

  std::vector<member_t> replacement;
  replacement.reserve(ways.size());
  std::transform(ways.begin(), ways.end(), std::back_inserter(replacement), way_member_creator(member.role));

  const std::optional<bool> forward = way_orientation(relation, index, way, repo);
  if(forward && !*forward) {
    printf("  relation #" ITEM_ID_FORMAT ": way #" ITEM_ID_FORMAT " is used backwards, inserting parts in reverse order\n",
           relation.id, way.id);
    std::reverse(replacement.begin(), replacement.end());
  }

  printf("  way #" ITEM_ID_FORMAT " is part of relation #" ITEM_ID_FORMAT " at position %u, replacing it by %zu ways\n",
         way.id, relation.id, index, replacement.size());

  std::vector<member_t> members;
  members.reserve(relation.members.size() + replacement.size() - 1);
  const std::vector<member_t>::const_iterator pos = std::next(relation.members.cbegin(), index);
  members.insert(members.end(), relation.members.cbegin(), pos);
  members.insert(members.end(), replacement.begin(), replacement.end());
  members.insert(members.end(), std::next(pos), relation.members.cend());
  relation.members.swap(members);

  return true;
}

std::vector<relation_t> relations_update_split_way(const way_t &way, const std::vector<way_t> &ways,
                                                   const map_data_repository &repo)
{
  std::vector<relation_t> ret;
  const object_t wobj(object_t::WAY, way.id);

  const std::vector<const relation_t *> relations = repo.relations_for_way(way.id);
  for(std::vector<const relation_t *>::const_iterator rit = relations.begin(); rit != relations.end(); rit++) {
    relation_t relation(**rit);
    bool changed = false;

    // members after the current one may already be replaced, so walk backwards
    for(unsigned int i = relation.members.size(); i > 0; i--) {
      if(relation.members[i - 1].object == wobj &&
         relation_replace_split_way(relation, i - 1, way, ways, repo))
        changed = true;
    }

    if(changed) {
      relation.flags |= OSM_FLAG_DIRTY;
      ret.push_back(relation);
    }
  }

  return ret;
}
