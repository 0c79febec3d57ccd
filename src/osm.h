/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "pos.h"

#include <cinttypes>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <libxml/tree.h>
#include <waysplit_annotations.h>
#include <waysplit_i18n.h>

#define OSM_FLAG_DIRTY    (1<<0)

/* item_id_t needs to be signed as negative ids are used for items */
/* not yet registered with the main osm database */
typedef int64_t item_id_t;
#define ITEM_ID_FORMAT  "%" PRIi64

#define ID_ILLEGAL  (static_cast<item_id_t>(0))

class base_object_t;
class node_t;
class osm_t;
class relation_t;
class way_t;
struct split_way_result;

typedef std::vector<item_id_t> node_chain_t;

/**
 * @brief reference to an OSM object by type and id
 */
struct object_t {
  enum type_t {
    ILLEGAL = 0,
    NODE = 1,
    WAY = 2,
    RELATION = 3
  };

  type_t type;
  item_id_t id;

  explicit inline object_t(type_t t = ILLEGAL, item_id_t i = ID_ILLEGAL) noexcept
    : type(t), id(i) {}

  inline bool operator==(const object_t &other) const noexcept
  { return type == other.type && id == other.id; }
  inline bool operator!=(const object_t &other) const noexcept
  { return !operator==(other); }

  /**
   * @brief the API string for the referenced object type
   * @retval nullptr the type is ILLEGAL
   */
  const char *type_string() const noexcept;
  std::string id_string() const;

  /**
   * @brief parse the API string of an object type
   * @retval ILLEGAL the string is no known type
   */
  static type_t type_from_string(const char *str) noexcept;
};

struct member_t {
  explicit member_t(const object_t &o, const std::string &r = std::string())
    : object(o), role(r) {}
  /**
   * @brief constructor
   * @param o the object to reference
   * @param m an existing member to copy the role from
   */
  member_t(const object_t &o, const member_t &m) : object(o), role(m.role) {}

  object_t object;
  std::string role;

  inline bool operator==(const member_t &other) const noexcept
  { return object == other.object && role == other.role; }
  inline bool operator==(const object_t &other) const noexcept
  { return object == other; }
  inline bool operator!=(const member_t &other) const noexcept
  { return !operator==(other); }

  inline bool has_role(const char *r) const
  { return role == r; }
};

/**
 * @brief the attributes of OSM objects as stored in the upstream database
 */
class base_attributes {
public:
  explicit base_attributes(item_id_t i = ID_ILLEGAL, unsigned int v = 0) noexcept
    : id(i), version(v) {}
  bool operator==(const base_attributes &other) const noexcept
  { return id == other.id && version == other.version; }

  item_id_t id;
  unsigned int version;
};

/**
 * @brief a way together with all the nodes it references
 */
struct way_complete_t {
  explicit way_complete_t(const way_t *w = nullptr) : way(w) {}

  const way_t *way;
  std::unordered_map<item_id_t, const node_t *> nodes;

  const node_t *node(item_id_t id) const;

  /**
   * @brief look up the positions of all nodes of the way
   * @param positions the positions in node chain order
   * @returns if all nodes were present
   */
  bool positions(std::vector<pos_t> &positions) const;
};

/**
 * @brief the read interface of the map data the split operates on
 *
 * The returned pointers are owned by the repository and stay valid as long
 * as the repository is not modified.
 */
class map_data_repository {
public:
  virtual ~map_data_repository() {}

  /**
   * @brief get a way and all the nodes it references
   * @returns the way data or an empty value if the way does not exist
   */
  virtual std::optional<way_complete_t> way_complete(item_id_t id) const = 0;

  /**
   * @brief get a way by id
   * @retval nullptr the way does not exist
   */
  virtual const way_t *way_by_id(item_id_t id) const = 0;

  /**
   * @brief get all relations that have the given way as member
   */
  virtual std::vector<const relation_t *> relations_for_way(item_id_t id) const = 0;
};

/**
 * @brief allocator for the ids of newly created objects
 *
 * Every call returns an id that was never returned before and does not
 * collide with any object present in the database.
 */
class element_id_provider {
public:
  virtual ~element_id_provider() {}

  virtual item_id_t next_node_id() = 0;
  virtual item_id_t next_way_id() = 0;
};

class osm_t : public map_data_repository, public element_id_provider {
  template<typename T> inline std::map<item_id_t, T *> &objects();
  template<typename T> inline const std::map<item_id_t, T *> &objects() const;
  template<typename T> void storeObject(const T &obj);
  template<typename T> item_id_t nextId(item_id_t &last) const;

public:
  typedef const std::unique_ptr<osm_t> &ref;
  typedef std::map<std::string, std::string> TagMap;

  explicit osm_t();
  ~osm_t() override;

  pos_area bounds;   // original bounds as they appear in the file

  std::map<item_id_t, node_t *> nodes;
  std::map<item_id_t, way_t *> ways;
  std::map<item_id_t, relation_t *> relations;

  template<typename T> T *object_by_id(item_id_t id) const;

  /**
   * @brief insert an object using the id already set
   *
   * The database takes ownership of the object.
   */
  void insert(node_t *node);
  void insert(way_t *way);
  void insert(relation_t *relation);

  /**
   * @brief store a copy of the object
   *
   * An existing object with the same id is replaced. Objects that are
   * already uploaded are marked dirty.
   */
  void store(const node_t &node);
  void store(const way_t &way);
  void store(const relation_t &relation);

  /**
   * @brief store all objects created or modified by a way split
   */
  void apply_result(const split_way_result &result);

  // map_data_repository
  std::optional<way_complete_t> way_complete(item_id_t id) const override;
  const way_t *way_by_id(item_id_t id) const override;
  std::vector<const relation_t *> relations_for_way(item_id_t id) const override;

  // element_id_provider
  item_id_t next_node_id() override;
  item_id_t next_way_id() override;

  /**
   * @brief check if object is in sane state
   * @returns error string or empty
   */
  trstring::native_type sanity_check() const;

  /**
   * @brief check if there are any modified or new objects
   */
  bool is_clean() const;

  /**
   * @brief parse an OSM XML file
   * @param path the directory to look in if filename has no directory part
   * @param filename the file to load
   * @retval nullptr the file could not be loaded
   */
  static osm_t *parse(const std::string &path, const std::string &filename);

  /**
   * @brief write all objects as OSM XML file
   * @returns if the file was written
   */
  bool save(const std::string &filename) const;

  /**
   * @brief generate the OSM XML document of all objects
   */
  xmlDocPtr generate_xml() const;

private:
  item_id_t lastNewNodeId;
  item_id_t lastNewWayId;
};

template<> inline std::map<item_id_t, node_t *> &osm_t::objects<node_t>()
{ return nodes; }
template<> inline std::map<item_id_t, way_t *> &osm_t::objects<way_t>()
{ return ways; }
template<> inline std::map<item_id_t, relation_t *> &osm_t::objects<relation_t>()
{ return relations; }

template<> inline const std::map<item_id_t, node_t *> &osm_t::objects<node_t>() const
{ return nodes; }
template<> inline const std::map<item_id_t, way_t *> &osm_t::objects<way_t>() const
{ return ways; }
template<> inline const std::map<item_id_t, relation_t *> &osm_t::objects<relation_t>() const
{ return relations; }
