/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "osm.h"
#include "pos.h"

#include <algorithm>
#include <libxml/tree.h>
#include <memory>
#include <string>
#include <vector>

class tag_t {
public:
  std::string key, value;
  tag_t(const std::string &k, const std::string &v)
    : key(k), value(v) {}

  inline bool key_compare(const char *k) const
  { return key == k; }

  inline bool operator==(const tag_t &other) const
  { return key == other.key && value == other.value; }
};

class tag_list_t {
public:
  inline tag_list_t() noexcept {}
  tag_list_t(const tag_list_t &other);
  tag_list_t &operator=(const tag_list_t &other);

  bool operator==(const tag_list_t &other) const;
  inline bool operator!=(const tag_list_t &other) const
  { return !operator==(other); }

  /**
   * @brief check if any tags are present
   */
  bool empty() const noexcept;

  /**
   * @brief get the value for the given key
   * @retval nullptr no tag with this key exists
   */
  const char *get_value(const char *key) const;

  template<typename _Predicate>
  void for_each(_Predicate pred) const {
    if(contents)
      std::for_each(contents->begin(), contents->end(), pred);
  }

  /**
   * @brief remove all elements and free their memory
   */
  void clear();

  /**
   * @brief copy the contained tags
   */
  osm_t::TagMap asMap() const;

  inline void swap(tag_list_t &other)
  { std::swap(contents, other.contents); }

  /**
   * @brief replace the current tags with the given ones
   * @param ntags array of new tags
   */
  void replace(std::vector<tag_t> &&ntags);

  /**
   * @brief replace the current tags with the given ones
   * @param ntags new tags
   */
  void replace(const osm_t::TagMap &ntags);

  inline bool operator==(const osm_t::TagMap &t2) const
  { return !operator!=(t2); }
  bool operator!=(const osm_t::TagMap &t2) const;

private:
  // do not directly use a vector here as many objects do not have
  // any tags and that would waste too much memory
  std::unique_ptr<std::vector<tag_t>> contents;
};

class base_object_t : public base_attributes {
  friend class osm_t;

protected:
  explicit base_object_t(const base_attributes &attr) noexcept;

  // it makes no sense do directly compare base_object_t instances as that will miss half of the picture
  bool operator==(const base_object_t &other) const
  {
    // flags are just a marker for runtime processing so are ignored here
    return base_attributes::operator==(other) && tags == other.tags;
  }

public:
  virtual ~base_object_t() {}

  unsigned int flags;
  tag_list_t tags;

  /**
   * @brief add the XML element for this object to the given parent
   */
  void generate_xml(xmlNodePtr parent) const;

  /**
   * @brief get the API string for this object type
   * @return the string used for this kind of object in the OSM API
   */
  virtual const char *apiString() const noexcept = 0;

  inline bool isNew() const noexcept
  { return id <= ID_ILLEGAL; }

  inline bool isDirty() const noexcept
  { return flags != 0; }

protected:
  virtual void generate_xml_custom(xmlNodePtr xml_node) const = 0;
};

class node_t : public base_object_t {
public:
  explicit node_t(const base_attributes &attr = base_attributes(), const pos_t &p = pos_t()) noexcept
    : base_object_t(attr), pos(p) {}

  inline bool operator==(const node_t &other) const
  {
    return base_object_t::operator==(other) && pos == other.pos;
  }
  inline bool operator!=(const node_t &other) const
  { return !operator==(other); }

  pos_t pos;

  const char *apiString() const noexcept override {
    return api_string();
  }
  static const char *api_string() noexcept {
    return "node";
  }
protected:
  void generate_xml_custom(xmlNodePtr xml_node) const override;
};

class way_t : public base_object_t {
public:
  explicit way_t(const base_attributes &attr = base_attributes())
    : base_object_t(attr) {}

  inline bool operator==(const way_t &other) const
  {
    return base_object_t::operator==(other) && node_chain == other.node_chain;
  }
  inline bool operator!=(const way_t &other) const
  { return !operator==(other); }

  node_chain_t node_chain;

  void append_node(item_id_t node);
  bool ends_with_node(item_id_t node) const noexcept;
  bool is_closed() const noexcept;

  /**
   * @brief id of the last node
   * @retval ID_ILLEGAL the way has no nodes
   */
  item_id_t last_node() const noexcept;
  /**
   * @brief id of the first node
   * @retval ID_ILLEGAL the way has no nodes
   */
  item_id_t first_node() const noexcept;
  void write_node_chain(xmlNodePtr way_node) const;

  const char *apiString() const noexcept override {
    return api_string();
  }
  static const char *api_string() noexcept {
    return "way";
  }

protected:
  void generate_xml_custom(xmlNodePtr xml_node) const override {
    write_node_chain(xml_node);
  }
};

class relation_t : public base_object_t {
public:
  explicit relation_t(const base_attributes &attr = base_attributes())
    : base_object_t(attr) {}

  inline bool operator==(const relation_t &other) const
  {
    return base_object_t::operator==(other) &&
           members == other.members;
  }
  inline bool operator!=(const relation_t &other) const
  { return !operator==(other); }

  std::vector<member_t> members;

  void generate_member_xml(xmlNodePtr xml_node) const;

  /**
   * @brief check if the relation has the given type tag
   */
  bool is_type(const char *type) const;

  const char *apiString() const noexcept override {
    return api_string();
  }
  static const char *api_string() noexcept {
    return "relation";
  }
protected:
  void generate_xml_custom(xmlNodePtr xml_node) const override {
    generate_member_xml(xml_node);
  }
};
