/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cmath>
#include <cstddef>
#include <libxml/tree.h>
#include <libxml/xmlreader.h>
#include <string>

typedef double pos_float_t;

/* equatorial radius in meters */
#define POS_EQ_RADIUS     (6378137.0)

#define DEG2RAD(a)  ((a) * M_PI / 180.0)
#define RAD2DEG(a)  ((a) * 180.0 / M_PI)

/* number of decimals the OSM database stores for coordinates */
#define POS_OSM_DECIMALS  7

/* global position */
struct pos_t {
  pos_float_t lat, lon;
  inline pos_t() noexcept : lat(NAN), lon(NAN) {}
  inline pos_t(pos_float_t a, pos_float_t o) noexcept : lat(a), lon(o) {}
  bool operator==(const pos_t &other) const noexcept
  { return lat == other.lat && lon == other.lon; }
  inline bool operator!=(const pos_t &other) const noexcept
  { return !operator==(other); }
  bool valid() const noexcept;

  /**
   * @brief check if both positions end up as the same coordinate in the OSM database
   *
   * The coordinates are compared after rounding them to POS_OSM_DECIMALS.
   */
  bool same_in_osm(const pos_t &other) const noexcept;

  /**
   * @brief the great circle distance to the other position in meters
   */
  pos_float_t distance(const pos_t &other) const noexcept;

  /**
   * @brief the point on the great circle segment from this position to other
   * @param other the end of the segment
   * @param fraction the part of the segment length, 0 returns this position, 1 returns other
   */
  pos_t interpolate(const pos_t &other, pos_float_t fraction) const noexcept;

  void toXmlProperties(xmlNodePtr node,
                       const char *latName = "lat", const char *lonName = "lon") const;

  static pos_t fromXmlProperties(xmlTextReaderPtr reader,
                                 const char *latName = "lat", const char *lonName = "lon");
};

struct pos_area {
  explicit pos_area() noexcept {}
  pos_area(const pos_t &mi, const pos_t &ma) noexcept
    : min(mi), max(ma) {}

  pos_t min;
  pos_t max;

  bool valid() const noexcept;

  inline bool operator==(const pos_area &other) const noexcept
  { return max == other.max && min == other.min; }
  inline bool operator!=(const pos_area &other) const noexcept
  { return !operator==(other); }
};

bool pos_lat_valid(pos_float_t lat) noexcept;
bool pos_lon_valid(pos_float_t lon) noexcept;
