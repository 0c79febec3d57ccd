/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "pos.h"

#include "misc.h"

#include <cmath>
#include <cstdint>

#include "waysplit_annotations.h"

bool pos_t::valid() const noexcept
{
  return pos_lat_valid(lat) && pos_lon_valid(lon);
}

bool pos_lat_valid(pos_float_t lat) noexcept
{
  return(!std::isnan(lat) && (lat >= -90.0) && (lat <= 90.0));
}

bool pos_lon_valid(pos_float_t lon) noexcept
{
  return(!std::isnan(lon) && (lon >= -180.0) && (lon <= 180.0));
}

namespace {

inline int64_t osm_fixed(pos_float_t v) noexcept
{
  return llround(v * 1e7);
}

} // namespace

bool pos_t::same_in_osm(const pos_t &other) const noexcept
{
  return osm_fixed(lat) == osm_fixed(other.lat) &&
         osm_fixed(lon) == osm_fixed(other.lon);
}

pos_float_t pos_t::distance(const pos_t &other) const noexcept
{
  const pos_float_t dlat = DEG2RAD(other.lat - lat);
  const pos_float_t dlon = DEG2RAD(other.lon - lon);
  const pos_float_t a = sin(dlat / 2) * sin(dlat / 2) +
                        cos(DEG2RAD(lat)) * cos(DEG2RAD(other.lat)) * sin(dlon / 2) * sin(dlon / 2);

  return POS_EQ_RADIUS * 2 * atan2(sqrt(a), sqrt(1 - a));
}

pos_t pos_t::interpolate(const pos_t &other, pos_float_t fraction) const noexcept
{
  const pos_float_t lat1 = DEG2RAD(lat);
  const pos_float_t lon1 = DEG2RAD(lon);
  const pos_float_t lat2 = DEG2RAD(other.lat);
  const pos_float_t lon2 = DEG2RAD(other.lon);

  // angular distance between both points
  const pos_float_t d = distance(other) / POS_EQ_RADIUS;
  if(unlikely(d == 0))
    return *this;

  const pos_float_t a = sin((1 - fraction) * d) / sin(d);
  const pos_float_t b = sin(fraction * d) / sin(d);

  const pos_float_t x = a * cos(lat1) * cos(lon1) + b * cos(lat2) * cos(lon2);
  const pos_float_t y = a * cos(lat1) * sin(lon1) + b * cos(lat2) * sin(lon2);
  const pos_float_t z = a * sin(lat1) + b * sin(lat2);

  return pos_t(RAD2DEG(atan2(z, sqrt(x * x + y * y))), RAD2DEG(atan2(y, x)));
}

static void xml_add_prop_coord(xmlNodePtr node, const char *key, pos_float_t val)
{
  char str[16];
  format_float(val, POS_OSM_DECIMALS, str);
  xmlNewProp(node, BAD_CAST key, BAD_CAST str);
}

void pos_t::toXmlProperties(xmlNodePtr node, const char *latName, const char *lonName) const
{
  xml_add_prop_coord(node, latName, lat);
  xml_add_prop_coord(node, lonName, lon);
}

static pos_float_t xml_reader_attr_float(xmlTextReaderPtr reader, const char *name)
{
  xmlString prop(xmlTextReaderGetAttribute(reader, BAD_CAST name));
  return xml_parse_float(prop);
}

pos_t pos_t::fromXmlProperties(xmlTextReaderPtr reader, const char *latName, const char *lonName)
{
  return pos_t(xml_reader_attr_float(reader, latName),
               xml_reader_attr_float(reader, lonName));
}

bool pos_area::valid() const noexcept
{
  return min.valid() &&
         max.valid() &&
         min.lat < max.lat &&
         min.lon < max.lon;
}
