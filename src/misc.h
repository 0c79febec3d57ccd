/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <libxml/tree.h>
#include <memory>
#include <string>

struct xmlDelete {
  inline void operator()(xmlChar *s) {
    xmlFree(s);
  }
};

class xmlString : public std::unique_ptr<xmlChar, xmlDelete> {
public:
  xmlString(xmlChar *txt = nullptr)
    : std::unique_ptr<xmlChar, xmlDelete>(txt) {}

  operator const char *() const
  { return reinterpret_cast<const char *>(get()); }

  inline bool empty() const
  { return !operator bool() || *get() == '\0'; }
};

struct xmlDocDelete {
  inline void operator()(xmlDocPtr doc) {
    xmlFreeDoc(doc);
  }
};

typedef std::unique_ptr<xmlDoc, xmlDocDelete> xmlDocGuard;

/**
 * @brief parse a floating point value independent of the current locale
 * @returns the parsed value or NAN if str is nullptr or no number
 */
double xml_parse_float(const xmlChar *str);
inline double xml_parse_float(const xmlString &str)
{ return xml_parse_float(str.get()); }

bool xml_get_prop_bool(xmlNode *node, const char *prop);

void format_float_int(int val, unsigned int decimals, char *str);

/**
 * @brief convert a floating point number to a integer representation
 * @param val the floating point value
 * @param decimals the maximum number of decimals behind the separator
 * @param str the buffer to print the number to, must be big enough
 *
 * This assumes that a "base 10 shift left by decimals" can still be
 * represented as an integer. Trailing zeroes are chopped.
 *
 * 16 as length of str is enough for every possible value: int needs at most
 * 10 digits, '-', '.', '\0' -> 13
 *
 * This does not use snprintf() as the result would depend on the
 * LC_NUMERIC setting of the current locale.
 */
void format_float(double val, unsigned int decimals, char *str);

void remove_trailing_zeroes(char *str);

/**
 * @brief check if the string is a complete decimal integer
 *
 * An optional leading sign is allowed, surrounding whitespace is not. The
 * value must fit into a signed 32 bit integer.
 */
bool is_integer(const std::string &str);
