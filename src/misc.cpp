/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "misc.h"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <limits>
#include <locale>
#include <strings.h>
#include <sstream>

#include "waysplit_annotations.h"

double xml_parse_float(const xmlChar *str)
{
  if(unlikely(str == nullptr))
    return NAN;

  std::istringstream ss(reinterpret_cast<const char *>(str));
  ss.imbue(std::locale::classic());
  double ret;
  ss >> ret;
  if(unlikely(ss.fail()))
    return NAN;

  return ret;
}

bool xml_get_prop_bool(xmlNode *node, const char *prop)
{
  xmlString prop_str(xmlGetProp(node, BAD_CAST prop));
  if(!prop_str)
    return false;

  return strcasecmp(prop_str, "true") == 0;
}

void format_float_int(int val, unsigned int decimals, char *str)
{
  unsigned int off = 0;
  // handle the sign explicitely so it does not count in the minimum
  // output length, could result in "-.42" otherwise
  if(val < 0) {
    str[0] = '-';
    off++;
    val = -val;
  }
  // make sure there are at least decimals + 1 characters in the output
  int l = sprintf(str + off, "%0*u", decimals + 1, val) + off;
  // move the decimals and \0 one position to the right
  memmove(str + l + 1 - decimals, str + l - decimals, decimals + 1);
  // insert dot
  str[l - decimals] = '.';
  // remove any trailing zeroes, use the knowledge about the string length
  // to avoid needless searching
  remove_trailing_zeroes(str + l - decimals - 1);
}

void format_float(double val, unsigned int decimals, char *str)
{
  format_float_int(static_cast<int>(round(val * pow(10, decimals))), decimals, str);
}

void remove_trailing_zeroes(char *str)
{
  char *delim = str;
  while(*delim >= '0' && *delim <= '9')
    delim++;
  if(*delim == '\0')
    return;
  char *p = delim + strlen(delim) - 1;
  while(*p == '0')
    *p-- = '\0';
  if(p == delim)
    *p = '\0';
}

bool is_integer(const std::string &str)
{
  std::string::size_type pos = 0;
  if(!str.empty() && (str[0] == '-' || str[0] == '+'))
    pos++;

  if(pos == str.size())
    return false;

  for(std::string::size_type i = pos; i < str.size(); i++)
    if(str[i] < '0' || str[i] > '9')
      return false;

  // the value must also fit into a 32 bit integer
  errno = 0;
  const long long val = strtoll(str.c_str(), nullptr, 10);
  return errno == 0 && val >= std::numeric_limits<int32_t>::min() &&
         val <= std::numeric_limits<int32_t>::max();
}
