/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <waysplit_i18n.h>

#include <cstdio>
#include <cstring>

#include "waysplit_annotations.h"

namespace {

/**
 * @brief helper to replace a given placeholder by the pattern
 */
std::string trstring_argn(std::string smsg, const char spattern[3], const char *a, size_t alen, std::string::size_type pos)
{
  while (pos != std::string::npos) {
    smsg.replace(pos, 2, a, alen);
    pos = smsg.find(spattern, pos + alen, 2);
  }

  return smsg;
}

struct placeholderReturn {
  placeholderReturn() { spattern[0] = '%'; spattern[1] = '1'; spattern[2] = '\0'; }
  // increase as needed
  char spattern[3];
  std::string::size_type pos;
};

placeholderReturn
placeholderPosition(const std::string &str)
{
  placeholderReturn ret;
  ret.pos = str.find(ret.spattern, 0, 2);

  // only one char long placeholder indexes are supported
  for (int i = 2; i < 10 && ret.pos == std::string::npos; i++) {
    ret.spattern[1] = '0' + i;
    ret.pos = str.find(ret.spattern, 0, 2);
  }

  if(unlikely(ret.pos == std::string::npos))
    printf("no placeholder found in string: '%s'\n", str.c_str());

  return ret;
}

} // namespace

trstring trstring::arg(const std::string &a) const
{
  placeholderReturn pos = placeholderPosition(*this);

  return trstring(trstring_argn(*this, pos.spattern, a.c_str(), a.size(), pos.pos));
}

trstring trstring::arg(const char *a) const
{
  placeholderReturn pos = placeholderPosition(*this);

  return trstring(trstring_argn(*this, pos.spattern, a, strlen(a), pos.pos));
}
