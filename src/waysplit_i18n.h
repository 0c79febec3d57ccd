/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cassert>
#include <cstddef>
#include <libintl.h>
#include <locale.h>
#include <string>
#include <utility>

#define _(String) trstring::tr(String)

extern const char *bad_tr_call; // never defined, so bad calls to tr_noop() can be detected
#define tr_noop(String) __builtin_constant_p(String) ? \
                  (String) : bad_tr_call

/**
 * @brief a translated message
 *
 * Placeholders in the message are written as %1 to %9 and are filled in
 * ascending order by calls to arg().
 */
class trstring : private std::string {
  explicit inline trstring(std::string &&s) : std::string(std::move(s)) {}
public:
  // use this type directly only when declaring variables, not arguments
  class native_type {
    const char *value;
  public:
    // catch if one passes a constant nullptr as argument
    native_type(std::nullptr_t) = delete;
    inline native_type(const char *v = nullptr) : value(v) {}
    inline bool isEmpty() const { return value == nullptr; }
    inline void clear() { value = nullptr; }
    inline operator const char *() const { return value; }
    inline std::string toStdString() const { return isEmpty() ? std::string() : value; }
  };
  typedef native_type native_type_arg;

  explicit inline trstring() : std::string() {}
  explicit inline trstring(const char *s) __attribute__((nonnull(2))) : std::string(gettext(s)) {}
  explicit inline trstring(native_type s) : std::string(s.toStdString()) {}
  // catch if one passes a constant nullptr as argument
  trstring(std::nullptr_t) = delete;
  trstring arg(std::nullptr_t) = delete;

  trstring arg(const std::string &a) const;
  trstring arg(const char *a) const __attribute__((nonnull(2)));
  inline trstring arg(char *a) const __attribute__((nonnull(2)))
  { return arg(static_cast<const char *>(a)); }
  inline trstring arg(const trstring &a) const
  { return arg(a.toStdString()); }
  inline trstring arg(native_type a) const
  {
    assert(!a.isEmpty());
    return arg(static_cast<const char *>(a));
  }
  template<typename T> inline trstring arg(T l) const
  { return arg(std::to_string(l)); }

  const std::string &toStdString() const { return *this; }

  inline void swap(trstring &other)
  { std::string::swap(other); }

  inline bool isEmpty() const
  { return empty(); }

  inline void clear()
  { std::string::clear(); }

  // this is a helper method to implement _(), do not call it directly
  static inline native_type tr(const char *s) __attribute__((nonnull(1)))
  {
    return native_type(gettext(s));
  }

  explicit operator const char *() const { return c_str(); }
};

static_assert(sizeof(trstring::native_type) <= sizeof(char*), "trstring::native_type is too big");
