/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <iterator>
#include <string>
#include <vector>

#include <waysplit_annotations.h>

static inline bool ends_with(const std::string &s, const char ch)
{
  return !s.empty() && s.back() == ch;
}

/**
 * @brief split a list at the given indexes
 * @param list the elements to split
 * @param indexes the sorted positions to split at
 *
 * The element at a split index is both the last element of one chunk and the
 * first one of the next chunk.
 */
template<typename T>
std::vector<std::vector<T> > split_into_chunks(const std::vector<T> &list, const std::vector<unsigned int> &indexes)
{
  std::vector<std::vector<T> > ret;
  ret.reserve(indexes.size() + 1);

  unsigned int last = 0;
  for(std::vector<unsigned int>::const_iterator it = indexes.begin(); it != indexes.end(); it++) {
    assert_cmpnum_op(*it, <, list.size());
    ret.push_back(std::vector<T>(std::next(list.begin(), last), std::next(list.begin(), *it + 1)));
    last = *it;
  }
  ret.push_back(std::vector<T>(std::next(list.begin(), last), list.end()));

  return ret;
}

/**
 * @brief find the closest element before index that matches the predicate
 * @returns the index of the element or list.size() if none matches
 */
template<typename T, typename _Predicate>
unsigned int find_previous(const std::vector<T> &list, unsigned int index, _Predicate pred)
{
  for(unsigned int i = index; i > 0; i--)
    if(pred(list[i - 1]))
      return i - 1;
  return list.size();
}

/**
 * @brief find the closest element after index that matches the predicate
 * @returns the index of the element or list.size() if none matches
 */
template<typename T, typename _Predicate>
unsigned int find_next(const std::vector<T> &list, unsigned int index, _Predicate pred)
{
  for(unsigned int i = index + 1; i < list.size(); i++)
    if(pred(list[i]))
      return i;
  return list.size();
}
