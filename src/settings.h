/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <array>
#include <memory>
#include <string>
#include <utility>

#define DEFAULT_OUTPUT "split.osm"
#define SETTINGS_FILE "settings.xml"

class settings_t {
protected:
  settings_t();

  /**
   * @brief read the settings file from the configuration directory
   * @returns if a settings file was found and parsed
   */
  bool load();
  void setDefaults();

public:
  typedef std::shared_ptr<settings_t> ref;

  /* directory for data files given without a path */
  std::string base_path;

  /* default name of the file the split result is written to */
  std::string output;

  /* print progress messages */
  bool verbose;

  static ref instance();

  /**
   * @brief the directory the settings file is stored in
   *
   * This is $WAYSPLIT_HOME, $HOME/.waysplit/ or /tmp/waysplit/, always
   * with a trailing slash.
   */
  static std::string config_path();

  /**
   * @brief write the settings file
   * @returns if the file was written
   */
  bool save() const;

  typedef std::array<std::pair<const char *, std::string *>, 2> StringKeys;
  typedef std::array<std::pair<const char *, bool *>, 1> BooleanKeys;
private:
  const StringKeys store_str;
  const BooleanKeys store_bool;
};
