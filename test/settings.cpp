/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <settings.h>

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

#include <waysplit_annotations.h>

namespace {

class emptySettings : public settings_t {
  emptySettings() {}
public:
  static std::shared_ptr<settings_t> get()
  {
    std::shared_ptr<settings_t> ret(new emptySettings());

    return ret;
  }

  bool ld()
  {
    return load();
  }

  void defs()
  {
    setDefaults();
  }
};

void testRef()
{
  settings_t::ref s = settings_t::instance();
  assert(s.get() == settings_t::instance().get());
}

void testConfigPath(const std::string &home)
{
  assert_cmpstr(settings_t::config_path(), home + "/");

  setenv("WAYSPLIT_HOME", "", 1);
  setenv("HOME", "/home/someone/", 1);
  assert_cmpstr(settings_t::config_path(), "/home/someone/.waysplit/");

  unsetenv("HOME");
  assert_cmpstr(settings_t::config_path(), "/tmp/waysplit/");

  setenv("WAYSPLIT_HOME", home.c_str(), 1);
}

void testDefaults()
{
  settings_t::ref settings = emptySettings::get();

  assert(settings->verbose);
  assert(settings->output.empty());

  setenv("WAYSPLIT_OUTPUT", "envout.osm", 1);
  static_cast<emptySettings *>(settings.get())->defs();
  assert_cmpstr(settings->output, "envout.osm");

  // an explicitly set value is kept
  settings->output = "other.osm";
  static_cast<emptySettings *>(settings.get())->defs();
  assert_cmpstr(settings->output, "other.osm");

  unsetenv("WAYSPLIT_OUTPUT");
  settings = emptySettings::get();
  static_cast<emptySettings *>(settings.get())->defs();
  assert_cmpstr(settings->output, DEFAULT_OUTPUT);
}

void testSaveLoad()
{
  settings_t::ref settings = emptySettings::get();

  // nothing saved yet
  assert(!static_cast<emptySettings *>(settings.get())->ld());

  settings->base_path = "/srv/osm data";
  settings->output = "result & more.osm";
  settings->verbose = false;
  assert(settings->save());

  settings_t::ref loaded = emptySettings::get();
  assert(static_cast<emptySettings *>(loaded.get())->ld());
  assert_cmpstr(loaded->base_path, settings->base_path);
  assert_cmpstr(loaded->output, settings->output);
  assert(!loaded->verbose);

  // empty strings are not stored
  settings->base_path.clear();
  settings->verbose = true;
  assert(settings->save());

  loaded = emptySettings::get();
  assert(static_cast<emptySettings *>(loaded.get())->ld());
  assert(loaded->base_path.empty());
  assert_cmpstr(loaded->output, settings->output);
  assert(loaded->verbose);

  unlink((settings_t::config_path() + SETTINGS_FILE).c_str());
}

} // namespace

int main()
{
  char tmpl[] = "/tmp/waysplit_settings_XXXXXX";
  const char *home = mkdtemp(tmpl);
  assert(home != nullptr);
  setenv("WAYSPLIT_HOME", home, 1);

  testRef();
  testConfigPath(home);
  testDefaults();
  testSaveLoad();

  rmdir(home);

  return 0;
}
