/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "osm.h"
#include "osm_objects.h"
#include "settings.h"
#include "split_position.h"
#include "split_way_action.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <libintl.h>
#include <libxml/parser.h>
#include <locale.h>
#include <memory>
#include <string>
#include <vector>

#include <waysplit_annotations.h>
#include <waysplit_i18n.h>

#ifndef PACKAGE
#define PACKAGE "waysplit"
#endif

#ifndef LOCALEDIR
#define LOCALEDIR "/usr/share/locale"
#endif

namespace {

void usage(const char *name)
{
  fprintf(stderr, "%s\n", static_cast<const char *>(
          trstring(_("Usage: %1 [-q] [-s] [-o OUTPUT] FILE WAY_ID SPLIT...\n"
                     "  SPLIT is node:LAT,LON or line:LAT1,LON1:LAT2,LON2:DELTA\n"
                     "  -s stores the output file as default for later runs")).arg(name)));
}

struct options_t {
  options_t() : way_id(ID_ILLEGAL), quiet(false), store(false) {}

  std::string file;
  item_id_t way_id;
  std::vector<split_polyline_at_position> splits;
  std::string output;
  bool quiet;
  bool store;
};

/**
 * @brief parse the command line
 * @returns if the arguments are valid
 */
bool parse_args(int argc, char **argv, options_t &opts)
{
  int i = 1;
  for(; i < argc && argv[i][0] == '-'; i++) {
    if(strcmp(argv[i], "-q") == 0) {
      opts.quiet = true;
    } else if(strcmp(argv[i], "-s") == 0) {
      opts.store = true;
    } else if(strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
      opts.output = argv[++i];
    } else {
      fprintf(stderr, "%s\n", static_cast<const char *>(trstring(_("Unknown option '%1'")).arg(argv[i])));
      return false;
    }
  }

  // file, way, and at least one split position
  if(argc - i < 3)
    return false;

  opts.file = argv[i++];

  char *endp;
  opts.way_id = strtoll(argv[i], &endp, 10);
  if(*endp != '\0' || opts.way_id == ID_ILLEGAL) {
    fprintf(stderr, "%s\n", static_cast<const char *>(trstring(_("Invalid way id '%1'")).arg(argv[i])));
    return false;
  }

  for(i++; i < argc; i++) {
    const std::optional<split_polyline_at_position> split = split_polyline_at_position::fromString(argv[i]);
    if(!split) {
      fprintf(stderr, "%s\n", static_cast<const char *>(trstring(_("Invalid split position '%1'")).arg(argv[i])));
      return false;
    }
    opts.splits.push_back(*split);
  }

  return true;
}

} // namespace

int main(int argc, char **argv)
{
  setlocale(LC_MESSAGES, "");
  bindtextdomain(PACKAGE, LOCALEDIR);
  bind_textdomain_codeset(PACKAGE, "UTF-8");
  textdomain(PACKAGE);

  options_t opts;
  if(!parse_args(argc, argv, opts)) {
    usage(argv[0]);
    return EINVAL;
  }

  settings_t::ref settings = settings_t::instance();
  if(!opts.output.empty())
    settings->output = opts.output;

  if((opts.quiet || !settings->verbose) && freopen("/dev/null", "w", stdout) == nullptr)
    fprintf(stderr, "unable to silence output: %s\n", strerror(errno));

  xmlInitParser();

  std::unique_ptr<osm_t> osm(osm_t::parse(settings->base_path, opts.file));
  if(!osm) {
    fprintf(stderr, "%s\n", static_cast<const char *>(trstring(_("Unable to load %1")).arg(opts.file)));
    xmlCleanupParser();
    return 1;
  }

  const trstring::native_type sanity = osm->sanity_check();
  if(!sanity.isEmpty()) {
    fprintf(stderr, "%s\n", static_cast<const char *>(sanity));
    xmlCleanupParser();
    return 1;
  }

  // the split is requested for the way as it is in the file
  const way_t *way = osm->way_by_id(opts.way_id);
  const split_way_action action(opts.splits,
                                way != nullptr ? way->first_node() : ID_ILLEGAL,
                                way != nullptr ? way->last_node() : ID_ILLEGAL);

  const new_elements_count_t count = action.new_elements_count();
  printf("split will create %u nodes and %u ways\n", count.nodes, count.ways);

  split_way_result result;
  const trstring err = action.apply(opts.way_id, *osm, *osm, result);
  if(!err.isEmpty()) {
    fprintf(stderr, "%s\n", static_cast<const char *>(err));
    xmlCleanupParser();
    return 1;
  }

  osm->apply_result(result);

  bool saved = osm->save(settings->output);

  if(saved && opts.store)
    saved = settings->save();

  xmlCleanupParser();

  return saved ? 0 : 1;
}
