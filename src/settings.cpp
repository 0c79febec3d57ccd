/*
 * SPDX-FileCopyrightText: 2026 The waysplit developers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "settings.h"

#include "misc.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <sys/stat.h>

#include <waysplit_annotations.h>
#include <waysplit_stl.h>

#define ST_ENTRY(a) std::make_pair(#a, &(a))

settings_t::ref settings_t::instance()
{
  static std::weak_ptr<settings_t> inst;
  ref settings = inst.lock();
  if (settings)
    return settings;

  settings.reset(new settings_t());
  inst = settings;

  settings->load();
  settings->setDefaults();

  return settings;
}

std::string settings_t::config_path()
{
  std::string ret;

  const char *p = getenv("WAYSPLIT_HOME");
  if(p != nullptr && *p != '\0') {
    ret = p;
  } else {
    p = getenv("HOME");
    if(p != nullptr && *p != '\0') {
      ret = p;
      if(!ends_with(ret, '/'))
        ret += '/';
      ret += ".waysplit";
    } else {
      /* if everthing fails use tmp dir */
      ret = "/tmp/waysplit";
    }
  }

  if(!ends_with(ret, '/'))
    ret += '/';

  return ret;
}

namespace {

class string_loader {
  xmlDocPtr const doc;
  xmlNode * const node;
public:
  inline string_loader(xmlDocPtr d, xmlNode *n) : doc(d), node(n) {}
  void operator()(const std::pair<const char *, std::string *> &p) const {
    if(strcmp(reinterpret_cast<const char *>(node->name), p.first) != 0)
      return;
    xmlString str(xmlNodeListGetString(doc, node->children, 1));
    if(str)
      *p.second = static_cast<const char *>(str);
    else
      p.second->clear();
  }
};

class bool_loader {
  xmlNode * const node;
public:
  explicit inline bool_loader(xmlNode *n) : node(n) {}
  void operator()(const std::pair<const char *, bool *> &p) const {
    if(strcmp(reinterpret_cast<const char *>(node->name), p.first) == 0)
      *p.second = xml_get_prop_bool(node, "value");
  }
};

} // namespace

bool settings_t::load()
{
  const std::string fname = config_path() + SETTINGS_FILE;

  struct stat st;
  if(stat(fname.c_str(), &st) != 0)
    return false;

  xmlDocGuard doc(xmlReadFile(fname.c_str(), nullptr, XML_PARSE_NONET));

  /* parse the file and get the DOM */
  if(unlikely(!doc)) {
    printf("error: could not parse file %s\n", fname.c_str());
    return false;
  }

  xmlNode *root = xmlDocGetRootElement(doc.get());
  if(unlikely(root == nullptr || strcmp(reinterpret_cast<const char *>(root->name), "settings") != 0)) {
    printf("error: %s is no settings file\n", fname.c_str());
    return false;
  }

  for(xmlNode *node = root->children; node != nullptr; node = node->next) {
    if(node->type != XML_ELEMENT_NODE)
      continue;

    std::for_each(store_str.begin(), store_str.end(), string_loader(doc.get(), node));
    std::for_each(store_bool.begin(), store_bool.end(), bool_loader(node));
  }

  return true;
}

void settings_t::setDefaults()
{
  if(output.empty()) {
    const char *p = getenv("WAYSPLIT_OUTPUT");
    if(p != nullptr && *p != '\0')
      output = p;
    else
      output = DEFAULT_OUTPUT;
  }
}

bool settings_t::save() const
{
  const std::string path = config_path();

  if(mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
    fprintf(stderr, "unable to create directory %s: %s\n", path.c_str(), strerror(errno));
    return false;
  }

  xmlDocGuard doc(xmlNewDoc(BAD_CAST "1.0"));
  xmlNodePtr root_node = xmlNewNode(nullptr, BAD_CAST "settings");
  xmlDocSetRootElement(doc.get(), root_node);

  /* store everything listed in the store tables */
  for(StringKeys::const_iterator it = store_str.begin(); it != store_str.end(); it++)
    if(!it->second->empty())
      xmlNewTextChild(root_node, nullptr, BAD_CAST it->first, BAD_CAST it->second->c_str());

  for(BooleanKeys::const_iterator it = store_bool.begin(); it != store_bool.end(); it++) {
    xmlNodePtr node = xmlNewChild(root_node, nullptr, BAD_CAST it->first, nullptr);
    xmlNewProp(node, BAD_CAST "value", BAD_CAST (*(it->second) ? "true" : "false"));
  }

  const std::string fname = path + SETTINGS_FILE;
  if(xmlSaveFormatFileEnc(fname.c_str(), doc.get(), "UTF-8", 1) < 0) {
    fprintf(stderr, "unable to write settings to %s\n", fname.c_str());
    return false;
  }

  return true;
}

settings_t::settings_t()
  : verbose(true)
  , store_str({{
                ST_ENTRY(base_path),
                ST_ENTRY(output)
  }})
  , store_bool({{
               ST_ENTRY(verbose)
  }})
{
}
