#include <settings.hh>
#include <utility>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/exceptions.hpp>
#include <boost/property_tree/ptree.hpp>
#include <stdlib.h>
#include <unistd.h>

#define FINAL_PATH "/lrudir.json"

using std::string;
using namespace boost::property_tree;

namespace lrudir {

// class SettingsImpl {{{
class Settings::SettingsImpl {
  protected:
    ptree pt;
    string config_path, given_path;
    bool hardcoded_path, loaded;
    bool get_project_path ();

  public:
    SettingsImpl() : hardcoded_path(false), loaded(false) { }
    SettingsImpl(string in) : given_path (in), hardcoded_path (true), loaded(false) { }
    bool load ();
    bool is_loaded () const { return loaded; }
    string get_path () const { return config_path; }

    template <typename T> T get (string) const;
    template <typename T> T get (string, T) const;
};
//}}}
// get_project_path {{{
bool Settings::SettingsImpl::get_project_path ()
{
  const char* home = getenv("HOME");
  string home_location   = string(home ? home : "") + "/.lrudir.json";
  string system_location = "/etc/lrudir.json";

  if (hardcoded_path) {
    config_path = given_path;                                           // First the from constructor

  } else if (home && access(home_location.c_str(), F_OK) == EXIT_SUCCESS) { // Then at home
    config_path = home_location;

  } else if (access(system_location.c_str(), F_OK) == EXIT_SUCCESS) {   // Then at /etc
    config_path = system_location;

  } else {
#ifdef LRUDIR_CONF_PATH
    config_path = string(LRUDIR_CONF_PATH) + FINAL_PATH;                // Then configure one
    return access(config_path.c_str(), F_OK) == EXIT_SUCCESS;
#else
    return false;
#endif
  }

  return true;
}
// }}}
// load {{{
// A missing configuration file is not an error, a malformed one
// throws json_parser_error.
bool Settings::SettingsImpl::load ()
{
  if (not get_project_path())
    return false;

  json_parser::read_json (config_path, pt);
  loaded = true;

  return true;
}
// }}}
// Get specializations {{{
template<> string Settings::SettingsImpl::get<string> (string str) const {
   return pt.get<string> (str.c_str());
}

template<> string Settings::SettingsImpl::get<string> (string str, string def) const {
   return pt.get<string> (str.c_str(), def);
}
 //}}}
// Settings method{{{
//
Settings::Settings() : impl (new SettingsImpl()) { }
Settings::Settings(string in) : impl (new SettingsImpl(in)) { }
Settings::Settings(const Settings& that) : impl (new SettingsImpl(*that.impl)) { }
Settings::Settings(Settings&&) = default;
Settings& Settings::operator=(Settings&&) = default;
Settings::~Settings() { }

Settings& Settings::load () & {
  impl->load ();
  return *this;
}

Settings&& Settings::load () && {
  impl->load ();
  return std::move(*this);
}

bool Settings::is_loaded () const { return impl->is_loaded (); }
string Settings::get_path () const { return impl->get_path (); }

template<> string Settings::get (string str) const {
  return impl->get<string>(str);
}

template<> string Settings::get (string str, string def) const {
  return impl->get<string>(str, def);
}
// }}}

} /* namespace lrudir */
