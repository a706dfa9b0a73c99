#include <state.hh>
#include <exception.hh>
#include <utils.hh>

#include <sstream>
#include <boost/optional.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/exceptions.hpp>
#include <boost/property_tree/ptree.hpp>

using std::string;
using namespace boost::property_tree;

namespace lrudir {

// read_state {{{
State read_state (const string& dir)
{
 const string path = join_path (dir, LRUDIR_STATE_FILE);

 string data;
 try {
  data = read_file (path);

 } catch (NotFound&) {
  throw NotACache (dir + " has no " LRUDIR_STATE_FILE " file");
 }

 ptree pt;
 std::istringstream in (data);
 try {
  json_parser::read_json (in, pt);

 } catch (json_parser_error& e) {
  throw NotACache (path + " is not valid JSON: " + e.what ());
 }

 //! Must be an object: strings carry data, arrays carry unnamed children
 if (not pt.data ().empty ())
  throw NotACache (path + " does not hold a JSON object");

 for (auto& child : pt) {
  if (child.first.empty ())
   throw NotACache (path + " does not hold a JSON object");
 }

 State state;
 boost::optional<ptree&> version = pt.get_child_optional ("version");

 if (version) {
  boost::optional<int> v = version->get_value_optional<int> ();
  if (not v)
   throw NotACache (path + " has a malformed version");

  state.version = *v;
 }

 return state;
}
// }}}
// write_state {{{
void write_state (const string& dir, const State& state, mode_t mode)
{
 ptree pt;
 pt.put ("version", state.version);

 std::ostringstream out;
 json_parser::write_json (out, pt);

 write_file (join_path (dir, LRUDIR_STATE_FILE), out.str (), mode);
}
// }}}

} /* namespace lrudir */
