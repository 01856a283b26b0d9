#include "util/BoostUtil.hpp"

#include <cctype>

namespace boost_util {

std::string env_var_to_option_name(const std::string& env_name) {
  std::string name;
  name.reserve(env_name.size());
  for (char c : env_name) {
    name.push_back(c == '_' ? '-' : std::tolower(static_cast<unsigned char>(c)));
  }
  return name;
}

}  // namespace boost_util
