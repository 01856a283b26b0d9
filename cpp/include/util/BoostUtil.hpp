#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>

#include <format>
#include <functional>
#include <string>

namespace boost_util {

/*
 * env_var_to_option_name("BUFFER_CAPACITY") -> "buffer-capacity"
 *
 * Lower-cases the name and replaces underscores with dashes.
 */
std::string env_var_to_option_name(const std::string& env_name);

namespace program_options {

/*
 * default_value("{:.4g}", &x) registers *dest as the default, using fmt to render it in --help.
 */
template <typename T>
auto default_value(std::format_string<T> fmt, T* dest) {
  T t = *dest;
  std::string s = std::format(fmt, t);
  return boost::program_options::value<T>(dest)->default_value(t, s);
}

struct Settings {
  static inline bool help_full = false;
};

/*
 * Wraps boost::program_options::options_description, tracking option names and one-letter
 * abbreviations in the type so that clashes fail to compile:
 *
 * po2::options_description desc("server");
 * return desc
 *     .add_option<"port", 'p'>(po::value<int>(&port), "listen port")
 *     .add_hidden_option<"max-connections">(...);
 *
 * Each call returns a new object of a new type; all of them share the same underlying
 * descriptions.
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = std::integer_sequence<int>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;

  using base_t = boost::program_options::options_description;

  options_description(const char* name);

  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  // Shown only by --help-full. No abbreviation.
  template <util::StringLiteral StrLit, typename... Ts>
  auto add_hidden_option(Ts&&... ts);

  /*
   * Adds --foo and --no-foo. --help lists only the one that changes *flag from its current value;
   * --help-full lists both.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  void print(std::ostream& s) const;

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.print(s);
    return s;
  }

  // Includes hidden options.
  const base_t& get() const { return *full_base_; }

 private:
  options_description(base_t* full_base, base_t* base) : full_base_(full_base), base_(base) {}

  // Returns the extended type, with name_ set to the boost option name ("foo" or "foo,f").
  template <util::StringLiteral StrLit, char Char = ' '>
  auto augment() const;

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  base_t* full_base_;  // shared, never freed
  base_t* base_;       // full_base_ minus hidden options
  std::string name_;
};

/*
 * Parses ts (argc, argv) against desc, which is either a boost or a boost_util
 * options_description. Parse errors are rethrown as util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

using env_name_mapper_t = std::function<std::string(const std::string&)>;

// (option name, error message)
using env_error_handler_t = std::function<void(const std::string&, const std::string&)>;

/*
 * Like parse_args(), but also reads environment variables. env_mapper maps an environment variable
 * name to the option it sets, or to "" to skip it. The command line wins over the environment.
 *
 * An environment value that fails to parse is passed to on_env_error and then dropped, leaving the
 * option as if the variable were unset. Command-line errors still throw.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args_and_env(const T& desc,
                                                         const env_name_mapper_t& env_mapper,
                                                         const env_error_handler_t& on_env_error,
                                                         Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
