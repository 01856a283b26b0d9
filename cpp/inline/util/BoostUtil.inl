#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/ScreenUtil.hpp"

#include <format>

namespace boost_util {

namespace program_options {

template <typename StrSeq, util::concepts::IntSequence CharSeq>
options_description<StrSeq, CharSeq>::options_description(const char* name)
    : full_base_(new base_t(name, util::get_screen_width() - 1)),
      base_(new base_t(name, util::get_screen_width() - 1)) {}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_option(Ts&&... ts) {
  auto out = augment<StrLit, Char>();
  out.full_base_->add_options()(out.name_.c_str(), ts...);
  out.base_->add_options()(out.name_.c_str(), std::forward<Ts>(ts)...);
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_hidden_option(Ts&&... ts) {
  auto out = augment<StrLit>();
  out.full_base_->add_options()(out.name_.c_str(), std::forward<Ts>(ts)...);
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
auto options_description<StrSeq, CharSeq>::add_flag(bool* flag, const char* true_help,
                                                    const char* false_help) {
  namespace po = boost::program_options;

  auto out = augment<TrueStrLit>().template augment<FalseStrLit>();

  std::string true_text = true_help;
  std::string false_text = false_help;
  (*flag ? true_text : false_text) += " (no-op)";

  auto set_true = [&]() { return po::value(flag)->implicit_value(true)->zero_tokens(); };
  auto set_false = [&]() { return po::value(flag)->implicit_value(false)->zero_tokens(); };

  out.full_base_->add_options()(TrueStrLit.value, set_true(), true_text.c_str())(
    FalseStrLit.value, set_false(), false_text.c_str());
  if (*flag) {
    out.base_->add_options()(FalseStrLit.value, set_false(), false_text.c_str());
  } else {
    out.base_->add_options()(TrueStrLit.value, set_true(), true_text.c_str());
  }
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
auto options_description<StrSeq, CharSeq>::add(const options_description<StrSeq2, CharSeq2>& desc) {
  static_assert(util::no_overlap_v<StrSeq, StrSeq2>, "Options name clash!");
  static_assert(util::no_overlap_v<CharSeq, CharSeq2>, "Options abbreviation clash!");

  using OutT = options_description<util::concat_string_literal_sequence_t<StrSeq, StrSeq2>,
                                   util::concat_int_sequence_t<CharSeq, CharSeq2>>;

  full_base_->add(*desc.full_base_);
  base_->add(*desc.base_);
  return OutT(full_base_, base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
void options_description<StrSeq, CharSeq>::print(std::ostream& s) const {
  (Settings::help_full ? full_base_ : base_)->print(s);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
auto options_description<StrSeq, CharSeq>::augment() const {
  static_assert(!util::string_literal_sequence_contains_v<StrSeq, StrLit>, "Options name clash!");
  constexpr bool kAbbreviated = Char != ' ';
  static_assert(!kAbbreviated || !util::int_sequence_contains_v<CharSeq, int(Char)>,
                "Options abbreviation clash!");

  using OutT = options_description<
    util::concat_string_literal_sequence_t<StrSeq, util::StringLiteralSequence<StrLit>>,
    std::conditional_t<kAbbreviated,
                       util::concat_int_sequence_t<CharSeq, util::int_sequence<int(Char)>>,
                       CharSeq>>;

  OutT out(full_base_, base_);
  std::string name(StrLit.value);
  out.name_ = kAbbreviated ? std::format("{},{}", name, Char) : name;
  return out;
}

namespace detail {

template <typename T>
const T& unwrap(const T& t) {
  return t;
}

template <typename S, util::concepts::IntSequence C>
const auto& unwrap(const options_description<S, C>& t) {
  return t.get();
}

}  // namespace detail

template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(std::forward<Ts>(ts)...).options(detail::unwrap(desc)).run(),
              vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  po::notify(vm);
  return vm;
}

template <typename T, typename... Ts>
boost::program_options::variables_map parse_args_and_env(const T& desc,
                                                         const env_name_mapper_t& env_mapper,
                                                         const env_error_handler_t& on_env_error,
                                                         Ts&&... ts) {
  namespace po = boost::program_options;
  const po::options_description& base = detail::unwrap(desc);

  po::variables_map vm;
  po::parsed_options env(&base);
  try {
    // store() keeps the first non-default value it sees, so the command line goes in first.
    po::store(po::command_line_parser(std::forward<Ts>(ts)...).options(base).run(), vm);
    env = po::parse_environment(base, env_mapper);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }

  // A failed store() can leave an empty entry behind, so each variable goes into a copy of vm.
  for (const po::option& option : env.options) {
    po::parsed_options single(&base);
    single.options.push_back(option);
    po::variables_map attempt(vm);
    try {
      po::store(single, attempt);
    } catch (const po::error& e) {
      on_env_error(option.string_key, e.what());
      continue;
    }
    vm = std::move(attempt);
  }
  po::notify(vm);
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
