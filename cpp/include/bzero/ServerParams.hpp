#pragma once

#include "util/SocketUtil.hpp"

#include <boost/program_options.hpp>

#include <string>
#include <vector>

namespace bzero {

/*
 * Configuration of the training server.
 *
 * Every option can be set on the command line (--buffer-capacity=500) or through the environment
 * (BUFFER_CAPACITY=500). The command line wins.
 *
 * port, batch_size and training_rounds have no defaults. If unset, report_missing() logs an error
 * for each of them and startup continues: port falls back to 0 (OS-chosen), training_rounds to 0
 * (unlimited), and batch_size stays 0, which makes every training attempt fail. An environment
 * value that does not parse is logged by report_env_error() and treated as unset.
 */
struct ServerParams {
  auto make_options_description();

  // Maps an environment variable name to the option it sets, or "" if it is not one of ours.
  static std::string env_to_option_name(const std::string& env_name);

  // Error handler for boost_util::program_options::parse_args_and_env().
  static void report_env_error(const std::string& option_name, const std::string& error);

  // Logs an error for each required option absent from vm. Returns the environment-style names.
  static std::vector<std::string> report_missing(const boost::program_options::variables_map& vm);

  // Throws ConfigError for values that are set but unusable, e.g. a negative capacity.
  void validate() const;

  // Logs every value at INFO level.
  void dump() const;

  int games_per_round() const { return num_clients * games_per_client; }

  io::port_t port = 0;
  int buffer_capacity = 1000;
  float learning_rate = 0.001;
  int batch_size = 0;
  int training_steps = 10;
  int num_clients = 1;
  int games_per_client = 1;
  int training_rounds = 0;
  int nn_width = 64;
  int nn_blocks = 2;

  std::string models_dir = "models";
  std::string stats_path = "data/training_stats.csv";
  std::string initial_model;
  int initial_round = 0;
  std::string device;  // empty: cuda if available, else cpu
  int max_connections = 64;
};

}  // namespace bzero

#include "inline/bzero/ServerParams.inl"
