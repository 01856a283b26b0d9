#include "bzero/ServerParams.hpp"

#include "bzero/Exceptions.hpp"
#include "bzero/TrainingTypes.hpp"
#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <array>
#include <cctype>

namespace bzero {

namespace {

constexpr std::array<const char*, 10> kEnvNames = {
  "PORT",           "BUFFER_CAPACITY", "LEARNING_RATE", "BATCH_SIZE", "TRAINING_STEPS",
  "NUM_CLIENTS",    "GAMES_PER_CLIENT", "TRAINING_ROUNDS", "NN_WIDTH", "NN_BLOCKS"};

constexpr std::array<const char*, 3> kRequiredEnvNames = {"PORT", "BATCH_SIZE", "TRAINING_ROUNDS"};

}  // namespace

std::string ServerParams::env_to_option_name(const std::string& env_name) {
  for (const char* name : kEnvNames) {
    if (env_name == name) {
      return boost_util::env_var_to_option_name(env_name);
    }
  }
  return "";
}

void ServerParams::report_env_error(const std::string& option_name, const std::string& error) {
  std::string env_name = option_name;
  for (char& c : env_name) {
    c = c == '-' ? '_' : std::toupper(static_cast<unsigned char>(c));
  }
  LOG_ERROR("Ignoring environment variable {}: {}", env_name, error);
}

std::vector<std::string> ServerParams::report_missing(
  const boost::program_options::variables_map& vm) {
  std::vector<std::string> missing;
  for (const char* env_name : kRequiredEnvNames) {
    std::string option = boost_util::env_var_to_option_name(env_name);
    if (!vm.count(option)) {
      LOG_ERROR("Missing required setting {} (--{})", env_name, option);
      missing.push_back(env_name);
    }
  }
  return missing;
}

void ServerParams::validate() const {
  if (port < 0 || port > 65535) throw ConfigError("Invalid port: {}", port);
  if (buffer_capacity <= 0) throw ConfigError("Invalid buffer capacity: {}", buffer_capacity);
  if (!(learning_rate > 0)) throw ConfigError("Invalid learning rate: {}", learning_rate);
  if (batch_size < 0 || batch_size > TrainingBatch::kMaxSize) {
    throw ConfigError("Invalid batch size: {} (max {})", batch_size, TrainingBatch::kMaxSize);
  }
  if (training_steps <= 0) throw ConfigError("Invalid training steps: {}", training_steps);
  if (num_clients <= 0) throw ConfigError("Invalid number of clients: {}", num_clients);
  if (games_per_client <= 0) throw ConfigError("Invalid games per client: {}", games_per_client);
  if (training_rounds < 0) throw ConfigError("Invalid training rounds: {}", training_rounds);
  if (nn_width <= 0) throw ConfigError("Invalid network width: {}", nn_width);
  if (nn_blocks < 0) throw ConfigError("Invalid number of blocks: {}", nn_blocks);
  if (initial_round < 0) throw ConfigError("Invalid initial round: {}", initial_round);
  if (max_connections <= 0) throw ConfigError("Invalid max connections: {}", max_connections);
}

void ServerParams::dump() const {
  LOG_INFO("PORT: {}", port);
  LOG_INFO("BUFFER_CAPACITY: {}", buffer_capacity);
  LOG_INFO("LEARNING_RATE: {}", learning_rate);
  LOG_INFO("BATCH_SIZE: {}", batch_size);
  LOG_INFO("TRAINING_STEPS: {}", training_steps);
  LOG_INFO("NUM_CLIENTS: {}", num_clients);
  LOG_INFO("GAMES_PER_CLIENT: {}", games_per_client);
  LOG_INFO("GAMES_PER_ROUND: {}", games_per_round());
  LOG_INFO("TRAINING_ROUNDS: {}", training_rounds);
  LOG_INFO("NN_WIDTH: {}", nn_width);
  LOG_INFO("NN_BLOCKS: {}", nn_blocks);
  LOG_INFO("models dir: {}", models_dir);
  LOG_INFO("stats path: {}", stats_path);
  LOG_INFO("initial model: {}", initial_model.empty() ? "<none>" : initial_model);
  LOG_INFO("initial round: {}", initial_round);
  LOG_INFO("device: {}", device.empty() ? "<auto>" : device);
}

}  // namespace bzero
