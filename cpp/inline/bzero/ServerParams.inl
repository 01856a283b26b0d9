#include "bzero/ServerParams.hpp"

#include "util/BoostUtil.hpp"

namespace bzero {

inline auto ServerParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Training server options");

  return desc
    .template add_option<"port">(po::value<io::port_t>(&port),
                                 "port to listen on (env: PORT). Required")
    .template add_option<"buffer-capacity">(
      po::value<int>(&buffer_capacity)->default_value(buffer_capacity),
      "max number of games held in the replay buffer (env: BUFFER_CAPACITY)")
    .template add_option<"learning-rate">(po2::default_value("{:.4g}", &learning_rate),
                                          "optimizer learning rate (env: LEARNING_RATE)")
    .template add_option<"batch-size">(po::value<int>(&batch_size),
                                       "training mini-batch size (env: BATCH_SIZE). Required")
    .template add_option<"training-steps">(
      po::value<int>(&training_steps)->default_value(training_steps),
      "optimizer steps per training round (env: TRAINING_STEPS)")
    .template add_option<"num-clients">(po::value<int>(&num_clients)->default_value(num_clients),
                                        "number of self-play clients (env: NUM_CLIENTS)")
    .template add_option<"games-per-client">(
      po::value<int>(&games_per_client)->default_value(games_per_client),
      "games each client plays per round (env: GAMES_PER_CLIENT)")
    .template add_option<"training-rounds">(
      po::value<int>(&training_rounds),
      "stop training after this many rounds, 0 for unlimited (env: TRAINING_ROUNDS). Required")
    .template add_option<"nn-width">(po::value<int>(&nn_width)->default_value(nn_width),
                                     "channels per residual block (env: NN_WIDTH)")
    .template add_option<"nn-blocks">(po::value<int>(&nn_blocks)->default_value(nn_blocks),
                                      "number of residual blocks (env: NN_BLOCKS)")
    .template add_option<"models-dir">(
      po::value<std::string>(&models_dir)->default_value(models_dir),
      "directory for per-round model checkpoints")
    .template add_option<"stats-path">(
      po::value<std::string>(&stats_path)->default_value(stats_path), "training statistics csv")
    .template add_option<"initial-model">(po::value<std::string>(&initial_model),
                                          "checkpoint to start from (default: fresh network)")
    .template add_option<"initial-round">(
      po::value<int>(&initial_round)->default_value(initial_round),
      "round to resume at; checkpoints are numbered from here")
    .template add_option<"device">(po::value<std::string>(&device),
                                   "torch device, e.g. cpu or cuda:0 (default: cuda if available)")
    .template add_hidden_option<"max-connections">(
      po::value<int>(&max_connections)->default_value(max_connections), "listen backlog");
}

}  // namespace bzero
