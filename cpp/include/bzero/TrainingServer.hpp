#pragma once

namespace bzero {

/*
 * Entry point of the blokus_training_server executable.
 *
 * Parses the command line and environment, initializes logging and util::Random, builds the
 * predictor, replay buffer, coordinator, round gate, facade and RPC server, and serves until
 * SIGINT or SIGTERM.
 */
struct TrainingServer {
  static int main(int ac, char* av[]);
};

}  // namespace bzero
