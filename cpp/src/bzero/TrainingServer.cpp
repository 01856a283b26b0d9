#include "bzero/TrainingServer.hpp"

#include "bzero/ReplayBuffer.hpp"
#include "bzero/RoundGate.hpp"
#include "bzero/RpcServer.hpp"
#include "bzero/ServerFacade.hpp"
#include "bzero/ServerParams.hpp"
#include "bzero/TorchPredictor.hpp"
#include "bzero/TrainingCoordinator.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <thread>
#include <unistd.h>

namespace bzero {

namespace {

// Blocks SIGINT/SIGTERM in the calling thread and in every thread it spawns afterwards, so that
// the signal is only ever observed by the sigwait() in wait_for_signal().
sigset_t block_termination_signals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  return set;
}

void wait_for_signal(sigset_t set, RpcServer* server) {
  int sig = 0;
  sigwait(&set, &sig);
  LOG_INFO("Caught signal {}, shutting down", sig);
  server->shutdown();
}

}  // namespace

int TrainingServer::main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    ServerParams params;
    util::Logging::Params log_params;
    util::Random::Params random_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args_and_env(desc, ServerParams::env_to_option_name,
                                                   ServerParams::report_env_error, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    LOG_INFO("Starting blokus training server (pid {})", getpid());
    params.dump();
    ServerParams::report_missing(vm);
    params.validate();

    TorchPredictor::Params predictor_params;
    predictor_params.width = params.nn_width;
    predictor_params.num_blocks = params.nn_blocks;
    predictor_params.learning_rate = params.learning_rate;
    predictor_params.device = params.device;
    predictor_params.initial_model = params.initial_model;

    ReplayBuffer buffer(params.buffer_capacity);

    TrainingCoordinator::Params coordinator_params;
    coordinator_params.batch_size = params.batch_size;
    coordinator_params.models_dir = params.models_dir;
    coordinator_params.stats_path = params.stats_path;
    coordinator_params.initial_round = params.initial_round;
    TrainingCoordinator coordinator(coordinator_params,
                                    std::make_unique<TorchPredictor>(predictor_params), buffer);

    RoundGate::Params gate_params;
    gate_params.games_per_round = params.games_per_round();
    gate_params.training_steps = params.training_steps;
    gate_params.training_rounds = params.training_rounds;
    RoundGate gate(gate_params, coordinator);

    ServerFacade facade(buffer, coordinator, gate);

    RpcServer::Params rpc_params;
    rpc_params.port = params.port;
    rpc_params.max_connections = params.max_connections;
    RpcServer server(rpc_params, facade);

    sigset_t signals = block_termination_signals();
    server.start();
    std::thread signal_thread(wait_for_signal, signals, &server);
    signal_thread.detach();

    server.wait();
    LOG_INFO("Training server exiting at round {}", coordinator.round());
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}

}  // namespace bzero
