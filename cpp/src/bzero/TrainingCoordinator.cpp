#include "bzero/TrainingCoordinator.hpp"

#include "bzero/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <mutex>
#include <string>
#include <string_view>

namespace bzero {

namespace {

// Round number of a "model_<round>.pt" file name, or -1 for any other name.
round_t parse_checkpoint_round(const std::string& filename) {
  constexpr std::string_view kPrefix = "model_";
  constexpr std::string_view kSuffix = ".pt";
  if (!filename.starts_with(kPrefix) || !filename.ends_with(kSuffix)) return -1;

  std::string_view digits(filename);
  digits = digits.substr(kPrefix.size(), digits.size() - kPrefix.size() - kSuffix.size());
  auto is_digit = [](unsigned char c) { return std::isdigit(c) != 0; };
  if (digits.empty() || !std::ranges::all_of(digits, is_digit)) return -1;

  round_t round = -1;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), round);
  return ec == std::errc() ? round : -1;
}

// params.initial_round, or one past the newest checkpoint in models_dir if that is later.
round_t first_unused_round(const TrainingCoordinator::Params& params) {
  namespace fs = boost::filesystem;

  round_t round = params.initial_round;
  boost::system::error_code ec;
  if (!fs::is_directory(params.models_dir, ec)) return round;

  for (const fs::directory_entry& entry : fs::directory_iterator(params.models_dir)) {
    round_t existing = parse_checkpoint_round(entry.path().filename().string());
    round = std::max(round, existing + 1);
  }
  if (round != params.initial_round) {
    LOG_WARN("{} already holds checkpoints up to round {}; starting at round {}",
             params.models_dir.string(), round - 1, round);
  }
  return round;
}

}  // namespace

TrainingCoordinator::TrainingCoordinator(const Params& params,
                                         std::unique_ptr<Predictor> predictor,
                                         ReplayBuffer& buffer)
    : params_(params),
      buffer_(buffer),
      predictor_(std::move(predictor)),
      stats_writer_(params.stats_path),
      round_(first_unused_round(params)) {}

void TrainingCoordinator::train(int steps) {
  if (steps <= 0) {
    throw InvalidStateError("Invalid number of training steps: {}", steps);
  }

  std::unique_lock lock(model_mutex_);
  round_t round = round_.load();
  LOG_INFO("Training round {} ({} steps, batch_size={}, buffer_size={})", round, steps,
           params_.batch_size, buffer_.size());

  for (int step = 0; step < steps; ++step) {
    LOG_INFO("Training step: {}", step);
    TrainingBatch batch = buffer_.sample(params_.batch_size);
    Losses losses = predictor_->train_step(batch);
    LOG_DEBUG("loss={} value_loss={} policy_loss={}", losses.loss, losses.value_loss,
              losses.policy_loss);
    stats_writer_.append(
      {round, losses.loss, losses.value_loss, losses.policy_loss, buffer_.size()});
  }

  boost::filesystem::path path = checkpoint_path(round);
  if (path.has_parent_path()) {
    boost::filesystem::create_directories(path.parent_path());
  }
  predictor_->save_checkpoint(path);
  round_.store(round + 1);
  LOG_INFO("Completed training round {}, saved {}", round, path.string());
}

Prediction TrainingCoordinator::predict(const BoardTensor& board) const {
  std::shared_lock lock(model_mutex_);
  return predictor_->predict(board);
}

boost::filesystem::path TrainingCoordinator::checkpoint_path(round_t round) const {
  return params_.models_dir / std::format("model_{}.pt", round);
}

std::vector<TrainingStatsRow> TrainingCoordinator::stats_rows() const {
  std::shared_lock lock(model_mutex_);
  return stats_writer_.rows();
}

}  // namespace bzero
