#include "bzero/BasicTypes.hpp"
#include "bzero/Constants.hpp"
#include "bzero/Exceptions.hpp"
#include "bzero/GameRecord.hpp"
#include "bzero/ReplayBuffer.hpp"
#include "bzero/TargetBuilder.hpp"
#include "bzero/TorchPredictor.hpp"
#include "bzero/TrainingTypes.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <boost/filesystem.hpp>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace bzero;

namespace fs = boost::filesystem;

namespace {

TorchPredictor::Params small_params() {
  TorchPredictor::Params params;
  params.width = 8;
  params.num_blocks = 1;
  params.device = "cpu";
  return params;
}

GameRecord::sptr make_game(int num_moves) {
  std::vector<Move> history;
  std::vector<SparsePolicy> policies;
  for (int i = 0; i < num_moves; ++i) {
    history.push_back(Move{player_index_t(i % kNumPlayers), tile_index_t(3 * i)});
    policies.push_back(SparsePolicy{ActionProb{tile_index_t(3 * i), 0.75f},
                                    ActionProb{tile_index_t(3 * i + 1), 0.25f}});
  }
  ValueArray scores;
  scores << 1, -1, 0.5, -0.5;
  return GameRecord::make(std::move(history), std::move(policies), scores);
}

BoardTensor sample_board() {
  return TargetBuilder::build(*make_game(12), 8, false, false).state;
}

}  // namespace

TEST(TorchPredictor, prediction_is_finite_and_deterministic) {
  TorchPredictor predictor(small_params());
  EXPECT_TRUE(predictor.device().is_cpu());

  BoardTensor board = sample_board();
  Prediction a = predictor.predict(board);
  Prediction b = predictor.predict(board);

  for (int i = 0; i < kNumTiles; ++i) {
    EXPECT_TRUE(std::isfinite(a.policy.data()[i]));
    EXPECT_EQ(a.policy.data()[i], b.policy.data()[i]);
  }
  for (int p = 0; p < kNumPlayers; ++p) {
    EXPECT_TRUE(std::isfinite(a.value[p]));
    EXPECT_EQ(a.value[p], b.value[p]);
  }
}

TEST(TorchPredictor, train_step_reports_consistent_losses) {
  util::Random::set_seed(1);
  TorchPredictor predictor(small_params());
  ReplayBuffer buffer(4);
  buffer.insert(make_game(10));

  constexpr int kSteps = 40;
  constexpr int kWindow = 5;
  float early = 0;
  float late = 0;
  for (int step = 0; step < kSteps; ++step) {
    Losses losses = predictor.train_step(buffer.sample(8));
    EXPECT_TRUE(std::isfinite(losses.loss));
    EXPECT_GE(losses.policy_loss, 0);
    EXPECT_GE(losses.value_loss, 0);
    EXPECT_NEAR(losses.loss, losses.policy_loss + losses.value_loss, 1e-4);
    if (step < kWindow) early += losses.loss;
    if (step >= kSteps - kWindow) late += losses.loss;
  }
  EXPECT_LT(late, early);
}

TEST(TorchPredictor, checkpoint_round_trip_reproduces_predictions) {
  fs::path dir = fs::temp_directory_path() / fs::unique_path("bzero-torch-%%%%-%%%%");
  fs::create_directories(dir);
  fs::path path = dir / "model_0.pt";

  util::Random::set_seed(1);
  TorchPredictor trained(small_params());
  ReplayBuffer buffer(4);
  buffer.insert(make_game(6));
  for (int step = 0; step < 3; ++step) {
    trained.train_step(buffer.sample(4));
  }
  trained.save_checkpoint(path);
  ASSERT_TRUE(fs::exists(path));

  TorchPredictor::Params params = small_params();
  params.initial_model = path.string();
  TorchPredictor restored(params);

  BoardTensor board = sample_board();
  Prediction expected = trained.predict(board);
  Prediction actual = restored.predict(board);
  for (int i = 0; i < kNumTiles; ++i) {
    EXPECT_NEAR(expected.policy.data()[i], actual.policy.data()[i], 1e-5);
  }
  for (int p = 0; p < kNumPlayers; ++p) {
    EXPECT_NEAR(expected.value[p], actual.value[p], 1e-5);
  }

  fs::remove_all(dir);
}

TEST(TorchPredictor, missing_initial_model_is_a_config_error) {
  TorchPredictor::Params params = small_params();
  params.initial_model = "/nonexistent/bzero/model_7.pt";
  EXPECT_THROW(TorchPredictor predictor(params), ConfigError);
}

TEST(TorchPredictor, unknown_device_is_a_config_error) {
  TorchPredictor::Params params = small_params();
  params.device = "not-a-device";
  EXPECT_THROW(TorchPredictor predictor(params), ConfigError);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
