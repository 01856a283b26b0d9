#include "util/BoostUtil.hpp"
#include "util/EigenUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"
#include "util/SocketUtil.hpp"

#include <boost/json.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <arpa/inet.h>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <sys/socket.h>
#include <vector>
#include <unistd.h>

TEST(Random, uniform_sample) {
  util::Random::set_seed(1);
  std::mt19937 prng = util::Random::make_prng();

  std::array<int, 5> counts = {};
  constexpr int N = 50000;
  for (int i = 0; i < N; ++i) {
    int k = util::Random::uniform_sample(prng, 3, 8);
    ASSERT_GE(k, 3);
    ASSERT_LT(k, 8);
    counts[k - 3]++;
  }
  for (int c : counts) {
    EXPECT_LT(std::abs(c * 1.0 / N - 0.2), 0.01);
  }

  EXPECT_THROW(util::Random::uniform_sample(prng, 4, 4), util::Exception);
}

TEST(Random, coin_flip) {
  util::Random::set_seed(1);
  std::mt19937 prng = util::Random::make_prng();

  constexpr int N = 50000;
  int heads = 0;
  for (int i = 0; i < N; ++i) {
    heads += util::Random::coin_flip(prng);
  }
  EXPECT_LT(std::abs(heads * 1.0 / N - 0.5), 0.01);
}

TEST(Random, weighted_sample_n) {
  util::Random::set_seed(1);
  std::mt19937 prng = util::Random::make_prng();

  std::array<int, 4> weights = {1, 0, 3, 4};
  constexpr int N = 80000;
  std::vector<int> picks =
    util::Random::weighted_sample_n(prng, weights.begin(), weights.end(), N);
  ASSERT_EQ((int)picks.size(), N);

  std::array<int, 4> counts = {};
  for (int k : picks) counts[k]++;

  EXPECT_EQ(counts[1], 0);
  EXPECT_LT(std::abs(counts[0] * 1.0 / N - 1.0 / 8), 0.01);
  EXPECT_LT(std::abs(counts[2] * 1.0 / N - 3.0 / 8), 0.01);
  EXPECT_LT(std::abs(counts[3] * 1.0 / N - 4.0 / 8), 0.01);
}

TEST(Random, make_prng_is_reproducible) {
  util::Random::set_seed(7);
  std::mt19937 a = util::Random::make_prng();
  util::Random::set_seed(7);
  std::mt19937 b = util::Random::make_prng();
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(a(), b());
  }
}

TEST(eigen_util, reverse) {
  constexpr int M = 3;
  constexpr int N = 4;
  using Tensor = eigen_util::FTensor<Eigen::Sizes<3, 4>>;

  Tensor tensor;
  tensor.setValues({{0, 1, 2, 3}, {4, 5, 6, 7}, {8, 9, 10, 11}});

  Tensor cols_reversed = eigen_util::reverse(tensor, 1);
  Tensor rows_reversed = eigen_util::reverse(tensor, 0);

  for (int i = 0; i < M; ++i) {
    for (int j = 0; j < N; ++j) {
      EXPECT_EQ(cols_reversed(i, j), tensor(i, N - 1 - j));
      EXPECT_EQ(rows_reversed(i, j), tensor(M - 1 - i, j));
    }
  }
}

TEST(eigen_util, reverse_inner_dim_of_rank3) {
  using Tensor = eigen_util::FTensor<Eigen::Sizes<2, 2, 3>>;

  Tensor tensor;
  tensor.setZero();
  tensor(1, 0, 0) = 1;

  Tensor reversed = eigen_util::reverse(tensor, 2);
  EXPECT_EQ(reversed(1, 0, 2), 1);
  EXPECT_EQ(eigen_util::count(reversed), 1);
}

TEST(eigen_util, sum_count_argmax) {
  using Tensor = eigen_util::FTensor<Eigen::Sizes<2, 3>>;

  Tensor tensor;
  tensor.setValues({{0, 2, 0}, {5, 0, 5}});

  EXPECT_EQ(eigen_util::sum(tensor), 12);
  EXPECT_EQ(eigen_util::count(tensor), 3);
  EXPECT_EQ(eigen_util::argmax(tensor), 3);
}

TEST(BoostUtil, env_var_to_option_name) {
  EXPECT_EQ(boost_util::env_var_to_option_name("BUFFER_CAPACITY"), "buffer-capacity");
  EXPECT_EQ(boost_util::env_var_to_option_name("PORT"), "port");
  EXPECT_EQ(boost_util::env_var_to_option_name("NN_WIDTH"), "nn-width");
}

TEST(BoostUtil, parse_args_and_env) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  int alpha = 0;
  int beta = 0;
  int gamma = 3;
  po2::options_description raw_desc("test");
  auto desc = raw_desc.template add_option<"alpha">(po::value<int>(&alpha))
                .template add_option<"beta">(po::value<int>(&beta))
                .template add_option<"gamma">(po::value<int>(&gamma)->default_value(gamma));

  setenv("BZERO_TEST_ALPHA", "11", 1);
  setenv("BZERO_TEST_BETA", "22", 1);
  auto mapper = [](const std::string& name) -> std::string {
    if (name == "BZERO_TEST_ALPHA") return "alpha";
    if (name == "BZERO_TEST_BETA") return "beta";
    return "";
  };

  const char* argv[] = {"prog", "--beta", "5"};
  auto fail = [](const std::string& option, const std::string& error) {
    FAIL() << option << ": " << error;
  };
  po::variables_map vm = po2::parse_args_and_env(desc, mapper, fail, 3, argv);
  unsetenv("BZERO_TEST_ALPHA");
  unsetenv("BZERO_TEST_BETA");

  EXPECT_EQ(alpha, 11);  // from the environment
  EXPECT_EQ(beta, 5);    // command line wins
  EXPECT_EQ(gamma, 3);
  EXPECT_EQ(vm.count("alpha"), 1u);
}

TEST(BoostUtil, parse_args_and_env_drops_bad_environment_values) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  int alpha = 0;
  int beta = 7;
  int gamma = 0;
  po2::options_description raw_desc("test");
  auto desc = raw_desc.template add_option<"alpha">(po::value<int>(&alpha))
                .template add_option<"beta">(po::value<int>(&beta)->default_value(beta))
                .template add_option<"gamma">(po::value<int>(&gamma));

  setenv("BZERO_TEST_ALPHA", "eleven", 1);
  setenv("BZERO_TEST_BETA", "2.5", 1);
  setenv("BZERO_TEST_GAMMA", "4", 1);
  auto mapper = [](const std::string& name) -> std::string {
    if (name == "BZERO_TEST_ALPHA") return "alpha";
    if (name == "BZERO_TEST_BETA") return "beta";
    if (name == "BZERO_TEST_GAMMA") return "gamma";
    return "";
  };
  std::vector<std::string> bad;
  auto collect = [&](const std::string& option, const std::string&) { bad.push_back(option); };

  const char* argv[] = {"prog"};
  po::variables_map vm = po2::parse_args_and_env(desc, mapper, collect, 1, argv);
  unsetenv("BZERO_TEST_ALPHA");
  unsetenv("BZERO_TEST_BETA");
  unsetenv("BZERO_TEST_GAMMA");

  std::sort(bad.begin(), bad.end());
  EXPECT_EQ(bad, (std::vector<std::string>{"alpha", "beta"}));
  EXPECT_EQ(vm.count("alpha"), 0u);
  EXPECT_EQ(alpha, 0);
  EXPECT_EQ(beta, 7);
  EXPECT_TRUE(vm["beta"].defaulted());
  EXPECT_EQ(gamma, 4);
}

TEST(BoostUtil, parse_args_rejects_unknown_option) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  int alpha = 0;
  po2::options_description raw_desc("test");
  auto desc = raw_desc.template add_option<"alpha">(po::value<int>(&alpha));

  const char* argv[] = {"prog", "--bogus", "1"};
  EXPECT_THROW(po2::parse_args(desc, 3, argv), util::CleanException);
}

class SocketPairTest : public testing::Test {
 protected:
  void SetUp() override {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    a_ = io::Socket::get_instance(fds[0]);
    b_ = io::Socket::get_instance(fds[1]);
  }

  void TearDown() override {
    if (a_) io::Socket::destroy(a_);
    if (b_) io::Socket::destroy(b_);
  }

  io::Socket* a_ = nullptr;
  io::Socket* b_ = nullptr;
};

TEST_F(SocketPairTest, json_round_trip) {
  boost::json::object msg;
  msg["type"] = "check";
  msg["values"] = boost::json::array{1, 2, 3};
  a_->json_write(msg);
  a_->json_write(boost::json::object{{"type", "second"}});

  boost::json::value received;
  ASSERT_TRUE(b_->json_read(&received));
  EXPECT_EQ(received.at("type").as_string(), "check");
  EXPECT_EQ(received.at("values").as_array().size(), 3u);

  ASSERT_TRUE(b_->json_read(&received));
  EXPECT_EQ(received.at("type").as_string(), "second");
}

TEST_F(SocketPairTest, length_prefix_is_big_endian) {
  a_->json_write(boost::json::value("ab"));  // serializes to "\"ab\"", 4 bytes

  uint8_t header[4];
  ASSERT_TRUE(b_->read(header, 4));
  EXPECT_EQ(header[0], 0);
  EXPECT_EQ(header[1], 0);
  EXPECT_EQ(header[2], 0);
  EXPECT_EQ(header[3], 4);
}

TEST_F(SocketPairTest, malformed_payload_keeps_stream_in_sync) {
  const char garbage[] = "{not json";
  uint32_t length = htonl(sizeof(garbage) - 1);
  a_->write(&length, sizeof(length));
  a_->write(garbage, sizeof(garbage) - 1);
  a_->json_write(boost::json::object{{"ok", true}});

  boost::json::value received;
  EXPECT_THROW(b_->json_read(&received), io::MalformedMessageError);
  ASSERT_TRUE(b_->json_read(&received));
  EXPECT_TRUE(received.at("ok").as_bool());
}

TEST_F(SocketPairTest, read_returns_false_after_peer_closes) {
  io::Socket::destroy(a_);
  a_ = nullptr;

  boost::json::value received;
  EXPECT_FALSE(b_->json_read(&received));
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
