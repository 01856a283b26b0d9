#include "bzero/TorchPredictor.hpp"

#include "bzero/Exceptions.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <vector>

namespace bzero {

namespace {

constexpr int kPolicyFilters = 2;
constexpr int kValueFilters = 1;
constexpr int kValueHidden = 64;

torch::nn::Conv2dOptions conv_options(int in, int out, int kernel) {
  return torch::nn::Conv2dOptions(in, out, kernel).padding(kernel / 2).bias(false);
}

}  // namespace

ResidualBlockImpl::ResidualBlockImpl(int width) {
  conv1 = register_module("conv1", torch::nn::Conv2d(conv_options(width, width, 3)));
  bn1 = register_module("bn1", torch::nn::BatchNorm2d(width));
  conv2 = register_module("conv2", torch::nn::Conv2d(conv_options(width, width, 3)));
  bn2 = register_module("bn2", torch::nn::BatchNorm2d(width));
}

torch::Tensor ResidualBlockImpl::forward(const torch::Tensor& x) {
  torch::Tensor y = torch::relu(bn1(conv1(x)));
  y = bn2(conv2(y));
  return torch::relu(y + x);
}

BlokusNetImpl::BlokusNetImpl(int width, int num_blocks) {
  stem = register_module(
    "stem", torch::nn::Sequential(torch::nn::Conv2d(conv_options(kNumPlanes, width, 3)),
                                  torch::nn::BatchNorm2d(width), torch::nn::ReLU()));

  blocks = register_module("blocks", torch::nn::Sequential());
  for (int i = 0; i < num_blocks; ++i) {
    blocks->push_back(ResidualBlock(width));
  }

  policy_head = register_module(
    "policy_head",
    torch::nn::Sequential(torch::nn::Conv2d(conv_options(width, kPolicyFilters, 1)),
                          torch::nn::BatchNorm2d(kPolicyFilters), torch::nn::ReLU(),
                          torch::nn::Flatten(),
                          torch::nn::Linear(kPolicyFilters * kNumTiles, kNumTiles)));

  value_head = register_module(
    "value_head",
    torch::nn::Sequential(torch::nn::Conv2d(conv_options(width, kValueFilters, 1)),
                          torch::nn::BatchNorm2d(kValueFilters), torch::nn::ReLU(),
                          torch::nn::Flatten(),
                          torch::nn::Linear(kValueFilters * kNumTiles, kValueHidden),
                          torch::nn::ReLU(), torch::nn::Linear(kValueHidden, kNumPlayers)));
}

std::tuple<torch::Tensor, torch::Tensor> BlokusNetImpl::forward(const torch::Tensor& x) {
  torch::Tensor y = stem->forward(x);
  if (!blocks->is_empty()) {
    y = blocks->forward(y);
  }
  return std::make_tuple(policy_head->forward(y), value_head->forward(y));
}

TorchPredictor::TorchPredictor(const Params& params)
    : device_(resolve_device(params.device)), net_(params.width, params.num_blocks) {
  if (!params.initial_model.empty()) {
    load_checkpoint(params.initial_model);
  }
  net_->to(device_);
  net_->eval();
  optimizer_ = std::make_unique<torch::optim::Adam>(
    net_->parameters(), torch::optim::AdamOptions(params.learning_rate));
  LOG_INFO("TorchPredictor: width={} blocks={} device={}", params.width, params.num_blocks,
           device_.str());
}

Prediction TorchPredictor::predict(const BoardTensor& board) {
  torch::NoGradGuard no_grad;

  float* data = const_cast<float*>(board.data());
  torch::Tensor input =
    torch::from_blob(data, {1, kNumPlanes, kDim, kDim}, torch::kFloat32).to(device_);
  auto [policy, value] = net_->forward(input);
  policy = policy.to(torch::kCPU).contiguous();
  value = value.to(torch::kCPU).contiguous();

  Prediction prediction;
  std::copy_n(policy.data_ptr<float>(), kNumTiles, prediction.policy.data());
  std::copy_n(value.data_ptr<float>(), kNumPlayers, prediction.value.data());
  return prediction;
}

Losses TorchPredictor::train_step(const TrainingBatch& batch) {
  int64_t b = batch.size();
  auto as_tensor = [&](const float* data, std::vector<int64_t> shape) {
    return torch::from_blob(const_cast<float*>(data), shape, torch::kFloat32).to(device_);
  };
  torch::Tensor states = as_tensor(batch.states(), {b, kNumPlanes, kDim, kDim});
  torch::Tensor policy_target = as_tensor(batch.policies(), {b, kNumTiles});
  torch::Tensor value_target = as_tensor(batch.values(), {b, kNumPlayers});

  net_->train();
  optimizer_->zero_grad();
  auto [policy_logits, values] = net_->forward(states);

  torch::Tensor policy_loss =
    -(policy_target * torch::log_softmax(policy_logits, /*dim=*/1)).sum(1).mean();
  torch::Tensor value_loss = torch::mse_loss(values, value_target);
  torch::Tensor loss = policy_loss + value_loss;

  loss.backward();
  optimizer_->step();
  net_->eval();

  Losses losses;
  losses.loss = loss.item<float>();
  losses.value_loss = value_loss.item<float>();
  losses.policy_loss = policy_loss.item<float>();
  return losses;
}

void TorchPredictor::save_checkpoint(const boost::filesystem::path& path) {
  try {
    torch::save(net_, path.string());
  } catch (const c10::Error& e) {
    throw util::Exception("Failed to save checkpoint {}: {}", path.string(),
                          e.what_without_backtrace());
  }
}

void TorchPredictor::load_checkpoint(const boost::filesystem::path& path) {
  if (!boost::filesystem::exists(path)) {
    throw ConfigError("Checkpoint not found: {}", path.string());
  }
  try {
    torch::load(net_, path.string(), device_);
  } catch (const c10::Error& e) {
    throw ConfigError("Failed to load checkpoint {}: {}", path.string(),
                      e.what_without_backtrace());
  }
  net_->eval();
  LOG_INFO("Loaded checkpoint {}", path.string());
}

torch::Device TorchPredictor::resolve_device(const std::string& name) {
  if (name.empty()) {
    return torch::cuda::is_available() ? torch::Device(torch::kCUDA) : torch::Device(torch::kCPU);
  }
  try {
    return torch::Device(name);
  } catch (const c10::Error& e) {
    throw ConfigError("Invalid device \"{}\": {}", name, e.what_without_backtrace());
  }
}

}  // namespace bzero
