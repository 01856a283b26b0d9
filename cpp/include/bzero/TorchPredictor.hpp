#pragma once

#include "bzero/Predictor.hpp"

#include <boost/filesystem.hpp>
#include <torch/torch.h>

#include <memory>
#include <string>
#include <tuple>

namespace bzero {

struct ResidualBlockImpl : torch::nn::Module {
  explicit ResidualBlockImpl(int width);
  torch::Tensor forward(const torch::Tensor& x);

  torch::nn::Conv2d conv1{nullptr};
  torch::nn::BatchNorm2d bn1{nullptr};
  torch::nn::Conv2d conv2{nullptr};
  torch::nn::BatchNorm2d bn2{nullptr};
};
TORCH_MODULE(ResidualBlock);

/*
 * Input [B, kNumPlanes, kDim, kDim]. Outputs policy logits [B, kNumTiles] and values
 * [B, kNumPlayers].
 */
struct BlokusNetImpl : torch::nn::Module {
  BlokusNetImpl(int width, int num_blocks);
  std::tuple<torch::Tensor, torch::Tensor> forward(const torch::Tensor& x);

  torch::nn::Sequential stem{nullptr};
  torch::nn::Sequential blocks{nullptr};
  torch::nn::Sequential policy_head{nullptr};
  torch::nn::Sequential value_head{nullptr};
};
TORCH_MODULE(BlokusNet);

/*
 * libtorch implementation of Predictor: a residual convnet trained with Adam.
 *
 * policy_loss = -(target * log_softmax(logits)).sum(1).mean()
 * value_loss = mse(values, target)
 * loss = policy_loss + value_loss
 */
class TorchPredictor : public Predictor {
 public:
  struct Params {
    int width = 64;
    int num_blocks = 2;
    float learning_rate = 0.001;
    std::string device;         // empty: cuda if available, else cpu
    std::string initial_model;  // empty: fresh weights
  };

  explicit TorchPredictor(const Params& params);

  Prediction predict(const BoardTensor& board) override;
  Losses train_step(const TrainingBatch& batch) override;
  void save_checkpoint(const boost::filesystem::path& path) override;
  void load_checkpoint(const boost::filesystem::path& path) override;

  const torch::Device& device() const { return device_; }

 private:
  static torch::Device resolve_device(const std::string& name);

  torch::Device device_;
  BlokusNet net_;
  std::unique_ptr<torch::optim::Adam> optimizer_;
};

}  // namespace bzero
