#include "util/EigenUtil.hpp"

namespace eigen_util {

template <concepts::FTensor Tensor>
auto reverse(const Tensor& tensor, int dim) {
  using Sizes = Tensor::Dimensions;
  constexpr int N = Sizes::count;
  static_assert(N > 0);

  Eigen::array<bool, N> rev;
  rev.fill(false);
  rev[dim] = true;
  return tensor.reverse(rev);
}

template <typename TensorT>
typename TensorT::Scalar sum(const TensorT& tensor) {
  using Scalar = typename TensorT::Scalar;
  Eigen::TensorFixedSize<Scalar, Eigen::Sizes<>, Eigen::RowMajor> out = tensor.sum();
  return out(0);
}

template <concepts::FTensor Tensor>
int count(const Tensor& tensor) {
  int c = 0;
  for (int i = 0; i < tensor.size(); ++i) {
    c += bool(tensor.data()[i]);
  }
  return c;
}

template <concepts::FTensor Tensor>
int argmax(const Tensor& tensor) {
  const auto* data = tensor.data();
  int best = 0;
  for (int i = 1; i < tensor.size(); ++i) {
    if (data[i] > data[best]) best = i;
  }
  return best;
}

}  // namespace eigen_util
