#pragma once

#include <cstdint>
#include <type_traits>

#include <Eigen/Core>
#include <unsupported/Eigen/CXX11/Tensor>

/*
 * Various util functions that make the eigen3 library more pleasant to use.
 */
namespace eigen_util {

// eigen_util::Shape<...> is a type alias for Eigen::Sizes<...>
template <int64_t... Is>
using Shape = Eigen::Sizes<Is...>;

template <typename T>
struct is_eigen_shape {
  static const bool value = false;
};
template <int64_t... Is>
struct is_eigen_shape<Eigen::Sizes<Is...>> {
  static const bool value = true;
};
template <typename T>
inline constexpr bool is_eigen_shape_v = is_eigen_shape<T>::value;

namespace concepts {

template <typename T>
concept Shape = is_eigen_shape_v<T>;

}  // namespace concepts

/*
 * FTensor is a fixed-size, row-major float tensor:
 *
 * using S = eigen_util::Shape<5, 20, 20>;
 * using T = eigen_util::FTensor<S>;
 *
 * Row-major is chosen so that the memory layout matches torch's default layout. This lets a batch
 * of FTensor's be handed to torch::from_blob() without reordering.
 */
template <concepts::Shape Shape>
using FTensor = Eigen::TensorFixedSize<float, Shape, Eigen::RowMajor>;

template <typename T>
struct is_ftensor {
  static const bool value = false;
};
template <typename Shape>
struct is_ftensor<FTensor<Shape>> {
  static const bool value = true;
};
template <typename T>
inline constexpr bool is_ftensor_v = is_ftensor<T>::value;

// FArray is a fixed-size float Eigen::Array of size N
template <int N>
using FArray = Eigen::Array<float, N, 1>;

namespace concepts {

template <typename T>
concept FTensor = is_ftensor_v<T>;

}  // namespace concepts

/*
 * Returns a lazy expression that reverses tensor along dimension dim. Assigning the result back to
 * the source tensor aliases; evaluate into a temporary first.
 */
template <concepts::FTensor Tensor>
auto reverse(const Tensor& tensor, int dim);

template <typename TensorT>
typename TensorT::Scalar sum(const TensorT& tensor);

// Number of nonzero entries.
template <concepts::FTensor Tensor>
int count(const Tensor& tensor);

// Flat (row-major) index of the max entry. Ties go to the lowest index.
template <concepts::FTensor Tensor>
int argmax(const Tensor& tensor);

}  // namespace eigen_util

#include "inline/util/EigenUtil.inl"
