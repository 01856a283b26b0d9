#pragma once

#include "bzero/Constants.hpp"
#include "util/EigenUtil.hpp"

#include <cstdint>

namespace bzero {

using player_index_t = int8_t;
using tile_index_t = int16_t;
using round_t = int32_t;

using BoardShape = eigen_util::Shape<kNumPlanes, kDim, kDim>;
using PolicyShape = eigen_util::Shape<kDim, kDim>;

// Occupancy planes for players 0..3, followed by the legal-move mask.
using BoardTensor = eigen_util::FTensor<BoardShape>;

// Indexed by (row, col); the flat row-major index equals the tile index.
using PolicyTensor = eigen_util::FTensor<PolicyShape>;

using ValueArray = eigen_util::FArray<kNumPlayers>;

enum spatial_axis_t : int8_t { kRowAxis = 0, kColAxis = 1 };

inline int tile_row(tile_index_t tile) { return tile / kDim; }
inline int tile_col(tile_index_t tile) { return tile % kDim; }
inline tile_index_t to_tile(int row, int col) { return row * kDim + col; }

}  // namespace bzero
