#pragma once

namespace bzero {

constexpr int kDim = 20;
constexpr int kNumTiles = kDim * kDim;
constexpr int kNumPlayers = 4;

// One occupancy plane per player, followed by the legal-move plane.
constexpr int kNumPlanes = kNumPlayers + 1;
constexpr int kLegalMovePlane = kNumPlayers;

}  // namespace bzero
