#pragma once

#include <cstdint>

namespace relgraph {

// Dense index of a node inside a normalized Graph's node arena.
using NodeIndex = std::int32_t;
constexpr NodeIndex kInvalidNodeIndex = -1;

// Reserved id of the node representing the analyzed source.
inline constexpr const char* kSourceNodeId = "source";

} // namespace relgraph
