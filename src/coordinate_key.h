#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace panegrid {

// Integer address of a chunk in the canvas grid. Any pair is valid.
struct ChunkCoord {
  int x = 0;
  int y = 0;

  auto operator<=>(const ChunkCoord&) const = default;
};

struct ChunkCoordHash {
  size_t operator()(const ChunkCoord& c) const noexcept {
    auto h1 = std::hash<int>{}(c.x);
    auto h2 = std::hash<int>{}(c.y);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

// max(|dx|, |dy|), computed in 64 bits so extreme coordinates cannot overflow
[[nodiscard]] int64_t chebyshev_distance(ChunkCoord a, ChunkCoord b);

// Storage key "{x},{y}" (decimal, no padding). Persisted data depends on this format.
[[nodiscard]] std::string to_key(ChunkCoord coord);

// Inverse of to_key. Returns nullopt for anything that is not exactly two
// comma-separated decimal integers in int range.
[[nodiscard]] std::optional<ChunkCoord> parse_key(std::string_view key);

} // namespace panegrid
