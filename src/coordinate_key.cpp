#include "coordinate_key.h"

#include <charconv>
#include <cstdlib>

namespace panegrid {

namespace {

std::optional<int> parse_int(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  // from_chars rejects a leading '+', which keeps keys canonical
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

int64_t chebyshev_distance(ChunkCoord a, ChunkCoord b) {
  int64_t dx = std::llabs(static_cast<int64_t>(a.x) - static_cast<int64_t>(b.x));
  int64_t dy = std::llabs(static_cast<int64_t>(a.y) - static_cast<int64_t>(b.y));
  return dx > dy ? dx : dy;
}

std::string to_key(ChunkCoord coord) {
  return std::to_string(coord.x) + "," + std::to_string(coord.y);
}

std::optional<ChunkCoord> parse_key(std::string_view key) {
  auto comma = key.find(',');
  if (comma == std::string_view::npos) {
    return std::nullopt;
  }
  auto x = parse_int(key.substr(0, comma));
  auto y = parse_int(key.substr(comma + 1));
  if (!x || !y) {
    return std::nullopt;
  }
  return ChunkCoord{*x, *y};
}

} // namespace panegrid
