#include "viewport.h"

#include <cmath>
#include <limits>

namespace panegrid {

namespace {

int floor_div(float value, float size) {
  if (!(size > 0.0f) || !std::isfinite(value)) {
    return 0;
  }
  double cell = std::floor(static_cast<double>(value) / static_cast<double>(size));
  constexpr double lo = std::numeric_limits<int>::min();
  constexpr double hi = std::numeric_limits<int>::max();
  if (cell < lo) {
    return std::numeric_limits<int>::min();
  }
  if (cell > hi) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(cell);
}

} // namespace

ChunkCoord chunk_at(const ChunkGrid& grid, Vec2 world) {
  return ChunkCoord{floor_div(world.x, grid.chunk_width), floor_div(world.y, grid.chunk_height)};
}

Vec2 chunk_origin(const ChunkGrid& grid, ChunkCoord coord) {
  return Vec2{static_cast<float>(coord.x) * grid.chunk_width,
              static_cast<float>(coord.y) * grid.chunk_height};
}

Vec2 to_chunk_local(const ChunkGrid& grid, Vec2 world) {
  Vec2 origin = chunk_origin(grid, chunk_at(grid, world));
  return Vec2{world.x - origin.x, world.y - origin.y};
}

} // namespace panegrid
