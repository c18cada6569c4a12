#pragma once

#include "chunk.h"
#include "coordinate_key.h"

namespace panegrid {

// Size of one chunk in world units. The canvas origin is the top-left of chunk (0, 0).
struct ChunkGrid {
  float chunk_width = 0.0f;
  float chunk_height = 0.0f;
};

// Chunk containing the world-space point. Points on a shared edge belong to the
// chunk with the larger coordinate; out-of-range points saturate at the grid edge.
[[nodiscard]] ChunkCoord chunk_at(const ChunkGrid& grid, Vec2 world);

// World-space position of the chunk's top-left corner
[[nodiscard]] Vec2 chunk_origin(const ChunkGrid& grid, ChunkCoord coord);

// Position of a world-space point relative to the chunk that contains it
[[nodiscard]] Vec2 to_chunk_local(const ChunkGrid& grid, Vec2 world);

} // namespace panegrid
