#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "coordinate_key.h"

namespace panegrid {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct Vec2 {
  float x = 0.0f;
  float y = 0.0f;

  bool operator==(const Vec2&) const = default;
};

struct Size {
  float width = 0.0f;
  float height = 0.0f;

  bool operator==(const Size&) const = default;
};

struct Color {
  uint8_t r = 255;
  uint8_t g = 255;
  uint8_t b = 255;
  uint8_t a = 255;

  bool operator==(const Color&) const = default;
};

// Attributes of one pane, as mounted and as persisted with its chunk
struct PaneRecord {
  std::string id;       // unique across the whole canvas, assigned by the caller
  std::string type;     // e.g. "text", "image", "note"
  std::string content;  // opaque payload, stored verbatim
  ChunkCoord chunk;     // must equal the owning chunk's coordinate
  Vec2 position;        // chunk-local units
  Size size;            // chunk-local units
  std::string tags;
  Color color;

  bool operator==(const PaneRecord&) const = default;
};

// Durable form of a chunk, as exchanged with SpatialStorage
struct ChunkRecord {
  ChunkCoord coord;
  std::string id;
  std::vector<PaneRecord> panes;
  std::optional<std::pair<int, int>> dimensions; // pixels
  bool loaded = false;
  TimePoint last_accessed{};
};

enum class ChunkState { Unloaded, Loading, Loaded, Unloading };

// A materialized chunk owned by ChunkWindowManager
struct Chunk {
  ChunkCoord coord;
  std::string id;
  std::map<std::string, PaneRecord> panes; // pane registry, keyed by pane id
  // stored pane records that could not be mounted; written back as they were read
  std::vector<PaneRecord> quarantined_panes;
  std::optional<std::pair<int, int>> dimensions;
  ChunkState state = ChunkState::Unloaded;
  TimePoint last_accessed{};
};

// Build the persisted snapshot of a live chunk, quarantined panes included
[[nodiscard]] ChunkRecord make_record(const Chunk& chunk, bool loaded);

} // namespace panegrid
