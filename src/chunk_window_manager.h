#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "chunk.h"
#include "coordinate_key.h"
#include "rect_packer.h"
#include "storage.h"

namespace panegrid {

enum class LoadStatus {
  AlreadyLoaded, // nothing fetched, nothing changed
  Restored,      // adopted the persisted chunk
  Created,       // nothing persisted, fresh identifier
};

struct LoadResult {
  bool success = false;
  std::string error; // Set if success == false
  LoadStatus status = LoadStatus::AlreadyLoaded;
  size_t restored_panes = 0;
  size_t skipped_panes = 0; // pane records that failed to restore, kept in quarantine
};

// changed is false when the call was a no-op (chunk not loaded, no such pane)
struct ChangeResult {
  bool success = false;
  std::string error; // Set if success == false
  bool changed = false;
};

struct ArrangeResult {
  bool success = false;
  std::string error;                      // Set if success == false
  std::optional<layout::PackResult> pack; // nullopt if the chunk is not loaded
};

struct WindowError {
  ChunkCoord coord;
  std::string message;
};

// Outcome of one request_window call. Loads are listed in the order performed.
struct WindowSyncResult {
  std::vector<ChunkCoord> loaded;
  std::vector<ChunkCoord> unloaded;
  std::vector<WindowError> errors;
};

enum class ChunkEventType { Loaded, Unloaded, Persisted, Deleted };

struct ChunkEvent {
  ChunkEventType type;
  ChunkCoord coord;
};

using ChunkListener = std::function<void(const ChunkEvent&)>;
using TimeSource = std::function<TimePoint()>;
using IdSource = std::function<std::string()>;

// Random RFC 4122 version 4 UUID string
[[nodiscard]] std::string generate_uuid();

// Keeps the set of materialized chunks in step with the viewport.
//
// The manager owns every loaded chunk and its panes; the storage owns a chunk once it
// has been unloaded. Operations are not synchronized: callers must not interleave
// two operations on the same coordinate. Storage failures are reported, never thrown,
// and leave the loaded set as it was before the call.
class ChunkWindowManager {
public:
  explicit ChunkWindowManager(SpatialStorage& storage, TimeSource now = {}, IdSource make_id = {});

  // Load every chunk within Chebyshev distance render_distance of origin (innermost
  // ring first), then unload every loaded chunk outside it.
  WindowSyncResult request_window(ChunkCoord origin, int render_distance);

  // Unload every loaded chunk, e.g. before shutdown
  WindowSyncResult unload_all();

  // Stored panes that cannot be mounted are skipped and kept in quarantine, so the
  // next save writes them back unchanged.
  [[nodiscard]] LoadResult load(ChunkCoord coord);

  // Persist the chunk as unloaded, then drop it. Unchanged if it was not loaded.
  [[nodiscard]] ChangeResult unload(ChunkCoord coord);

  // Unchanged (and creates nothing) if the chunk is not loaded.
  [[nodiscard]] ChangeResult mount_pane(ChunkCoord coord, PaneRecord pane);

  // Unchanged if the chunk is not loaded or has no such pane.
  [[nodiscard]] ChangeResult unmount_pane(const std::string& pane_id, ChunkCoord coord);

  // Replace the attributes of a mounted pane in memory only. Pair with a
  // (debounced) persist_chunk.
  [[nodiscard]] bool update_pane(ChunkCoord coord, PaneRecord pane);

  // Write-through of the chunk's current state. Unchanged if not loaded.
  [[nodiscard]] ChangeResult persist_chunk(ChunkCoord coord);

  // Pack the chunk's panes, write the placements back into them and persist.
  // container defaults to the chunk's dimensions.
  [[nodiscard]] ArrangeResult arrange_chunk(ChunkCoord coord,
                                            const layout::PackOptions& options = {},
                                            std::optional<Size> container = std::nullopt);

  // Remove the chunk from memory (without saving) and from storage.
  // changed tells whether anything was stored.
  [[nodiscard]] ChangeResult delete_chunk(ChunkCoord coord);

  [[nodiscard]] bool is_loaded(ChunkCoord coord) const;
  [[nodiscard]] const Chunk* find_chunk(ChunkCoord coord) const;
  [[nodiscard]] const PaneRecord* find_pane(ChunkCoord coord, const std::string& pane_id) const;
  [[nodiscard]] std::vector<ChunkCoord> loaded_coords() const;
  [[nodiscard]] size_t loaded_count() const;

  // Dimensions given to chunks that are created fresh
  void set_default_dimensions(std::optional<std::pair<int, int>> dimensions) {
    default_dimensions_ = dimensions;
  }

  void set_listener(ChunkListener listener) {
    listener_ = std::move(listener);
  }

private:
  void unload_each(const std::vector<ChunkCoord>& coords, WindowSyncResult& result);
  Chunk* find_mutable(ChunkCoord coord);
  std::optional<ChunkCoord> find_pane_owner(const std::string& pane_id) const;
  // Empty if the pane was mounted, otherwise the reason it was rejected
  std::string restore_pane(Chunk& chunk, const PaneRecord& pane) const;
  StorageResult save(Chunk& chunk, bool loaded);
  void erase(ChunkCoord coord);
  void notify(ChunkEventType type, ChunkCoord coord) const;

  SpatialStorage& storage_;
  TimeSource now_;
  IdSource make_id_;
  ChunkListener listener_;
  std::optional<std::pair<int, int>> default_dimensions_;

  // loaded chunks by x column, then y
  std::map<int, std::map<int, Chunk>> columns_;
  size_t loaded_count_ = 0;
};

} // namespace panegrid
