#include "chunk_window_manager.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <magic_enum/magic_enum.hpp>
#include <random>
#include <utility>
#include <vector>

#include "spiral.h"
#include "timing.h"

namespace panegrid {

namespace {

bool is_finite_pane(const PaneRecord& pane) {
  return std::isfinite(pane.position.x) && std::isfinite(pane.position.y) &&
         std::isfinite(pane.size.width) && std::isfinite(pane.size.height);
}

std::optional<ChunkCoord> offset_coord(ChunkCoord origin, ChunkCoord offset) {
  int64_t x = static_cast<int64_t>(origin.x) + offset.x;
  int64_t y = static_cast<int64_t>(origin.y) + offset.y;
  constexpr int64_t lo = std::numeric_limits<int>::min();
  constexpr int64_t hi = std::numeric_limits<int>::max();
  if (x < lo || x > hi || y < lo || y > hi) {
    return std::nullopt;
  }
  return ChunkCoord{static_cast<int>(x), static_cast<int>(y)};
}

} // namespace

std::string generate_uuid() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  std::uniform_int_distribution<uint64_t> dist;
  uint64_t hi = dist(engine);
  uint64_t lo = dist(engine);

  // version 4, variant 10xx
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32, (hi >> 16) & 0xFFFF,
                     hi & 0xFFFF, lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}

ChunkWindowManager::ChunkWindowManager(SpatialStorage& storage, TimeSource now, IdSource make_id)
    : storage_(storage), now_(std::move(now)), make_id_(std::move(make_id)) {
  if (!now_) {
    now_ = [] { return Clock::now(); };
  }
  if (!make_id_) {
    make_id_ = generate_uuid;
  }
}

// ============================================================================
// Window Synchronization
// ============================================================================

WindowSyncResult ChunkWindowManager::request_window(ChunkCoord origin, int render_distance) {
  WindowSyncResult result;

  if (render_distance < 0) {
    spdlog::warn("request_window: negative render distance {} treated as 0", render_distance);
    render_distance = 0;
  }

  timed_void("request_window load pass", [&] {
    for (const ChunkCoord& offset : SpiralSequence(render_distance)) {
      auto coord = offset_coord(origin, offset);
      if (!coord) {
        continue; // off the edge of the grid
      }
      auto loaded = load(*coord);
      if (!loaded.success) {
        spdlog::error("Failed to load chunk {}: {}", to_key(*coord), loaded.error);
        result.errors.push_back({*coord, loaded.error});
      } else if (loaded.status != LoadStatus::AlreadyLoaded) {
        result.loaded.push_back(*coord);
      }
    }
  });

  // Two per-axis tests: whole columns out of range first, then rows within the
  // remaining columns. Together this is "Chebyshev distance > render_distance".
  std::vector<ChunkCoord> evict;
  for (const auto& [x, column] : columns_) {
    bool column_out = std::llabs(static_cast<int64_t>(origin.x) - x) > render_distance;
    for (const auto& [y, chunk] : column) {
      if (column_out || std::llabs(static_cast<int64_t>(origin.y) - y) > render_distance) {
        evict.push_back(ChunkCoord{x, y});
      }
    }
  }

  timed_void("request_window unload pass", [&] { unload_each(evict, result); });

  spdlog::debug("request_window({}, {}): {} loaded, {} unloaded, {} errors, {} resident",
                to_key(origin), render_distance, result.loaded.size(), result.unloaded.size(),
                result.errors.size(), loaded_count_);
  return result;
}

WindowSyncResult ChunkWindowManager::unload_all() {
  WindowSyncResult result;
  unload_each(loaded_coords(), result);
  return result;
}

// ============================================================================
// Load / Unload
// ============================================================================

LoadResult ChunkWindowManager::load(ChunkCoord coord) {
  LoadResult result;
  if (is_loaded(coord)) {
    result.success = true;
    result.status = LoadStatus::AlreadyLoaded;
    return result;
  }

  Chunk chunk;
  chunk.coord = coord;
  chunk.state = ChunkState::Loading;

  auto stored = storage_.load_chunk(coord);
  if (!stored.success) {
    result.error = "storage failed to load chunk " + to_key(coord) + ": " + stored.error;
    return result;
  }

  if (stored.record) {
    ChunkRecord& record = *stored.record;
    result.status = LoadStatus::Restored;
    chunk.id = std::move(record.id);
    if (chunk.id.empty()) {
      chunk.id = make_id_();
      spdlog::warn("Chunk {} was stored without an identifier, assigned {}", to_key(coord),
                   chunk.id);
    }
    chunk.dimensions = record.dimensions;

    for (auto& pane : record.panes) {
      std::string rejected = restore_pane(chunk, pane);
      if (rejected.empty()) {
        ++result.restored_panes;
      } else {
        ++result.skipped_panes;
        spdlog::warn("Skipping pane '{}' in chunk {}: {}", pane.id, to_key(coord), rejected);
        chunk.quarantined_panes.push_back(std::move(pane));
      }
    }
  } else {
    result.status = LoadStatus::Created;
    chunk.id = make_id_();
    chunk.dimensions = default_dimensions_;
  }

  chunk.state = ChunkState::Loaded;
  chunk.last_accessed = now_();
  columns_[coord.x].emplace(coord.y, std::move(chunk));
  ++loaded_count_;

  spdlog::debug("Loaded chunk {} ({}, {} panes, {} skipped)", to_key(coord),
                magic_enum::enum_name(result.status), result.restored_panes, result.skipped_panes);
  notify(ChunkEventType::Loaded, coord);
  result.success = true;
  return result;
}

ChangeResult ChunkWindowManager::unload(ChunkCoord coord) {
  Chunk* chunk = find_mutable(coord);
  if (!chunk) {
    return {true, {}, false};
  }

  chunk->state = ChunkState::Unloading;
  auto saved = save(*chunk, false);
  if (!saved.success) {
    chunk->state = ChunkState::Loaded;
    return {false, saved.error, false};
  }

  erase(coord);
  spdlog::debug("Unloaded chunk {}", to_key(coord));
  notify(ChunkEventType::Unloaded, coord);
  return {true, {}, true};
}

// ============================================================================
// Pane Registry
// ============================================================================

ChangeResult ChunkWindowManager::mount_pane(ChunkCoord coord, PaneRecord pane) {
  Chunk* chunk = find_mutable(coord);
  if (!chunk) {
    spdlog::debug("mount_pane: chunk {} is not loaded, ignoring pane '{}'", to_key(coord), pane.id);
    return {true, {}, false};
  }
  if (pane.id.empty()) {
    return {false, "cannot mount a pane without an identifier in chunk " + to_key(coord), false};
  }
  if (auto owner = find_pane_owner(pane.id); owner && *owner != coord) {
    return {false, "pane '" + pane.id + "' is already mounted in chunk " + to_key(*owner), false};
  }

  pane.chunk = coord;
  std::optional<PaneRecord> previous;
  if (auto it = chunk->panes.find(pane.id); it != chunk->panes.end()) {
    previous = it->second;
  }
  const std::string pane_id = pane.id;
  TimePoint previous_access = chunk->last_accessed;

  // the mounted pane supersedes any quarantined record with the same identifier
  std::vector<PaneRecord> previous_quarantine = chunk->quarantined_panes;
  std::erase_if(chunk->quarantined_panes,
                [&pane_id](const PaneRecord& stale) { return stale.id == pane_id; });

  chunk->panes.insert_or_assign(pane_id, std::move(pane));
  chunk->last_accessed = now_();

  auto saved = save(*chunk, true);
  if (!saved.success) {
    if (previous) {
      chunk->panes.insert_or_assign(pane_id, std::move(*previous));
    } else {
      chunk->panes.erase(pane_id);
    }
    chunk->quarantined_panes = std::move(previous_quarantine);
    chunk->last_accessed = previous_access;
    return {false, saved.error, false};
  }

  spdlog::debug("Mounted pane '{}' in chunk {}", pane_id, to_key(coord));
  return {true, {}, true};
}

ChangeResult ChunkWindowManager::unmount_pane(const std::string& pane_id, ChunkCoord coord) {
  Chunk* chunk = find_mutable(coord);
  if (!chunk) {
    return {true, {}, false};
  }
  auto it = chunk->panes.find(pane_id);
  if (it == chunk->panes.end()) {
    spdlog::debug("unmount_pane: no pane '{}' in chunk {}", pane_id, to_key(coord));
    return {true, {}, false};
  }

  PaneRecord removed = std::move(it->second);
  chunk->panes.erase(it);
  TimePoint previous_access = chunk->last_accessed;
  chunk->last_accessed = now_();

  auto saved = save(*chunk, true);
  if (!saved.success) {
    chunk->panes.emplace(pane_id, std::move(removed));
    chunk->last_accessed = previous_access;
    return {false, saved.error, false};
  }

  spdlog::debug("Unmounted pane '{}' from chunk {}", pane_id, to_key(coord));
  return {true, {}, true};
}

bool ChunkWindowManager::update_pane(ChunkCoord coord, PaneRecord pane) {
  Chunk* chunk = find_mutable(coord);
  if (!chunk) {
    return false;
  }
  auto it = chunk->panes.find(pane.id);
  if (it == chunk->panes.end()) {
    return false;
  }
  pane.chunk = coord;
  it->second = std::move(pane);
  chunk->last_accessed = now_();
  return true;
}

ChangeResult ChunkWindowManager::persist_chunk(ChunkCoord coord) {
  Chunk* chunk = find_mutable(coord);
  if (!chunk) {
    return {true, {}, false};
  }
  auto saved = save(*chunk, true);
  if (!saved.success) {
    return {false, saved.error, false};
  }
  return {true, {}, true};
}

ArrangeResult ChunkWindowManager::arrange_chunk(ChunkCoord coord,
                                                const layout::PackOptions& options,
                                                std::optional<Size> container) {
  ArrangeResult arranged;
  Chunk* chunk = find_mutable(coord);
  if (!chunk) {
    arranged.success = true;
    return arranged;
  }

  if (!container) {
    if (!chunk->dimensions) {
      arranged.error = "chunk " + to_key(coord) + " has no dimensions to arrange within";
      return arranged;
    }
    container = Size{static_cast<float>(chunk->dimensions->first),
                     static_cast<float>(chunk->dimensions->second)};
  }

  std::vector<std::string> ids;
  ids.reserve(chunk->panes.size());
  for (const auto& [id, pane] : chunk->panes) {
    ids.push_back(id);
  }

  auto result = timed("arrange_chunk", [&] {
    return layout::pack(
        ids, *container,
        [chunk](const std::string& id) -> std::optional<Size> {
          auto it = chunk->panes.find(id);
          if (it == chunk->panes.end()) {
            return std::nullopt;
          }
          return it->second.size;
        },
        options);
  });

  auto backup = chunk->panes;
  TimePoint previous_access = chunk->last_accessed;
  for (const auto& placement : result.placements) {
    PaneRecord& pane = chunk->panes.at(placement.id);
    pane.position = Vec2{placement.rect.x, placement.rect.y};
    pane.size = Size{placement.rect.width, placement.rect.height};
  }
  chunk->last_accessed = now_();

  auto saved = save(*chunk, true);
  if (!saved.success) {
    chunk->panes = std::move(backup);
    chunk->last_accessed = previous_access;
    arranged.error = saved.error;
    return arranged;
  }

  spdlog::info("Arranged {} panes in chunk {} (all fit: {}, utilization {:.2f})",
               result.placements.size(), to_key(coord), result.all_fit, result.utilization);
  arranged.success = true;
  arranged.pack = std::move(result);
  return arranged;
}

ChangeResult ChunkWindowManager::delete_chunk(ChunkCoord coord) {
  auto deleted = storage_.delete_chunk(coord);
  if (!deleted.success) {
    return {false, "storage failed to delete chunk " + to_key(coord) + ": " + deleted.error,
            false};
  }
  if (is_loaded(coord)) {
    erase(coord);
  }
  spdlog::info("Deleted chunk {}", to_key(coord));
  notify(ChunkEventType::Deleted, coord);
  return {true, {}, deleted.found};
}

// ============================================================================
// Queries
// ============================================================================

bool ChunkWindowManager::is_loaded(ChunkCoord coord) const {
  return find_chunk(coord) != nullptr;
}

const Chunk* ChunkWindowManager::find_chunk(ChunkCoord coord) const {
  auto column = columns_.find(coord.x);
  if (column == columns_.end()) {
    return nullptr;
  }
  auto it = column->second.find(coord.y);
  return it == column->second.end() ? nullptr : &it->second;
}

const PaneRecord* ChunkWindowManager::find_pane(ChunkCoord coord, const std::string& pane_id) const {
  const Chunk* chunk = find_chunk(coord);
  if (!chunk) {
    return nullptr;
  }
  auto it = chunk->panes.find(pane_id);
  return it == chunk->panes.end() ? nullptr : &it->second;
}

std::vector<ChunkCoord> ChunkWindowManager::loaded_coords() const {
  std::vector<ChunkCoord> coords;
  coords.reserve(loaded_count_);
  for (const auto& [x, column] : columns_) {
    for (const auto& [y, chunk] : column) {
      coords.push_back(ChunkCoord{x, y});
    }
  }
  return coords;
}

size_t ChunkWindowManager::loaded_count() const {
  return loaded_count_;
}

// ============================================================================
// Internal Helpers
// ============================================================================

void ChunkWindowManager::unload_each(const std::vector<ChunkCoord>& coords,
                                     WindowSyncResult& result) {
  for (const ChunkCoord& coord : coords) {
    auto unloaded = unload(coord);
    if (!unloaded.success) {
      spdlog::error("Failed to unload chunk {}: {}", to_key(coord), unloaded.error);
      result.errors.push_back({coord, unloaded.error});
    } else if (unloaded.changed) {
      result.unloaded.push_back(coord);
    }
  }
}

Chunk* ChunkWindowManager::find_mutable(ChunkCoord coord) {
  return const_cast<Chunk*>(std::as_const(*this).find_chunk(coord));
}

std::optional<ChunkCoord> ChunkWindowManager::find_pane_owner(const std::string& pane_id) const {
  for (const auto& [x, column] : columns_) {
    for (const auto& [y, chunk] : column) {
      if (chunk.panes.contains(pane_id)) {
        return ChunkCoord{x, y};
      }
    }
  }
  return std::nullopt;
}

std::string ChunkWindowManager::restore_pane(Chunk& chunk, const PaneRecord& pane) const {
  if (pane.id.empty()) {
    return "pane record has no identifier";
  }
  if (chunk.panes.contains(pane.id)) {
    return "duplicate pane identifier within the chunk";
  }
  if (auto owner = find_pane_owner(pane.id)) {
    return "pane identifier is already mounted in chunk " + to_key(*owner);
  }
  if (!is_finite_pane(pane)) {
    return "pane geometry is not finite";
  }
  PaneRecord mounted = pane;
  if (mounted.chunk != chunk.coord) {
    spdlog::warn("Pane '{}' recorded chunk {} but is stored in {}, reassigning", pane.id,
                 to_key(pane.chunk), to_key(chunk.coord));
    mounted.chunk = chunk.coord;
  }
  chunk.panes.emplace(pane.id, std::move(mounted));
  return {};
}

StorageResult ChunkWindowManager::save(Chunk& chunk, bool loaded) {
  auto saved = storage_.save_chunk(make_record(chunk, loaded));
  if (!saved.success) {
    return {false, "storage failed to save chunk " + to_key(chunk.coord) + ": " + saved.error,
            false};
  }
  notify(ChunkEventType::Persisted, chunk.coord);
  return {true, {}, false};
}

void ChunkWindowManager::erase(ChunkCoord coord) {
  auto column = columns_.find(coord.x);
  if (column == columns_.end()) {
    return;
  }
  if (column->second.erase(coord.y) > 0) {
    --loaded_count_;
  }
  if (column->second.empty()) {
    columns_.erase(column);
  }
}

void ChunkWindowManager::notify(ChunkEventType type, ChunkCoord coord) const {
  spdlog::trace("chunk event {} at {}", magic_enum::enum_name(type), to_key(coord));
  if (listener_) {
    listener_(ChunkEvent{type, coord});
  }
}

} // namespace panegrid
