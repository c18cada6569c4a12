#include "storage.h"

#include <spdlog/spdlog.h>

namespace panegrid {

StorageCoordsResult SpatialStorage::list_all_coords() {
  StorageCoordsResult result;
  auto listed = list_all_chunks();
  if (!listed.success) {
    result.error = listed.error;
    return result;
  }
  result.coords.reserve(listed.records.size());
  for (const auto& record : listed.records) {
    result.coords.push_back(record.coord);
  }
  result.success = true;
  return result;
}

StorageReadResult MemoryStorage::load_chunk(ChunkCoord coord) {
  StorageReadResult result;
  result.success = true;
  auto it = records_.find(to_key(coord));
  if (it == records_.end()) {
    spdlog::trace("Memory storage: no chunk at {}", to_key(coord));
    return result;
  }
  result.record = it->second;
  return result;
}

StorageResult MemoryStorage::save_chunk(const ChunkRecord& record) {
  records_[to_key(record.coord)] = record;
  spdlog::trace("Memory storage: saved chunk {} with {} panes", to_key(record.coord),
                record.panes.size());
  return StorageResult{true, {}, false};
}

StorageResult MemoryStorage::has_chunk(ChunkCoord coord) {
  return StorageResult{true, {}, records_.contains(to_key(coord))};
}

StorageResult MemoryStorage::delete_chunk(ChunkCoord coord) {
  return StorageResult{true, {}, records_.erase(to_key(coord)) > 0};
}

StorageListResult MemoryStorage::list_all_chunks() {
  StorageListResult result;
  result.success = true;
  result.records.reserve(records_.size());
  for (const auto& [key, record] : records_) {
    result.records.push_back(record);
  }
  return result;
}

} // namespace panegrid
