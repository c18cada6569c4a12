#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "chunk.h"
#include "coordinate_key.h"

namespace panegrid {

// Result of a storage call. found carries the answer of has_chunk / delete_chunk.
struct StorageResult {
  bool success = false;
  std::string error; // Set if success == false
  bool found = false;
};

struct StorageReadResult {
  bool success = false;
  std::string error;                 // Set if success == false
  std::optional<ChunkRecord> record; // nullopt if nothing is stored at the coordinate
};

struct StorageListResult {
  bool success = false;
  std::string error; // Set if success == false
  std::vector<ChunkRecord> records;
};

struct StorageCoordsResult {
  bool success = false;
  std::string error; // Set if success == false
  std::vector<ChunkCoord> coords;
};

// Durable key/value store of chunks, keyed by chunk coordinate.
// Failures are reported in the result; a missing chunk is not a failure.
class SpatialStorage {
public:
  virtual ~SpatialStorage() = default;

  [[nodiscard]] virtual StorageReadResult load_chunk(ChunkCoord coord) = 0;

  [[nodiscard]] virtual StorageResult save_chunk(const ChunkRecord& record) = 0;

  [[nodiscard]] virtual StorageResult has_chunk(ChunkCoord coord) = 0;

  // found is false if nothing was stored at coord
  [[nodiscard]] virtual StorageResult delete_chunk(ChunkCoord coord) = 0;

  [[nodiscard]] virtual StorageListResult list_all_chunks() = 0;

  [[nodiscard]] virtual StorageCoordsResult list_all_coords();
};

// In-process storage keyed by the "{x},{y}" string, like a browser key/value store.
class MemoryStorage : public SpatialStorage {
public:
  StorageReadResult load_chunk(ChunkCoord coord) override;
  StorageResult save_chunk(const ChunkRecord& record) override;
  StorageResult has_chunk(ChunkCoord coord) override;
  StorageResult delete_chunk(ChunkCoord coord) override;
  StorageListResult list_all_chunks() override;

  [[nodiscard]] size_t size() const {
    return records_.size();
  }

private:
  std::map<std::string, ChunkRecord> records_;
};

} // namespace panegrid
