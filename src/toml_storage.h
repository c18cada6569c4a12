#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <toml++/toml.hpp>

#include "storage.h"

namespace panegrid {

// SpatialStorage backed by a single TOML document. Every chunk is a top-level
// table keyed by "{x},{y}"; each save or delete rewrites the file.
class TomlFileStorage : public SpatialStorage {
  // Only open() can name the tag, so only open() can construct
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  struct OpenResult {
    bool success = false;
    std::string error; // Set if success == false
    std::unique_ptr<TomlFileStorage> storage;
  };

  // Opens (or prepares to create) the store at path.
  // Fails if the file exists but cannot be parsed.
  [[nodiscard]] static OpenResult open(const std::filesystem::path& path);

  TomlFileStorage(PrivateTag, std::filesystem::path path, toml::table root);

  // Fails without touching the file if any text field is not valid UTF-8.
  StorageResult save_chunk(const ChunkRecord& record) override;

  StorageReadResult load_chunk(ChunkCoord coord) override;
  StorageResult has_chunk(ChunkCoord coord) override;
  StorageResult delete_chunk(ChunkCoord coord) override;
  StorageListResult list_all_chunks() override;
  StorageCoordsResult list_all_coords() override;

  [[nodiscard]] const std::filesystem::path& path() const {
    return path_;
  }

private:
  StorageResult write_file() const;

  std::filesystem::path path_;
  toml::table root_;
};

// TOML encoding of a single chunk record (the value stored under its key)
[[nodiscard]] toml::table chunk_record_to_toml(const ChunkRecord& record);

// Decoding is lenient: missing or out-of-range fields take defaults so that a damaged
// pane entry still surfaces and can be rejected by the caller instead of hiding the chunk.
[[nodiscard]] ChunkRecord chunk_record_from_toml(ChunkCoord coord, const toml::table& table);

} // namespace panegrid
