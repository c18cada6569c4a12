#pragma once

#include <filesystem>
#include <string>

#include "persist_debouncer.h"
#include "rect_packer.h"

namespace panegrid {

// Default window values
constexpr int kDefaultRenderDistance = 2;
constexpr int kDefaultChunkWidth = 1470;
constexpr int kDefaultChunkHeight = 735;

constexpr const char* kDefaultStorePath = "panegrid-store.toml";

// Viewport window configuration
struct WindowOptions {
  int renderDistance = kDefaultRenderDistance;
  int chunkWidth = kDefaultChunkWidth; // pixels, also the default arrange container
  int chunkHeight = kDefaultChunkHeight;
};

// Auto-arrange configuration
struct LayoutOptions {
  float padding = layout::kDefaultPadding;
  float margin = layout::kDefaultMargin;
  float minimumWidth = layout::kDefaultMinimumItemSize.width;
  float minimumHeight = layout::kDefaultMinimumItemSize.height;
  layout::OverflowPolicy overflow = layout::OverflowPolicy::Stack;
};

struct StorageOptions {
  std::filesystem::path path = kDefaultStorePath;
};

// Write coalescing for drag/resize
struct PersistOptions {
  int debounceMs = kDefaultPersistDebounceMs;
};

// Global options container
struct GlobalOptions {
  WindowOptions windowOptions;
  LayoutOptions layoutOptions;
  StorageOptions storageOptions;
  PersistOptions persistOptions;
};

// Get default global options
GlobalOptions get_default_global_options();

// Packer options derived from the layout section
[[nodiscard]] layout::PackOptions to_pack_options(const LayoutOptions& options);

// Result type for TOML operations
struct WriteResult {
  bool success;
  std::string error; // Set if success == false
};

struct ReadResult {
  bool success;
  std::string error;     // Set if success == false
  GlobalOptions options; // Valid if success == true
};

// Write GlobalOptions to a TOML file
WriteResult write_options_toml(const GlobalOptions& options, const std::filesystem::path& filepath);

// Read GlobalOptions from a TOML file. Missing keys keep their defaults; invalid
// values are logged and replaced by defaults.
ReadResult read_options_toml(const std::filesystem::path& filepath);

} // namespace panegrid
