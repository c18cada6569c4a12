#include "options.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <toml++/toml.hpp>

namespace panegrid {

namespace {

std::string overflow_to_string(layout::OverflowPolicy policy) {
  std::string name{magic_enum::enum_name(policy)};
  for (auto& c : name) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return name;
}

std::optional<float> read_float(const toml::table& section, std::string_view key) {
  if (auto value = section[key].as_floating_point()) {
    double v = value->get();
    if (std::isfinite(v) && std::fabs(v) > std::numeric_limits<float>::max()) {
      return std::nullopt;
    }
    return static_cast<float>(v);
  }
  if (auto value = section[key].as_integer()) {
    return static_cast<float>(value->get());
  }
  return std::nullopt;
}

std::optional<int> read_int(const toml::table& section, std::string_view key) {
  if (auto value = section[key].as_integer()) {
    return static_cast<int>(value->get());
  }
  return std::nullopt;
}

} // anonymous namespace

GlobalOptions get_default_global_options() {
  return GlobalOptions{};
}

layout::PackOptions to_pack_options(const LayoutOptions& options) {
  layout::PackOptions pack;
  pack.padding = options.padding;
  pack.margin = options.margin;
  pack.minimum_item_size = Size{options.minimumWidth, options.minimumHeight};
  pack.overflow = options.overflow;
  return pack;
}

WriteResult write_options_toml(const GlobalOptions& options, const std::filesystem::path& filepath) {
  try {
    toml::table root;

    // Build window section
    toml::table window;
    window.insert("render_distance", options.windowOptions.renderDistance);
    window.insert("chunk_width", options.windowOptions.chunkWidth);
    window.insert("chunk_height", options.windowOptions.chunkHeight);
    root.insert("window", window);

    // Build layout section
    toml::table arrange;
    arrange.insert("padding", options.layoutOptions.padding);
    arrange.insert("margin", options.layoutOptions.margin);
    arrange.insert("minimum_width", options.layoutOptions.minimumWidth);
    arrange.insert("minimum_height", options.layoutOptions.minimumHeight);
    arrange.insert("overflow", overflow_to_string(options.layoutOptions.overflow));
    root.insert("layout", arrange);

    // Build storage section
    toml::table storage;
    storage.insert("path", options.storageOptions.path.string());
    root.insert("storage", storage);

    // Build persist section
    toml::table persist;
    persist.insert("debounce_ms", options.persistOptions.debounceMs);
    root.insert("persist", persist);

    // Write to file
    std::ofstream file(filepath);
    if (!file) {
      return {false, "Failed to open file for writing: " + filepath.string()};
    }
    file << root << "\n";
    return {true, ""};
  } catch (const std::exception& e) {
    return {false, std::string("Error writing TOML: ") + e.what()};
  }
}

ReadResult read_options_toml(const std::filesystem::path& filepath) {
  try {
    auto tbl = toml::parse_file(filepath.string());
    GlobalOptions options;

    // Parse window section
    if (auto window = tbl["window"].as_table()) {
      if (auto distance = read_int(*window, "render_distance")) {
        options.windowOptions.renderDistance = *distance;
      }
      if (auto width = read_int(*window, "chunk_width")) {
        options.windowOptions.chunkWidth = *width;
      }
      if (auto height = read_int(*window, "chunk_height")) {
        options.windowOptions.chunkHeight = *height;
      }
    }

    // Validate window values
    if (options.windowOptions.renderDistance < 0) {
      spdlog::error("Invalid window.render_distance value ({}): must be non-negative. Using default.",
                    options.windowOptions.renderDistance);
      options.windowOptions.renderDistance = kDefaultRenderDistance;
    }
    if (options.windowOptions.chunkWidth <= 0 || options.windowOptions.chunkHeight <= 0) {
      spdlog::error("Invalid window chunk size ({}x{}): must be positive. Using default.",
                    options.windowOptions.chunkWidth, options.windowOptions.chunkHeight);
      options.windowOptions.chunkWidth = kDefaultChunkWidth;
      options.windowOptions.chunkHeight = kDefaultChunkHeight;
    }

    // Parse layout section
    if (auto arrange = tbl["layout"].as_table()) {
      if (auto padding = read_float(*arrange, "padding")) {
        options.layoutOptions.padding = *padding;
      }
      if (auto margin = read_float(*arrange, "margin")) {
        options.layoutOptions.margin = *margin;
      }
      if (auto width = read_float(*arrange, "minimum_width")) {
        options.layoutOptions.minimumWidth = *width;
      }
      if (auto height = read_float(*arrange, "minimum_height")) {
        options.layoutOptions.minimumHeight = *height;
      }
      if (auto overflow = (*arrange)["overflow"].as_string()) {
        auto policy =
            magic_enum::enum_cast<layout::OverflowPolicy>(overflow->get(), magic_enum::case_insensitive);
        if (policy) {
          options.layoutOptions.overflow = *policy;
        } else {
          spdlog::error("Invalid layout.overflow value '{}': expected stack or reserve. Using default.",
                        overflow->get());
        }
      }
    }

    // Validate layout values - negative spacing not allowed
    if (options.layoutOptions.padding < 0) {
      spdlog::error("Invalid layout.padding value ({}): must be non-negative. Using default.",
                    options.layoutOptions.padding);
      options.layoutOptions.padding = layout::kDefaultPadding;
    }
    if (options.layoutOptions.margin < 0) {
      spdlog::error("Invalid layout.margin value ({}): must be non-negative. Using default.",
                    options.layoutOptions.margin);
      options.layoutOptions.margin = layout::kDefaultMargin;
    }
    if (options.layoutOptions.minimumWidth <= 0 || options.layoutOptions.minimumHeight <= 0) {
      spdlog::error("Invalid layout minimum size ({}x{}): must be positive. Using default.",
                    options.layoutOptions.minimumWidth, options.layoutOptions.minimumHeight);
      options.layoutOptions.minimumWidth = layout::kDefaultMinimumItemSize.width;
      options.layoutOptions.minimumHeight = layout::kDefaultMinimumItemSize.height;
    }

    // Parse storage section
    if (auto storage = tbl["storage"].as_table()) {
      if (auto path = (*storage)["path"].as_string()) {
        options.storageOptions.path = path->get();
      }
    }

    // Parse persist section
    if (auto persist = tbl["persist"].as_table()) {
      if (auto debounce = read_int(*persist, "debounce_ms")) {
        options.persistOptions.debounceMs = *debounce;
      }
    }

    if (options.persistOptions.debounceMs < 0) {
      spdlog::error("Invalid persist.debounce_ms value ({}): must be non-negative. Using default.",
                    options.persistOptions.debounceMs);
      options.persistOptions.debounceMs = kDefaultPersistDebounceMs;
    }

    return {true, "", options};
  } catch (const toml::parse_error& e) {
    return {false, std::string("TOML parse error: ") + e.what(), {}};
  } catch (const std::exception& e) {
    return {false, std::string("Error reading TOML: ") + e.what(), {}};
  }
}

} // namespace panegrid
