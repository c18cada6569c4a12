#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>

#include "options.h"

using namespace panegrid;

namespace {

// Helper to create a temp file path
std::filesystem::path create_temp_file_path() {
  auto temp_dir = std::filesystem::temp_directory_path();
  auto filename = "panegrid-options-test-" +
                  std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                  ".toml";
  return temp_dir / filename;
}

// Helper to write a simple valid TOML config
void write_valid_config(const std::filesystem::path& path, int render_distance = 3,
                        float padding = 12.0f) {
  std::ofstream file(path);
  file << std::fixed << std::setprecision(1);
  file << "[window]\n";
  file << "render_distance = " << render_distance << "\n";
  file << "[layout]\n";
  file << "padding = " << padding << "\n";
}

// RAII helper to clean up temp files
struct TempFileGuard {
  std::filesystem::path path;
  explicit TempFileGuard(const std::filesystem::path& p) : path(p) {
  }
  ~TempFileGuard() {
    if (std::filesystem::exists(path)) {
      std::filesystem::remove(path);
    }
  }
};

} // namespace

// ============================================================================
// read_options_toml / write_options_toml
// ============================================================================

TEST_SUITE("options toml") {
  TEST_CASE("defaults match the canvas defaults") {
    auto options = get_default_global_options();
    CHECK(options.windowOptions.renderDistance == kDefaultRenderDistance);
    CHECK(options.windowOptions.chunkWidth == 1470);
    CHECK(options.windowOptions.chunkHeight == 735);
    CHECK(options.layoutOptions.padding == 8.0f);
    CHECK(options.layoutOptions.margin == 16.0f);
    CHECK(options.layoutOptions.minimumWidth == 100.0f);
    CHECK(options.layoutOptions.minimumHeight == 80.0f);
    CHECK(options.layoutOptions.overflow == layout::OverflowPolicy::Stack);
    CHECK(options.persistOptions.debounceMs == kDefaultPersistDebounceMs);
  }

  TEST_CASE("written options read back unchanged") {
    auto temp_path = create_temp_file_path();
    TempFileGuard guard(temp_path);

    GlobalOptions options;
    options.windowOptions.renderDistance = 4;
    options.windowOptions.chunkWidth = 1000;
    options.windowOptions.chunkHeight = 500;
    options.layoutOptions.padding = 4.0f;
    options.layoutOptions.margin = 24.0f;
    options.layoutOptions.overflow = layout::OverflowPolicy::Reserve;
    options.storageOptions.path = "canvas/store.toml";
    options.persistOptions.debounceMs = 250;

    REQUIRE(write_options_toml(options, temp_path).success);
    auto loaded = read_options_toml(temp_path);
    REQUIRE(loaded.success);

    CHECK(loaded.options.windowOptions.renderDistance == 4);
    CHECK(loaded.options.windowOptions.chunkWidth == 1000);
    CHECK(loaded.options.windowOptions.chunkHeight == 500);
    CHECK(loaded.options.layoutOptions.padding == 4.0f);
    CHECK(loaded.options.layoutOptions.margin == 24.0f);
    CHECK(loaded.options.layoutOptions.overflow == layout::OverflowPolicy::Reserve);
    CHECK(loaded.options.storageOptions.path == std::filesystem::path("canvas/store.toml"));
    CHECK(loaded.options.persistOptions.debounceMs == 250);
  }

  TEST_CASE("overflow policy is written in lowercase") {
    auto temp_path = create_temp_file_path();
    TempFileGuard guard(temp_path);

    GlobalOptions options;
    options.layoutOptions.overflow = layout::OverflowPolicy::Reserve;
    REQUIRE(write_options_toml(options, temp_path).success);

    std::ifstream file(temp_path);
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    CHECK(contents.find("reserve") != std::string::npos);
    CHECK(contents.find("Reserve") == std::string::npos);
  }

  TEST_CASE("missing sections keep defaults") {
    auto temp_path = create_temp_file_path();
    TempFileGuard guard(temp_path);
    write_valid_config(temp_path, 5, 2.0f);

    auto loaded = read_options_toml(temp_path);
    REQUIRE(loaded.success);
    CHECK(loaded.options.windowOptions.renderDistance == 5);
    CHECK(loaded.options.windowOptions.chunkWidth == kDefaultChunkWidth);
    CHECK(loaded.options.layoutOptions.padding == 2.0f);
    CHECK(loaded.options.layoutOptions.margin == layout::kDefaultMargin);
    CHECK(loaded.options.storageOptions.path == std::filesystem::path(kDefaultStorePath));
  }

  TEST_CASE("integer spacing values are accepted") {
    auto temp_path = create_temp_file_path();
    TempFileGuard guard(temp_path);
    {
      std::ofstream file(temp_path);
      file << "[layout]\n";
      file << "padding = 3\n";
      file << "margin = 0\n";
    }

    auto loaded = read_options_toml(temp_path);
    REQUIRE(loaded.success);
    CHECK(loaded.options.layoutOptions.padding == 3.0f);
    CHECK(loaded.options.layoutOptions.margin == 0.0f);
  }

  TEST_CASE("invalid values fall back to defaults") {
    auto temp_path = create_temp_file_path();
    TempFileGuard guard(temp_path);
    {
      std::ofstream file(temp_path);
      file << "[window]\n";
      file << "render_distance = -1\n";
      file << "chunk_width = 0\n";
      file << "[layout]\n";
      file << "padding = -2.0\n";
      file << "minimum_height = 0.0\n";
      file << "overflow = \"sideways\"\n";
      file << "[persist]\n";
      file << "debounce_ms = -10\n";
    }

    auto loaded = read_options_toml(temp_path);
    REQUIRE(loaded.success);
    CHECK(loaded.options.windowOptions.renderDistance == kDefaultRenderDistance);
    CHECK(loaded.options.windowOptions.chunkWidth == kDefaultChunkWidth);
    CHECK(loaded.options.windowOptions.chunkHeight == kDefaultChunkHeight);
    CHECK(loaded.options.layoutOptions.padding == layout::kDefaultPadding);
    CHECK(loaded.options.layoutOptions.minimumHeight == layout::kDefaultMinimumItemSize.height);
    CHECK(loaded.options.layoutOptions.overflow == layout::OverflowPolicy::Stack);
    CHECK(loaded.options.persistOptions.debounceMs == kDefaultPersistDebounceMs);
  }

  TEST_CASE("spacing beyond float range keeps the default") {
    auto temp_path = create_temp_file_path();
    TempFileGuard guard(temp_path);
    {
      std::ofstream file(temp_path);
      file << "[layout]\n";
      file << "padding = 1e300\n";
      file << "margin = -1e300\n";
    }

    auto loaded = read_options_toml(temp_path);
    REQUIRE(loaded.success);
    CHECK(loaded.options.layoutOptions.padding == layout::kDefaultPadding);
    CHECK(loaded.options.layoutOptions.margin == layout::kDefaultMargin);
  }

  TEST_CASE("overflow policy is case insensitive") {
    auto temp_path = create_temp_file_path();
    TempFileGuard guard(temp_path);
    {
      std::ofstream file(temp_path);
      file << "[layout]\n";
      file << "overflow = \"RESERVE\"\n";
    }

    auto loaded = read_options_toml(temp_path);
    REQUIRE(loaded.success);
    CHECK(loaded.options.layoutOptions.overflow == layout::OverflowPolicy::Reserve);
  }

  TEST_CASE("unparseable file is an error") {
    auto temp_path = create_temp_file_path();
    TempFileGuard guard(temp_path);
    {
      std::ofstream file(temp_path);
      file << "this is not valid toml {{{\n";
    }

    auto loaded = read_options_toml(temp_path);
    REQUIRE_FALSE(loaded.success);
    CHECK(loaded.error.find("TOML parse error") != std::string::npos);
  }

  TEST_CASE("missing file is an error") {
    auto loaded = read_options_toml(create_temp_file_path());
    CHECK_FALSE(loaded.success);
    CHECK(!loaded.error.empty());
  }

  TEST_CASE("to_pack_options carries every layout value") {
    LayoutOptions options;
    options.padding = 1.0f;
    options.margin = 2.0f;
    options.minimumWidth = 30.0f;
    options.minimumHeight = 40.0f;
    options.overflow = layout::OverflowPolicy::Reserve;

    auto pack = to_pack_options(options);
    CHECK(pack.padding == 1.0f);
    CHECK(pack.margin == 2.0f);
    CHECK(pack.minimum_item_size == Size{30.0f, 40.0f});
    CHECK(pack.overflow == layout::OverflowPolicy::Reserve);
  }
}

#endif // !DOCTEST_CONFIG_DISABLE
