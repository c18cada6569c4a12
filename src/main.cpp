#ifdef DOCTEST_CONFIG_DISABLE

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <magic_enum/magic_enum.hpp>
#include <string>
#include <vector>

#include "argument_parser.h"
#include "chunk_window_manager.h"
#include "options.h"
#include "spiral.h"
#include "toml_storage.h"
#include "version.h"
#include "viewport.h"

namespace {

constexpr int kMaxPrintedRenderDistance = 32;

std::filesystem::path getDefaultConfigPath() {
  return std::filesystem::current_path() / "panegrid.toml";
}

} // namespace

// Helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

using namespace panegrid;

void applyLogLevel(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    spdlog::set_level(spdlog::level::trace);
    break;
  case LogLevel::Debug:
    spdlog::set_level(spdlog::level::debug);
    break;
  case LogLevel::Info:
    spdlog::set_level(spdlog::level::info);
    break;
  case LogLevel::Warn:
    spdlog::set_level(spdlog::level::warn);
    break;
  case LogLevel::Err:
    spdlog::set_level(spdlog::level::err);
    break;
  case LogLevel::Off:
    spdlog::set_level(spdlog::level::off);
    break;
  }
}

// Grid of load order numbers, top row = highest y
int runSpiral(const SpiralCommand& cmd) {
  if (cmd.renderDistance > kMaxPrintedRenderDistance) {
    spdlog::error("spiral can print render distances up to {}", kMaxPrintedRenderDistance);
    return 1;
  }
  int side = 2 * cmd.renderDistance + 1;
  std::vector<std::vector<size_t>> order(static_cast<size_t>(side),
                                         std::vector<size_t>(static_cast<size_t>(side), 0));
  size_t step = 1;
  for (const ChunkCoord& offset : SpiralSequence(cmd.renderDistance)) {
    auto row = static_cast<size_t>(cmd.renderDistance - offset.y);
    auto col = static_cast<size_t>(offset.x + cmd.renderDistance);
    order[row][col] = step++;
  }

  int width = static_cast<int>(std::to_string(step - 1).size()) + 1;
  for (const auto& row : order) {
    for (size_t value : row) {
      std::cout << std::setw(width) << value;
    }
    std::cout << "\n";
  }
  return 0;
}

void printSync(const WindowSyncResult& sync) {
  for (const auto& coord : sync.loaded) {
    std::cout << "loaded   " << to_key(coord) << "\n";
  }
  for (const auto& coord : sync.unloaded) {
    std::cout << "unloaded " << to_key(coord) << "\n";
  }
  for (const auto& error : sync.errors) {
    std::cout << "error    " << to_key(error.coord) << ": " << error.message << "\n";
  }
}

// Loads a single chunk, runs action on it, and writes it back
template <typename F>
int withChunk(ChunkWindowManager& manager, ChunkCoord coord, F&& action) {
  auto loaded = manager.load(coord);
  if (!loaded.success) {
    spdlog::error("{}", loaded.error);
    return 1;
  }
  int code = action();
  auto flushed = manager.unload_all();
  if (!flushed.errors.empty()) {
    return 1;
  }
  return code;
}

int runStoreCommand(const Command& command, SpatialStorage& storage, const GlobalOptions& options) {
  ChunkWindowManager manager(storage);
  manager.set_default_dimensions(
      std::make_pair(options.windowOptions.chunkWidth, options.windowOptions.chunkHeight));

  return std::visit(
      overloaded{
          [&](const WindowCommand& cmd) {
            int distance = cmd.renderDistance.value_or(options.windowOptions.renderDistance);
            auto sync = manager.request_window(ChunkCoord{cmd.x, cmd.y}, distance);
            printSync(sync);
            std::cout << manager.loaded_count() << " chunks resident\n";
            auto flushed = manager.unload_all();
            return sync.errors.empty() && flushed.errors.empty() ? 0 : 1;
          },
          [&](const MountCommand& cmd) {
            ChunkCoord coord{cmd.x, cmd.y};
            return withChunk(manager, coord, [&] {
              PaneRecord pane;
              pane.id = cmd.paneId;
              pane.type = cmd.paneType;
              pane.size = Size{cmd.width, cmd.height};
              auto mounted = manager.mount_pane(coord, pane);
              if (!mounted.success) {
                spdlog::error("{}", mounted.error);
                return 1;
              }
              if (!mounted.changed) {
                return 1;
              }
              std::cout << "mounted " << cmd.paneId << " in " << to_key(coord) << "\n";
              return 0;
            });
          },
          [&](const UnmountCommand& cmd) {
            ChunkCoord coord{cmd.x, cmd.y};
            return withChunk(manager, coord, [&] {
              auto removed = manager.unmount_pane(cmd.paneId, coord);
              if (!removed.success) {
                spdlog::error("{}", removed.error);
                return 1;
              }
              if (!removed.changed) {
                std::cout << "no pane " << cmd.paneId << " in " << to_key(coord) << "\n";
                return 1;
              }
              std::cout << "unmounted " << cmd.paneId << " from " << to_key(coord) << "\n";
              return 0;
            });
          },
          [&](const ArrangeCommand& cmd) {
            ChunkCoord coord{cmd.x, cmd.y};
            return withChunk(manager, coord, [&] {
              auto arranged = manager.arrange_chunk(coord, to_pack_options(options.layoutOptions));
              if (!arranged.success) {
                spdlog::error("{}", arranged.error);
                return 1;
              }
              if (!arranged.pack) {
                return 1;
              }
              const auto& result = *arranged.pack;
              for (const auto& placement : result.placements) {
                std::cout << placement.id << " at (" << placement.rect.x << ", " << placement.rect.y
                          << ") size " << placement.rect.width << "x" << placement.rect.height
                          << (placement.fitted ? "" : " [overflow]") << "\n";
              }
              std::cout << "all fit: " << (result.all_fit ? "yes" : "no")
                        << ", utilization: " << result.utilization << "\n";
              return 0;
            });
          },
          [&](const ListCommand&) {
            auto listed = storage.list_all_chunks();
            if (!listed.success) {
              spdlog::error("{}", listed.error);
              return 1;
            }
            std::sort(listed.records.begin(), listed.records.end(),
                      [](const ChunkRecord& a, const ChunkRecord& b) { return a.coord < b.coord; });
            for (const auto& record : listed.records) {
              std::cout << to_key(record.coord) << "  " << record.id << "  " << record.panes.size()
                        << " panes\n";
            }
            return 0;
          },
          [&](const DeleteCommand& cmd) {
            auto deleted = manager.delete_chunk(ChunkCoord{cmd.x, cmd.y});
            if (!deleted.success) {
              spdlog::error("{}", deleted.error);
              return 1;
            }
            std::cout << (deleted.changed ? "deleted " : "nothing stored at ")
                      << to_key(ChunkCoord{cmd.x, cmd.y}) << "\n";
            return 0;
          },
          [](const auto&) { return 0; },
      },
      command);
}

int main(int argc, char* argv[]) {
  // Flush spdlog on info-level messages to ensure immediate output
  spdlog::flush_on(spdlog::level::info);

  // Parse command-line arguments
  auto result = parseArgs(argc, argv);
  if (!result.success) {
    spdlog::error("{}", result.error);
    printUsage();
    return 1;
  }

  // Apply log level if specified
  if (result.args.options.logLevel) {
    applyLogLevel(*result.args.options.logLevel);
    spdlog::debug("Log level set to {}", magic_enum::enum_name(*result.args.options.logLevel));
  }

  spdlog::debug("panegrid v{}", get_version_string());

  // Determine config path to load
  std::filesystem::path configPath;
  bool configExplicitlySpecified = false;

  if (result.args.options.configPath) {
    configPath = *result.args.options.configPath;
    configExplicitlySpecified = true;
  } else {
    configPath = getDefaultConfigPath();
  }

  auto globalOptions = get_default_global_options();

  // Load config
  if (configExplicitlySpecified || std::filesystem::exists(configPath)) {
    auto loaded = read_options_toml(configPath);
    if (loaded.success) {
      globalOptions = loaded.options;
      spdlog::info("Loaded config from: {}", configPath.string());
    } else {
      if (configExplicitlySpecified) {
        // Explicit config path failed - error out
        spdlog::error("Failed to load config: {}", loaded.error);
        return 1;
      }
      // Default config failed to load - just use defaults
      spdlog::debug("Default config not loaded: {}", loaded.error);
    }
  }

  if (result.args.options.storePath) {
    globalOptions.storageOptions.path = *result.args.options.storePath;
  }

  if (!result.args.command) {
    printUsage();
    return 0;
  }

  const Command& command = *result.args.command;

  // Commands that do not touch the store
  if (std::holds_alternative<HelpCommand>(command)) {
    printUsage();
    return 0;
  }
  if (std::holds_alternative<VersionCommand>(command)) {
    std::cout << "panegrid v" << get_version_string() << std::endl;
    return 0;
  }
  if (auto init = std::get_if<InitConfigCommand>(&command)) {
    auto targetPath = init->filepath ? std::filesystem::path(*init->filepath) : getDefaultConfigPath();
    auto written = write_options_toml(get_default_global_options(), targetPath);
    if (!written.success) {
      spdlog::error("Failed to write config: {}", written.error);
      return 1;
    }
    spdlog::info("Config written to: {}", targetPath.string());
    return 0;
  }
  if (auto spiral = std::get_if<SpiralCommand>(&command)) {
    return runSpiral(*spiral);
  }
  if (auto locate = std::get_if<LocateCommand>(&command)) {
    ChunkGrid grid{static_cast<float>(globalOptions.windowOptions.chunkWidth),
                   static_cast<float>(globalOptions.windowOptions.chunkHeight)};
    Vec2 world{locate->worldX, locate->worldY};
    Vec2 local = to_chunk_local(grid, world);
    std::cout << to_key(chunk_at(grid, world)) << " local (" << local.x << ", " << local.y
              << ")\n";
    return 0;
  }

  auto opened = TomlFileStorage::open(globalOptions.storageOptions.path);
  if (!opened.success) {
    spdlog::error("{}", opened.error);
    return 1;
  }
  spdlog::info("Using chunk store: {}", opened.storage->path().string());

  return runStoreCommand(command, *opened.storage, globalOptions);
}

#endif
