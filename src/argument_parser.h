#pragma once

#include <optional>
#include <string>
#include <variant>

namespace panegrid {

// ===== Command Structs =====
struct HelpCommand {}; // --help or -h

struct VersionCommand {};

struct InitConfigCommand {
  std::optional<std::string> filepath; // Empty = use default (panegrid.toml in cwd)
};

// Print the spiral load order for a render distance
struct SpiralCommand {
  int renderDistance = 0;
};

// Sync a window around a chunk against the store and report what moved
struct WindowCommand {
  int x = 0;
  int y = 0;
  std::optional<int> renderDistance; // Empty = from config
};

struct MountCommand {
  int x = 0;
  int y = 0;
  std::string paneId;
  float width = 0.0f;
  float height = 0.0f;
  std::string paneType = "note";
};

struct UnmountCommand {
  int x = 0;
  int y = 0;
  std::string paneId;
};

struct ArrangeCommand {
  int x = 0;
  int y = 0;
};

struct ListCommand {};

struct DeleteCommand {
  int x = 0;
  int y = 0;
};

// Which chunk a world-space point falls in
struct LocateCommand {
  float worldX = 0.0f;
  float worldY = 0.0f;
};

// Variant holding all possible commands
using Command = std::variant<HelpCommand, VersionCommand, InitConfigCommand, SpiralCommand,
                             WindowCommand, MountCommand, UnmountCommand, ArrangeCommand,
                             ListCommand, DeleteCommand, LocateCommand>;

// ===== CLI Options =====
enum class LogLevel { Trace, Debug, Info, Warn, Err, Off };

struct CliOptions {
  std::optional<LogLevel> logLevel;      // --logmode <level>
  std::optional<std::string> configPath; // --config <filepath>
  std::optional<std::string> storePath;  // --store <filepath>
};

// ===== Parsed Arguments =====
struct ParsedArgs {
  CliOptions options;
  std::optional<Command> command; // nullopt if no command specified
};

// ===== Parser Result =====
struct ParseResult {
  bool success;
  std::string error; // Set if success == false
  ParsedArgs args;
};

// Parse command-line arguments
ParseResult parseArgs(int argc, char* argv[]);

// Print usage information to stdout
void printUsage();

} // namespace panegrid
