#include "argument_parser.h"

#include <charconv>
#include <cmath>
#include <iostream>
#include <optional>
#include <string_view>

namespace panegrid {

namespace {

std::optional<LogLevel> parseLogLevel(const std::string& level) {
  if (level == "trace") return LogLevel::Trace;
  if (level == "debug") return LogLevel::Debug;
  if (level == "info") return LogLevel::Info;
  if (level == "warn") return LogLevel::Warn;
  if (level == "err") return LogLevel::Err;
  if (level == "off") return LogLevel::Off;
  return std::nullopt;
}

std::optional<int> parse_int(std::string_view text) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<float> parse_float(const std::string& text) {
  try {
    size_t consumed = 0;
    float value = std::stof(text, &consumed);
    if (consumed != text.size() || !std::isfinite(value)) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// Reads the "<x> <y>" chunk coordinate pair that most commands start with.
// On failure returns nullopt and sets error.
std::optional<std::pair<int, int>> parse_coord(const std::string& cmd, int argc, char* argv[],
                                               int& i, std::string& error) {
  if (i + 1 >= argc) {
    error = cmd + " requires chunk coordinates <x> <y>";
    return std::nullopt;
  }
  auto x = parse_int(argv[i]);
  auto y = parse_int(argv[i + 1]);
  if (!x || !y) {
    error = "Invalid chunk coordinates for " + cmd + ": " + argv[i] + " " + argv[i + 1];
    return std::nullopt;
  }
  i += 2;
  return std::make_pair(*x, *y);
}

ParseResult makeError(const std::string& error) {
  ParseResult result;
  result.success = false;
  result.error = error;
  return result;
}

ParseResult makeSuccess(ParsedArgs args) {
  ParseResult result;
  result.success = true;
  result.args = std::move(args);
  return result;
}

} // namespace

ParseResult parseArgs(int argc, char* argv[]) {
  ParsedArgs args;
  int i = 1;

  // Parse options first (--option value)
  while (i < argc) {
    std::string arg = argv[i];

    // Check for help flags
    if (arg == "--help" || arg == "-h") {
      args.command = HelpCommand{};
      return makeSuccess(args);
    }

    if (arg == "--version" || arg == "-v") {
      args.command = VersionCommand{};
      return makeSuccess(args);
    }

    // Check if it's an option (starts with --)
    if (arg.rfind("--", 0) == 0) {
      std::string optionName = arg.substr(2);

      if (optionName == "logmode") {
        if (i + 1 >= argc) {
          return makeError("--logmode requires a value");
        }
        ++i;
        std::string value = argv[i];
        auto level = parseLogLevel(value);
        if (!level) {
          return makeError("Invalid log level: " + value +
                           ". Valid values: trace, debug, info, warn, err, off");
        }
        args.options.logLevel = level;
      } else if (optionName == "config") {
        if (i + 1 >= argc) {
          return makeError("--config requires a filepath");
        }
        ++i;
        args.options.configPath = argv[i];
      } else if (optionName == "store") {
        if (i + 1 >= argc) {
          return makeError("--store requires a filepath");
        }
        ++i;
        args.options.storePath = argv[i];
      } else {
        return makeError("Unknown option: --" + optionName);
      }
      ++i;
      continue;
    }

    // Not an option, must be a command
    break;
  }

  if (i >= argc) {
    return makeSuccess(args);
  }

  std::string cmd = argv[i];
  ++i;

  if (cmd == "help") {
    args.command = HelpCommand{};
  } else if (cmd == "version") {
    args.command = VersionCommand{};
  } else if (cmd == "init-config") {
    InitConfigCommand initCmd;
    if (i < argc && argv[i][0] != '-') {
      // Optional filepath argument provided
      initCmd.filepath = argv[i];
      ++i;
    }
    args.command = initCmd;
  } else if (cmd == "spiral") {
    if (i >= argc) {
      return makeError("spiral requires a render distance");
    }
    auto distance = parse_int(argv[i]);
    if (!distance || *distance < 0) {
      return makeError(std::string("Invalid render distance: ") + argv[i]);
    }
    ++i;
    args.command = SpiralCommand{*distance};
  } else if (cmd == "window") {
    std::string error;
    auto coord = parse_coord(cmd, argc, argv, i, error);
    if (!coord) {
      return makeError(error);
    }
    WindowCommand windowCmd{coord->first, coord->second, std::nullopt};
    if (i < argc) {
      auto distance = parse_int(argv[i]);
      if (!distance || *distance < 0) {
        return makeError(std::string("Invalid render distance: ") + argv[i]);
      }
      windowCmd.renderDistance = *distance;
      ++i;
    }
    args.command = windowCmd;
  } else if (cmd == "mount") {
    std::string error;
    auto coord = parse_coord(cmd, argc, argv, i, error);
    if (!coord) {
      return makeError(error);
    }
    if (i + 2 >= argc) {
      return makeError("mount requires <x> <y> <pane-id> <width> <height> [type]");
    }
    MountCommand mountCmd;
    mountCmd.x = coord->first;
    mountCmd.y = coord->second;
    mountCmd.paneId = argv[i];
    auto width = parse_float(argv[i + 1]);
    auto height = parse_float(argv[i + 2]);
    if (!width || !height) {
      return makeError("Invalid pane size for mount");
    }
    mountCmd.width = *width;
    mountCmd.height = *height;
    i += 3;
    if (i < argc) {
      mountCmd.paneType = argv[i];
      ++i;
    }
    args.command = mountCmd;
  } else if (cmd == "unmount") {
    std::string error;
    auto coord = parse_coord(cmd, argc, argv, i, error);
    if (!coord) {
      return makeError(error);
    }
    if (i >= argc) {
      return makeError("unmount requires <x> <y> <pane-id>");
    }
    args.command = UnmountCommand{coord->first, coord->second, argv[i]};
    ++i;
  } else if (cmd == "arrange") {
    std::string error;
    auto coord = parse_coord(cmd, argc, argv, i, error);
    if (!coord) {
      return makeError(error);
    }
    args.command = ArrangeCommand{coord->first, coord->second};
  } else if (cmd == "list") {
    args.command = ListCommand{};
  } else if (cmd == "delete") {
    std::string error;
    auto coord = parse_coord(cmd, argc, argv, i, error);
    if (!coord) {
      return makeError(error);
    }
    args.command = DeleteCommand{coord->first, coord->second};
  } else if (cmd == "locate") {
    if (i + 1 >= argc) {
      return makeError("locate requires a world position <x> <y>");
    }
    auto wx = parse_float(argv[i]);
    auto wy = parse_float(argv[i + 1]);
    if (!wx || !wy) {
      return makeError("Invalid world position for locate");
    }
    i += 2;
    args.command = LocateCommand{*wx, *wy};
  } else {
    return makeError("Unknown command: " + cmd);
  }

  if (i < argc) {
    return makeError("Unexpected argument after " + cmd + ": " + argv[i]);
  }
  return makeSuccess(args);
}

void printUsage() {
  std::cout << "Usage: panegrid [options] [command] [command-args]\n"
            << "\n"
            << "Options:\n"
            << "  --help, -h              Show this help message\n"
            << "  --version, -v           Show version\n"
            << "  --logmode <level>       Set log level (trace, debug, info, warn, err, off)\n"
            << "  --config <filepath>     Load configuration from a TOML file\n"
            << "  --store <filepath>      Chunk store to use (overrides [storage] path)\n"
            << "\n"
            << "Commands:\n"
            << "  init-config [filepath]  Create default configuration TOML file\n"
            << "                          (defaults to panegrid.toml in the working directory)\n"
            << "  spiral <R>              Print the chunk load order for render distance R\n"
            << "  window <x> <y> [R]      Load the window around chunk (x, y), then unload it\n"
            << "  mount <x> <y> <id> <w> <h> [type]\n"
            << "                          Mount a pane of size w x h into chunk (x, y)\n"
            << "  unmount <x> <y> <id>    Remove a pane from chunk (x, y)\n"
            << "  arrange <x> <y>         Auto-arrange the panes of chunk (x, y)\n"
            << "  list                    List every stored chunk\n"
            << "  delete <x> <y>          Delete chunk (x, y) from the store\n"
            << "  locate <wx> <wy>        Show the chunk containing a world position\n"
            << "\n"
            << "Examples:\n"
            << "  panegrid spiral 2\n"
            << "  panegrid --store canvas.toml window 0 0 1\n"
            << "  panegrid mount 0 0 note-1 300 200 text\n"
            << "  panegrid --logmode debug arrange 0 0\n"
            << "  panegrid init-config panegrid.toml\n";
}

} // namespace panegrid
