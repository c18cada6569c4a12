#include "toml_storage.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <string_view>
#include <system_error>

namespace panegrid {

namespace {

template <typename T>
toml::array pair_to_array(T first, T second) {
  toml::array arr;
  arr.push_back(first);
  arr.push_back(second);
  return arr;
}

std::optional<double> number_at(const toml::array& arr, size_t index) {
  if (index >= arr.size()) {
    return std::nullopt;
  }
  if (auto f = arr[index].as_floating_point()) {
    return f->get();
  }
  if (auto i = arr[index].as_integer()) {
    return static_cast<double>(i->get());
  }
  return std::nullopt;
}

// Floats as read; nan and inf pass through, finite values beyond float range do not
std::optional<std::pair<float, float>> parse_float_pair(const toml::array* arr) {
  if (!arr || arr->size() != 2) {
    return std::nullopt;
  }
  auto a = number_at(*arr, 0);
  auto b = number_at(*arr, 1);
  if (!a || !b) {
    return std::nullopt;
  }
  constexpr double limit = std::numeric_limits<float>::max();
  for (double v : {*a, *b}) {
    if (std::isfinite(v) && std::fabs(v) > limit) {
      return std::nullopt;
    }
  }
  return std::make_pair(static_cast<float>(*a), static_cast<float>(*b));
}

// Integers only, each within [min_value, INT_MAX]
std::optional<std::pair<int, int>> parse_int_pair(const toml::array* arr,
                                                  int64_t min_value = std::numeric_limits<int>::min()) {
  if (!arr || arr->size() != 2) {
    return std::nullopt;
  }
  int values[2];
  for (size_t i = 0; i < 2; ++i) {
    auto v = (*arr)[i].as_integer();
    if (!v || v->get() < min_value || v->get() > std::numeric_limits<int>::max()) {
      return std::nullopt;
    }
    values[i] = static_cast<int>(v->get());
  }
  return std::make_pair(values[0], values[1]);
}

TimePoint time_from_ms(int64_t ms) {
  constexpr int64_t limit =
      std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::max()).count();
  if (ms > limit || ms < -limit) {
    return TimePoint{};
  }
  return TimePoint{std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds{ms})};
}

// Well-formed UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
bool is_valid_utf8(std::string_view text) {
  size_t i = 0;
  while (i < text.size()) {
    auto c = static_cast<unsigned char>(text[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }
    size_t length = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if ((c & 0xE0) == 0xC0) {
      length = 2;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      length = 3;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      length = 4;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      return false;
    }
    if (i + length > text.size()) {
      return false;
    }
    for (size_t k = 1; k < length; ++k) {
      auto next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (next & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

// Names the first text field that is not valid UTF-8, empty if all are
std::string find_invalid_text(const ChunkRecord& record) {
  if (!is_valid_utf8(record.id)) {
    return "chunk identifier";
  }
  for (size_t i = 0; i < record.panes.size(); ++i) {
    const PaneRecord& pane = record.panes[i];
    const std::pair<const char*, const std::string*> fields[] = {
        {"id", &pane.id}, {"type", &pane.type}, {"content", &pane.content}, {"tags", &pane.tags}};
    for (const auto& [name, value] : fields) {
      if (!is_valid_utf8(*value)) {
        return "pane " + std::to_string(i) + " " + name;
      }
    }
  }
  return {};
}

std::optional<Color> parse_color(const toml::array* arr) {
  if (!arr || arr->size() != 4) {
    return std::nullopt;
  }
  int64_t values[4];
  for (size_t i = 0; i < 4; ++i) {
    auto v = (*arr)[i].as_integer();
    if (!v || v->get() < 0 || v->get() > 255) {
      return std::nullopt;
    }
    values[i] = v->get();
  }
  return Color{static_cast<uint8_t>(values[0]), static_cast<uint8_t>(values[1]),
               static_cast<uint8_t>(values[2]), static_cast<uint8_t>(values[3])};
}

toml::table pane_to_toml(const PaneRecord& pane) {
  toml::table t;
  t.insert("id", pane.id);
  t.insert("type", pane.type);
  t.insert("content", pane.content);
  t.insert("chunk", pair_to_array<int64_t>(pane.chunk.x, pane.chunk.y));
  t.insert("position", pair_to_array<double>(pane.position.x, pane.position.y));
  t.insert("size", pair_to_array<double>(pane.size.width, pane.size.height));
  t.insert("tags", pane.tags);
  toml::array color;
  color.push_back(static_cast<int64_t>(pane.color.r));
  color.push_back(static_cast<int64_t>(pane.color.g));
  color.push_back(static_cast<int64_t>(pane.color.b));
  color.push_back(static_cast<int64_t>(pane.color.a));
  t.insert("color", color);
  return t;
}

PaneRecord pane_from_toml(ChunkCoord owner, const toml::table& t) {
  PaneRecord pane;
  pane.id = t["id"].value_or(std::string{});
  pane.type = t["type"].value_or(std::string{});
  pane.content = t["content"].value_or(std::string{});
  pane.tags = t["tags"].value_or(std::string{});
  pane.chunk = owner;
  if (auto chunk = parse_int_pair(t["chunk"].as_array())) {
    pane.chunk = ChunkCoord{chunk->first, chunk->second};
  } else if (t["chunk"]) {
    spdlog::warn("Pane '{}' in chunk {} has an invalid chunk coordinate, using the owner",
                 pane.id, to_key(owner));
  }
  if (auto position = parse_float_pair(t["position"].as_array())) {
    pane.position = Vec2{position->first, position->second};
  }
  if (auto size = parse_float_pair(t["size"].as_array())) {
    pane.size = Size{size->first, size->second};
  }
  if (auto color = parse_color(t["color"].as_array())) {
    pane.color = *color;
  } else if (t["color"]) {
    spdlog::warn("Pane '{}' in chunk {} has an invalid color, using default", pane.id,
                 to_key(owner));
  }
  return pane;
}

} // namespace

toml::table chunk_record_to_toml(const ChunkRecord& record) {
  toml::table t;
  t.insert("id", record.id);
  t.insert("loaded", record.loaded);
  t.insert("last_accessed_ms",
           static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                    record.last_accessed.time_since_epoch())
                                    .count()));
  if (record.dimensions) {
    t.insert("dimensions",
             pair_to_array<int64_t>(record.dimensions->first, record.dimensions->second));
  }
  toml::array panes;
  for (const auto& pane : record.panes) {
    panes.push_back(pane_to_toml(pane));
  }
  t.insert("panes", panes);
  return t;
}

ChunkRecord chunk_record_from_toml(ChunkCoord coord, const toml::table& t) {
  ChunkRecord record;
  record.coord = coord;
  record.id = t["id"].value_or(std::string{});
  record.loaded = t["loaded"].value_or(false);
  record.last_accessed = time_from_ms(t["last_accessed_ms"].value_or(int64_t{0}));
  if (auto dims = parse_int_pair(t["dimensions"].as_array(), 1)) {
    record.dimensions = dims;
  } else if (t["dimensions"]) {
    spdlog::warn("Chunk {} has invalid dimensions, ignoring them", to_key(coord));
  }
  if (auto panes = t["panes"].as_array()) {
    for (const auto& node : *panes) {
      if (auto pane_tbl = node.as_table()) {
        record.panes.push_back(pane_from_toml(coord, *pane_tbl));
      } else {
        spdlog::warn("Chunk {} has a pane entry that is not a table, skipping", to_key(coord));
      }
    }
  }
  return record;
}

TomlFileStorage::TomlFileStorage(PrivateTag, std::filesystem::path path, toml::table root)
    : path_(std::move(path)), root_(std::move(root)) {
}

TomlFileStorage::OpenResult TomlFileStorage::open(const std::filesystem::path& path) {
  OpenResult result;
  toml::table root;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    try {
      root = toml::parse_file(path.string());
    } catch (const toml::parse_error& e) {
      result.error = std::string("TOML parse error in chunk store: ") + e.what();
      return result;
    } catch (const std::exception& e) {
      result.error = std::string("Error reading chunk store: ") + e.what();
      return result;
    }
    spdlog::debug("Opened chunk store {} ({} entries)", path.string(), root.size());
  } else if (ec) {
    result.error = "Cannot access chunk store " + path.string() + ": " + ec.message();
    return result;
  } else {
    spdlog::debug("Chunk store {} does not exist yet, starting empty", path.string());
  }
  result.success = true;
  result.storage = std::make_unique<TomlFileStorage>(PrivateTag{}, path, std::move(root));
  return result;
}

StorageResult TomlFileStorage::write_file() const {
  auto tmp_path = path_;
  tmp_path += ".tmp";
  try {
    if (path_.has_parent_path()) {
      std::filesystem::create_directories(path_.parent_path());
    }
    {
      std::ofstream file(tmp_path, std::ios::trunc);
      if (!file) {
        return {false, "Failed to open file for writing: " + tmp_path.string(), false};
      }
      file << root_ << "\n";
      if (!file) {
        return {false, "Failed to write chunk store: " + tmp_path.string(), false};
      }
    }
    std::filesystem::rename(tmp_path, path_);
  } catch (const std::exception& e) {
    return {false, std::string("Error writing chunk store: ") + e.what(), false};
  }
  return {true, {}, false};
}

StorageReadResult TomlFileStorage::load_chunk(ChunkCoord coord) {
  StorageReadResult result;
  result.success = true;
  auto key = to_key(coord);
  auto entry = root_[key].as_table();
  if (!entry) {
    spdlog::trace("Chunk store: no chunk at {}", key);
    return result;
  }
  result.record = chunk_record_from_toml(coord, *entry);
  return result;
}

StorageResult TomlFileStorage::save_chunk(const ChunkRecord& record) {
  auto key = to_key(record.coord);
  if (auto field = find_invalid_text(record); !field.empty()) {
    spdlog::error("Refusing to save chunk {}: {} is not valid UTF-8", key, field);
    return {false, "chunk " + key + ": " + field + " is not valid UTF-8", false};
  }
  std::optional<toml::table> previous;
  if (auto existing = root_[key].as_table()) {
    previous = *existing;
  }
  root_.insert_or_assign(key, chunk_record_to_toml(record));

  auto written = write_file();
  if (!written.success) {
    // keep the in-memory document in step with what is on disk
    if (previous) {
      root_.insert_or_assign(key, std::move(*previous));
    } else {
      root_.erase(key);
    }
    return written;
  }
  spdlog::debug("Saved chunk at {} ({} panes)", key, record.panes.size());
  return {true, {}, false};
}

StorageResult TomlFileStorage::has_chunk(ChunkCoord coord) {
  return {true, {}, root_[to_key(coord)].is_table()};
}

StorageResult TomlFileStorage::delete_chunk(ChunkCoord coord) {
  auto key = to_key(coord);
  auto existing = root_[key].as_table();
  if (!existing) {
    return {true, {}, false};
  }
  toml::table previous = *existing;
  root_.erase(key);

  auto written = write_file();
  if (!written.success) {
    root_.insert_or_assign(key, std::move(previous));
    return written;
  }
  spdlog::debug("Deleted chunk at {}", key);
  return {true, {}, true};
}

StorageListResult TomlFileStorage::list_all_chunks() {
  StorageListResult result;
  result.success = true;
  for (auto&& [key, node] : root_) {
    auto coord = parse_key(key.str());
    auto table = node.as_table();
    if (!coord || !table) {
      spdlog::warn("Chunk store: ignoring entry '{}'", key.str());
      continue;
    }
    result.records.push_back(chunk_record_from_toml(*coord, *table));
  }
  return result;
}

StorageCoordsResult TomlFileStorage::list_all_coords() {
  StorageCoordsResult result;
  result.success = true;
  for (auto&& [key, node] : root_) {
    if (auto coord = parse_key(key.str()); coord && node.is_table()) {
      result.coords.push_back(*coord);
    }
  }
  std::sort(result.coords.begin(), result.coords.end());
  return result;
}

} // namespace panegrid
