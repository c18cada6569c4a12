#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunk.h"

namespace panegrid::layout {

// Axis-aligned rectangle in container-local units
struct Rect {
  float x = 0.0f;
  float y = 0.0f;
  float width = 0.0f;
  float height = 0.0f;
};

// What to do with an item that no free rectangle can hold
enum class OverflowPolicy {
  Stack,   // place it below the lowest placed item, free space untouched
  Reserve, // as Stack, and also carve its footprint out of the free space
};

// Defaults follow the pane layout of the canvas UI
constexpr Size kDefaultMinimumItemSize{100.0f, 80.0f};
constexpr float kDefaultPadding = 8.0f;
constexpr float kDefaultMargin = 16.0f;

struct PackOptions {
  Size minimum_item_size = kDefaultMinimumItemSize;
  float padding = kDefaultPadding;
  float margin = kDefaultMargin;
  OverflowPolicy overflow = OverflowPolicy::Stack;
};

struct Placement {
  std::string id;
  Rect rect;
  bool fitted = true; // false for overflow placements
};

struct PackResult {
  std::vector<Placement> placements; // in placement order (largest first)
  bool all_fit = true;
  float utilization = 0.0f; // fitted item area / container area
};

using SizeLookup = std::function<std::optional<Size>(const std::string&)>;

// MaxRects packing with the Best-Short-Side-Fit heuristic.
// Pure and deterministic: the same inputs always produce the same placements.
[[nodiscard]] PackResult pack(const std::vector<std::string>& item_ids, Size container,
                              const SizeLookup& size_lookup, const PackOptions& options = {});

// Convenience overload with sizes in a map
[[nodiscard]] PackResult pack(const std::vector<std::string>& item_ids, Size container,
                              const std::unordered_map<std::string, Size>& sizes,
                              const PackOptions& options = {});

// Largest size per item that fits the most items of at least minimum_size into
// total_size. Returns minimum_size if not even one fits.
[[nodiscard]] float fit_max_amount_evenly(float total_size, float minimum_size);

// Whether count items of minimum_size fit as a grid (cols x rows) inside the
// container after margin, with padding between neighbours.
[[nodiscard]] bool can_items_fit(size_t count, Size container,
                                 Size minimum_size = kDefaultMinimumItemSize,
                                 float padding = kDefaultPadding, float margin = kDefaultMargin);

[[nodiscard]] bool rects_overlap(const Rect& a, const Rect& b);

[[nodiscard]] bool rect_contains(const Rect& outer, const Rect& inner);

} // namespace panegrid::layout
