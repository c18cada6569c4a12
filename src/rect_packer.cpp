#include "rect_packer.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace panegrid::layout {

namespace {

struct SizedItem {
  const std::string* id;
  float width;
  float height;
  float area;
};

// Remaining parts of free after taking out used: the full-height strips left and
// right of it and the full-width strips above and below it. Slivers may overlap.
void clip_free_rect(const Rect& free, const Rect& used, std::vector<Rect>& out) {
  auto push_if_positive = [&out](Rect r) {
    if (r.width > 0.0f && r.height > 0.0f) {
      out.push_back(r);
    }
  };

  if (free.x < used.x) {
    push_if_positive(Rect{free.x, free.y, used.x - free.x, free.height});
  }
  if (free.x + free.width > used.x + used.width) {
    push_if_positive(Rect{used.x + used.width, free.y,
                          (free.x + free.width) - (used.x + used.width), free.height});
  }
  if (free.y < used.y) {
    push_if_positive(Rect{free.x, free.y, free.width, used.y - free.y});
  }
  if (free.y + free.height > used.y + used.height) {
    push_if_positive(Rect{free.x, used.y + used.height, free.width,
                          (free.y + free.height) - (used.y + used.height)});
  }
}

void split_free_rects(std::vector<Rect>& free_rects, const Rect& used) {
  std::vector<Rect> next;
  next.reserve(free_rects.size() + 4);
  for (const Rect& free : free_rects) {
    if (rects_overlap(free, used)) {
      clip_free_rect(free, used, next);
    } else {
      next.push_back(free);
    }
  }
  free_rects = std::move(next);
}

// Drop every free rectangle that lies inside another one. Of two identical
// rectangles only the earlier one is kept.
void prune_free_rects(std::vector<Rect>& free_rects) {
  for (size_t i = free_rects.size(); i-- > 0;) {
    for (size_t j = free_rects.size(); j-- > 0;) {
      if (i != j && rect_contains(free_rects[j], free_rects[i])) {
        free_rects.erase(free_rects.begin() + static_cast<std::ptrdiff_t>(i));
        break;
      }
    }
  }
}

// Best-Short-Side-Fit: the free rectangle whose smaller leftover side is smallest,
// ties broken by the larger leftover side, then by list order.
std::optional<size_t> find_best_free_rect(const std::vector<Rect>& free_rects, float width,
                                          float height) {
  std::optional<size_t> best;
  float best_short = std::numeric_limits<float>::infinity();
  float best_long = std::numeric_limits<float>::infinity();

  for (size_t i = 0; i < free_rects.size(); ++i) {
    const Rect& free = free_rects[i];
    if (free.width < width || free.height < height) {
      continue;
    }
    float leftover_h = free.width - width;
    float leftover_v = free.height - height;
    float short_side = std::min(leftover_h, leftover_v);
    float long_side = std::max(leftover_h, leftover_v);
    if (short_side < best_short || (short_side == best_short && long_side < best_long)) {
      best = i;
      best_short = short_side;
      best_long = long_side;
    }
  }
  return best;
}

// Negative (or nan) spacing would let items overlap, so it is clamped to 0
PackOptions sanitize_pack_options(const PackOptions& options) {
  PackOptions opts = options;
  if (!(opts.padding >= 0.0f)) {
    spdlog::warn("pack: padding {} is invalid, using 0", opts.padding);
    opts.padding = 0.0f;
  }
  if (!(opts.margin >= 0.0f)) {
    spdlog::warn("pack: margin {} is invalid, using 0", opts.margin);
    opts.margin = 0.0f;
  }
  if (!(opts.minimum_item_size.width > 0.0f) || !(opts.minimum_item_size.height > 0.0f)) {
    spdlog::warn("pack: minimum item size {}x{} is invalid, using the default",
                 opts.minimum_item_size.width, opts.minimum_item_size.height);
    opts.minimum_item_size = kDefaultMinimumItemSize;
  }
  return opts;
}

} // namespace

bool rects_overlap(const Rect& a, const Rect& b) {
  return !(a.x >= b.x + b.width || a.x + a.width <= b.x || a.y >= b.y + b.height ||
           a.y + a.height <= b.y);
}

bool rect_contains(const Rect& outer, const Rect& inner) {
  return inner.x >= outer.x && inner.y >= outer.y &&
         inner.x + inner.width <= outer.x + outer.width &&
         inner.y + inner.height <= outer.y + outer.height;
}

PackResult pack(const std::vector<std::string>& item_ids, Size container,
                const SizeLookup& size_lookup, const PackOptions& options) {
  const PackOptions opts = sanitize_pack_options(options);
  PackResult result;
  if (item_ids.empty()) {
    return result;
  }

  std::vector<SizedItem> items;
  items.reserve(item_ids.size());
  for (const auto& id : item_ids) {
    float width = opts.minimum_item_size.width;
    float height = opts.minimum_item_size.height;
    if (size_lookup) {
      if (auto size = size_lookup(id); size && size->width > 0.0f && size->height > 0.0f) {
        width = size->width;
        height = size->height;
      }
    }
    items.push_back(SizedItem{&id, width, height, width * height});
  }
  // larger items first; stable so equal areas keep input order
  std::stable_sort(items.begin(), items.end(),
                   [](const SizedItem& a, const SizedItem& b) { return a.area > b.area; });

  std::vector<Rect> free_rects;
  Rect usable{opts.margin, opts.margin, container.width - 2.0f * opts.margin,
              container.height - 2.0f * opts.margin};
  if (usable.width > 0.0f && usable.height > 0.0f) {
    free_rects.push_back(usable);
  }

  float fitted_area = 0.0f;
  std::optional<float> lowest_bottom;

  for (const SizedItem& item : items) {
    float required_w = item.width + opts.padding;
    float required_h = item.height + opts.padding;

    Placement placement;
    placement.id = *item.id;

    auto best = find_best_free_rect(free_rects, required_w, required_h);
    if (!best) {
      result.all_fit = false;
      float y = lowest_bottom ? *lowest_bottom + opts.padding : opts.margin;
      placement.rect = Rect{opts.margin, y, item.width, item.height};
      placement.fitted = false;
      spdlog::debug("pack: '{}' ({}x{}) does not fit, stacked at ({}, {})", placement.id,
                    item.width, item.height, placement.rect.x, placement.rect.y);
      if (opts.overflow == OverflowPolicy::Reserve) {
        split_free_rects(free_rects, Rect{placement.rect.x, placement.rect.y, required_w, required_h});
        prune_free_rects(free_rects);
      }
    } else {
      const Rect chosen = free_rects[*best];
      placement.rect = Rect{chosen.x, chosen.y, item.width, item.height};
      fitted_area += item.width * item.height;
      split_free_rects(free_rects, Rect{chosen.x, chosen.y, required_w, required_h});
      prune_free_rects(free_rects);
    }

    float bottom = placement.rect.y + placement.rect.height;
    lowest_bottom = lowest_bottom ? std::max(*lowest_bottom, bottom) : bottom;
    result.placements.push_back(std::move(placement));
  }

  float container_area = container.width * container.height;
  result.utilization = container_area > 0.0f ? fitted_area / container_area : 0.0f;

  spdlog::trace("pack: {} items into {}x{}, all_fit={}, utilization={:.3f}, {} free rects left",
                items.size(), container.width, container.height, result.all_fit,
                result.utilization, free_rects.size());
  return result;
}

PackResult pack(const std::vector<std::string>& item_ids, Size container,
                const std::unordered_map<std::string, Size>& sizes, const PackOptions& options) {
  return pack(
      item_ids, container,
      [&sizes](const std::string& id) -> std::optional<Size> {
        auto it = sizes.find(id);
        if (it == sizes.end()) {
          return std::nullopt;
        }
        return it->second;
      },
      options);
}

float fit_max_amount_evenly(float total_size, float minimum_size) {
  if (minimum_size <= 0.0f) {
    return minimum_size;
  }
  float can_fit = std::floor(total_size / minimum_size);
  if (can_fit <= 0.0f) {
    return minimum_size;
  }
  return total_size / can_fit;
}

bool can_items_fit(size_t count, Size container, Size minimum_size, float padding, float margin) {
  if (count == 0) {
    return true;
  }
  float available_w = container.width - 2.0f * margin;
  float available_h = container.height - 2.0f * margin;

  for (size_t cols = 1; cols <= count; ++cols) {
    size_t rows = (count + cols - 1) / cols;
    float required_w = static_cast<float>(cols) * minimum_size.width +
                       static_cast<float>(cols - 1) * padding;
    float required_h = static_cast<float>(rows) * minimum_size.height +
                       static_cast<float>(rows - 1) * padding;
    if (required_w <= available_w && required_h <= available_h) {
      return true;
    }
  }
  return false;
}

} // namespace panegrid::layout
