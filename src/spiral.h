#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

#include "coordinate_key.h"

namespace panegrid {

// Square-spiral walk over offsets around (0, 0), innermost ring first.
// Ring i (1..render_distance+1) has side 2(i-1)+1 and walks its right, bottom,
// left and top sides in rotation, with side offsets 0, +1, -1, +2, -2, ...
// Every offset with Chebyshev distance <= render_distance appears exactly once.
class SpiralSequence {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ChunkCoord;
    using difference_type = std::ptrdiff_t;
    using pointer = const ChunkCoord*;
    using reference = const ChunkCoord&;

    iterator() = default;

    reference operator*() const {
      return current_;
    }
    pointer operator->() const {
      return &current_;
    }
    iterator& operator++();
    iterator operator++(int) {
      iterator copy = *this;
      ++*this;
      return copy;
    }
    bool operator==(const iterator& other) const {
      return done_ == other.done_ && (done_ || emitted_ == other.emitted_);
    }

  private:
    friend class SpiralSequence;
    explicit iterator(int render_distance);

    void emit();

    // 64-bit so that render_distance + 1 and the ring side stay exact at INT_MAX
    int64_t last_ring_ = 0;
    int64_t ring_ = 1;       // 1-based ring index
    int direction_ = 0;      // 0 right, 1 bottom, 2 left, 3 top
    int64_t occurrence_ = 0; // completed rotations within the ring
    size_t emitted_ = 0;
    bool done_ = true;
    ChunkCoord current_;
  };

  explicit SpiralSequence(int render_distance) : render_distance_(render_distance) {
  }

  [[nodiscard]] iterator begin() const {
    return iterator(render_distance_);
  }
  [[nodiscard]] iterator end() const {
    return iterator();
  }

  // (2R+1)^2, or 0 for a negative distance
  [[nodiscard]] size_t size() const;

private:
  int render_distance_;
};

// Materialized spiral offsets, for callers that want a vector
[[nodiscard]] std::vector<ChunkCoord> spiral_offsets(int render_distance);

} // namespace panegrid
