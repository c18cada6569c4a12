#include "spiral.h"

namespace panegrid {

SpiralSequence::iterator::iterator(int render_distance)
    : last_ring_(static_cast<int64_t>(render_distance) + 1), done_(render_distance < 0) {
  if (!done_) {
    emit();
  }
}

void SpiralSequence::iterator::emit() {
  // both stay within [-(ring - 1), ring - 1], so they fit an int
  auto radius = static_cast<int>(ring_ - 1);

  // 0, +1, -1, +2, -2, ... as the rotation count grows
  auto side_offset = static_cast<int>((occurrence_ + 1) / 2);
  if (occurrence_ % 2 == 0) {
    side_offset = -side_offset;
  }

  switch (direction_) {
  case 0:
    current_ = ChunkCoord{radius, side_offset};
    break;
  case 1:
    current_ = ChunkCoord{-side_offset, radius};
    break;
  case 2:
    current_ = ChunkCoord{-radius, -side_offset};
    break;
  default:
    current_ = ChunkCoord{side_offset, -radius};
    break;
  }
}

SpiralSequence::iterator& SpiralSequence::iterator::operator++() {
  if (done_) {
    return *this;
  }
  ++emitted_;

  int64_t length = 2 * (ring_ - 1) + 1;
  ++direction_;
  if (direction_ > 3) {
    direction_ = 0;
    ++occurrence_;
  }

  if (occurrence_ >= length - 1) {
    // ring finished, the side-1 centre ring stops after a single cell
    ++ring_;
    direction_ = 0;
    occurrence_ = 0;
    if (ring_ > last_ring_) {
      done_ = true;
      return *this;
    }
  }
  emit();
  return *this;
}

size_t SpiralSequence::size() const {
  if (render_distance_ < 0) {
    return 0;
  }
  size_t side = 2 * static_cast<size_t>(render_distance_) + 1;
  return side * side;
}

std::vector<ChunkCoord> spiral_offsets(int render_distance) {
  SpiralSequence sequence(render_distance);
  std::vector<ChunkCoord> offsets;
  offsets.reserve(sequence.size());
  for (const auto& offset : sequence) {
    offsets.push_back(offset);
  }
  return offsets;
}

} // namespace panegrid
