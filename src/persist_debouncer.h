#pragma once

#include <chrono>
#include <map>
#include <vector>

#include "chunk_window_manager.h"

namespace panegrid {

constexpr int kDefaultPersistDebounceMs = 100;

// Coalesces rapid pane mutations (drag, resize) into one persist_chunk call per
// chunk once the chunk has been quiet for the debounce window. Driven by the
// caller's event loop through flush_due.
class PersistDebouncer {
public:
  using SteadyClock = std::chrono::steady_clock;

  explicit PersistDebouncer(std::chrono::milliseconds window =
                                std::chrono::milliseconds(kDefaultPersistDebounceMs))
      : window_(window) {
  }

  // Record a mutation of coord at time now; restarts the chunk's quiet window.
  void touch(ChunkCoord coord, SteadyClock::time_point now);

  // Persist every chunk whose quiet window has elapsed. Returns the coordinates
  // that were written. A failed write is logged and kept pending for the next call.
  std::vector<ChunkCoord> flush_due(ChunkWindowManager& manager, SteadyClock::time_point now);

  // Persist everything pending regardless of timing (e.g. on shutdown)
  std::vector<ChunkCoord> flush_all(ChunkWindowManager& manager);

  [[nodiscard]] size_t pending_count() const {
    return pending_.size();
  }

  [[nodiscard]] std::chrono::milliseconds window() const {
    return window_;
  }

  void set_window(std::chrono::milliseconds window) {
    window_ = window;
  }

private:
  enum class FlushOutcome { Written, Skipped, Failed };

  FlushOutcome flush_one(ChunkWindowManager& manager, ChunkCoord coord);

  std::chrono::milliseconds window_;
  std::map<ChunkCoord, SteadyClock::time_point> pending_; // coord -> last mutation
};

} // namespace panegrid
