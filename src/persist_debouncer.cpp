#include "persist_debouncer.h"

#include <spdlog/spdlog.h>

namespace panegrid {

void PersistDebouncer::touch(ChunkCoord coord, SteadyClock::time_point now) {
  pending_[coord] = now;
}

PersistDebouncer::FlushOutcome PersistDebouncer::flush_one(ChunkWindowManager& manager,
                                                           ChunkCoord coord) {
  auto persisted = manager.persist_chunk(coord);
  if (!persisted.success) {
    spdlog::error("Debounced persist of chunk {} failed: {}", to_key(coord), persisted.error);
    return FlushOutcome::Failed;
  }
  if (!persisted.changed) {
    // unloaded in the meantime; unload already wrote it
    spdlog::debug("Debounced persist skipped, chunk {} is no longer loaded", to_key(coord));
    return FlushOutcome::Skipped;
  }
  return FlushOutcome::Written;
}

std::vector<ChunkCoord> PersistDebouncer::flush_due(ChunkWindowManager& manager,
                                                    SteadyClock::time_point now) {
  std::vector<ChunkCoord> flushed;
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (now - it->second < window_) {
      ++it;
      continue;
    }
    auto outcome = flush_one(manager, it->first);
    if (outcome == FlushOutcome::Failed) {
      ++it;
      continue;
    }
    if (outcome == FlushOutcome::Written) {
      flushed.push_back(it->first);
    }
    it = pending_.erase(it);
  }
  return flushed;
}

std::vector<ChunkCoord> PersistDebouncer::flush_all(ChunkWindowManager& manager) {
  std::vector<ChunkCoord> flushed;
  for (auto it = pending_.begin(); it != pending_.end();) {
    auto outcome = flush_one(manager, it->first);
    if (outcome == FlushOutcome::Failed) {
      ++it;
      continue;
    }
    if (outcome == FlushOutcome::Written) {
      flushed.push_back(it->first);
    }
    it = pending_.erase(it);
  }
  return flushed;
}

} // namespace panegrid
