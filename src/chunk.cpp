#include "chunk.h"

namespace panegrid {

ChunkRecord make_record(const Chunk& chunk, bool loaded) {
  ChunkRecord record;
  record.coord = chunk.coord;
  record.id = chunk.id;
  record.dimensions = chunk.dimensions;
  record.loaded = loaded;
  record.last_accessed = chunk.last_accessed;
  record.panes.reserve(chunk.panes.size() + chunk.quarantined_panes.size());
  for (const auto& [id, pane] : chunk.panes) {
    record.panes.push_back(pane);
  }
  record.panes.insert(record.panes.end(), chunk.quarantined_panes.begin(),
                      chunk.quarantined_panes.end());
  return record;
}

} // namespace panegrid
