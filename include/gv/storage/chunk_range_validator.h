#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace gv::storage {

// Catalog row describing one stored chunk, in plaintext coordinates.
struct StoredChunk {
  uint64_t start_offset{0};
  uint64_t size{0};
  uint64_t file_id{0};
};

// Checks that the chunks of one file partition [0, file_size) without gaps or
// overlaps. Throws ChunkBoundaryError; checks run in the order leading chunk,
// total size, contiguity.
class ChunkRangeValidator {
public:
  static void Validate(std::span<const StoredChunk> chunks, uint64_t file_size);

  // Outer boundaries left after interior starts and ends cancel out.
  static std::vector<uint64_t> UnmatchedBoundaries(std::span<const StoredChunk> chunks);
};

}  // namespace gv::storage
