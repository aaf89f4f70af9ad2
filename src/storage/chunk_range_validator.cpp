#include "gv/storage/chunk_range_validator.h"

#include <algorithm>
#include <iterator>
#include <string>

#include "gv/error.h"
#include "gv/errors.h"

namespace gv::storage {

std::vector<uint64_t> ChunkRangeValidator::UnmatchedBoundaries(std::span<const StoredChunk> chunks) {
  // Sorted multisets: a repeated boundary must survive so overlaps stay unmatched.
  std::vector<uint64_t> starts;
  std::vector<uint64_t> ends;
  starts.reserve(chunks.size());
  ends.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    if (chunk.size == 0) {
      continue; // empty trailing parts carry no range
    }
    starts.push_back(chunk.start_offset);
    ends.push_back(chunk.start_offset + chunk.size);
  }
  std::sort(starts.begin(), starts.end());
  std::sort(ends.begin(), ends.end());
  std::vector<uint64_t> unmatched;
  std::set_symmetric_difference(starts.begin(), starts.end(), ends.begin(), ends.end(),
                                std::back_inserter(unmatched));
  return unmatched;
}

void ChunkRangeValidator::Validate(std::span<const StoredChunk> chunks, uint64_t file_size) {
  const auto unmatched = UnmatchedBoundaries(chunks);
  if (unmatched.empty() && file_size == 0) {
    return;
  }
  const auto contains = [&](uint64_t value) {
    return std::binary_search(unmatched.begin(), unmatched.end(), value);
  };
  if (!contains(0)) {
    throw ChunkBoundaryError(ChunkBoundaryErrorKind::kMissingLeadingChunk,
                             errors::validation::kMissingLeadingChunk,
                             std::string(errors::msg::kMissingLeadingChunk));
  }
  // An empty file has no outer boundaries, so any surviving range overshoots it.
  if (file_size == 0 || !contains(file_size)) {
    throw ChunkBoundaryError(ChunkBoundaryErrorKind::kSizeMismatch, errors::validation::kSizeMismatch,
                             std::string(errors::msg::kChunkSizeMismatch) + ": expected " +
                                 std::to_string(file_size));
  }
  if (unmatched.size() > 2) {
    throw ChunkBoundaryError(ChunkBoundaryErrorKind::kNonContiguousChunks,
                             errors::validation::kNonContiguousChunks,
                             std::string(errors::msg::kNonContiguousChunks) + " (" +
                                 std::to_string(unmatched.size()) + " unmatched boundaries)");
  }
}

}  // namespace gv::storage
