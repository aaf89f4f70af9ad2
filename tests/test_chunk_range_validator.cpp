#include "gv/storage/chunk_catalog.h"
#include "gv/storage/chunk_range_validator.h"
#include "gv/error.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <optional>
#include <vector>

namespace {

using gv::storage::ChunkRangeValidator;
using gv::storage::StoredChunk;

std::optional<gv::ChunkBoundaryErrorKind> Check(const std::vector<StoredChunk>& chunks, uint64_t size) {
  try {
    ChunkRangeValidator::Validate(chunks, size);
  } catch (const gv::ChunkBoundaryError& err) {
    assert(gv::ClassifyError(err) == gv::ErrorClass::kIntegrity);
    return err.kind;
  }
  return std::nullopt;
}

void TestContiguousPasses() {
  assert(!Check({{0, 5}, {5, 3}}, 8) && "contiguous partition passes");
  assert(!Check({{5, 3}, {0, 5}}, 8) && "order does not matter");
  assert(!Check({{0, 8}}, 8));
  assert(!Check({}, 0) && "empty file with no chunks passes");
  assert(!Check({{0, 0}}, 0) && "empty file with an empty chunk passes");
  assert(!Check({{0, 5}, {5, 3}, {8, 0}}, 8) && "empty trailing chunk is ignored");
}

void TestOverlapAndGap() {
  assert(Check({{0, 5}, {5, 3}, {4, 4}}, 8) == gv::ChunkBoundaryErrorKind::kNonContiguousChunks &&
         "overlap detected");
  assert(Check({{0, 2}, {4, 4}}, 8) == gv::ChunkBoundaryErrorKind::kNonContiguousChunks && "gap detected");
}

void TestRepeatedBoundariesAreOverlaps() {
  assert(Check({{0, 5}, {0, 5}, {5, 3}}, 8) == gv::ChunkBoundaryErrorKind::kNonContiguousChunks &&
         "duplicated chunk detected");
  assert(Check({{0, 8}, {0, 4}, {4, 4}}, 8) == gv::ChunkBoundaryErrorKind::kNonContiguousChunks &&
         "chunk covering two others detected");
  const auto unmatched = ChunkRangeValidator::UnmatchedBoundaries(std::vector<StoredChunk>{{0, 8}, {0, 4}, {4, 4}});
  assert((unmatched == std::vector<uint64_t>{0, 0, 8, 8}));
}

void TestMissingLeadingAndSize() {
  assert(Check({{1, 7}}, 8) == gv::ChunkBoundaryErrorKind::kMissingLeadingChunk);
  assert(Check({}, 8) == gv::ChunkBoundaryErrorKind::kMissingLeadingChunk);
  assert(Check({{0, 5}, {5, 3}}, 9) == gv::ChunkBoundaryErrorKind::kSizeMismatch);
  assert(Check({{0, 5}}, 0) == gv::ChunkBoundaryErrorKind::kSizeMismatch);
}

void TestErrorCodes() {
  try {
    ChunkRangeValidator::Validate(std::vector<StoredChunk>{{0, 2}, {4, 4}}, 8);
    assert(false && "gap must throw");
  } catch (const gv::Error& err) {
    assert(err.domain == gv::ErrorDomain::Validation);
    assert(err.code == gv::errors::validation::kNonContiguousChunks);
  }
}

void TestCatalogArena() {
  gv::storage::ChunkCatalog catalog;
  const auto file_id = catalog.AddFile("/data/a.bin", 8);
  const auto other_id = catalog.AddFile("/data/b.bin", 4);
  assert(file_id == 1 && other_id == 2);
  const auto first = catalog.AddChunk(file_id, {0, 5, "aa", true, "u1"});
  catalog.AddChunk(other_id, {0, 4, "bb", false, "u2"});
  catalog.AddChunk(file_id, {5, 3, "cc", true, "u1"});

  const auto chunk = catalog.Chunk(first);
  assert(chunk && chunk->file_id == file_id && chunk->record.checksum == "aa");
  assert(!catalog.Chunk(99));
  assert(catalog.FindFile("/data/b.bin") == other_id);
  assert(!catalog.FindFile("/data/c.bin"));

  const auto rows = catalog.ChunksForFile(file_id);
  assert(rows.size() == 2 && rows[0].start_offset == 0 && rows[1].start_offset == 5);
  catalog.ValidateFile(file_id);
  catalog.ValidateFile(other_id);

  bool threw = false;
  try {
    catalog.AddChunk(42, {});
  } catch (const gv::Error& err) {
    threw = err.code == gv::errors::validation::kUnknownRecord;
  }
  assert(threw && "chunks need a known file");

  const auto gap_file = catalog.AddFile("/data/gap.bin", 8);
  catalog.AddChunk(gap_file, {0, 2, "", false, "u3"});
  catalog.AddChunk(gap_file, {4, 4, "", false, "u3"});
  threw = false;
  try {
    catalog.ValidateFile(gap_file);
  } catch (const gv::ChunkBoundaryError& err) {
    threw = err.kind == gv::ChunkBoundaryErrorKind::kNonContiguousChunks;
  }
  assert(threw && "catalog gaps surface through the validator");
}

void TestCatalogPersistence() {
  gv::storage::ChunkCatalog catalog;
  const auto id = catalog.AddFile("/data/a.bin", 8);
  catalog.AddChunk(id, {0, 8, "abcd", true, "upload-1"});

  const auto path = std::filesystem::temp_directory_path() / "gv_catalog_test.json";
  catalog.Save(path);
  const auto loaded = gv::storage::ChunkCatalog::Load(path);
  assert(loaded.file_count() == 1 && loaded.chunk_count() == 1);
  const auto chunk = loaded.Chunk(1);
  assert(chunk && chunk->record.upload_id == "upload-1" && chunk->record.encrypted);
  assert(loaded.File(id)->path == std::filesystem::path("/data/a.bin"));
  loaded.ValidateFile(id);
  std::filesystem::remove(path);
}

}  // namespace

int main() {
  TestContiguousPasses();
  TestOverlapAndGap();
  TestRepeatedBoundariesAreOverlaps();
  TestMissingLeadingAndSize();
  TestErrorCodes();
  TestCatalogArena();
  TestCatalogPersistence();
  std::cout << "chunk range validator tests ok\n";
  return 0;
}
