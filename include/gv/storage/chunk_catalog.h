#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "gv/storage/chunk_range_validator.h"

namespace gv::storage {

using FileId = uint64_t;
using ChunkId = uint64_t;

struct CatalogFile {
  FileId id{0};
  std::filesystem::path path;
  uint64_t size{0};
};

struct ChunkRecord {
  uint64_t start_offset{0}; // plaintext coordinates
  uint64_t size{0};
  std::string checksum;
  bool encrypted{false};
  std::string upload_id;
};

struct CatalogChunk {
  ChunkId id{0};
  FileId file_id{0};
  ChunkRecord record;
};

// Arena of catalogued files and their uploaded chunks. Ids are dense and
// start at 1; lookups hand out copies.
class ChunkCatalog {
public:
  FileId AddFile(const std::filesystem::path& path, uint64_t size);
  ChunkId AddChunk(FileId file_id, ChunkRecord record);

  std::optional<CatalogFile> File(FileId id) const;
  // Most recently added file with this path.
  std::optional<FileId> FindFile(const std::filesystem::path& path) const;
  std::optional<CatalogChunk> Chunk(ChunkId id) const;

  // Rows in insertion order. Unknown file ids are a Validation error.
  std::vector<StoredChunk> ChunksForFile(FileId file_id) const;
  void ValidateFile(FileId file_id) const;

  size_t file_count() const noexcept { return files_.size(); }
  size_t chunk_count() const noexcept { return chunks_.size(); }

  nlohmann::json ToJson() const;
  static ChunkCatalog FromJson(const nlohmann::json& value);

  void Save(const std::filesystem::path& path) const;
  static ChunkCatalog Load(const std::filesystem::path& path);

private:
  const CatalogFile& RequireFile(FileId id) const;

  std::vector<CatalogFile> files_;
  std::vector<CatalogChunk> chunks_;
};

}  // namespace gv::storage
