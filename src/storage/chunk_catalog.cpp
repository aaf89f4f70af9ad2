#include "gv/storage/chunk_catalog.h"

#include <string>

#include "gv/common.h"
#include "gv/error.h"
#include "gv/orchestrator/io_util.h"

namespace gv::storage {

namespace {

[[noreturn]] void ThrowUnknown(const char* kind, uint64_t id) {
  throw Error(ErrorDomain::Validation, errors::validation::kUnknownRecord,
              std::string("Unknown catalog ") + kind + " id " + std::to_string(id));
}

}  // namespace

FileId ChunkCatalog::AddFile(const std::filesystem::path& path, uint64_t size) {
  const FileId id = files_.size() + 1;
  files_.push_back(CatalogFile{id, path, size});
  return id;
}

ChunkId ChunkCatalog::AddChunk(FileId file_id, ChunkRecord record) {
  RequireFile(file_id);
  const ChunkId id = chunks_.size() + 1;
  chunks_.push_back(CatalogChunk{id, file_id, std::move(record)});
  return id;
}

const CatalogFile& ChunkCatalog::RequireFile(FileId id) const {
  if (id == 0 || id > files_.size()) {
    ThrowUnknown("file", id);
  }
  return files_[id - 1];
}

std::optional<CatalogFile> ChunkCatalog::File(FileId id) const {
  if (id == 0 || id > files_.size()) {
    return std::nullopt;
  }
  return files_[id - 1];
}

std::optional<FileId> ChunkCatalog::FindFile(const std::filesystem::path& path) const {
  for (auto it = files_.rbegin(); it != files_.rend(); ++it) {
    if (it->path == path) {
      return it->id;
    }
  }
  return std::nullopt;
}

std::optional<CatalogChunk> ChunkCatalog::Chunk(ChunkId id) const {
  if (id == 0 || id > chunks_.size()) {
    return std::nullopt;
  }
  return chunks_[id - 1];
}

std::vector<StoredChunk> ChunkCatalog::ChunksForFile(FileId file_id) const {
  RequireFile(file_id);
  std::vector<StoredChunk> rows;
  for (const auto& chunk : chunks_) {
    if (chunk.file_id == file_id) {
      rows.push_back(StoredChunk{chunk.record.start_offset, chunk.record.size, file_id});
    }
  }
  return rows;
}

void ChunkCatalog::ValidateFile(FileId file_id) const {
  const auto& file = RequireFile(file_id);
  const auto rows = ChunksForFile(file_id);
  ChunkRangeValidator::Validate(rows, file.size);
}

nlohmann::json ChunkCatalog::ToJson() const {
  nlohmann::json files = nlohmann::json::array();
  for (const auto& file : files_) {
    files.push_back({{"id", file.id}, {"path", PathToUtf8String(file.path)}, {"size", file.size}});
  }
  nlohmann::json chunks = nlohmann::json::array();
  for (const auto& chunk : chunks_) {
    chunks.push_back({
        {"id", chunk.id},
        {"file_id", chunk.file_id},
        {"start_offset", chunk.record.start_offset},
        {"size", chunk.record.size},
        {"checksum", chunk.record.checksum},
        {"encrypted", chunk.record.encrypted},
        {"upload_id", chunk.record.upload_id},
    });
  }
  return nlohmann::json{{"version", 1}, {"files", std::move(files)}, {"chunks", std::move(chunks)}};
}

ChunkCatalog ChunkCatalog::FromJson(const nlohmann::json& value) {
  ChunkCatalog catalog;
  try {
    for (const auto& file : value.at("files")) {
      const auto id = catalog.AddFile(std::filesystem::u8path(file.at("path").get<std::string>()),
                                      file.at("size").get<uint64_t>());
      if (id != file.at("id").get<uint64_t>()) {
        ThrowUnknown("file", file.at("id").get<uint64_t>());
      }
    }
    for (const auto& chunk : value.at("chunks")) {
      ChunkRecord record{chunk.at("start_offset").get<uint64_t>(), chunk.at("size").get<uint64_t>(),
                         chunk.at("checksum").get<std::string>(), chunk.at("encrypted").get<bool>(),
                         chunk.at("upload_id").get<std::string>()};
      const auto id = catalog.AddChunk(chunk.at("file_id").get<uint64_t>(), std::move(record));
      if (id != chunk.at("id").get<uint64_t>()) {
        ThrowUnknown("chunk", chunk.at("id").get<uint64_t>());
      }
    }
  } catch (const nlohmann::json::exception& ex) {
    throw Error(ErrorDomain::Validation, errors::validation::kMalformedEncoding,
                std::string("Chunk catalog malformed: ") + ex.what());
  }
  return catalog;
}

void ChunkCatalog::Save(const std::filesystem::path& path) const {
  orchestrator::AtomicReplace(path, std::string_view(ToJson().dump(2)));
}

ChunkCatalog ChunkCatalog::Load(const std::filesystem::path& path) {
  const auto bytes = orchestrator::ReadWholeFile(path);
  auto parsed = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
  if (parsed.is_discarded()) {
    throw Error(ErrorDomain::Validation, errors::validation::kMalformedEncoding,
                "Chunk catalog is not valid JSON: " + PathToUtf8String(path));
  }
  return FromJson(parsed);
}

}  // namespace gv::storage
