#include "gv/crypto/tree_hash.h"

#include <algorithm>
#include <fstream>

#include "gv/common.h"
#include "gv/crypto/provider.h"
#include "gv/encoding.h"
#include "gv/error.h"
#include "gv/errors.h"

namespace gv::crypto {

namespace {

TreeDigest ReduceLevels(std::vector<TreeDigest> level, CryptoProvider& provider) {
  std::array<uint8_t, 64> pair{};
  while (level.size() > 1) {
    std::vector<TreeDigest> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      if (i + 1 == level.size()) {
        next.push_back(level[i]);
        break;
      }
      std::copy(level[i].begin(), level[i].end(), pair.begin());
      std::copy(level[i + 1].begin(), level[i + 1].end(), pair.begin() + 32);
      next.push_back(provider.SHA256(pair));
    }
    level.swap(next);
  }
  return level.front();
}

}  // namespace

void TreeHasher::Update(std::span<const uint8_t> data) {
  total_ += data.size();
  auto& provider = GetCryptoProvider();
  while (!data.empty()) {
    if (pending_.empty() && data.size() >= kTreeHashLeafSize) {
      leaves_.push_back(provider.SHA256(data.first(kTreeHashLeafSize)));
      data = data.subspan(kTreeHashLeafSize);
      continue;
    }
    const size_t take = std::min(kTreeHashLeafSize - pending_.size(), data.size());
    pending_.insert(pending_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(take));
    data = data.subspan(take);
    if (pending_.size() == kTreeHashLeafSize) {
      leaves_.push_back(provider.SHA256(pending_));
      pending_.clear();
    }
  }
}

TreeDigest TreeHasher::Finish() {
  auto& provider = GetCryptoProvider();
  if (!pending_.empty() || leaves_.empty()) {
    leaves_.push_back(provider.SHA256(pending_));
  }
  auto root = ReduceLevels(std::move(leaves_), provider);
  leaves_.clear();
  pending_.clear();
  total_ = 0;
  return root;
}

std::string TreeHasher::FinishHex() {
  const auto root = Finish();
  return encoding::ToHex(root);
}

TreeDigest CombineTreeHashes(std::span<const TreeDigest> roots) {
  auto& provider = GetCryptoProvider();
  if (roots.empty()) {
    return provider.SHA256({});
  }
  return ReduceLevels(std::vector<TreeDigest>(roots.begin(), roots.end()), provider);
}

TreeDigest TreeHash(std::span<const uint8_t> data) {
  TreeHasher hasher;
  hasher.Update(data);
  return hasher.Finish();
}

std::string TreeHashHex(std::span<const uint8_t> data) {
  return encoding::ToHex(TreeHash(data));
}

std::string TreeHashFileHex(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error(ErrorDomain::IO, errors::io::kOpenFailed,
                std::string(errors::msg::kSourceUnreadable) + ": " + PathToUtf8String(path));
  }
  TreeHasher hasher;
  std::vector<uint8_t> buffer(kTreeHashLeafSize);
  while (in) {
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0) {
      hasher.Update(std::span<const uint8_t>(buffer.data(), static_cast<size_t>(got)));
    }
  }
  if (in.bad()) {
    throw Error(ErrorDomain::IO, errors::io::kReadFailed,
                std::string(errors::msg::kSourceUnreadable) + ": " + PathToUtf8String(path));
  }
  return hasher.FinishHex();
}

}  // namespace gv::crypto
