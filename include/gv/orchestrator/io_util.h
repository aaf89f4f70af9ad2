#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

#include "gv/error.h"

namespace gv::orchestrator {

struct AtomicReplaceHooks {
  // Runs after the temporary file is synced and closed, before the rename.
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Replaces `target` by writing the payload to a private temporary file in the
// same directory, syncing it, renaming it into place and syncing the directory.
// A failure at any stage leaves the previous target untouched.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

inline void AtomicReplace(const std::filesystem::path& target, std::string_view text,
                          const AtomicReplaceHooks& hooks = {}) {
  AtomicReplace(target,
                std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()),
                hooks);
}

std::vector<uint8_t> ReadWholeFile(const std::filesystem::path& path);

}  // namespace gv::orchestrator
