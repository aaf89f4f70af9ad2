#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gv {

inline std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

inline std::string PathToUtf8String(const std::filesystem::path& path) {
  auto u8 = path.u8string();
  return std::string(u8.begin(), u8.end());
}

inline std::vector<uint8_t> ToByteVector(std::string_view text) {
  auto bytes = AsBytes(text);
  return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

}  // namespace gv
