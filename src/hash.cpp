#include "lectern/hash.hpp"

#include <array>
#include <filesystem>
#include <fstream>

extern "C" {
#include <blake3.h>
}

#include "lectern/content_provider.hpp"

namespace lectern {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

// Feeds the whole file into `hasher`. Returns false if the file cannot be read.
bool update_from_file(blake3_hasher& hasher, const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return false;
  constexpr std::size_t kBufferSize = 65536;
  std::array<char, kBufferSize> buffer{};
  while (file.good()) {
    file.read(buffer.data(), buffer.size());
    const std::streamsize count = file.gcount();
    if (count > 0) blake3_hasher_update(&hasher, buffer.data(), static_cast<size_t>(count));
  }
  return !file.bad();
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string window_content_digest(std::string_view html) {
  return hash_domain("win:", html);
}

std::string document_key_for_files(const std::vector<std::string>& files) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, "doc:", 4);
  for (const auto& f : files) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(f, ec);
    if (ec) return {};
    // Length-delimit each entry so file boundaries are part of the identity.
    const std::string name = std::filesystem::path(f).filename().string();
    const std::string header = name + '\0' + std::to_string(size) + '\0';
    blake3_hasher_update(&hasher, header.data(), header.size());
    if (!update_from_file(hasher, f)) return {};
  }
  return finalize_hex(hasher);
}

std::string document_key(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return document_key_for_files(DirectoryContentProvider::chapter_files(path));
  }
  if (!std::filesystem::is_regular_file(path, ec)) return {};
  return document_key_for_files({path});
}

}  // namespace lectern
