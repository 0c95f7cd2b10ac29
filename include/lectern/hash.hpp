#pragma once

// lectern/hash.hpp - BLAKE3 digests for window content and document identity.
//
// BLAKE3 is the sole hash primitive. Digests are 64-char lowercase hex.
// Domain prefixes ("doc:", "win:") keep a document key from ever colliding with
// a window digest of the same bytes.

#include <string>
#include <string_view>
#include <vector>

namespace lectern {

std::string blake3_hex(std::string_view payload);

// Domain-separated digest: BLAKE3(domain || payload).
std::string hash_domain(std::string_view domain, std::string_view payload);

// Digest of an assembled window's HTML.
std::string window_content_digest(std::string_view html);

// Identity key for a book: BLAKE3 over "doc:" followed by, for each chapter file
// in chapter order, its file name, '\0', its size in decimal, '\0' and its bytes.
// A regular file is a one-file book; a directory contributes its chapter files.
// Returns empty string on any read failure.
std::string document_key(const std::string& path);
std::string document_key_for_files(const std::vector<std::string>& files);

}  // namespace lectern
