#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace rfshared::checksum {

/*
  Content digests used for end-to-end integrity of IQ recordings.

  Both functions return the lowercase hex MD5 digest, so a record produced at
  the edge from DigestOfFile() can be checked downstream with Digest() over
  bytes already in memory (and vice versa).
*/

// Chunk size used when streaming a file through the hash state.
inline constexpr std::size_t kFileChunkBytes = 8192;

std::string Digest(std::string_view data);

/*
  Streams the file in kFileChunkBytes chunks; never holds the whole file.
  Filesystem failures surface as std::filesystem::filesystem_error.
*/
std::string DigestOfFile(const std::filesystem::path& path);

} // namespace rfshared::checksum
