#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/io_util.h>

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

namespace rfshared::util {

/*
  Arrow IO helpers.

  Arrow reports filesystem failures as Status values; these rethrow them as
  std::filesystem::filesystem_error so callers see the errno (ENOENT, EACCES,
  ...) and the offending path.
*/

[[noreturn]] inline void ThrowIoError(const arrow::Status& status, const std::filesystem::path& path) {
  const int errno_value = arrow::internal::ErrnoFromStatus(status);
  const auto code       = errno_value != 0 ? std::error_code(errno_value, std::generic_category()) : std::make_error_code(std::errc::io_error);
  throw std::filesystem::filesystem_error(status.message(), path, code);
}

template <typename T>
T Unwrap(arrow::Result<T> result, const std::filesystem::path& path) {
  if (!result.ok()) ThrowIoError(result.status(), path);
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status, const std::filesystem::path& path) {
  if (!status.ok()) ThrowIoError(status, path);
}

/*
  Read entire file into a string.
*/
inline std::string ReadFileToString(const std::filesystem::path& path) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()), path);
  auto size   = Unwrap(file->GetSize(), path);
  auto buffer = Unwrap(file->Read(size), path);
  Unwrap(file->Close(), path);
  return buffer->ToString();
}

/*
  Atomic write:
      write tmp → flush → rename
*/
inline void WriteFileAtomic(const std::filesystem::path& path, const std::string& contents) {
  const std::filesystem::path tmp_path = path.string() + ".tmp";
  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()), tmp_path);
    Unwrap(out->Write(contents.data(), static_cast<int64_t>(contents.size())), tmp_path);
    Unwrap(out->Flush(), tmp_path);
    Unwrap(out->Close(), tmp_path);
  }
  std::filesystem::rename(tmp_path, path);
}

} // namespace rfshared::util
