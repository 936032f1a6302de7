#include "javaidx/byte_source.hpp"

#include "idx_errors.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace javaidx {

using core::idx::IoError;

std::size_t MemoryByteSource::Read(std::span<std::byte> out) {
  if (position_ >= bytes_.size()) {
    return 0;
  }
  const auto available = static_cast<std::size_t>(bytes_.size() - position_);
  const auto count = std::min(available, out.size());
  std::copy_n(bytes_.begin() + static_cast<std::ptrdiff_t>(position_), count, out.begin());
  position_ += count;
  return count;
}

void MemoryByteSource::Seek(std::uint64_t offset) {
  position_ = offset;
}

FileByteSource::FileByteSource(std::filesystem::path path, std::ifstream in, std::uint64_t size)
    : path_(std::move(path)), in_(std::move(in)), size_(size) {}

FileByteSource FileByteSource::Open(const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw IoError("failed to read file size of " + path.string() + ": " + ec.message());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IoError("failed to open file for read: " + path.string());
  }
  return FileByteSource(path, std::move(in), static_cast<std::uint64_t>(size));
}

std::size_t FileByteSource::Read(std::span<std::byte> out) {
  if (out.empty() || position_ >= size_) {
    return 0;
  }
  in_.clear();
  in_.seekg(static_cast<std::streamoff>(position_), std::ios::beg);
  if (!in_) {
    throw IoError("failed to seek for read in " + path_.string());
  }
  const auto wanted = std::min<std::uint64_t>(out.size(), size_ - position_);
  in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(wanted));
  const auto got = in_.gcount();
  if (got < 0) {
    throw IoError("failed to read from " + path_.string());
  }
  position_ += static_cast<std::uint64_t>(got);
  return static_cast<std::size_t>(got);
}

void FileByteSource::Seek(std::uint64_t offset) {
  position_ = offset;
}

}  // namespace javaidx
