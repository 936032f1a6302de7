#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>

namespace javaidx {

// Sequential, seekable input borrowed for the duration of one decode call.
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  // Returns the number of bytes copied into `out`; less than out.size() only at end of input.
  virtual std::size_t Read(std::span<std::byte> out) = 0;
  virtual void Seek(std::uint64_t offset) = 0;
  virtual std::uint64_t Tell() const = 0;
  virtual std::uint64_t Size() const = 0;
};

class MemoryByteSource final : public ByteSource {
 public:
  explicit MemoryByteSource(std::span<const std::byte> bytes) : bytes_(bytes) {}

  std::size_t Read(std::span<std::byte> out) override;
  void Seek(std::uint64_t offset) override;
  std::uint64_t Tell() const override { return position_; }
  std::uint64_t Size() const override { return bytes_.size(); }

 private:
  std::span<const std::byte> bytes_;
  std::uint64_t position_ = 0;
};

class FileByteSource final : public ByteSource {
 public:
  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;
  FileByteSource(FileByteSource&&) noexcept = default;
  FileByteSource& operator=(FileByteSource&&) noexcept = default;
  ~FileByteSource() override = default;

  static FileByteSource Open(const std::filesystem::path& path);

  std::size_t Read(std::span<std::byte> out) override;
  void Seek(std::uint64_t offset) override;
  std::uint64_t Tell() const override { return position_; }
  std::uint64_t Size() const override { return size_; }

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  FileByteSource(std::filesystem::path path, std::ifstream in, std::uint64_t size);

  std::filesystem::path path_;
  std::ifstream in_;
  std::uint64_t size_ = 0;
  std::uint64_t position_ = 0;
};

}  // namespace javaidx
