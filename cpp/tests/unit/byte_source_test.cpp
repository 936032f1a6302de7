#include "javaidx/byte_source.hpp"

#include "../../src/core/idx_format.hpp"
#include "../idx_builder.hpp"
#include "../test_logger.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using javaidx::IdxError;
using javaidx::IdxErrorKind;
using javaidx::MemoryByteSource;
using javaidx::core::idx::BigEndianCursor;
using javaidx::core::idx::PrefixWidth;

void ExpectIdxError(const std::string& name,
                    const std::function<void()>& fn,
                    IdxErrorKind expected_kind,
                    const std::string& expected_substring) {
  try {
    fn();
  } catch (const IdxError& ex) {
    const std::string message = ex.what();
    if (ex.kind() != expected_kind) {
      throw std::runtime_error("unexpected error kind for " + name + ": " + message);
    }
    if (message.find(expected_substring) == std::string::npos) {
      throw std::runtime_error("unexpected error for " + name + ": " + message);
    }
    javaidx::tests::Log("expected exception in " + name + ": " + message);
    return;
  }
  throw std::runtime_error("expected throw: " + name);
}

std::filesystem::path WriteTempFile(const std::string& name, const std::vector<std::byte>& bytes) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to create temp file: " + path.string());
  }
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    throw std::runtime_error("failed to write temp file: " + path.string());
  }
  return path;
}

}  // namespace

int main() {
  try {
    javaidx::tests::Log("byte_source_test: start");

    {
      javaidx::tests::Log("scenario: memory source short read at end");
      const std::array<std::byte, 3> bytes{std::byte{0x01}, std::byte{0x02}, std::byte{0x03}};
      MemoryByteSource source(bytes);
      std::array<std::byte, 2> out{};
      if (source.Read(out) != 2 || out[0] != std::byte{0x01} || out[1] != std::byte{0x02}) {
        throw std::runtime_error("first memory read mismatch");
      }
      if (source.Read(out) != 1 || out[0] != std::byte{0x03}) {
        throw std::runtime_error("short memory read mismatch");
      }
      if (source.Read(out) != 0) {
        throw std::runtime_error("read past end must return 0");
      }
      source.Seek(10);
      if (source.Read(out) != 0 || source.Tell() != 10) {
        throw std::runtime_error("read after seek past end must return 0");
      }
      javaidx::tests::Log("scenario passed: memory source short read at end");
    }

    {
      javaidx::tests::Log("scenario: big-endian integers");
      javaidx::tests::IdxBuilder builder;
      builder.AppendU8(0xAB);
      builder.AppendU16(0x1234);
      builder.AppendU32(0x0000025DU);  // 605
      builder.AppendI64(-2);
      const auto bytes = std::move(builder).Build();
      javaidx::tests::LogBytes("integer_bytes", bytes);
      MemoryByteSource source(bytes);
      BigEndianCursor cursor(source);
      if (cursor.ReadU8("u8") != 0xAB) {
        throw std::runtime_error("u8 mismatch");
      }
      if (cursor.ReadU16("u16") != 0x1234) {
        throw std::runtime_error("u16 mismatch");
      }
      if (cursor.ReadU32("u32") != 605U) {
        throw std::runtime_error("u32 mismatch");
      }
      if (cursor.ReadI64("i64") != -2) {
        throw std::runtime_error("i64 mismatch");
      }
      ExpectIdxError("read_past_end", [&]() { (void)cursor.ReadU8("trailing byte"); },
                     IdxErrorKind::kTruncatedInput, "trailing byte");
      javaidx::tests::Log("scenario passed: big-endian integers");
    }

    {
      javaidx::tests::Log("scenario: length prefix widths");
      javaidx::tests::IdxBuilder builder;
      builder.AppendString16("date");
      builder.AppendString32("10.7.119.10");
      builder.AppendString16("");
      const auto bytes = std::move(builder).Build();
      MemoryByteSource source(bytes);
      BigEndianCursor cursor(source);
      if (cursor.ReadString(PrefixWidth::kU16, "name") != "date") {
        throw std::runtime_error("u16-prefixed string mismatch");
      }
      if (cursor.ReadString(PrefixWidth::kU32, "address") != "10.7.119.10") {
        throw std::runtime_error("u32-prefixed string mismatch");
      }
      if (!cursor.ReadString(PrefixWidth::kU16, "empty").empty()) {
        throw std::runtime_error("empty string mismatch");
      }
      if (cursor.position() != bytes.size()) {
        throw std::runtime_error("cursor must stop at end of last string");
      }
      javaidx::tests::Log("scenario passed: length prefix widths");
    }

    {
      javaidx::tests::Log("scenario: oversized declared length is truncation");
      javaidx::tests::IdxBuilder builder;
      builder.AppendU32(0xFFFFFFF0U);
      builder.AppendRaw("abc");
      const auto bytes = std::move(builder).Build();
      MemoryByteSource source(bytes);
      BigEndianCursor cursor(source);
      ExpectIdxError("oversized_string", [&]() { (void)cursor.ReadString(PrefixWidth::kU32, "url"); },
                     IdxErrorKind::kTruncatedInput, "declared length of url");
      javaidx::tests::Log("scenario passed: oversized declared length is truncation");
    }

    {
      javaidx::tests::Log("scenario: seek past end is truncation");
      const std::array<std::byte, 16> bytes{};
      MemoryByteSource source(bytes);
      BigEndianCursor cursor(source);
      cursor.SeekAbsolute(16, "end");
      ExpectIdxError("seek_past_end", [&]() { cursor.SeekAbsolute(128, "secondary section"); },
                     IdxErrorKind::kTruncatedInput, "secondary section");
      javaidx::tests::Log("scenario passed: seek past end is truncation");
    }

    {
      javaidx::tests::Log("scenario: file source reads and seeks");
      javaidx::tests::IdxBuilder builder;
      builder.AppendU32(603);
      builder.AppendString32("http://example.invalid/a.jar");
      const auto bytes = std::move(builder).Build();
      const auto path = WriteTempFile("javaidx_byte_source_test.bin", bytes);
      javaidx::tests::LogKV("temp_file", path.string());
      {
        auto source = javaidx::FileByteSource::Open(path);
        if (source.Size() != bytes.size()) {
          throw std::runtime_error("file size mismatch");
        }
        BigEndianCursor cursor(source);
        if (cursor.ReadU32("version") != 603U) {
          throw std::runtime_error("file u32 mismatch");
        }
        if (cursor.ReadString(PrefixWidth::kU32, "url") != "http://example.invalid/a.jar") {
          throw std::runtime_error("file string mismatch");
        }
        cursor.SeekAbsolute(0, "start");
        if (cursor.ReadU32("version") != 603U) {
          throw std::runtime_error("file reread after seek mismatch");
        }
      }
      std::error_code ec;
      std::filesystem::remove(path, ec);
      javaidx::tests::Log("scenario passed: file source reads and seeks");
    }

    {
      javaidx::tests::Log("scenario: missing file is an io error");
      const auto missing = std::filesystem::temp_directory_path() / "javaidx_missing_file_does_not_exist.idx";
      ExpectIdxError("missing_file", [&]() { (void)javaidx::FileByteSource::Open(missing); },
                     IdxErrorKind::kIo, "failed to read file size");
      javaidx::tests::Log("scenario passed: missing file is an io error");
    }

    javaidx::tests::Log("byte_source_test: finished");
    std::cout << "byte_source_test passed\n";
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    javaidx::tests::LogError(ex.what());
    std::cerr << "byte_source_test failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
