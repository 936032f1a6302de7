#include "javaidx/idx_decoder.hpp"
#include "javaidx/timestamp.hpp"

#include "tool_logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace {

struct ToolOptions {
  javaidx::DecodeOptions decode{};
  javaidx::TimelineOptions timeline{};
  bool print_headers = false;
  std::vector<std::filesystem::path> inputs{};
};

constexpr int kExitUsage = 2;

void PrintUsage(std::ostream& out) {
  out << "usage: javaidx_dump [options] <file-or-directory>...\n"
         "\n"
         "Decodes Java deployment cache index (.idx) records.\n"
         "\n"
         "options:\n"
         "  --no-605-scaling   keep the raw 605 last-modified value (no x1000)\n"
         "  --no-hosted-event  do not emit the 'File Hosted Date' event\n"
         "  --headers          print every decoded header field\n"
         "  --help             show this message\n";
}

bool HasIdxExtension(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  if (ext.size() != 4) {
    return false;
  }
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return ext == ".idx";
}

std::vector<std::filesystem::path> CollectInputs(const std::vector<std::filesystem::path>& roots) {
  std::vector<std::filesystem::path> files;
  for (const auto& root : roots) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
      files.push_back(root);
      continue;
    }
    std::vector<std::filesystem::path> found;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
      javaidx::cli::LogError("failed to scan " + root.string() + ": " + ec.message());
      continue;
    }
    for (const std::filesystem::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
      if (ec) {
        javaidx::cli::LogError("failed to scan " + root.string() + ": " + ec.message());
        break;
      }
      if (it->is_regular_file(ec) && HasIdxExtension(it->path())) {
        found.push_back(it->path());
      }
    }
    std::sort(found.begin(), found.end());
    javaidx::cli::LogKV("scanned_directory", root.string());
    javaidx::cli::LogKV("idx_files_found", static_cast<std::uint64_t>(found.size()));
    files.insert(files.end(), found.begin(), found.end());
  }
  return files;
}

std::string FormatOptionalTimestamp(const std::optional<std::int64_t>& value) {
  return value.has_value() ? javaidx::FormatUtcTimestamp(*value) : std::string("-");
}

void PrintRecord(const std::filesystem::path& path,
                 const javaidx::DecodedDownloadRecord& record,
                 const ToolOptions& options) {
  std::cout << path.string() << '\t' << record.format_version << '\t' << record.url << '\t'
            << record.ip_address << '\t' << javaidx::FormatUtcTimestamp(record.last_modified_ms)
            << '\t' << FormatOptionalTimestamp(record.download_ms) << '\n';
  for (const auto& event : javaidx::ToTimelineEvents(record, options.timeline)) {
    std::cout << "  event\t" << javaidx::FormatUtcTimestamp(event.timestamp_ms) << '\t'
              << event.description << '\t' << event.data_type << '\n';
  }
  if (options.print_headers) {
    for (const auto& field : record.header_fields) {
      std::cout << "  header\t" << field.name << '\t' << field.value << '\n';
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  ToolOptions options{};
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage(std::cout);
      return EXIT_SUCCESS;
    }
    if (arg == "--no-605-scaling") {
      options.decode.last_modified_scaling = javaidx::LastModifiedScaling::kNone;
    } else if (arg == "--no-hosted-event") {
      options.timeline.emit_hosted_event = false;
    } else if (arg == "--headers") {
      options.print_headers = true;
    } else if (arg.starts_with("--")) {
      std::cerr << "unknown option: " << arg << "\n";
      PrintUsage(std::cerr);
      return kExitUsage;
    } else {
      options.inputs.emplace_back(arg);
    }
  }
  if (options.inputs.empty()) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  options.decode.collect_header_fields = options.print_headers;

  const auto files = CollectInputs(options.inputs);
  std::size_t failures = 0;
  for (const auto& file : files) {
    javaidx::cli::LogKV("decoding", file.string());
    const auto result = javaidx::TryDecodeIdxFile(file, options.decode);
    if (const auto* failure = std::get_if<javaidx::DecodeFailure>(&result)) {
      ++failures;
      javaidx::cli::LogError(file.string() + " [" + std::string(javaidx::IdxErrorKindName(failure->kind)) +
                             "] " + failure->message);
      continue;
    }
    PrintRecord(file, std::get<javaidx::DecodedDownloadRecord>(result), options);
  }

  javaidx::cli::LogKV("records_decoded", static_cast<std::uint64_t>(files.size() - failures));
  javaidx::cli::LogKV("records_failed", static_cast<std::uint64_t>(failures));
  return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
