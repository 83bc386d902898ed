#include <cstddef>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cdm/codec/codec.hpp"
#include "cdm/core/error.hpp"
#include "cdm/parser/parser.hpp"

namespace {

constexpr std::string_view kReport =
    "[Read]\n"
    "  SEQ    1MiB (Q=  8, T= 1):   531.458 MB/s [    506.8 IOPS] < 15726.77 us>\n"
    "[Write]\n"
    "  SEQ    1MiB (Q=  8, T= 1):   494.379 MB/s [    471.5 IOPS] < 16887.06 us>\n"
    "Profile: Default\n";

std::vector<std::byte> to_bytes(std::string_view text) {
  std::vector<std::byte> out(text.size());
  std::memcpy(out.data(), text.data(), text.size());
  return out;
}

std::vector<std::byte> compress_report(cdm::CodecId id) {
  auto codec = cdm::make_codec(cdm::CodecParams{.id = id, .level = 1});
  if (!codec) {
    return {};
  }
  auto comp = (*codec)->compress(to_bytes(kReport));
  return comp ? std::move(*comp) : std::vector<std::byte>{};
}

std::filesystem::path write_temp(const std::string& name, const std::vector<std::byte>& bytes) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  return path;
}

bool test_frame_roundtrip() {
  for (const auto id : {cdm::CodecId::None, cdm::CodecId::Lz4, cdm::CodecId::Zstd}) {
    auto codec = cdm::make_codec(cdm::CodecParams{.id = id, .level = 1});
    if (!codec) {
      std::cerr << std::format("make_codec({}) failed\n", cdm::codec_name(id));
      return false;
    }

    const auto raw = to_bytes(kReport);
    auto comp = (*codec)->compress(raw);
    if (!comp) {
      std::cerr << std::format("{} compress failed: {}\n", (*codec)->name(), comp.error().what());
      return false;
    }
    if (cdm::detect_codec(*comp) != id) {
      std::cerr << std::format("{} frame not detected by magic\n", (*codec)->name());
      return false;
    }

    auto plain = (*codec)->decompress(*comp);
    if (!plain || *plain != raw) {
      std::cerr << std::format("{} roundtrip mismatch\n", (*codec)->name());
      return false;
    }
  }
  return true;
}

bool test_concatenated_frames() {
  for (const auto id : {cdm::CodecId::Lz4, cdm::CodecId::Zstd}) {
    auto frames = compress_report(id);
    const auto second = compress_report(id);
    frames.insert(frames.end(), second.begin(), second.end());

    auto codec = cdm::make_codec(cdm::CodecParams{.id = id});
    auto plain = (*codec)->decompress(frames);
    if (!plain || plain->size() != 2 * kReport.size()) {
      std::cerr << std::format("{} concatenated frames not fully decoded\n", cdm::codec_name(id));
      return false;
    }
  }
  return true;
}

bool test_corrupt_input() {
  for (const auto id : {cdm::CodecId::Lz4, cdm::CodecId::Zstd}) {
    auto frame = compress_report(id);
    if (frame.size() < 8) {
      std::cerr << std::format("{} fixture too small\n", cdm::codec_name(id));
      return false;
    }
    frame.resize(frame.size() / 2);

    auto codec = cdm::make_codec(cdm::CodecParams{.id = id});
    const auto plain = (*codec)->decompress(frame);
    if (plain || plain.error().code() != cdm::ErrorCode::CodecError) {
      std::cerr << std::format("{} truncated frame should be a CodecError\n",
                               cdm::codec_name(id));
      return false;
    }
  }
  return true;
}

bool test_detect_plain_text() {
  if (cdm::detect_codec(to_bytes(kReport)) != cdm::CodecId::None ||
      cdm::detect_codec(std::span<const std::byte>{}) != cdm::CodecId::None) {
    std::cerr << std::format("plain text misdetected as compressed\n");
    return false;
  }
  return true;
}

bool test_compressed_report_file() {
  const auto zst = write_temp("cdm_codec_report.txt.zst", compress_report(cdm::CodecId::Zstd));
  const auto lz4 = write_temp("cdm_codec_report.txt.lz4", compress_report(cdm::CodecId::Lz4));

  const auto a = cdm::parse_file(zst);
  const auto b = cdm::parse_file(lz4, cdm::SourceOptions{.compression = cdm::CodecId::Lz4});
  if (!a || !b) {
    std::cerr << std::format("compressed report failed to parse\n");
    return false;
  }
  if (a->run.read.size() != 1 || a->run.write.size() != 1 || a->run.profile != "Default") {
    std::cerr << std::format("zstd report content mismatch\n");
    return false;
  }
  if (a->digest != b->digest) {
    std::cerr << std::format("digest should not depend on compression\n");
    return false;
  }

  const auto wrong = cdm::parse_file(zst, cdm::SourceOptions{.compression = cdm::CodecId::Lz4});
  if (wrong || wrong.error().code() != cdm::ErrorCode::CodecError) {
    std::cerr << std::format("forcing lz4 on a zstd file should be a CodecError\n");
    return false;
  }

  std::filesystem::remove(zst);
  std::filesystem::remove(lz4);
  return true;
}

}  // namespace

int main() {
  if (!test_frame_roundtrip()) {
    return 1;
  }
  if (!test_concatenated_frames()) {
    return 1;
  }
  if (!test_corrupt_input()) {
    return 1;
  }
  if (!test_detect_plain_text()) {
    return 1;
  }
  if (!test_compressed_report_file()) {
    return 1;
  }
  return 0;
}
