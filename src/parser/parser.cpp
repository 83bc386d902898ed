#include "cdm/parser/parser.hpp"

#include <exception>
#include <optional>
#include <utility>
#include <variant>

#include "cdm/core/error.hpp"
#include "cdm/sink/digest_sink.hpp"

namespace cdm {
namespace {

class SpanLineSource final : public ILineSource {
 public:
  explicit SpanLineSource(std::span<const std::string> lines) : lines_(lines) {}

  Expected<std::optional<std::string>> next_line() noexcept override {
    if (next_ >= lines_.size()) {
      return std::optional<std::string>{};
    }
    try {
      return std::optional<std::string>{lines_[next_++]};
    } catch (const std::exception& ex) {
      return std::unexpected(Error{ErrorCode::Internal, ex.what()});
    }
  }

  size_t line_number() const noexcept override { return next_; }

 private:
  std::span<const std::string> lines_;
  size_t next_{0};
};

std::vector<Measurement>* target_sequence(Section section, BenchmarkRun& run) {
  switch (section) {
    case Section::Read:
      return &run.read;
    case Section::Write:
      return &run.write;
    case Section::Mix:
      return &run.mix;
    case Section::None:
      break;
  }
  return nullptr;
}

std::optional<std::string>& metadata_slot(MetadataField field, BenchmarkRun& run) {
  switch (field) {
    case MetadataField::Profile:
      return run.profile;
    case MetadataField::Test:
      return run.test_label;
    case MetadataField::Mode:
      return run.mode;
    case MetadataField::Time:
      return run.measurement_time;
    case MetadataField::Date:
      return run.date;
    case MetadataField::Os:
      return run.operating_system;
    case MetadataField::Comment:
      return run.comment;
  }
  return run.comment;
}

}  // namespace

Expected<Section> accumulate(Section current, LineMatch match, BenchmarkRun& run) {
  if (auto* m = std::get_if<MeasurementLine>(&match)) {
    auto* seq = target_sequence(current, run);
    if (seq == nullptr) {
      return std::unexpected(
          Error{ErrorCode::ClassificationError,
                "can not classify test result to 'read', 'write' or 'mix': no section header"});
    }
    seq->push_back(std::move(m->measurement));
    return current;
  }
  if (const auto* header = std::get_if<SectionHeaderLine>(&match)) {
    return header->section;
  }
  if (auto* meta = std::get_if<MetadataLine>(&match)) {
    metadata_slot(meta->field, run) = std::move(meta->value);
    return Section::None;
  }
  return current;
}

Expected<BenchmarkRun> parse(ILineSource& source, const ParseOptions& opts) noexcept {
  BenchmarkRun run{};
  Section section = Section::None;

  try {
    for (;;) {
      auto line = source.next_line();
      if (!line) {
        return std::unexpected(line.error());
      }
      if (!line->has_value()) {
        break;
      }

      const size_t line_no = source.line_number();
      auto match = classify_line(**line, opts);
      if (!match) {
        return std::unexpected(match.error().with_line(line_no));
      }
      auto next = accumulate(section, std::move(*match), run);
      if (!next) {
        return std::unexpected(next.error().with_line(line_no));
      }
      section = *next;
    }
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what(), source.line_number()});
  }
  return run;
}

Expected<BenchmarkRun> parse_lines(std::span<const std::string> lines,
                                   const ParseOptions& opts) noexcept {
  SpanLineSource source(lines);
  return parse(source, opts);
}

Expected<BenchmarkRun> parse_text(std::string_view text, const ParseOptions& opts) noexcept {
  std::string owned;
  try {
    owned.assign(text);
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what()});
  }
  auto source = make_memory_source(std::move(owned),
                                   SourceOptions{.encoding = TextEncoding::Utf8,
                                                 .compression = CodecId::None});
  if (!source) {
    return std::unexpected(source.error());
  }
  return parse(**source, opts);
}

Expected<ParsedReport> parse_file(const std::filesystem::path& path,
                                  const SourceOptions& source_opts,
                                  const ParseOptions& opts) noexcept {
  try {
    DigestSink digest;
    SourceOptions with_digest = source_opts;
    with_digest.digest = &digest;

    auto source = open_file_source(path, with_digest);
    if (!source) {
      return std::unexpected(source.error());
    }
    auto run = parse(**source, opts);
    if (!run) {
      return std::unexpected(run.error());
    }

    ParsedReport report{};
    report.source = path.string();
    report.run = std::move(*run);
    report.digest = digest.digest();
    report.line_count = (*source)->line_number();
    return report;
  } catch (const std::exception& ex) {
    return std::unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

}  // namespace cdm
