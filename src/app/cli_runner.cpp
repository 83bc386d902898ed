#include "app/cli_runner.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>

#include "cdm/core/error.hpp"
#include "cdm/parser/parser.hpp"
#include "cdm/report/output.hpp"
#include "cdm/report/summary.hpp"
#include "cdm/report/table.hpp"
#include "cdm/scheduler/scheduler.hpp"

namespace {

using AppError = cdm::Error;
using cdm::ErrorCode;

template <typename T>
using Result = cdm::Expected<T>;

using cdm::CodecId;
using cdm::ParsedReport;
using cdm::TextEncoding;
using cdm::TokenDialect;
using cdm::app::Config;
using cdm::app::OutputFormat;

void print_file_error(const std::filesystem::path& path, const AppError& err) {
  if (err.line() > 0) {
    std::cerr << std::format("error: {}:{}: {}: {}\n", path.string(), err.line(),
                             cdm::error_code_name(err.code()), err.what());
  } else {
    std::cerr << std::format("error: {}: {}: {}\n", path.string(),
                             cdm::error_code_name(err.code()), err.what());
  }
}

uint32_t effective_threads(const Config& cfg) {
  const auto files = static_cast<uint32_t>(std::max<size_t>(1, cfg.inputs.size()));
  const uint32_t requested =
      cfg.threads == 0 ? std::max(1u, std::thread::hardware_concurrency()) : cfg.threads;
  return std::min(requested, files);
}

Result<std::vector<std::optional<Result<ParsedReport>>>> parse_all(const Config& cfg) {
  std::vector<std::optional<Result<ParsedReport>>> results(cfg.inputs.size());

  const cdm::SourceOptions source_opts{.encoding = cfg.encoding, .compression = cfg.compression};
  const cdm::ParseOptions parse_opts{.dialect = cfg.dialect};

  cdm::SchedulerConfig sched_cfg{};
  sched_cfg.worker_threads = effective_threads(cfg);
  sched_cfg.queue_depth = cfg.queue_depth;
  // Each job owns its slot; slots are read only after drain().
  sched_cfg.handler = [&results, &source_opts, &parse_opts](const cdm::Job& job) {
    results[job.seq] = cdm::parse_file(job.path, source_opts, parse_opts);
  };

  auto sched = cdm::make_scheduler(std::move(sched_cfg));
  if (!sched) {
    return std::unexpected(sched.error());
  }
  auto& scheduler = **sched;

  auto started = scheduler.start();
  if (!started) {
    return std::unexpected(started.error());
  }
  for (size_t i = 0; i < cfg.inputs.size(); ++i) {
    auto submitted = scheduler.submit(cdm::Job{.seq = i, .path = cfg.inputs[i].string()});
    if (!submitted) {
      static_cast<void>(scheduler.join());
      return std::unexpected(submitted.error());
    }
  }
  static_cast<void>(scheduler.stop_issue_new_work());
  auto drained = scheduler.drain();
  static_cast<void>(scheduler.join());
  if (!drained) {
    return std::unexpected(drained.error());
  }
  return results;
}

Result<void> write_reports(const Config& cfg, const std::vector<ParsedReport>& reports) {
  std::ofstream file;
  std::ostream* out = &std::cout;
  if (cfg.output.has_value()) {
    file.open(*cfg.output, std::ios::trunc);
    if (!file.is_open()) {
      return std::unexpected(
          AppError{ErrorCode::IoError, "failed to open output path " + cfg.output->string()});
    }
    out = &file;
  }

  switch (cfg.format) {
    case OutputFormat::Csv: {
      std::vector<cdm::TableRow> rows;
      for (const auto& report : reports) {
        auto flat = cdm::flatten(report.run, report.source);
        rows.insert(rows.end(), std::make_move_iterator(flat.begin()),
                    std::make_move_iterator(flat.end()));
      }
      cdm::write_csv(*out, rows, cdm::CsvOptions{.include_source = cfg.with_source});
      break;
    }
    case OutputFormat::Json:
      cdm::write_json(*out, reports);
      break;
    case OutputFormat::Text:
      for (const auto& report : reports) {
        cdm::write_text(*out, report);
      }
      break;
  }

  out->flush();
  if (!*out) {
    return std::unexpected(AppError{ErrorCode::IoError, "failed to write output"});
  }
  return {};
}

Result<int> run_batch(const Config& cfg) {
  auto results = parse_all(cfg);
  if (!results) {
    return std::unexpected(results.error());
  }

  bool failed = false;
  std::vector<ParsedReport> reports;
  std::unordered_map<uint64_t, std::string> seen;

  for (size_t i = 0; i < results->size(); ++i) {
    auto& slot = (*results)[i];
    const auto& path = cfg.inputs[i];
    if (!slot.has_value()) {
      print_file_error(path, AppError{ErrorCode::Internal, "report was not processed"});
      failed = true;
      continue;
    }
    if (!*slot) {
      print_file_error(path, slot->error());
      failed = true;
      continue;
    }

    ParsedReport& report = **slot;
    if (cfg.dedupe) {
      const auto [it, inserted] = seen.emplace(report.digest, report.source);
      if (!inserted) {
        std::cerr << std::format("[warn] skipping {}: same content as {} (digest 0x{:016x})\n",
                                 report.source, it->second, report.digest);
        continue;
      }
    }
    if (cfg.verbose) {
      std::cerr << std::format("[info] {}: {} lines, {} read / {} write / {} mix (digest 0x{:016x})\n",
                               report.source, report.line_count, report.run.read.size(),
                               report.run.write.size(), report.run.mix.size(), report.digest);
    }
    reports.push_back(std::move(report));
  }

  auto written = write_reports(cfg, reports);
  if (!written) {
    return std::unexpected(written.error());
  }

  if (cfg.summary) {
    const auto entries = cdm::summarize(reports);
    cdm::write_summary(std::cerr, entries);
  }
  return failed ? 1 : 0;
}

bool has_help_flag(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return true;
    }
  }
  return false;
}

void print_cli_help(const std::string& exe_path) {
  const std::string exe = exe_path.empty() ? "cdmparse" : exe_path;
  std::cout << "Usage:\n"
            << "  " << exe << " [options] <report>...\n\n"
            << "Input:\n"
            << "  --encoding <utf-8|utf-16le|auto>     Report text encoding (default: utf-8)\n"
            << "  --compression <auto|none|lz4|zstd>   Archive compression (default: auto)\n"
            << "  --dialect <extended|legacy>          Accepted tokens; legacy knows only\n"
            << "                                       SEQ/RND and [Read]/[Write] (default: extended)\n\n"
            << "Output:\n"
            << "  --format <csv|json|text>             Output format (default: csv)\n"
            << "  --output <path>                      Write output to file (default: stdout)\n"
            << "  --with-source                        Prepend a source column to CSV rows\n"
            << "  --summary                            Print per-test throughput statistics to stderr\n\n"
            << "Batch:\n"
            << "  --threads <u32>                      Parser threads, 0 = hardware concurrency (default: 0)\n"
            << "  --queue-depth <u32>                  Pending job limit (default: 64)\n"
            << "  --dedupe                             Skip reports whose content was already seen\n"
            << "  --verbose                            Trace each parsed report to stderr\n\n"
            << "Help:\n"
            << "  -h, --help                           Show this help and exit\n\n"
            << "Examples:\n"
            << "  " << exe << " CrystalDiskMark_20210622162528.txt\n"
            << "  " << exe << " --encoding utf-16le --format json --output runs.json cdm7/*.txt\n"
            << "  " << exe << " --with-source --dedupe --summary archive/*.txt.zst\n";
}

}  // namespace

namespace cdm::app {

cdm::Expected<TextEncoding> parse_encoding(const std::string& s) {
  if (s == "utf-8" || s == "utf8") {
    return TextEncoding::Utf8;
  }
  if (s == "utf-16le" || s == "utf-16 le" || s == "utf16le") {
    return TextEncoding::Utf16Le;
  }
  if (s == "auto") {
    return TextEncoding::Auto;
  }
  return std::unexpected(AppError{ErrorCode::InvalidArgument, "invalid --encoding: " + s});
}

cdm::Expected<std::optional<CodecId>> parse_compression(const std::string& s) {
  if (s == "auto") {
    return std::optional<CodecId>{};
  }
  if (s == "none") {
    return std::optional<CodecId>{CodecId::None};
  }
  if (s == "lz4") {
    return std::optional<CodecId>{CodecId::Lz4};
  }
  if (s == "zstd") {
    return std::optional<CodecId>{CodecId::Zstd};
  }
  return std::unexpected(AppError{ErrorCode::InvalidArgument, "invalid --compression: " + s});
}

cdm::Expected<OutputFormat> parse_format(const std::string& s) {
  if (s == "csv") {
    return OutputFormat::Csv;
  }
  if (s == "json") {
    return OutputFormat::Json;
  }
  if (s == "text") {
    return OutputFormat::Text;
  }
  return std::unexpected(AppError{ErrorCode::InvalidArgument, "invalid --format: " + s});
}

cdm::Expected<TokenDialect> parse_dialect(const std::string& s) {
  if (s == "extended") {
    return TokenDialect::Extended;
  }
  if (s == "legacy") {
    return TokenDialect::Legacy;
  }
  return std::unexpected(AppError{ErrorCode::InvalidArgument, "invalid --dialect: " + s});
}

cdm::Expected<Config> parse_args(int argc, char** argv) {
  Config cfg{};
  if (argc > 0) {
    cfg.executable_path = argv[0];
  }

  argparse::ArgumentParser program("cdmparse");
  program.add_argument("reports").nargs(argparse::nargs_pattern::at_least_one);
  program.add_argument("--encoding").default_value(std::string("utf-8"));
  program.add_argument("--compression").default_value(std::string("auto"));
  program.add_argument("--dialect").default_value(std::string("extended"));
  program.add_argument("--format").default_value(std::string("csv"));
  program.add_argument("--output").default_value(std::string(""));
  program.add_argument("--with-source").default_value(false).implicit_value(true);
  program.add_argument("--summary").default_value(false).implicit_value(true);
  program.add_argument("--threads").scan<'u', uint32_t>().default_value(static_cast<uint32_t>(0));
  program.add_argument("--queue-depth")
      .scan<'u', uint32_t>()
      .default_value(static_cast<uint32_t>(64));
  program.add_argument("--dedupe").default_value(false).implicit_value(true);
  program.add_argument("--verbose").default_value(false).implicit_value(true);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return std::unexpected(AppError{ErrorCode::InvalidArgument, "argument parsing failed"});
  }

  auto encoding = parse_encoding(program.get<std::string>("--encoding"));
  if (!encoding) {
    return std::unexpected(encoding.error());
  }
  cfg.encoding = *encoding;

  auto compression = parse_compression(program.get<std::string>("--compression"));
  if (!compression) {
    return std::unexpected(compression.error());
  }
  cfg.compression = *compression;

  auto dialect = parse_dialect(program.get<std::string>("--dialect"));
  if (!dialect) {
    return std::unexpected(dialect.error());
  }
  cfg.dialect = *dialect;

  auto format = parse_format(program.get<std::string>("--format"));
  if (!format) {
    return std::unexpected(format.error());
  }
  cfg.format = *format;

  const auto output = program.get<std::string>("--output");
  if (!output.empty()) {
    cfg.output = std::filesystem::path(output);
  }
  for (const auto& report : program.get<std::vector<std::string>>("reports")) {
    cfg.inputs.emplace_back(report);
  }
  cfg.with_source = program.get<bool>("--with-source");
  cfg.summary = program.get<bool>("--summary");
  cfg.threads = program.get<uint32_t>("--threads");
  cfg.queue_depth = program.get<uint32_t>("--queue-depth");
  cfg.dedupe = program.get<bool>("--dedupe");
  cfg.verbose = program.get<bool>("--verbose");

  if (cfg.inputs.empty()) {
    return std::unexpected(AppError{ErrorCode::InvalidArgument, "no report files given"});
  }
  if (cfg.queue_depth == 0) {
    return std::unexpected(AppError{ErrorCode::InvalidArgument, "--queue-depth must be > 0"});
  }
  return cfg;
}

}  // namespace cdm::app

int run_cli_impl(int argc, char** argv) {
  if (has_help_flag(argc, argv)) {
    print_cli_help(argc > 0 ? std::string(argv[0]) : std::string("cdmparse"));
    return 0;
  }

  auto cfg = cdm::app::parse_args(argc, argv);
  if (!cfg) {
    std::cerr << "error: " << cfg.error().what() << "\n";
    return 2;
  }

  auto run = run_batch(*cfg);
  if (!run) {
    std::cerr << "run error: " << run.error().what() << "\n";
    return 1;
  }
  return *run;
}
