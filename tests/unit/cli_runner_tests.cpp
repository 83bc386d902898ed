#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "app/cli_runner.hpp"

namespace {

const std::filesystem::path kOutDir =
    std::filesystem::temp_directory_path() / "cdm_test_cli_out";

constexpr std::string_view kReportA =
    "[Read]\n"
    "  SEQ    1MiB (Q=  8, T= 1):   531.458 MB/s [    506.8 IOPS] < 15726.77 us>\n"
    "[Write]\n"
    "  SEQ    1MiB (Q=  8, T= 1):   494.379 MB/s [    471.5 IOPS] < 16887.06 us>\n"
    "Profile: Default\n"
    "Comment: disk A\n";

constexpr std::string_view kReportB =
    "[Read]\n"
    "  RND    4KiB (Q= 32, T= 1):   269.406 MB/s [  65772.9 IOPS] <   470.58 us>\n"
    "Comment: disk B\n";

// Swaps the stream buffer of `stream` for a string buffer until destroyed.
class StreamCapture {
 public:
  explicit StreamCapture(std::ostream& stream)
      : stream_(stream), old_(stream.rdbuf(buf_.rdbuf())) {}
  ~StreamCapture() { stream_.rdbuf(old_); }

  StreamCapture(const StreamCapture&) = delete;
  StreamCapture& operator=(const StreamCapture&) = delete;

  std::string text() const { return buf_.str(); }

 private:
  std::ostringstream buf_;
  std::ostream& stream_;
  std::streambuf* old_;
};

std::filesystem::path write_file(const std::string& name, std::string_view content) {
  const auto path = kOutDir / name;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  return path;
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::vector<std::string> read_lines(const std::filesystem::path& path) {
  std::vector<std::string> lines;
  std::istringstream in(read_file(path));
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  return lines;
}

int run_cli(std::vector<std::string> args) {
  args.insert(args.begin(), "cdmparse");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return run_cli_impl(static_cast<int>(args.size()), argv.data());
}

bool reset_out_dir() {
  std::error_code ec;
  std::filesystem::remove_all(kOutDir, ec);
  std::filesystem::create_directories(kOutDir, ec);
  if (ec) {
    std::cerr << std::format("failed to create {}: {}\n", kOutDir.string(), ec.message());
    return false;
  }
  return true;
}

bool test_rows_follow_argument_order() {
  if (!reset_out_dir()) {
    return false;
  }
  const auto b = write_file("b.txt", kReportB);
  const auto a = write_file("a.txt", kReportA);
  const auto csv = kOutDir / "out.csv";

  int rc = 0;
  {
    StreamCapture err(std::cerr);
    rc = run_cli({"--threads", "4", "--with-source", "--output", csv.string(), b.string(),
                  a.string()});
  }
  if (rc != 0) {
    std::cerr << std::format("expected exit 0, got {}\n", rc);
    return false;
  }

  const auto lines = read_lines(csv);
  if (lines.size() != 4 || !lines[0].starts_with("source,date,")) {
    std::cerr << std::format("expected header plus 3 rows:\n{}\n", read_file(csv));
    return false;
  }
  const auto row_is = [&](size_t i, const std::filesystem::path& src, std::string_view cells) {
    return lines[i].starts_with(src.string() + ",") && lines[i].find(cells) != std::string::npos;
  };
  if (!row_is(1, b, ",read,RND,4,KiB,") || !row_is(2, a, ",read,SEQ,") ||
      !row_is(3, a, ",write,SEQ,")) {
    std::cerr << std::format("rows are not in argument order:\n{}\n", read_file(csv));
    return false;
  }
  return true;
}

bool test_failed_file_exit_one() {
  if (!reset_out_dir()) {
    return false;
  }
  const auto good = write_file("good.txt", kReportA);
  const auto bad = write_file(
      "bad.txt", "SEQ 1MiB (Q= 8, T= 1): 531.458 MB/s [506.8 IOPS] <15726.77 us>\n");
  const auto missing = kOutDir / "missing.txt";
  const auto csv = kOutDir / "out.csv";

  int rc = 0;
  std::string diag;
  {
    StreamCapture err(std::cerr);
    rc = run_cli({"--output", csv.string(), bad.string(), good.string(), missing.string()});
    diag = err.text();
  }
  if (rc != 1) {
    std::cerr << std::format("expected exit 1, got {}\n", rc);
    return false;
  }
  if (diag.find(std::format("error: {}:1: classification error: ", bad.string())) ==
      std::string::npos) {
    std::cerr << std::format("missing line-numbered error for {}:\n{}\n", bad.string(), diag);
    return false;
  }
  if (diag.find(std::format("error: {}: io error: ", missing.string())) == std::string::npos) {
    std::cerr << std::format("missing io error for {}:\n{}\n", missing.string(), diag);
    return false;
  }

  // The good file still produces its rows.
  const auto lines = read_lines(csv);
  if (lines.size() != 3 || lines[2].find("disk A") == std::string::npos) {
    std::cerr << std::format("good report rows missing:\n{}\n", read_file(csv));
    return false;
  }
  return true;
}

bool test_bad_arguments_exit_two() {
  if (!reset_out_dir()) {
    return false;
  }
  const auto a = write_file("a.txt", kReportA);

  for (const auto& args : {
           std::vector<std::string>{"--format", "xml", a.string()},
           std::vector<std::string>{"--encoding", "latin-1", a.string()},
           std::vector<std::string>{"--queue-depth", "0", a.string()},
           std::vector<std::string>{"--format", "csv"},
       }) {
    int rc = 0;
    std::string diag;
    {
      StreamCapture err(std::cerr);
      rc = run_cli(args);
      diag = err.text();
    }
    if (rc != 2 || diag.find("error: ") == std::string::npos) {
      std::cerr << std::format("expected exit 2 with a diagnostic for '{}', got {}\n",
                               args.front(), rc);
      return false;
    }
  }
  return true;
}

bool test_help_exit_zero() {
  int rc = 1;
  std::string help;
  {
    StreamCapture out(std::cout);
    rc = run_cli({"--help"});
    help = out.text();
  }
  if (rc != 0 || help.find("--dedupe") == std::string::npos) {
    std::cerr << std::format("--help should print usage and exit 0, got {}\n", rc);
    return false;
  }
  return true;
}

bool test_dedupe_skips_same_content() {
  if (!reset_out_dir()) {
    return false;
  }
  std::string crlf;
  for (const char ch : kReportA) {
    if (ch == '\n') {
      crlf += '\r';
    }
    crlf += ch;
  }
  const auto first = write_file("first.txt", kReportA);
  const auto copy = write_file("copy.txt", crlf);
  const auto other = write_file("other.txt", kReportB);
  const auto csv = kOutDir / "out.csv";

  int rc = 0;
  std::string diag;
  {
    StreamCapture err(std::cerr);
    rc = run_cli({"--dedupe", "--with-source", "--output", csv.string(), first.string(),
                  copy.string(), other.string()});
    diag = err.text();
  }
  if (rc != 0) {
    std::cerr << std::format("expected exit 0, got {}\n{}\n", rc, diag);
    return false;
  }
  if (diag.find(std::format("[warn] skipping {}: same content as {}", copy.string(),
                            first.string())) == std::string::npos) {
    std::cerr << std::format("missing dedupe warning:\n{}\n", diag);
    return false;
  }

  const auto lines = read_lines(csv);
  if (lines.size() != 4) {
    std::cerr << std::format("expected 3 rows after dedupe:\n{}\n", read_file(csv));
    return false;
  }
  for (size_t i = 1; i < lines.size(); ++i) {
    if (lines[i].starts_with(copy.string() + ",")) {
      std::cerr << std::format("duplicate report was not skipped:\n{}\n", read_file(csv));
      return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  if (!test_rows_follow_argument_order()) {
    return 1;
  }
  if (!test_failed_file_exit_one()) {
    return 1;
  }
  if (!test_bad_arguments_exit_two()) {
    return 1;
  }
  if (!test_help_exit_zero()) {
    return 1;
  }
  if (!test_dedupe_skips_same_content()) {
    return 1;
  }

  std::error_code ec;
  std::filesystem::remove_all(kOutDir, ec);
  return 0;
}
