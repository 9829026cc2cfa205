#pragma once
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace gitstack::proc {

struct Options {
  std::filesystem::path cwd;                               // empty: inherit
  std::vector<std::pair<std::string, std::string>> env;    // added to the inherited environment
  std::stop_token stop;                                    // kills the child when requested
};

struct Result {
  int exit_code = 0;
  std::string out;
  std::string err;
};

// Run argv[0] (looked up in PATH) to completion, capturing stdout and stderr.
// stdin is /dev/null. Throws CancelledError if `opts.stop` is triggered.
Result run(const std::vector<std::string> &argv, const Options &opts = {});

// A running child whose stdout is consumed line by line.
class LineReader {
public:
  LineReader(const std::vector<std::string> &argv, const Options &opts = {});
  ~LineReader();

  LineReader(const LineReader &) = delete;
  LineReader &operator=(const LineReader &) = delete;

  // Next stdout line without its newline, or std::nullopt at end of output.
  std::optional<std::string> next_line();

  // Wait for the child to exit (draining output) and return its exit status.
  int wait();

  [[nodiscard]] const std::string &stderr_text() const { return err_; }

private:
  bool fill();
  void kill_child();

  int pid_ = -1;
  int out_fd_ = -1;
  int err_fd_ = -1;
  int status_ = -1;
  std::string buffer_;
  std::string err_;
  std::stop_token stop_;
};

} // namespace gitstack::proc
