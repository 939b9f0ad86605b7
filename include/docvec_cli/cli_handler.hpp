#pragma once

#include <optional>
#include <string>
#include <vector>

#include "docvec_core/services/indexing_service.hpp"
#include "docvec_core/services/search_service.hpp"

namespace docvec_cli {

enum class Command { Index, Search, Help };

struct CliOptions {
  Command command;
  std::string file_path;
  std::string query;
  std::optional<int> top_k;
  std::optional<std::string> config_path;
};

// Bad command line; reported with exit status EXIT_USAGE
class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  static constexpr int EXIT_OK = 0;
  static constexpr int EXIT_FAILURE_STATUS = 1;
  static constexpr int EXIT_USAGE = 2;

  CliHandler() = default;

  // Parse command line arguments
  CliOptions parse_arguments(int argc, char *argv[]);

  // Runs one pipeline and returns the process exit status
  int execute_command(const CliOptions &options);

  static std::string format_search_results(const std::vector<docvec_core::SearchResult> &results);
  static std::string format_index_report(const docvec_core::IndexReport &report);

  void print_help();

 private:
  int handle_index_command(const CliOptions &options);
  int handle_search_command(const CliOptions &options);

  static int parse_top_k(const std::string &value);
  void print_error(const std::string &error);
};

}  // namespace docvec_cli
