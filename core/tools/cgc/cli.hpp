// cgc/cli.hpp - Argument parsing and commands of the cgc tool
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace codegraph::cli
{

/// Exit status: no error-severity violation was found
inline constexpr int k_exit_ok = 0;
/// Exit status: at least one error-severity violation
inline constexpr int k_exit_violations = 1;
/// Exit status: usage or input error
inline constexpr int k_exit_usage = 2;

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::vector<std::string> changed_files;
  std::string config_path;
  std::string output_path;
  std::string label;
  // change
  std::string entity;
  std::string change_type;
  std::string new_name;
  bool json = false;
  int verbosity = 0;
  bool show_help = false;
  std::string error;
};

/// argv[0] is the program name, argv[1] the command
[[nodiscard]] CommandArgs parse_args(int argc, const char * const * argv);

/// Where a command writes: `out` for results, `err` for diagnostics
struct Console
{
  std::ostream & out;
  std::ostream & err;
  bool color = false;
};

void print_usage(std::ostream & os, std::string_view program_name);

/// Run one parsed command and return its exit status
int run_command(const CommandArgs & args, const Console & console);

/// Parse, handle help and usage errors, set the log level, run
int run(int argc, const char * const * argv, const Console & console);

}  // namespace codegraph::cli
