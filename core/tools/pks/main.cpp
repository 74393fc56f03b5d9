// pks - Pack boundary checker Command Line Interface
//
// Usage:
//   pks [--project-root <dir>] [-v] [-j <n>] [--no-color] <command> [options]
//
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "pks/driver/runner.hpp"

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "pks - pack boundary checker\n\n"
            << "Usage: " << program_name << " [options] <command> [command options]\n\n"
            << "Commands:\n"
            << "  check [files...]         Look for violations in the codebase\n"
            << "      --ignore-recorded-violations\n"
            << "                           Also report violations listed in package_todo.yml\n"
            << "  check-contents <file>    Check one file whose contents are piped to stdin\n"
            << "      --ignore-recorded-violations\n"
            << "  validate                 Look for errors in the pack configuration\n"
            << "  list-packs               List packs found with packwerk.yml\n"
            << "  list-included-files      List the files that are analyzed\n"
            << "  list-definitions         List constant definitions and where they are\n"
            << "      --ambiguous          Only constants defined in more than one file\n"
            << "  list-references          List every constant reference\n"
            << "      --json               Print references as JSON\n\n"
            << "Options:\n"
            << "  --project-root <dir>     Root of the project (default: .)\n"
            << "  -j, --jobs <n>           Worker threads (default: hardware threads)\n"
            << "  --no-color               Disable terminal colors\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string project_root = ".";
  size_t jobs = 0;
  bool verbose = false;
  bool no_color = false;
  bool ignore_recorded_violations = false;
  bool ambiguous = false;
  bool json = false;
  bool show_help = false;
  std::string error;
};

bool parse_jobs(const std::string & value, size_t & out)
{
  if (value.empty()) return false;
  char * end = nullptr;
  const unsigned long n = std::strtoul(value.c_str(), &end, 10);
  if (end == nullptr || *end != '\0' || n == 0) return false;
  out = static_cast<size_t>(n);
  return true;
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--project-root") {
      if (i + 1 >= argc) {
        args.error = "--project-root requires a directory";
        return args;
      }
      args.project_root = argv[++i];
    } else if (arg == "-j" || arg == "--jobs") {
      if (i + 1 >= argc || !parse_jobs(argv[i + 1], args.jobs)) {
        args.error = "--jobs requires a positive number";
        return args;
      }
      ++i;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "--ignore-recorded-violations") {
      args.ignore_recorded_violations = true;
    } else if (arg == "--ambiguous" || arg == "-a") {
      args.ambiguous = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option: " + arg;
      return args;
    } else if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }

  if (args.command.empty() && !args.show_help) {
    args.error = "no command given";
  }
  return args;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }
  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  pks::RunOptions options;
  options.project_root = args.project_root;
  options.jobs = args.jobs;
  options.verbose = args.verbose;
  options.use_color = !args.no_color && isatty(fileno(stdout)) != 0;

  pks::Runner runner(options, std::cout, std::cerr);

  if (args.command == "check") {
    pks::CheckOptions check_options;
    check_options.ignore_recorded_violations = args.ignore_recorded_violations;
    return runner.check(check_options, args.positional);
  }
  if (args.command == "check-contents") {
    if (args.positional.size() != 1) {
      std::cerr << "error: check-contents requires exactly one file\n";
      return 1;
    }
    pks::CheckOptions check_options;
    check_options.ignore_recorded_violations = args.ignore_recorded_violations;
    const std::string contents{
      std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    return runner.check_contents(check_options, args.positional.front(), contents);
  }
  if (args.command == "validate") {
    return runner.validate();
  }
  if (args.command == "list-packs") {
    return runner.list_packs();
  }
  if (args.command == "list-included-files") {
    return runner.list_included_files();
  }
  if (args.command == "list-definitions") {
    return runner.list_definitions(args.ambiguous);
  }
  if (args.command == "list-references") {
    return runner.list_references(args.json);
  }

  std::cerr << "error: unknown command: " << args.command << "\n";
  print_usage(argv[0]);
  return 1;
}
