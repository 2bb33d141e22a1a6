// iapi - Inversion API schema checker Command Line Interface
//
// Usage:
//   iapi check [file.json | file.yaml | --project]
//   iapi dump <file>
//
#include <filesystem>
#include <iostream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "iapi/basic/diagnostic_printer.hpp"
#include "iapi/driver/engine.hpp"
#include "iapi/project/project_config.hpp"
#include "iapi/schema/model_json.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_errors = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Inversion API schema checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [file]             Validate a schema document or project\n"
            << "  dump <file>              Validate and print the resolved model as JSON\n\n"
            << "Options:\n"
            << "  --project                Validate the documents listed in iapi.yaml\n"
            << "  --warnings-as-errors     Treat warnings as errors\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string bad_option;
  bool use_project = false;
  bool warnings_as_errors = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--warnings-as-errors") {
      args.warnings_as_errors = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else if (args.bad_option.empty()) {
      args.bad_option = arg;
    }
  }

  return args;
}

void print_diagnostics(
  const iapi::DiagnosticBag & diagnostics, const std::string & document_name, bool use_color)
{
  if (diagnostics.empty()) return;
  iapi::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, document_name);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args, bool use_color)
{
  iapi::ValidateOptions options;
  options.warnings_as_errors = args.warnings_as_errors;

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find iapi.yaml
    auto config_path = iapi::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << iapi::k_project_config_file_name
                << " found in current directory or parents\n";
      return k_exit_errors;
    }

    const auto config_result = iapi::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return k_exit_errors;
    }

    if (args.verbose) {
      std::cerr << "Checking project: " << config_result.config.package.name << " ("
                << config_result.config.validator.documents.size() << " documents)\n";
    }

    const iapi::ProjectResult result =
      iapi::Engine::validate_project(config_result.config, options);
    print_diagnostics(result.diagnostics, config_path->string(), use_color);

    for (const auto & report : result.documents) {
      if (args.verbose) {
        std::cerr << "Checked: " << report.path.string() << "\n";
      }
      print_diagnostics(report.result.diagnostics, report.path.string(), use_color);
      if (report.result.success) {
        std::cout << report.path.string() << ": OK\n";
      }
    }

    return result.success ? k_exit_ok : k_exit_errors;
  }

  // Single file mode
  const fs::path input_path = fs::absolute(args.input_file);

  if (args.verbose) {
    std::cerr << "Checking: " << input_path.string() << "\n";
  }

  const iapi::ValidateResult result = iapi::Engine::validate_file(input_path, options);
  print_diagnostics(result.diagnostics, args.input_file, use_color);

  if (result.success) {
    std::cout << args.input_file << ": OK\n";
    return k_exit_ok;
  }
  return k_exit_errors;
}

int cmd_dump(const CommandArgs & args, bool use_color)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: iapi dump <file>\n";
    return k_exit_usage;
  }

  iapi::ValidateOptions options;
  options.warnings_as_errors = args.warnings_as_errors;

  const fs::path input_path = fs::absolute(args.input_file);
  if (args.verbose) {
    std::cerr << "Dumping: " << input_path.string() << "\n";
  }

  const iapi::ValidateResult result = iapi::Engine::validate_file(input_path, options);
  print_diagnostics(result.diagnostics, args.input_file, use_color);

  if (!result.success || !result.model) {
    return k_exit_errors;
  }

  std::cout << iapi::model_to_json(*result.model).dump(2) << "\n";
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.bad_option.empty()) {
    std::cerr << "error: unexpected argument '" << args.bad_option << "'\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;

  if (args.command == "check") {
    return cmd_check(args, use_color);
  }

  if (args.command == "dump") {
    return cmd_dump(args, use_color);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_usage;
}
