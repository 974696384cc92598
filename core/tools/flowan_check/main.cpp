// flowan-check - Flow analysis command line interface
//
// Usage:
//   flowan-check <unit.json> [--config flowan.yaml] [--source file]
//                [--dump-flow] [--no-color] [-v]
//
#include <fmt/format.h>

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

#include "flowan/basic/diagnostic_printer.hpp"
#include "flowan/driver/checker.hpp"
#include "flowan/project/analysis_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "flowan-check v0.1.0\n\n"
            << "Usage: " << program_name << " <unit.json> [options]\n\n"
            << "Options:\n"
            << "  --config <path>     Use this flowan.yaml instead of searching for one\n"
            << "  --source <path>     Program text the unit's ranges refer to\n"
            << "  --dump-flow         Print flow results as JSON on stdout\n"
            << "  --no-color          Disable colored diagnostics\n"
            << "  -v, --verbose       Verbose output\n"
            << "  -h, --help          Show this help message\n";
}

bool use_color_for(flowan::ColorMode mode, bool no_color_flag)
{
  if (no_color_flag) {
    return false;
  }
  switch (mode) {
    case flowan::ColorMode::Always:
      return true;
    case flowan::ColorMode::Never:
      return false;
    case flowan::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string input_file;
  std::string config_path;
  std::string source_path;
  bool dump_flow = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" || arg == "--source") {
      if (i + 1 >= argc) {
        args.error = "missing value for " + arg;
        return args;
      }
      (arg == "--config" ? args.config_path : args.source_path) = argv[++i];
    } else if (arg == "--dump-flow") {
      args.dump_flow = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
      return args;
    }
  }

  if (!args.show_help && args.input_file.empty()) {
    args.error = "no input file";
  }
  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// Explicit --config wins; otherwise search upward from the input file.
flowan::ConfigLoadResult resolve_config(const CommandArgs & args)
{
  if (!args.config_path.empty()) {
    return flowan::load_analysis_config(args.config_path);
  }
  if (auto found = flowan::find_analysis_config(fs::path(args.input_file))) {
    if (args.verbose) {
      std::cerr << fmt::format("Using configuration {}\n", found->string());
    }
    return flowan::load_analysis_config(*found);
  }
  return flowan::ConfigLoadResult::ok(flowan::AnalysisConfig{});
}

int cmd_check(const CommandArgs & args)
{
  const flowan::ConfigLoadResult config = resolve_config(args);
  if (!config.success) {
    std::cerr << "error: " << config.error << "\n";
    return 1;
  }

  flowan::CheckOptions options;
  options.flow = config.config.flow;
  options.dump_flow = args.dump_flow || config.config.output.dump_flow;
  options.verbose = args.verbose;
  if (!args.source_path.empty()) {
    options.source_path = fs::path(args.source_path);
  }

  const flowan::CheckResult result = flowan::Checker::check_file(args.input_file, options);

  flowan::DiagnosticPrinter printer(
    std::cerr, use_color_for(config.config.output.color, args.no_color));
  printer.print_all(result.diagnostics, result.source);

  if (options.dump_flow) {
    std::cout << result.flow_dump.dump(2) << "\n";
  }

  return result.success ? 0 : 1;
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
    std::cerr << "error: " << args.error << "\n\n";
    print_usage(argv[0]);
    return 1;
  }

  return cmd_check(args);
}
