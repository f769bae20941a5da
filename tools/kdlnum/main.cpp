// kdlnum - KDL numeric literal tool
//
// Usage:
//   kdlnum parse <literal>... [--type T] [--json]
//   kdlnum check <file>
//   kdlnum format <file> [--config kdlnum.yaml] [--no-radix] [--exponent-char c]
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <nlohmann/json.hpp>

#include "kdlnum/basic/diagnostic_printer.hpp"
#include "kdlnum/basic/source_file.hpp"
#include "kdlnum/driver/literal_reader.hpp"
#include "kdlnum/json/number_json.hpp"
#include "kdlnum/number/number_error.hpp"
#include "kdlnum/print/number_writer.hpp"
#include "kdlnum/print/print_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "kdlnum v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  parse <literal>...       Parse literals and print their values\n"
            << "  check <file>             Report malformed literals in a file\n"
            << "  format <file>            Print every literal of a file in canonical form\n\n"
            << "Options:\n"
            << "  --type <name>            Type annotation attached by 'parse'\n"
            << "  --json                   Print 'parse' results as JSON\n"
            << "  --config <path>          Print configuration (default: nearest kdlnum.yaml)\n"
            << "  --no-radix               Write every number in decimal\n"
            << "  --exponent-char <E|e>    Exponent marker for decimal floats\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const kdlnum::DiagnosticBag & diagnostics, const kdlnum::SourceFile & source)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  kdlnum::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, source);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::optional<std::string> type;
  std::string config_path;
  std::optional<std::string> exponent_char;
  bool json = false;
  bool no_radix = false;
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

    if (arg == "--type") {
      if (i + 1 < argc) {
        args.type = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--exponent-char") {
      if (i + 1 < argc) {
        args.exponent_char = argv[++i];
      }
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--no-radix") {
      args.no_radix = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else {
      // Negative literals such as -5 are positional too.
      args.positional.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

std::optional<kdlnum::PrintConfig> resolve_print_config(
  const CommandArgs & args, const fs::path & start_dir)
{
  kdlnum::PrintConfig config;

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = kdlnum::find_print_config(start_dir);
  }

  if (config_path) {
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
    const auto result = kdlnum::load_print_config(*config_path);
    if (!result.success) {
      std::cerr << "error: " << result.error << "\n";
      return std::nullopt;
    }
    config = result.config;
  }

  // Command line flags override the file.
  if (args.no_radix) {
    config.respect_radix = false;
  }
  if (args.exponent_char) {
    if (*args.exponent_char != "E" && *args.exponent_char != "e") {
      std::cerr << "error: --exponent-char must be 'E' or 'e'\n";
      return std::nullopt;
    }
    config.exponent_char = args.exponent_char->front();
  }

  return config;
}

std::optional<kdlnum::SourceFile> read_source(const std::string & input_file)
{
  const fs::path input_path = fs::absolute(input_file);

  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }

  std::ifstream file(input_path);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return kdlnum::SourceFile(input_path, buffer.str());
}

// ============================================================================
// Commands
// ============================================================================

int cmd_parse(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: at least one literal required\n";
    std::cerr << "usage: kdlnum parse <literal>... [--type T] [--json]\n";
    return 1;
  }

  const auto config = resolve_print_config(args, fs::current_path());
  if (!config) {
    return 1;
  }

  int status = 0;
  nlohmann::json out = nlohmann::json::array();

  for (const auto & literal : args.positional) {
    if (args.verbose) {
      std::cerr << "Parsing: " << literal << "\n";
    }

    const auto result = kdlnum::parse_literal_word(literal, args.type);
    if (!result.success()) {
      std::cerr << "error: " << literal << ": " << result.message << "\n";
      status = 1;
      continue;
    }

    if (args.json) {
      out.push_back(kdlnum::to_json(*result.value));
      continue;
    }

    try {
      std::cout << literal << ": " << kdlnum::to_string(result.value->kind()) << " ";
      kdlnum::write_typed_number(std::cout, *result.value, *config);
      std::cout << "\n";
    } catch (const kdlnum::NumberError & e) {
      std::cout << "\n";
      std::cerr << "error: " << literal << ": " << e.what() << "\n";
      status = 1;
    }
  }

  if (args.json) {
    std::cout << out.dump(2) << "\n";
  }

  return status;
}

int cmd_check(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: kdlnum check <file>\n";
    return 1;
  }

  const auto source = read_source(args.positional.front());
  if (!source) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Checking: " << source->path().string() << "\n";
  }

  const auto result = kdlnum::read_literals(*source);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, *source);
  }

  if (result.has_errors()) {
    return 1;
  }

  std::cout << args.positional.front() << ": OK (" << result.entries.size() << " literals)\n";
  return 0;
}

int cmd_format(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: kdlnum format <file> [--config kdlnum.yaml]\n";
    return 1;
  }

  const auto source = read_source(args.positional.front());
  if (!source) {
    return 1;
  }

  const auto config = resolve_print_config(args, source->path());
  if (!config) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Formatting: " << source->path().string() << "\n";
  }

  const auto result = kdlnum::read_literals(*source);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, *source);
  }

  if (result.has_errors()) {
    return 1;
  }

  std::vector<kdlnum::NumberValue> values;
  values.reserve(result.entries.size());
  for (const auto & entry : result.entries) {
    values.push_back(entry.value);
  }

  try {
    kdlnum::write_numbers(std::cout, values, *config, "\n");
    if (!values.empty()) {
      std::cout << "\n";
    }
  } catch (const kdlnum::NumberError & e) {
    std::cerr << "\nerror: " << e.what() << "\n";
    return 1;
  }

  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "parse") {
    return cmd_parse(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "format") {
    return cmd_format(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
