// dockspan - Dockerfile instruction inspector
//
// Usage:
//   dockspan dump [options] <Dockerfile>
//   dockspan check [options] <Dockerfile>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "dockspan/ast/json_visitor.hpp"
#include "dockspan/basic/diagnostic_printer.hpp"
#include "dockspan/basic/source_manager.hpp"
#include "dockspan/project/project_config.hpp"
#include "dockspan/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "dockspan v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options] <Dockerfile>\n\n"
            << "Commands:\n"
            << "  dump                     Print the parsed instructions\n"
            << "  check                    Report parse errors\n\n"
            << "Options:\n"
            << "  --config <path>          Use this dockspan.yaml instead of searching for one\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  --fail-fast              Stop at the first failing instruction\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

bool use_color_for(dockspan::ColorMode mode, bool no_color_flag)
{
  if (no_color_flag) return false;
  switch (mode) {
    case dockspan::ColorMode::Always:
      return true;
    case dockspan::ColorMode::Never:
      return false;
    case dockspan::ColorMode::Auto:
      break;
  }
  // Detect if terminal supports colors (simple check for TTY)
  return isatty(fileno(stderr)) != 0;
}

void print_summary(const dockspan::Dockerfile & file, const dockspan::SourceManager & source)
{
  const std::string name = source.get_file_path().filename().string();
  for (const auto & instruction : file.instructions) {
    const auto pos = source.get_line_column(instruction.span().start());
    std::cout << name << ":" << pos.line << ":" << pos.column << ": " << instruction.describe()
              << "\n";
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string config_path;
  bool no_color = false;
  bool fail_fast = false;
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

    if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "--fail-fast") {
      args.fail_fast = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Shared pipeline
// ============================================================================

struct Session
{
  dockspan::ProjectConfig config;
  dockspan::SourceManager source;
  dockspan::Dockerfile dockerfile;
  dockspan::DiagnosticBag diags;
};

bool load_config(const CommandArgs & args, const fs::path & input_path, dockspan::ProjectConfig & out)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = dockspan::find_project_config(input_path);
  }

  if (!config_path) {
    if (args.verbose) {
      std::cerr << "No " << dockspan::k_project_config_file_name << " found, using defaults\n";
    }
    return true;
  }

  const auto result = dockspan::load_project_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return false;
  }
  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  out = result.config;
  return true;
}

bool run_pipeline(const CommandArgs & args, Session & session)
{
  if (args.input_file.empty()) {
    std::cerr << "error: Dockerfile path required\n";
    return false;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return false;
  }

  if (!load_config(args, input_path, session.config)) {
    return false;
  }

  std::ifstream file(input_path, std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  session.source = dockspan::SourceManager(input_path, buffer.str());

  if (args.verbose) {
    std::cerr << "Parsing: " << input_path.string() << "\n";
  }

  if (args.fail_fast || !session.config.parse.recover) {
    auto parsed = dockspan::parse_dockerfile(session.source.get_source());
    if (parsed) {
      session.dockerfile = std::move(parsed).value();
    } else {
      session.diags.add(dockspan::to_diagnostic(parsed.error()));
    }
  } else {
    auto parsed = dockspan::parse_dockerfile_with_recovery(session.source.get_source());
    session.dockerfile = std::move(parsed.dockerfile);
    session.diags.merge(std::move(parsed.diags));
  }
  return true;
}

void print_diagnostics(const CommandArgs & args, const Session & session)
{
  if (session.diags.empty()) return;
  dockspan::DiagnosticPrinter printer(
    std::cerr, use_color_for(session.config.output.color, args.no_color));
  printer.print_all(session.diags, session.source);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_dump(const CommandArgs & args)
{
  Session session;
  if (!run_pipeline(args, session)) {
    return 1;
  }
  print_diagnostics(args, session);

  if (session.config.output.format == dockspan::OutputFormat::Summary) {
    print_summary(session.dockerfile, session.source);
  } else {
    std::cout << dockspan::to_json(session.dockerfile).dump(session.config.output.indent) << "\n";
  }

  return session.diags.has_errors() ? 1 : 0;
}

int cmd_check(const CommandArgs & args)
{
  Session session;
  if (!run_pipeline(args, session)) {
    return 1;
  }
  print_diagnostics(args, session);

  if (session.diags.has_errors()) {
    return 1;
  }
  std::cout << args.input_file << ": OK (" << session.dockerfile.instructions.size()
            << " instructions)\n";
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

  if (args.command == "dump") {
    return cmd_dump(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
