// nekoc - NekoMaid UI command line front-end
//
// Usage:
//   nekoc check [file.nui | --project]
//   nekoc dump <file.nui>
//   nekoc tokens <file.nui>
//   nekoc ast <file.nui>
//   nekoc init <project-name>
//
#include <fmt/core.h>

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

#include "neko_ui/ast/ast_context.hpp"
#include "neko_ui/ast/json_visitor.hpp"
#include "neko_ui/basic/diagnostic_printer.hpp"
#include "neko_ui/document/document_json.hpp"
#include "neko_ui/driver/document_loader.hpp"
#include "neko_ui/project/project_config.hpp"
#include "neko_ui/syntax/frontend.hpp"
#include "neko_ui/syntax/lexer.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "NekoMaid UI front-end v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [file.nui]            Parse and resolve a file or project\n"
            << "  dump <file.nui>             Print the resolved document as JSON\n"
            << "  tokens <file.nui>           Print the token stream\n"
            << "  ast <file.nui>              Print the syntax tree as JSON\n"
            << "  init <project-name>         Initialize a new project\n\n"
            << "Options:\n"
            << "  --project                   Use nekoui.yaml (entry points and widgets)\n"
            << "  --recover                   Keep parsing after errors\n"
            << "  --allow-undeclared-classes  Accept classes no style mentions\n"
            << "  --no-color                  Disable colored diagnostics\n"
            << "  -h, --help                  Show this help message\n";
}

bool stderr_is_tty() { return isatty(fileno(stderr)) != 0; }

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  bool use_project = false;
  bool recover = false;
  bool allow_undeclared_classes = false;
  bool no_color = false;
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
    const std::string arg = argv[i];

    if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--recover") {
      args.recover = true;
    } else if (arg == "--allow-undeclared-classes") {
      args.allow_undeclared_classes = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      fmt::print(stderr, "warning: ignoring unknown option '{}'\n", arg);
    }
  }

  return args;
}

// ============================================================================
// Helpers
// ============================================================================

bool use_color(const CommandArgs & args) { return !args.no_color && stderr_is_tty(); }

void report(
  const CommandArgs & args, const neko_ui::DiagnosticBag & diags,
  const neko_ui::SourceRegistry & sources)
{
  if (diags.empty()) {
    return;
  }
  neko_ui::DiagnosticPrinter printer(std::cerr, use_color(args));
  printer.print_all(diags, sources);
  printer.print_summary(diags);
}

std::optional<std::string> read_input(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    fmt::print(stderr, "error: failed to open file: {}\n", path.string());
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

neko_ui::syntax::ParseOptions parse_options(const CommandArgs & args)
{
  neko_ui::syntax::ParseOptions options;
  options.recover = args.recover;
  return options;
}

bool require_input(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    fmt::print(stderr, "error: input file required\n");
    fmt::print(stderr, "usage: nekoc {} <file.nui>\n", args.command);
    return false;
  }
  return true;
}

/// Load one file; `widgets` may be null (no widget checking).
neko_ui::LoadResult load(
  const CommandArgs & args, const fs::path & path, const neko_ui::WidgetRegistry * widgets,
  const neko_ui::UiConfig * ui)
{
  neko_ui::LoadOptions options;
  options.parse = parse_options(args);
  options.resolve.allow_undeclared_classes = args.allow_undeclared_classes;
  options.resolve.widgets = widgets;
  if (ui != nullptr) {
    options.parse.recover = options.parse.recover || ui->recover;
    options.parse.max_errors = ui->max_errors;
    options.resolve.allow_undeclared_classes =
      options.resolve.allow_undeclared_classes || ui->allow_undeclared_classes;
  }
  return neko_ui::DocumentLoader(std::move(options)).load_file(path);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check_project(const CommandArgs & args)
{
  const auto config_path = neko_ui::find_project_config(fs::current_path());
  if (!config_path) {
    fmt::print(stderr, "error: no {} found in current directory or parents\n",
               neko_ui::k_project_config_file_name);
    return 1;
  }

  const auto config_result = neko_ui::load_project_config(*config_path);
  if (!config_result.success) {
    fmt::print(stderr, "error: {}\n", config_result.error);
    return 1;
  }
  const neko_ui::ProjectConfig & config = config_result.config;
  if (config.ui.entry_points.empty()) {
    fmt::print(stderr, "error: ui.entry_points is empty in {}\n", config_path->string());
    return 1;
  }

  const neko_ui::WidgetRegistry widgets = neko_ui::build_widget_registry(config);
  bool ok = true;
  for (const auto & entry : config.ui.entry_points) {
    const fs::path path = config.project_root / entry;
    const neko_ui::LoadResult result = load(args, path, &widgets, &config.ui);
    report(args, result.diagnostics, result.sources);
    if (result.success) {
      fmt::print("{}: OK\n", entry.string());
    } else {
      ok = false;
    }
  }
  return ok ? 0 : 1;
}

int cmd_check(const CommandArgs & args)
{
  if (args.use_project || args.input_file.empty()) {
    return cmd_check_project(args);
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    fmt::print(stderr, "error: file not found: {}\n", input_path.string());
    return 1;
  }

  const neko_ui::LoadResult result = load(args, input_path, nullptr, nullptr);
  report(args, result.diagnostics, result.sources);
  if (!result.success) {
    return 1;
  }
  fmt::print("{}: OK\n", args.input_file);
  return 0;
}

int cmd_dump(const CommandArgs & args)
{
  if (!require_input(args)) {
    return 1;
  }

  const neko_ui::LoadResult result = load(args, fs::absolute(args.input_file), nullptr, nullptr);
  report(args, result.diagnostics, result.sources);
  if (!result.success) {
    return 1;
  }
  std::cout << neko_ui::to_json(*result.document).dump(2) << "\n";
  return 0;
}

int cmd_tokens(const CommandArgs & args)
{
  if (!require_input(args)) {
    return 1;
  }
  auto text = read_input(args.input_file);
  if (!text) {
    return 1;
  }

  neko_ui::SourceRegistry sources;
  neko_ui::DiagnosticBag diags;
  const neko_ui::FileId file_id = sources.register_file(args.input_file, std::move(*text));
  const neko_ui::SourceFile * file = sources.get_file(file_id);

  neko_ui::syntax::Lexer lexer(file_id, file->content(), &diags);
  for (const auto & token : lexer.lex_all()) {
    fmt::print(
      "{}:{}\t{}\t{}\n", token.loc.line, token.loc.column, neko_ui::syntax::to_string(token.kind),
      token.text);
  }

  report(args, diags, sources);
  return diags.has_errors() ? 1 : 0;
}

int cmd_ast(const CommandArgs & args)
{
  if (!require_input(args)) {
    return 1;
  }
  auto text = read_input(args.input_file);
  if (!text) {
    return 1;
  }

  neko_ui::SourceRegistry sources;
  neko_ui::AstContext ast;
  neko_ui::DiagnosticBag diags;
  const neko_ui::ParseOutput parsed = neko_ui::parse_source(
    sources, args.input_file, std::move(*text), ast, diags, parse_options(args));

  report(args, diags, sources);
  if (parsed.program == nullptr) {
    return 1;
  }
  std::cout << neko_ui::to_json(parsed.program).dump(2) << "\n";
  return parsed.success ? 0 : 1;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    fmt::print(stderr, "error: project name required\n");
    fmt::print(stderr, "usage: nekoc init <project-name>\n");
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    fmt::print(stderr, "error: directory already exists: {}\n", project_dir.string());
    return 1;
  }

  try {
    fs::create_directories(project_dir / "src");

    std::ofstream config(project_dir / neko_ui::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << args.input_file << "'\n"
           << "  version: '0.1.0'\n\n"
           << "ui:\n"
           << "  entry_points:\n"
           << "    - 'src/main.nui'\n"
           << "  recover: false\n"
           << "  max_errors: 32\n\n"
           << "widgets:\n"
           << "  text:\n"
           << "    defaults:\n"
           << "      font-size: 14px\n"
           << "      color: '#000'\n";
    config.close();

    std::ofstream main(project_dir / "src" / "main.nui");
    main << "// Main window\n"
         << "var accent = #3366ff;\n\n"
         << "style div +panel {\n"
         << "  color: $accent;\n"
         << "}\n\n"
         << "layout div {\n"
         << "  class panel;\n"
         << "  width: 100%;\n"
         << "  layout text {\n"
         << "    content: \"Hello\";\n"
         << "  }\n"
         << "}\n";
    main.close();

    if (!config || !main) {
      fmt::print(stderr, "error: failed to write project files in {}\n", project_dir.string());
      return 1;
    }

    fmt::print("Initialized new NekoMaid UI project in {}\n", project_dir.string());
    fmt::print("\nNext steps:\n  cd {}\n  nekoc check\n", args.input_file);
    return 0;
  } catch (const fs::filesystem_error & e) {
    fmt::print(stderr, "error: {}\n", e.what());
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }
  if (args.command == "dump") {
    return cmd_dump(args);
  }
  if (args.command == "tokens") {
    return cmd_tokens(args);
  }
  if (args.command == "ast") {
    return cmd_ast(args);
  }
  if (args.command == "init") {
    return cmd_init(args);
  }

  fmt::print(stderr, "error: unknown command '{}'\n", args.command);
  print_usage(argv[0]);
  return 1;
}
