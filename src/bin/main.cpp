#include <eqp/equation.hpp>
#include <eqp/errors.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;

struct cli_options {
  std::vector<std::string> expressions;
  std::string input_file;
  bool dump_tokens = false;
  bool show_help = false;
  bool show_version = false;
};

// One expression to parse and where it came from, for diagnostics.
struct source_line {
  std::string origin;
  std::string text;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: eqp [options] <expression> [expression ...]\n"
     << "\n"
     << "Parses each equation and prints its fully parenthesized tree.\n"
     << "\n"
     << "Options:\n"
     << "  -f <file>         Read expressions from a file, one per line\n"
     << "                    (blank lines and lines starting with # are "
        "skipped)\n"
     << "  --tokens          Print the token stream instead of the tree\n"
     << "  --                Treat all following arguments as expressions\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "eqp " << EQP_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;
  bool options_done = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (!options_done) {
      if (arg == "-h" || arg == "--help") {
        opts.show_help = true;
        return opts;
      }

      if (arg == "--version") {
        opts.show_version = true;
        return opts;
      }

      if (arg == "--tokens") {
        opts.dump_tokens = true;
        continue;
      }

      if (arg == "--") {
        options_done = true;
        continue;
      }

      if (arg == "-f") {
        if (i + 1 >= argc) {
          std::cerr << "eqp: -f requires an argument\n";
          std::exit(exit_usage);
        }
        if (!opts.input_file.empty()) {
          std::cerr << "eqp: -f may only be given once\n";
          std::exit(exit_usage);
        }
        opts.input_file = argv[++i];
        continue;
      }

      if (arg.size() > 1 && arg[0] == '-') {
        std::cerr << "eqp: unknown option: " << arg << "\n";
        std::exit(exit_usage);
      }
    }

    opts.expressions.push_back(arg);
  }

  return opts;
}

static std::vector<source_line>
read_lines(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "eqp: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }

  std::vector<source_line> lines;
  std::string line;
  int number = 0;
  while (std::getline(in, line)) {
    ++number;
    auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') continue;
    if (line.back() == '\r') line.pop_back();
    lines.push_back({path + ":" + std::to_string(number), line});
  }
  return lines;
}

static void
print_tokens(const eqp::token_stream<eqp::equation::token_kind>& tokens) {
  for (const auto& tok : tokens)
    std::cout << eqp::equation::to_string(tok.kind) << " '" << tok.lexeme
              << "' @" << tok.offset << "\n";
}

static void
report(const source_line& src, std::size_t offset, const std::string& what) {
  std::cerr << "eqp: " << src.origin << ": "
            << eqp::describe_position(src.text, offset) << ": " << what
            << "\n";
}

// Returns false when the expression could not be parsed.
static bool
process(const source_line& src, const cli_options& opts) {
  const auto& compiler = eqp::equation::default_compiler();
  try {
    if (opts.dump_tokens) {
      print_tokens(compiler.tokenize(src.text));
      return true;
    }
    auto tree = eqp::equation::parse(src.text);
    std::cout << eqp::equation::to_string(tree) << "\n";
    return true;
  } catch (const eqp::no_match_error& e) {
    report(src, e.offset(), e.what());
  } catch (const eqp::parse_error& e) {
    report(src, e.offset(), e.what());
  } catch (const std::exception& e) {
    std::cerr << "eqp: " << src.origin << ": " << e.what() << "\n";
  }
  return false;
}

static int
run(const cli_options& opts) {
  std::vector<source_line> sources;
  if (!opts.input_file.empty()) sources = read_lines(opts.input_file);

  for (std::size_t i = 0; i < opts.expressions.size(); ++i)
    sources.push_back(
        {"argument " + std::to_string(i + 1), opts.expressions[i]});

  bool ok = true;
  for (const auto& src : sources)
    ok = process(src, opts) && ok;

  return ok ? exit_success : exit_parse;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.expressions.empty() && opts.input_file.empty()) {
    std::cerr << "eqp: no input expressions\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
