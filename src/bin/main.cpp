#include <gll/cst_extractor.hpp>
#include <gll/cst_writer.hpp>
#include <gll/engine.hpp>
#include <gll/errors.hpp>
#include <gll/generic_ast.hpp>
#include <gll/notation_lowering.hpp>
#include <gll/ostream_writer.hpp>
#include <gll/xml_grammar_reader.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_grammar = 3;
static constexpr int exit_parse = 4;
static constexpr int exit_ambiguity = 5;

enum class output_format { sexpr, xml, ast };

struct cli_options {
  std::string grammar_file;
  std::string input_file;
  std::string start;
  output_format format = output_format::sexpr;
  bool strict = false;
  bool layout = true;
  bool trivia = false;
  bool stats = false;
  bool forest = false;
  long timeout_ms = 0;
  std::size_t max_descriptors = 0;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: gll [options] <grammar> <input>\n"
     << "\n"
     << "Parses <input> ('-' for stdin) with <grammar> and prints the\n"
     << "concrete syntax tree. Grammars ending in .xml use the XML grammar\n"
     << "format; anything else uses the grammar notation.\n"
     << "\n"
     << "Options:\n"
     << "  -s <symbol>           Start symbol (notation grammars)\n"
     << "  --xml                 Print the tree as XML\n"
     << "  --ast                 Print the generic AST\n"
     << "  --strict              Report every ambiguity\n"
     << "  --no-layout           Do not insert whitespace and comments\n"
     << "  --trivia              Include whitespace and comments in output\n"
     << "  --stats               Print parser statistics to stderr\n"
     << "  --forest              Print the ambiguous forest nodes\n"
     << "  --timeout <ms>        Abandon the parse after <ms> milliseconds\n"
     << "  --max-descriptors <n> Abandon the parse after <n> descriptors\n"
     << "  -h, --help            Show this help message\n"
     << "  --version             Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "gll " << GLL_VERSION << "\n";
}

static std::string
require_value(int argc, char* argv[], int& i, const std::string& flag) {
  if (i + 1 >= argc) {
    std::cerr << "gll: " << flag << " requires an argument\n";
    std::exit(exit_usage);
  }
  return argv[++i];
}

static unsigned long long
require_number(int argc, char* argv[], int& i, const std::string& flag) {
  auto value = require_value(argc, argv, i, flag);
  char* end = nullptr;
  auto n = std::strtoull(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0') {
    std::cerr << "gll: " << flag << " expects a number, got " << value << "\n";
    std::exit(exit_usage);
  }
  return n;
}

static bool
is_xml_grammar(const std::string& path) {
  return fs::path(path).extension() == ".xml";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-s") {
      opts.start = require_value(argc, argv, i, arg);
    } else if (arg == "--xml") {
      opts.format = output_format::xml;
    } else if (arg == "--ast") {
      opts.format = output_format::ast;
    } else if (arg == "--strict") {
      opts.strict = true;
    } else if (arg == "--no-layout") {
      opts.layout = false;
    } else if (arg == "--trivia") {
      opts.trivia = true;
    } else if (arg == "--stats") {
      opts.stats = true;
    } else if (arg == "--forest") {
      opts.forest = true;
    } else if (arg == "--timeout") {
      opts.timeout_ms = static_cast<long>(require_number(argc, argv, i, arg));
    } else if (arg == "--max-descriptors") {
      opts.max_descriptors =
          static_cast<std::size_t>(require_number(argc, argv, i, arg));
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "gll: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() > 2) {
    std::cerr << "gll: too many arguments\n";
    std::exit(exit_usage);
  }
  if (positional.size() > 0) opts.grammar_file = positional[0];
  if (positional.size() > 1) opts.input_file = positional[1];
  if (!opts.start.empty() && is_xml_grammar(opts.grammar_file)) {
    std::cerr << "gll: -s applies to notation grammars only\n";
    std::exit(exit_usage);
  }
  return opts;
}

static std::string
read_file(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "gll: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void
print_statistics(std::ostream& os, const gll::parse_statistics& st) {
  os << "gll: descriptors " << st.descriptors << "\n"
     << "gll: gss nodes " << st.gss_nodes << ", edges " << st.gss_edges << "\n"
     << "gll: sppf symbol " << st.symbol_nodes << ", intermediate "
     << st.intermediate_nodes << ", terminal " << st.terminal_nodes
     << ", epsilon " << st.epsilon_nodes << ", packed " << st.packed_nodes
     << "\n";
}

static void
print_forest(std::ostream& os, const gll::sppf::forest& f,
             gll::sppf::node_id root) {
  auto ambiguous = f.ambiguous_nodes();
  os << "derivations: " << f.count_derivations(root) << "\n"
     << "ambiguous nodes: " << ambiguous.size() << "\n";
  for (auto id : ambiguous) {
    os << "  " << f.describe(id) << "\n";
    for (auto p : f.at(id).packed)
      os << "    " << f.describe(p) << "\n";
  }
}

static int
run(const cli_options& opts) {
  std::string grammar_text = read_file(opts.grammar_file);
  std::string input = read_file(opts.input_file);

  gll::grammar g;
  try {
    if (is_xml_grammar(opts.grammar_file)) {
      g = gll::load_xml_grammar(grammar_text);
    } else {
      gll::lowering_options lo;
      lo.layout = opts.layout;
      lo.start = opts.start;
      g = gll::load_notation(grammar_text, lo);
    }
  } catch (const gll::grammar_error& e) {
    std::cerr << "gll: " << opts.grammar_file << ": " << e.what() << "\n";
    return exit_grammar;
  }

  gll::parse_options po;
  po.max_descriptors = opts.max_descriptors;
  if (opts.timeout_ms > 0) {
    po.deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(opts.timeout_ms);
  }

  std::optional<gll::parse_result> result;
  try {
    result.emplace(gll::parse(g, input, po));
  } catch (const gll::parse_aborted& e) {
    std::cerr << "gll: " << e.what() << "\n";
    return exit_parse;
  }

  if (opts.stats) print_statistics(std::cerr, result->statistics());

  if (!result->ok()) {
    std::cerr << "gll: " << opts.input_file << ": "
              << result->failure().message() << "\n";
    return exit_parse;
  }

  if (opts.forest) print_forest(std::cout, *result->forest(), result->root());

  gll::extract_options eo;
  if (opts.strict) eo.policy = gll::strict_policy();

  try {
    auto tree = gll::extract_cst(*result, eo);

    gll::cst_write_options wo;
    wo.trivia = opts.trivia;
    wo.indent = true;

    switch (opts.format) {
      case output_format::sexpr:
        gll::write_sexpr(std::cout, g, tree, wo);
        break;
      case output_format::xml: {
        gll::ostream_writer writer(std::cout, true);
        gll::write_xml(writer, g, tree, wo);
        break;
      }
      case output_format::ast:
        std::cout << gll::to_string(gll::lower_generic(g, tree));
        break;
    }
    std::cout << "\n";
  } catch (const gll::ambiguity_error& e) {
    std::cerr << "gll: " << e.what() << "\n";
    return exit_ambiguity;
  } catch (const gll::unhandled_production_error& e) {
    std::cerr << "gll: " << e.what() << "\n";
    return exit_grammar;
  } catch (const gll::lowering_error& e) {
    std::cerr << "gll: " << e.what() << "\n";
    return exit_grammar;
  }

  return exit_success;
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

  if (opts.grammar_file.empty() || opts.input_file.empty()) {
    std::cerr << "gll: a grammar and an input file are required\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
