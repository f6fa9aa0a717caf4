/**
 * xsys - Expert System Rule Compiler
 *
 * Compiles a .xsys rule file (statements, results and IF ... THEN rules)
 * into an interactive HTML questionnaire or a JSON document, or evaluates it
 * directly against a set of answers.
 *
 * Usage:
 *   xsys --input <file.xsys> [options]
 *
 * Options:
 *   --input, -i      Rule file with .xsys extension (required)
 *   --type, -t       Output type: html or json (default: html)
 *   --title, -T      Page title for HTML output (default: Expert System)
 *   --output, -o     Output file name without extension (default: output)
 *   --answers, -a    Evaluate with answers instead of generating output
 *   --strict         Reject undeclared statements/results and duplicates
 *   --config, -c     Config file (default: ./xsys.yml)
 *   --verbose, -v    Verbose output
 *   --help, -h       Show this help message
 *
 * Example:
 *   xsys -i diagnose.xsys -t json -o diagnose
 *   xsys -i diagnose.xsys --answers "no_boot=yes,fan_noise=no"
 */

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <chrono>
#include <filesystem>

#include "core/types.hpp"
#include "core/parse_error.hpp"
#include "core/program_parser.hpp"
#include "core/evaluator.hpp"
#include "core/rule_engine.hpp"
#include "core/expression_parser.hpp"
#include "core/fingerprint.hpp"
#include "core/logger.hpp"
#include "core/yaml_config.hpp"
#include "output/json_writer.hpp"
#include "output/html_writer.hpp"

using namespace xsys;

namespace {

constexpr const char* XSYS_VERSION = "1.0.0";
constexpr const char* INPUT_EXTENSION = ".xsys";

/**
 * Command-line arguments.
 */
struct Arguments {
    std::string input;                    // Rule file (.xsys)
    std::string type = "html";            // html | json
    std::string title = xsys::output::DEFAULT_TITLE;
    std::string output = "output";        // Output file stem
    std::string answers;                  // Evaluate mode when non-empty
    bool answers_set = false;
    bool strict = false;
    bool verbose = false;
    bool debug = false;
    bool help = false;

    // Which options came from the command line (config must not override them)
    bool type_set = false;
    bool title_set = false;
    bool output_set = false;

    std::string config_file;              // Custom config file path (default: ./xsys.yml)
    std::string log_dir;

    std::string error;                    // Argument error, reported by main()
};

bool takes_value(const std::string& arg) {
    static const char* const options[] = {
        "--input", "-i", "--type", "-t", "--title", "-T", "--output", "-o",
        "--answers", "-a", "--config", "-c",
    };
    for (const char* option : options) {
        if (arg == option) return true;
    }
    return false;
}

/**
 * Parse command-line arguments.
 */
Arguments parse_args(int argc, char* argv[]) {
    Arguments args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--debug") {
            args.debug = true;
        } else if (arg == "--strict") {
            args.strict = true;
        } else if ((arg == "--input" || arg == "-i") && has_value) {
            args.input = argv[++i];
        } else if ((arg == "--type" || arg == "-t") && has_value) {
            args.type = argv[++i];
            args.type_set = true;
        } else if ((arg == "--title" || arg == "-T") && has_value) {
            args.title = argv[++i];
            args.title_set = true;
        } else if ((arg == "--output" || arg == "-o") && has_value) {
            args.output = argv[++i];
            args.output_set = true;
        } else if ((arg == "--answers" || arg == "-a") && has_value) {
            args.answers = argv[++i];
            args.answers_set = true;
        } else if ((arg == "--config" || arg == "-c") && has_value) {
            args.config_file = argv[++i];
        } else if (args.error.empty()) {
            args.error = takes_value(arg) ? "Missing value for option: " + arg
                                          : "Unknown option: " + arg;
        }
    }

    return args;
}

/**
 * Print usage information.
 */
void print_usage() {
    std::cout << "\n";
    std::cout << "xsys " << XSYS_VERSION << " - Expert System Rule Compiler\n";
    std::cout << "==================================\n\n";

    std::cout << "Usage:\n";
    std::cout << "  xsys --input <file.xsys> [options]\n\n";

    std::cout << R"(Output Options:
  --input, -i <file>      Rule file with .xsys extension (required)
  --type, -t <type>       Output type: html or json (default: html)
  --title, -T <text>      Header of the generated HTML page (default: Expert System)
  --output, -o <name>     Output file name without extension (default: output)

Evaluation:
  --answers, -a <list>    Evaluate instead of generating, e.g. "a=yes,b=no"

Parser Options:
  --strict                Reject undeclared statements/results and duplicate names

Other:
  --help, -h              Show this help message
  --verbose, -v           Verbose output
  --debug                 Write debug entries to the log
  --config, -c <file>     Config file (default: ./xsys.yml)

Examples:
  xsys -i diagnose.xsys
  xsys -i diagnose.xsys -t json -o diagnose
  xsys -i diagnose.xsys --answers "no_boot=yes,fan_noise=no"
)";
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool read_file(const std::string& path, std::string& contents) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;

    std::stringstream ss;
    ss << file.rdbuf();
    contents = ss.str();
    return !file.bad();
}

/**
 * --answers mode: print the selected result for one answer set.
 */
int run_evaluate(const ParsedProgram& program, const Arguments& args) {
    Answers answers;
    try {
        answers = parse_answers(args.answers);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[!] " << e.what() << "\n";
        XSYS_LOG_ERROR(e.what());
        return 1;
    }

    if (args.verbose) {
        for (const auto& stmt : program.statements) {
            auto it = answers.find(stmt.name);
            std::cout << "[*] " << stmt.name << " = "
                      << (it != answers.end() ? it->second : "(unanswered)") << "\n";
        }
    }

    RuleEngine engine(program);
    Verdict verdict = engine.evaluate(answers);

    if (args.verbose) {
        for (size_t index : verdict.fired) {
            const Rule& rule = program.rules[index];
            std::cout << "[*] Rule " << (index + 1) << " fired: IF " << to_string(*rule.expression)
                      << " THEN " << rule.result << "\n";
        }
        for (size_t index : verdict.unresolved) {
            std::cout << "[!] Rule " << (index + 1) << " names undeclared result \""
                      << program.rules[index].result << "\" (ignored)\n";
        }
    }

    std::stringstream log;
    log << "EVALUATE: Answers=" << answers.size()
        << ", Fired=" << verdict.fired.size()
        << ", Result=" << verdict.result_name.value_or("(none)");
    XSYS_LOG_INFO(log.str());

    if (verdict.has_result()) {
        std::cout << "Result: " << *verdict.result_text << "\n";
    } else {
        std::cout << "No result selected.\n";
    }
    return 0;
}

/**
 * Default mode: write <output>.<type>.
 */
int run_generate(const ParsedProgram& program, const Arguments& args) {
    std::string data = args.type == "json"
        ? output::to_json(program) + "\n"
        : output::to_html(program, args.title);

    std::string output_file = args.output + "." + args.type;
    std::ofstream out(output_file, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "[!] Cannot write output file: " << output_file << "\n";
        Logger::instance().log_error("Cannot write " + output_file);
        return 1;
    }
    out << data;
    out.close();
    if (!out) {
        std::cerr << "[!] Failed while writing output file: " << output_file << "\n";
        Logger::instance().log_error("Write failed for " + output_file);
        return 1;
    }

    Logger::instance().log_generated(output_file, args.type, data.size());
    std::cout << "File generated: " << output_file << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto start_time = std::chrono::steady_clock::now();

    Arguments args = parse_args(argc, argv);

    // Load config file (xsys.yml in current directory or ~/.xsys/config.yml)
    // Command-line arguments take precedence over config file
    AppConfig app_config;
    if (app_config.load(args.config_file)) {
        apply_config_to_args(args, app_config);
        if (args.verbose) std::cout << "[*] Loaded config from: " << app_config.source_path << "\n";
    }

    if (args.help || argc == 1) {
        print_usage();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "[!] " << args.error << "\n";
        print_usage();
        return 1;
    }

    if (args.input.empty()) {
        std::cerr << "[!] Missing required option: --input <file.xsys>\n";
        return 1;
    }
    if (!ends_with(args.input, INPUT_EXTENSION)) {
        std::cerr << "Input file must have a .xsys extension.\n";
        return 1;
    }
    if (args.type != "html" && args.type != "json") {
        std::cerr << "[!] Unsupported output type: " << args.type << " (expected html or json)\n";
        return 1;
    }

    auto& logger = Logger::instance();
    if (!logger.init(args.log_dir, args.debug) && args.verbose) {
        std::cerr << "[!] Logging disabled: cannot open log in "
                  << (args.log_dir.empty() ? "~/.xsys" : args.log_dir) << "\n";
    }
    logger.log_startup(XSYS_VERSION, args.input, args.answers_set ? "evaluate" : args.type);

    std::error_code ec;
    std::string input_path = std::filesystem::absolute(args.input, ec).string();
    if (ec || !std::filesystem::exists(input_path, ec)) {
        std::cerr << "Input file not found: " << (input_path.empty() ? args.input : input_path) << "\n";
        logger.log_error("Input file not found: " + args.input);
        return 1;
    }

    std::string source;
    if (!read_file(input_path, source)) {
        std::cerr << "[!] Cannot read input file: " << input_path << "\n";
        logger.log_error("Cannot read " + input_path);
        return 1;
    }

    int rc = 0;
    try {
        ParseOptions options;
        options.strict = args.strict;
        ParsedProgram program = parse_program(source, options);

        std::string fp = format_fingerprint(fingerprint(program));
        logger.log_parsed(args.input, program.statements.size(), program.results.size(),
                          program.rules.size(), fp);
        if (args.verbose) {
            std::cout << "[*] Parsed " << program.statements.size() << " statements, "
                      << program.results.size() << " results, "
                      << program.rules.size() << " rules (fingerprint " << fp << ")\n";
        }

        rc = args.answers_set ? run_evaluate(program, args) : run_generate(program, args);
    } catch (const ParseError& e) {
        std::cerr << "Syntax Error: " << e.what() << "\n";
        logger.log_error(std::string(to_string(e.kind())) + ": " + e.what());
        rc = 1;
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << "\n";
        logger.log_error(e.what());
        rc = 1;
    }

    double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_time).count();
    logger.log_shutdown(rc == 0 ? "success" : "error", elapsed_ms);

    return rc;
}
