#include "driver_options.hh"
#include <charconv>
#include <system_error>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace dfscan::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// Value of "-x <v>", "-x<v>" or "--long=<v>"
static std::string take_value(const char* arg, const char* prefix, int& i, int argc, char** argv) {
    std::string value = get_option_value(arg, prefix);
    if (value.empty() && prefix[1] != '-' && i + 1 < argc) {
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + prefix + " requires argument");
    }
    return value;
}

static OutputFormat parse_format(const std::string& value) {
    if (value == "text") return OutputFormat::Text;
    if (value == "json") return OutputFormat::Json;
    throw std::runtime_error("Invalid format: " + value + " (expected: json, text)");
}

static ColorMode parse_color(const std::string& value) {
    if (value == "auto") return ColorMode::Auto;
    if (value == "always") return ColorMode::Always;
    if (value == "never") return ColorMode::Never;
    throw std::runtime_error("Invalid color mode: " + value + " (expected: auto, always, never)");
}

static int parse_indent(const std::string& value) {
    int indent = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, indent);
    if (ec != std::errc{} || ptr != end || indent < 0 || indent > 16) {
        throw std::runtime_error("Invalid indent: " + value + " (expected 0..16)");
    }
    return indent;
}

// ============================================================================
// Main Parser
// ============================================================================

DriverOptions parse_command_line(int argc, char** argv) {
    DriverOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        // Version
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (starts_with(arg, "--color=")) {
            opts.color = parse_color(get_option_value(arg, "--color="));
            continue;
        }

        // Report format
        if (starts_with(arg, "--format=")) {
            opts.format = parse_format(get_option_value(arg, "--format="));
            continue;
        }

        if (starts_with(arg, "-f")) {
            opts.format = parse_format(take_value(arg, "-f", i, argc, argv));
            continue;
        }

        if (starts_with(arg, "--indent=")) {
            opts.indent = parse_indent(get_option_value(arg, "--indent="));
            continue;
        }

        // Output file
        if (starts_with(arg, "-o")) {
            opts.output_file = take_value(arg, "-o", i, argc, argv);
            continue;
        }

        // Warning options
        if (std::strcmp(arg, "-Werror") == 0) {
            opts.warnings_as_errors = true;
            continue;
        }

        if (std::strcmp(arg, "-w") == 0) {
            opts.suppress_all_warnings = true;
            continue;
        }

        if (starts_with(arg, "-Wno-")) {
            std::string warning = get_option_value(arg, "-Wno-");
            if (warning.empty()) {
                throw std::runtime_error("Option -Wno- requires a warning code");
            }
            opts.disabled_warnings.insert(warning);
            continue;
        }

        // Standard input
        if (std::strcmp(arg, "-") == 0) {
            opts.input_files.push_back(arg);
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Input file
        opts.input_files.push_back(arg);
    }

    // Validation
    if (opts.input_files.empty()) {
        throw std::runtime_error("No input files specified");
    }

    if (opts.quiet && opts.verbose) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <Dockerfile...|->\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -f, --format=<fmt>      Report format: text (default) or json\n";
    std::cout << "  -o <file>               Write the report to <file> (default: stdout)\n";
    std::cout << "  --indent=<n>            JSON indentation, 0 for one line (default: 2)\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --color=<when>          auto (default), always or never\n";
    std::cout << "  -w                      Suppress all warnings\n";
    std::cout << "  -Werror                 Treat all warnings as errors\n";
    std::cout << "  -Wno-<code>             Disable specific warning (e.g. -Wno-W002)\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " Dockerfile\n";
    std::cout << "  " << program_name << " -f json -o facts.json Dockerfile\n";
    std::cout << "  cat Dockerfile | " << program_name << " -Wno-W002 -\n";
}

void print_version() {
    std::cout << "dfscan v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

}  // namespace dfscan::driver
