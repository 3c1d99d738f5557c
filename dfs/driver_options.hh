#pragma once

#include "logger.hh"
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace dfscan::driver {

/// Report format
enum class OutputFormat {
    Text,  // describe() report (default)
    Json   // to_value() tree encoded as JSON
};

/// Driver configuration
struct DriverOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::vector<std::filesystem::path> input_files;  // "-" reads stdin
    std::filesystem::path output_file;               // empty: stdout

    OutputFormat format = OutputFormat::Text;        // -f, --format
    int indent = 2;                                  // --indent=N

    // ========================================================================
    // Semantic Analysis Options
    // ========================================================================

    bool warnings_as_errors = false;                 // -Werror
    bool suppress_all_warnings = false;              // -w
    std::set<std::string> disabled_warnings;         // -Wno-W001

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
    ColorMode color = ColorMode::Auto;               // --color=
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
DriverOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

}  // namespace dfscan::driver
