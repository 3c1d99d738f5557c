#pragma once

#include "driver_options.hh"
#include "logger.hh"
#include <dfscan/parser.hh>
#include <dfscan/semantic.hh>
#include <dfscan/serialize.hh>
#include <string>
#include <vector>

namespace dfscan::driver {

/// Runs the analysis over every input and writes one report
class Driver {
public:
    explicit Driver(const DriverOptions& options, Logger& logger);

    /// Returns 0 on success, non-zero if any input failed
    int run();

private:
    struct report_entry {
        std::string source;
        analysis facts;
    };

    // ========================================================================
    // Pipeline Stages
    // ========================================================================

    /// Read a file, or stdin for "-"
    std::string read_input(const std::filesystem::path& input);

    /// Parse and analyze one document. Returns false on a failure.
    bool analyze_input(const std::string& source, const std::string& text,
                       std::vector<report_entry>& out);

    /// Encode all entries in the selected format
    std::string render(const std::vector<report_entry>& entries) const;

    void write_report(const std::string& report);

    // ========================================================================
    // Utility Methods
    // ========================================================================

    void print_diagnostics(const std::string& source, const semantic::analysis_result& result);

    semantic::analysis_options build_analysis_options() const;

    // ========================================================================
    // State
    // ========================================================================

    const DriverOptions& options_;
    Logger& logger_;
};

}  // namespace dfscan::driver
