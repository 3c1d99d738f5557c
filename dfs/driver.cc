#include "driver.hh"
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace dfscan::driver {

Driver::Driver(const DriverOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Driver::run() {
    try {
        std::vector<report_entry> entries;
        bool failed = false;

        for (const auto& input : options_.input_files) {
            const std::string source = input == "-" ? "<stdin>" : input.string();
            logger_.verbose("Analyzing: " + source);

            const std::string text = read_input(input);
            if (!analyze_input(source, text, entries)) {
                failed = true;
            }
        }

        if (failed) {
            return 1;
        }

        write_report(render(entries));
        return 0;

    } catch (const std::exception& e) {
        logger_.error(e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

std::string Driver::read_input(const std::filesystem::path& input) {
    if (input == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }

    std::ifstream ifs(input, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Failed to open file: " + input.string());
    }

    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

bool Driver::analyze_input(const std::string& source, const std::string& text,
                           std::vector<report_entry>& out) {
    semantic::analysis_result result;
    try {
        const ast::dockerfile doc = parse_dockerfile(text);
        logger_.debug(source + ": " + std::to_string(doc.instructions.size()) + " instruction(s)");
        result = semantic::analyze(doc, build_analysis_options());
    } catch (const analysis_error& e) {
        std::ostringstream oss;
        oss << source << ":";
        if (e.line() > 0) {
            oss << e.line() << ":";
        }
        oss << " ";
        if (!e.keyword().empty()) {
            oss << e.keyword() << ": ";
        }
        oss << e.reason() << " [" << e.code() << "]";
        logger_.error(oss.str());
        return false;
    }

    print_diagnostics(source, result);

    if (options_.warnings_as_errors && result.has_warnings()) {
        logger_.error(source + ": " + std::to_string(result.warning_count()) +
                      " warning(s) treated as errors");
        return false;
    }

    logger_.verbose(source + ": " + std::to_string(result.facts.num_stages) + " stage(s), " +
                    std::to_string(result.facts.instructions.total_count) + " instruction(s)");
    out.push_back(report_entry{source, std::move(result.facts)});
    return true;
}

std::string Driver::render(const std::vector<report_entry>& entries) const {
    if (options_.format == OutputFormat::Json) {
        // A single input is reported as the bare analysis object
        if (entries.size() == 1) {
            return serialize::to_json(serialize::to_value(entries.front().facts), options_.indent) + "\n";
        }

        serialize::array reports;
        for (const auto& entry : entries) {
            reports.push_back(serialize::object{
                {"file", entry.source},
                {"analysis", serialize::to_value(entry.facts)},
            });
        }
        return serialize::to_json(reports, options_.indent) + "\n";
    }

    std::string text;
    for (const auto& entry : entries) {
        if (entries.size() > 1) {
            text += "==> " + entry.source + " <==\n";
        }
        text += serialize::describe(entry.facts);
    }
    return text;
}

void Driver::write_report(const std::string& report) {
    if (options_.output_file.empty()) {
        std::cout << report;
        return;
    }

    logger_.verbose("Writing: " + options_.output_file.string());

    std::ofstream ofs(options_.output_file, std::ios::binary);
    if (!ofs) {
        throw std::runtime_error("Failed to open file for writing: " + options_.output_file.string());
    }

    ofs << report;

    if (!ofs) {
        throw std::runtime_error("Failed to write file: " + options_.output_file.string());
    }
}

// ============================================================================
// Utility Methods
// ============================================================================

void Driver::print_diagnostics(const std::string& source, const semantic::analysis_result& result) {
    for (const auto& diag : result.diagnostics) {
        std::string location = source + ":";
        if (diag.position.line > 0) {
            location += std::to_string(diag.position.line) + ":";
        }
        const std::string message = location + " " + diag.message + " [" + diag.code + "]";

        switch (diag.level) {
            case semantic::diagnostic_level::error:
                logger_.error(message);
                break;
            case semantic::diagnostic_level::warning:
                logger_.warning(message);
                break;
            case semantic::diagnostic_level::note:
                logger_.note(message);
                break;
        }
    }

    if (result.has_warnings()) {
        logger_.verbose(source + ": total warnings: " + std::to_string(result.warning_count()));
    }
}

semantic::analysis_options Driver::build_analysis_options() const {
    semantic::analysis_options opts;
    opts.disabled_warnings = options_.disabled_warnings;

    if (options_.suppress_all_warnings) {
        opts.min_level = semantic::diagnostic_level::error;
    }
    return opts;
}

}  // namespace dfscan::driver
