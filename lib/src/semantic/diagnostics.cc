//
// Diagnostic formatting and utilities
//

#include <dfscan/semantic.hh>
#include <algorithm>
#include <iterator>
#include <ostream>
#include <sstream>

namespace dfscan::semantic {

// ============================================================================
// Diagnostic Formatting
// ============================================================================

std::string diagnostic::format() const {
    std::ostringstream oss;

    // Format: line N: level: message [code]
    if (position.line > 0) {
        oss << "line " << position.line << ": ";
    }

    switch (level) {
        case diagnostic_level::error:
            oss << "error: ";
            break;
        case diagnostic_level::warning:
            oss << "warning: ";
            break;
        case diagnostic_level::note:
            oss << "note: ";
            break;
    }

    oss << message;

    if (!code.empty()) {
        oss << " [" << code << "]";
    }

    return oss.str();
}

// ============================================================================
// Analysis Result Methods
// ============================================================================

bool analysis_result::has_warnings() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::warning; });
}

size_t analysis_result::warning_count() const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::warning; }));
}

std::vector<diagnostic> analysis_result::get_warnings() const {
    std::vector<diagnostic> result;
    std::copy_if(diagnostics.begin(), diagnostics.end(),
                std::back_inserter(result),
                [](const auto& d) { return d.level == diagnostic_level::warning; });
    return result;
}

void analysis_result::print_diagnostics(std::ostream& os) const {
    for (const auto& diag : diagnostics) {
        os << diag.format() << "\n";
    }

    const size_t warnings = warning_count();
    if (warnings > 0) {
        os << warnings << " warning" << (warnings != 1 ? "s" : "") << " generated.\n";
    }
}

} // namespace dfscan::semantic
