//
// Semantic Analysis for Dockerfiles
//
// Walks the parsed instruction sequence once and derives:
//   - stage topology (stages, names, base images, --from references)
//   - multistage facts (stages used as bases / copied / added, unused stages)
//   - instruction statistics (total and per keyword)
//   - declared configuration (ARG, ENV, LABEL, EXPOSE)
//
// USAGE EXAMPLE:
//   auto doc = parse_dockerfile(text);
//
//   analysis_options opts;
//   opts.disabled_warnings = {"W002"};  // Allow implicit :latest
//
//   auto result = semantic::analyze(doc, opts);  // throws analysis_error
//
//   std::cout << result.facts.num_stages << "\n";
//   result.print_diagnostics(std::cerr);
//
// Errors are terminal and thrown (see parser_error.hh); warnings are advisory
// and never change the facts.
//

#pragma once

#include "ast.hh"
#include "image_reference.hh"
#include "ordered_map.hh"
#include "parser.hh"
#include "stage_graph.hh"
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dfscan {

// ============================================================================
// Analysis Facts
// ============================================================================

/// Stage-to-stage relationships. All name lists are distinct, first-seen order.
struct multistage_analysis {
    bool is_multistage = false;                       ///< More than one stage
    std::vector<std::string> stages_used_as_base_images;
    std::vector<std::string> stages_copied_from;
    std::vector<std::string> stages_added_from;
    std::vector<std::string> unused_stages;           ///< Never contains the final stage

    bool operator==(const multistage_analysis&) const = default;
};

struct instruction_stats {
    std::size_t total_count = 0;
    ordered_map<std::string, std::size_t> by_type;    ///< Keyword -> count

    bool operator==(const instruction_stats&) const = default;
};

/// Everything derived from one document. Owns all data by value.
struct analysis {
    std::size_t num_stages = 0;
    std::vector<image_reference> images;              ///< Distinct base images, first-seen order
    std::vector<std::string> stage_names;             ///< One per named stage, declaration order
    std::vector<std::string> copy_from_stages;        ///< Distinct COPY --from values
    std::vector<std::string> add_from_stages;         ///< Distinct ADD --from values
    multistage_analysis multistage;
    std::vector<std::string> exposed_ports;           ///< Raw EXPOSE tokens, declaration order
    instruction_stats instructions;
    ordered_map<std::string, std::optional<std::string>> args;
    ordered_map<std::string, std::string> labels;
    ordered_map<std::string, std::string> env_vars;

    std::vector<stage> stages;                        ///< Full stage records (not serialized)

    bool operator==(const analysis&) const = default;
};

namespace semantic {

// ============================================================================
// Diagnostics
// ============================================================================

enum class diagnostic_level {
    error,
    warning,
    note
};

/// Advisory codes. Errors use error_codes in parser_error.hh.
namespace diag_codes {
    constexpr const char* W_UNUSED_STAGE = "W001";        ///< Named stage never referenced and not final
    constexpr const char* W_IMPLICIT_LATEST = "W002";     ///< External base image without tag or digest
    constexpr const char* W_DEPRECATED = "W003";          ///< MAINTAINER
    constexpr const char* W_STAGE_SHADOWING = "W004";     ///< AS name reuses a declared stage name
    constexpr const char* W_UNKNOWN_INSTRUCTION = "W005"; ///< Keyword outside the known set
    constexpr const char* W_EXTERNAL_COPY_SOURCE = "W006";///< --from names an external image
}

struct diagnostic {
    diagnostic_level level;
    std::string code;
    std::string message;
    ast::source_pos position;

    /// "line 12: warning: message [W001]"
    std::string format() const;
};

// ============================================================================
// Analysis Result and Options
// ============================================================================

struct analysis_result {
    analysis facts;
    std::vector<diagnostic> diagnostics;  ///< Ordered by line

    bool has_warnings() const;
    size_t warning_count() const;
    std::vector<diagnostic> get_warnings() const;

    /// Print every diagnostic followed by a "N warnings generated." summary.
    void print_diagnostics(std::ostream& os) const;
};

struct analysis_options {
    /// Warning codes to drop (e.g. {"W002"}).
    std::set<std::string> disabled_warnings;

    /// Minimum level to report; note includes everything.
    diagnostic_level min_level = diagnostic_level::warning;
};

// ============================================================================
// Main Analysis Interface
// ============================================================================

/// Analyze a parsed document.
/// Throws empty_input_error, malformed_instruction_error,
/// invalid_stage_reference_error or invalid_image_reference_error.
analysis_result analyze(const ast::dockerfile& doc, const analysis_options& opts = {});

namespace phases {

/// Every AS alias in the document (used to detect forward references).
std::vector<std::string> collect_stage_names(const ast::dockerfile& doc);

/// Derive multistage facts once all stages and references are known.
/// stages_used_as_base_images etc. only list names of declared stages.
multistage_analysis compute_multistage(const std::vector<stage>& stages,
                                       const std::vector<std::string>& base_refs,
                                       const std::vector<std::string>& copy_refs,
                                       const std::vector<std::string>& add_refs);

} // namespace phases

} // namespace semantic

/// Single entry point: parse and analyze text, returning only the facts.
/// Throws analysis_error subclasses (see parser_error.hh).
analysis analyze_dockerfile(const std::string& text);

} // namespace dfscan
