//
// Stage registry for multistage documents
//
// Stages are appended in declaration order; names map to the most recent
// stage declaring them (later FROM ... AS x shadows an earlier x). Lookups
// only see stages declared so far, so a reference can never resolve forward.
//

#pragma once

#include "image_reference.hh"
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dfscan {

struct stage {
    std::size_t index;                ///< 0-based, contiguous
    std::optional<std::string> name;  ///< Alias as written after AS
    image_reference base_image;
    std::size_t line;                 ///< Line of the declaring FROM

    bool operator==(const stage&) const = default;
};

enum class lookup_status {
    found,            ///< index refers to a stage declared earlier
    self_reference,   ///< names the stage containing the reference
    forward,          ///< names a stage declared later (or a future index)
    external          ///< not a stage: treat as an external image
};

struct stage_lookup {
    lookup_status status;
    std::size_t index = 0;  ///< Valid for found and self_reference
};

class stage_graph {
public:
    /// @param document_names every alias declared anywhere in the document,
    ///        used to tell forward references apart from external images
    explicit stage_graph(const std::vector<std::string>& document_names = {});

    /// Resolve a stage name (case-insensitive) or numeric index.
    /// @param referencing_stage stage that contains the reference; nullopt
    ///        while resolving the base image of a stage not yet declared
    /// @param allow_index accept "N" as a stage index (--from=N); FROM only
    ///        refers to stages by name
    [[nodiscard]] stage_lookup resolve(const std::string& ref,
                                       std::optional<std::size_t> referencing_stage,
                                       bool allow_index = true) const;

    /// Append a stage; its name becomes visible to later lookups.
    const stage& declare(std::optional<std::string> name, image_reference base_image, std::size_t line);

    /// True if a stage with this name (case-insensitive) is already declared.
    [[nodiscard]] bool is_declared(const std::string& name) const;

    /// Name of the stage, or its index as text for an unnamed stage.
    [[nodiscard]] std::string display_name(std::size_t index) const;

    [[nodiscard]] const std::vector<stage>& stages() const { return stages_; }
    [[nodiscard]] std::size_t size() const { return stages_.size(); }
    [[nodiscard]] bool empty() const { return stages_.empty(); }

    /// Index of the most recently declared stage.
    [[nodiscard]] std::optional<std::size_t> current() const;

private:
    std::vector<stage> stages_;
    std::map<std::string, std::size_t> by_name_;  // lower-cased name -> index
    std::set<std::string> document_names_;        // lower-cased
};

/// Lower-case ASCII copy (stage names compare case-insensitively).
std::string to_lower(const std::string& text);

} // namespace dfscan
