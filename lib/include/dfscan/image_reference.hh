//
// Image reference decomposition: [registry/]name[:tag|@digest]
//
// USAGE EXAMPLE:
//   auto c = parse_image_components("localhost:5000/team/app:1.2");
//   // c.registry == "localhost:5000", c.name == "team/app", c.tag == "1.2"
//
// Build-argument placeholders (${VAR}, $VAR) are kept as literal text. A ':'
// inside "${...}" (e.g. "${BASE:-debian}") is not a tag separator.
//

#pragma once

#include <optional>
#include <string>

namespace dfscan {

/// Parsed parts of an external image reference.
/// tag and digest are mutually exclusive; both absent means implicit "latest".
struct image_components {
    std::optional<std::string> registry;  ///< Present if the first path component has '.', ':' or is "localhost"
    std::string name;                     ///< Repository path, never empty
    std::optional<std::string> tag;       ///< Text after ':' following the last '/'
    std::optional<std::string> digest;    ///< Text after '@' ("algorithm:hex")

    bool operator==(const image_components&) const = default;
};

/// Base image of a stage or source of a --from copy.
/// components is absent when full names a previously declared stage.
struct image_reference {
    std::string full;
    std::optional<image_components> components;

    [[nodiscard]] bool is_stage_reference() const { return !components.has_value(); }

    bool operator==(const image_reference&) const = default;
};

/// Decompose an external image reference.
/// Throws image_reference_error when the text violates the grammar
/// (empty text, whitespace, several '@', tag together with digest,
/// empty name, tag or digest, empty path component).
image_components parse_image_components(const std::string& ref);

/// Wrap ref as an external image (components parsed).
image_reference make_external_image(const std::string& ref);

/// Wrap a local stage name (components absent).
image_reference make_stage_image(const std::string& stage_name);

/// True if ref consists only of build-argument placeholders ("$BASE", "${IMG}").
bool is_placeholder_only(const std::string& ref);

} // namespace dfscan
