//
// Generic ordered key-value representation of analysis results
//
// to_value() mirrors the analysis field-for-field:
//   { num_stages, images[{full, components{registry, name, tag, digest}|null}],
//     stage_names, copy_from_stages, add_from_stages,
//     multistage_analysis{is_multistage, stages_used_as_base_images,
//                         stages_copied_from, stages_added_from, unused_stages},
//     exposed_ports, instructions{total_count, by_type}, args, labels, env_vars }
//
// Objects keep insertion order so the encoded text is stable and diffable.
//

#pragma once

#include "semantic.hh"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dfscan::serialize {

struct value;

using array = std::vector<value>;
using object = std::vector<std::pair<std::string, value>>;

struct value {
    using node_type = std::variant<
        std::monostate,   // null
        bool,
        std::int64_t,
        std::string,
        array,
        object
    >;

    node_type node;

    value() = default;
    value(std::nullptr_t) {}
    value(bool b) : node(b) {}
    value(std::int64_t i) : node(i) {}
    value(const char* s) : node(std::string(s)) {}
    value(std::string s) : node(std::move(s)) {}
    value(array a) : node(std::move(a)) {}
    value(object o) : node(std::move(o)) {}

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(node); }

    /// Member lookup on an object value; nullptr if absent or not an object.
    [[nodiscard]] const value* get(const std::string& key) const;

    bool operator==(const value&) const = default;
};

/// Thrown by analysis_from_value() when the tree lacks a field or has the wrong shape.
class shape_error : public std::runtime_error {
public:
    explicit shape_error(const std::string& msg)
        : std::runtime_error(msg) {}
};

value to_value(const image_components& components);
value to_value(const image_reference& image);
value to_value(const multistage_analysis& multistage);
value to_value(const instruction_stats& stats);
value to_value(const analysis& facts);

/// Inverse of to_value(const analysis&). Stage records are not part of the
/// tree and stay empty. Throws shape_error.
analysis analysis_from_value(const value& tree);

/// Encode as JSON. indent = 0 writes a single line.
void write_json(std::ostream& os, const value& tree, int indent = 2);
std::string to_json(const value& tree, int indent = 2);

/// Multi-line human-readable report of the facts.
std::string describe(const analysis& facts);

} // namespace dfscan::serialize
