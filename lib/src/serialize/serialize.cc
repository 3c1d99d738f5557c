//
// Ordered key-value serialization of analysis results
//

#include <dfscan/serialize.hh>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace dfscan::serialize {

namespace {
    value string_list(const std::vector<std::string>& values) {
        array result;
        result.reserve(values.size());
        for (const auto& v : values) {
            result.emplace_back(v);
        }
        return result;
    }

    value optional_string(const std::optional<std::string>& v) {
        return v ? value(*v) : value(nullptr);
    }

    value count(std::size_t n) {
        return value(static_cast<std::int64_t>(n));
    }

    // ========================================================================
    // Readers
    // ========================================================================

    const value& member(const value& tree, const std::string& key) {
        const value* v = tree.get(key);
        if (!v) {
            throw shape_error("missing field '" + key + "'");
        }
        return *v;
    }

    const std::string& as_string(const value& v, const std::string& what) {
        if (auto* s = std::get_if<std::string>(&v.node)) {
            return *s;
        }
        throw shape_error("'" + what + "' is not a string");
    }

    std::optional<std::string> as_optional_string(const value& v, const std::string& what) {
        if (v.is_null()) {
            return std::nullopt;
        }
        return as_string(v, what);
    }

    std::size_t as_count(const value& v, const std::string& what) {
        if (auto* i = std::get_if<std::int64_t>(&v.node); i && *i >= 0) {
            return static_cast<std::size_t>(*i);
        }
        throw shape_error("'" + what + "' is not a non-negative integer");
    }

    bool as_bool(const value& v, const std::string& what) {
        if (auto* b = std::get_if<bool>(&v.node)) {
            return *b;
        }
        throw shape_error("'" + what + "' is not a boolean");
    }

    const array& as_array(const value& v, const std::string& what) {
        if (auto* a = std::get_if<array>(&v.node)) {
            return *a;
        }
        throw shape_error("'" + what + "' is not an array");
    }

    const object& as_object(const value& v, const std::string& what) {
        if (auto* o = std::get_if<object>(&v.node)) {
            return *o;
        }
        throw shape_error("'" + what + "' is not an object");
    }

    std::vector<std::string> as_string_list(const value& v, const std::string& what) {
        std::vector<std::string> result;
        for (const auto& item : as_array(v, what)) {
            result.push_back(as_string(item, what));
        }
        return result;
    }

    image_reference read_image(const value& v) {
        image_reference image;
        image.full = as_string(member(v, "full"), "full");
        const value& components = member(v, "components");
        if (!components.is_null()) {
            image_components c;
            c.registry = as_optional_string(member(components, "registry"), "registry");
            c.name = as_string(member(components, "name"), "name");
            c.tag = as_optional_string(member(components, "tag"), "tag");
            c.digest = as_optional_string(member(components, "digest"), "digest");
            image.components = std::move(c);
        }
        return image;
    }

    // ========================================================================
    // JSON Encoding
    // ========================================================================

    void write_string(std::ostream& os, const std::string& s) {
        os << '"';
        for (char ch : s) {
            const auto c = static_cast<unsigned char>(ch);
            switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) {
                        os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                           << static_cast<int>(c) << std::dec << std::setfill(' ');
                    } else {
                        os << ch;
                    }
            }
        }
        os << '"';
    }

    class json_writer {
    public:
        json_writer(std::ostream& os, int indent)
            : os_(os), indent_(indent) {}

        void write(const value& v, int depth) {
            if (v.is_null()) {
                os_ << "null";
            } else if (auto* b = std::get_if<bool>(&v.node)) {
                os_ << (*b ? "true" : "false");
            } else if (auto* i = std::get_if<std::int64_t>(&v.node)) {
                os_ << *i;
            } else if (auto* s = std::get_if<std::string>(&v.node)) {
                write_string(os_, *s);
            } else if (auto* a = std::get_if<array>(&v.node)) {
                write_array(*a, depth);
            } else if (auto* o = std::get_if<object>(&v.node)) {
                write_object(*o, depth);
            }
        }

    private:
        void newline(int depth) {
            if (indent_ <= 0) {
                return;
            }
            os_ << '\n' << std::string(static_cast<size_t>(indent_ * depth), ' ');
        }

        void write_array(const array& a, int depth) {
            if (a.empty()) {
                os_ << "[]";
                return;
            }
            os_ << '[';
            for (size_t i = 0; i < a.size(); ++i) {
                if (i > 0) os_ << ',';
                newline(depth + 1);
                write(a[i], depth + 1);
            }
            newline(depth);
            os_ << ']';
        }

        void write_object(const object& o, int depth) {
            if (o.empty()) {
                os_ << "{}";
                return;
            }
            os_ << '{';
            for (size_t i = 0; i < o.size(); ++i) {
                if (i > 0) os_ << ',';
                newline(depth + 1);
                write_string(os_, o[i].first);
                os_ << (indent_ > 0 ? ": " : ":");
                write(o[i].second, depth + 1);
            }
            newline(depth);
            os_ << '}';
        }

        std::ostream& os_;
        int indent_;
    };

    std::string join(const std::vector<std::string>& parts) {
        if (parts.empty()) return "(none)";

        std::string result = parts[0];
        for (size_t i = 1; i < parts.size(); ++i) {
            result += ", " + parts[i];
        }
        return result;
    }
}

const value* value::get(const std::string& key) const {
    if (auto* o = std::get_if<object>(&node)) {
        for (const auto& [k, v] : *o) {
            if (k == key) {
                return &v;
            }
        }
    }
    return nullptr;
}

// ============================================================================
// Analysis -> value
// ============================================================================

value to_value(const image_components& components) {
    return object{
        {"registry", optional_string(components.registry)},
        {"name", components.name},
        {"tag", optional_string(components.tag)},
        {"digest", optional_string(components.digest)},
    };
}

value to_value(const image_reference& image) {
    return object{
        {"full", image.full},
        {"components", image.components ? to_value(*image.components) : value(nullptr)},
    };
}

value to_value(const multistage_analysis& multistage) {
    return object{
        {"is_multistage", multistage.is_multistage},
        {"stages_used_as_base_images", string_list(multistage.stages_used_as_base_images)},
        {"stages_copied_from", string_list(multistage.stages_copied_from)},
        {"stages_added_from", string_list(multistage.stages_added_from)},
        {"unused_stages", string_list(multistage.unused_stages)},
    };
}

value to_value(const instruction_stats& stats) {
    object by_type;
    for (const auto& [kw, n] : stats.by_type) {
        by_type.emplace_back(kw, count(n));
    }
    return object{
        {"total_count", count(stats.total_count)},
        {"by_type", std::move(by_type)},
    };
}

value to_value(const analysis& facts) {
    array images;
    for (const auto& image : facts.images) {
        images.push_back(to_value(image));
    }

    object args;
    for (const auto& [name, default_value] : facts.args) {
        args.emplace_back(name, optional_string(default_value));
    }
    object labels;
    for (const auto& [key, v] : facts.labels) {
        labels.emplace_back(key, v);
    }
    object env_vars;
    for (const auto& [key, v] : facts.env_vars) {
        env_vars.emplace_back(key, v);
    }

    return object{
        {"num_stages", count(facts.num_stages)},
        {"images", std::move(images)},
        {"stage_names", string_list(facts.stage_names)},
        {"copy_from_stages", string_list(facts.copy_from_stages)},
        {"add_from_stages", string_list(facts.add_from_stages)},
        {"multistage_analysis", to_value(facts.multistage)},
        {"exposed_ports", string_list(facts.exposed_ports)},
        {"instructions", to_value(facts.instructions)},
        {"args", std::move(args)},
        {"labels", std::move(labels)},
        {"env_vars", std::move(env_vars)},
    };
}

// ============================================================================
// value -> Analysis
// ============================================================================

analysis analysis_from_value(const value& tree) {
    as_object(tree, "analysis");
    analysis facts;

    facts.num_stages = as_count(member(tree, "num_stages"), "num_stages");
    for (const auto& image : as_array(member(tree, "images"), "images")) {
        facts.images.push_back(read_image(image));
    }
    facts.stage_names = as_string_list(member(tree, "stage_names"), "stage_names");
    facts.copy_from_stages = as_string_list(member(tree, "copy_from_stages"), "copy_from_stages");
    facts.add_from_stages = as_string_list(member(tree, "add_from_stages"), "add_from_stages");

    const value& ms = member(tree, "multistage_analysis");
    facts.multistage.is_multistage = as_bool(member(ms, "is_multistage"), "is_multistage");
    facts.multistage.stages_used_as_base_images =
        as_string_list(member(ms, "stages_used_as_base_images"), "stages_used_as_base_images");
    facts.multistage.stages_copied_from =
        as_string_list(member(ms, "stages_copied_from"), "stages_copied_from");
    facts.multistage.stages_added_from =
        as_string_list(member(ms, "stages_added_from"), "stages_added_from");
    facts.multistage.unused_stages = as_string_list(member(ms, "unused_stages"), "unused_stages");

    facts.exposed_ports = as_string_list(member(tree, "exposed_ports"), "exposed_ports");

    const value& instructions = member(tree, "instructions");
    facts.instructions.total_count = as_count(member(instructions, "total_count"), "total_count");
    for (const auto& [kw, n] : as_object(member(instructions, "by_type"), "by_type")) {
        facts.instructions.by_type.insert_or_assign(kw, as_count(n, kw));
    }

    for (const auto& [name, v] : as_object(member(tree, "args"), "args")) {
        facts.args.insert_or_assign(name, as_optional_string(v, name));
    }
    for (const auto& [key, v] : as_object(member(tree, "labels"), "labels")) {
        facts.labels.insert_or_assign(key, as_string(v, key));
    }
    for (const auto& [key, v] : as_object(member(tree, "env_vars"), "env_vars")) {
        facts.env_vars.insert_or_assign(key, as_string(v, key));
    }

    return facts;
}

// ============================================================================
// Text Output
// ============================================================================

void write_json(std::ostream& os, const value& tree, int indent) {
    json_writer writer(os, indent);
    writer.write(tree, 0);
}

std::string to_json(const value& tree, int indent) {
    std::ostringstream oss;
    write_json(oss, tree, indent);
    return oss.str();
}

std::string describe(const analysis& facts) {
    std::ostringstream oss;

    oss << "Stages: " << facts.num_stages
        << (facts.multistage.is_multistage ? " (multistage)" : "") << "\n";
    for (const auto& s : facts.stages) {
        oss << "  [" << s.index << "] " << (s.name ? *s.name : "<unnamed>")
            << " <- " << s.base_image.full
            << (s.base_image.is_stage_reference() ? " (stage)" : "") << "\n";
    }

    oss << "Images:\n";
    for (const auto& image : facts.images) {
        oss << "  " << image.full;
        if (const auto& c = image.components) {
            oss << " (registry=" << c->registry.value_or("-")
                << ", name=" << c->name
                << ", tag=" << c->tag.value_or("-")
                << ", digest=" << c->digest.value_or("-") << ")";
        } else {
            oss << " (local stage)";
        }
        oss << "\n";
    }

    oss << "Copied from: " << join(facts.copy_from_stages) << "\n";
    oss << "Added from: " << join(facts.add_from_stages) << "\n";
    oss << "Stages used as base images: " << join(facts.multistage.stages_used_as_base_images) << "\n";
    oss << "Unused stages: " << join(facts.multistage.unused_stages) << "\n";
    oss << "Exposed ports: " << join(facts.exposed_ports) << "\n";

    oss << "Instructions: " << facts.instructions.total_count << "\n";
    for (const auto& [kw, n] : facts.instructions.by_type) {
        oss << "  " << kw << ": " << n << "\n";
    }

    oss << "Build arguments:\n";
    for (const auto& [name, default_value] : facts.args) {
        oss << "  " << name;
        if (default_value) {
            oss << "=" << *default_value;
        }
        oss << "\n";
    }
    oss << "Labels:\n";
    for (const auto& [key, v] : facts.labels) {
        oss << "  " << key << "=" << v << "\n";
    }
    oss << "Environment:\n";
    for (const auto& [key, v] : facts.env_vars) {
        oss << "  " << key << "=" << v << "\n";
    }

    return oss.str();
}

} // namespace dfscan::serialize
