//
// Stage registry with declaration-order lookups
//

#include <dfscan/stage_graph.hh>
#include <algorithm>
#include <cctype>
#include <limits>

namespace dfscan {

namespace {
    bool is_index(const std::string& ref) {
        return !ref.empty() &&
               std::all_of(ref.begin(), ref.end(), [](unsigned char c) { return std::isdigit(c); });
    }

    // Saturates instead of overflowing for absurdly long digit strings
    std::size_t to_index(const std::string& ref) {
        std::size_t value = 0;
        for (char c : ref) {
            const auto digit = static_cast<std::size_t>(c - '0');
            if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
                return std::numeric_limits<std::size_t>::max();
            }
            value = value * 10 + digit;
        }
        return value;
    }
}

std::string to_lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

stage_graph::stage_graph(const std::vector<std::string>& document_names) {
    for (const auto& name : document_names) {
        document_names_.insert(to_lower(name));
    }
}

stage_lookup stage_graph::resolve(const std::string& ref,
                                  std::optional<std::size_t> referencing_stage,
                                  bool allow_index) const {
    std::optional<std::size_t> index;

    if (allow_index && is_index(ref)) {
        const std::size_t n = to_index(ref);
        if (n >= stages_.size()) {
            return stage_lookup{lookup_status::forward};
        }
        index = n;
    } else {
        const std::string key = to_lower(ref);
        if (auto it = by_name_.find(key); it != by_name_.end()) {
            index = it->second;
        } else if (document_names_.contains(key)) {
            return stage_lookup{lookup_status::forward};
        } else {
            return stage_lookup{lookup_status::external};
        }
    }

    if (referencing_stage && *index == *referencing_stage) {
        return stage_lookup{lookup_status::self_reference, *index};
    }
    return stage_lookup{lookup_status::found, *index};
}

const stage& stage_graph::declare(std::optional<std::string> name, image_reference base_image,
                                  std::size_t line) {
    const std::size_t index = stages_.size();
    if (name) {
        by_name_[to_lower(*name)] = index;
    }
    stages_.push_back(stage{index, std::move(name), std::move(base_image), line});
    return stages_.back();
}

bool stage_graph::is_declared(const std::string& name) const {
    return by_name_.contains(to_lower(name));
}

std::string stage_graph::display_name(std::size_t index) const {
    const auto& s = stages_.at(index);
    return s.name ? *s.name : std::to_string(index);
}

std::optional<std::size_t> stage_graph::current() const {
    if (stages_.empty()) {
        return std::nullopt;
    }
    return stages_.size() - 1;
}

} // namespace dfscan
