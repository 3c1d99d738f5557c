//
// Multistage relationships
//
// A stage is "used" when a later FROM builds on it or a COPY/ADD --from reads
// from it. The final stage is the build target and is never reported unused.
//

#include <dfscan/semantic.hh>
#include <algorithm>
#include <set>

namespace dfscan::semantic::phases {

namespace {
    // Distinct values in first-seen order, compared case-insensitively
    std::vector<std::string> distinct(const std::vector<std::string>& values) {
        std::vector<std::string> result;
        std::set<std::string> seen;
        for (const auto& v : values) {
            if (seen.insert(to_lower(v)).second) {
                result.push_back(v);
            }
        }
        return result;
    }
}

std::vector<std::string> collect_stage_names(const ast::dockerfile& doc) {
    std::vector<std::string> names;
    for (const auto& instr : doc.instructions) {
        if (auto* from = std::get_if<ast::from_instr>(&instr.node)) {
            if (from->stage_alias) {
                names.push_back(*from->stage_alias);
            }
        }
    }
    return names;
}

multistage_analysis compute_multistage(const std::vector<stage>& stages,
                                       const std::vector<std::string>& base_refs,
                                       const std::vector<std::string>& copy_refs,
                                       const std::vector<std::string>& add_refs) {
    multistage_analysis result;
    result.is_multistage = stages.size() > 1;
    result.stages_used_as_base_images = distinct(base_refs);
    result.stages_copied_from = distinct(copy_refs);
    result.stages_added_from = distinct(add_refs);

    std::set<std::string> used;
    for (const auto* refs : {&base_refs, &copy_refs, &add_refs}) {
        for (const auto& name : *refs) {
            used.insert(to_lower(name));
        }
    }
    if (!stages.empty() && stages.back().name) {
        used.insert(to_lower(*stages.back().name));
    }

    std::vector<std::string> declared;
    for (const auto& s : stages) {
        if (s.name) {
            declared.push_back(*s.name);
        }
    }
    for (const auto& name : distinct(declared)) {
        if (!used.contains(to_lower(name))) {
            result.unused_stages.push_back(name);
        }
    }

    return result;
}

} // namespace dfscan::semantic::phases
