//
// Image reference decomposition
//

#include <dfscan/image_reference.hh>
#include <dfscan/parser_error.hh>
#include <algorithm>
#include <cctype>

namespace dfscan {

namespace {
    constexpr char MASK_CHAR = '_';

    // Copy of ref with the inside of every "${...}" blanked out, so that
    // separators used by shell parameter expansion are not taken as '/', ':'
    // or '@' of the reference grammar
    std::string mask_placeholders(const std::string& ref) {
        std::string masked = ref;
        int depth = 0;
        for (std::size_t i = 0; i < ref.size(); ++i) {
            if (ref[i] == '$' && i + 1 < ref.size() && ref[i + 1] == '{') {
                ++depth;
                ++i;
                continue;
            }
            if (depth > 0) {
                if (ref[i] == '}') {
                    --depth;
                } else {
                    masked[i] = MASK_CHAR;
                }
            }
        }
        return masked;
    }

    bool has_empty_component(const std::string& path) {
        if (path.empty() || path.front() == '/' || path.back() == '/') {
            return true;
        }
        return path.find("//") != std::string::npos;
    }
}

image_components parse_image_components(const std::string& ref) {
    if (ref.empty()) {
        throw image_reference_error("empty image reference");
    }
    if (std::any_of(ref.begin(), ref.end(), [](unsigned char c) { return std::isspace(c); })) {
        throw image_reference_error("image reference '" + ref + "' contains whitespace");
    }

    const std::string masked = mask_placeholders(ref);
    image_components result;

    // Digest
    std::string rest = ref;
    std::string masked_rest = masked;
    const auto at_count = std::count(masked.begin(), masked.end(), '@');
    if (at_count > 1) {
        throw image_reference_error("image reference '" + ref + "' contains more than one '@'");
    }
    if (at_count == 1) {
        const auto at = masked.find('@');
        std::string digest = ref.substr(at + 1);
        if (digest.empty()) {
            throw image_reference_error("empty digest in '" + ref + "'");
        }
        result.digest = std::move(digest);
        rest = ref.substr(0, at);
        masked_rest = masked.substr(0, at);
    }

    // Tag: ':' after the last '/'
    const auto last_slash = masked_rest.rfind('/');
    const auto tag_search_from = (last_slash == std::string::npos) ? 0 : last_slash + 1;
    const auto colon = masked_rest.find(':', tag_search_from);
    if (colon != std::string::npos) {
        std::string tag = rest.substr(colon + 1);
        if (tag.empty()) {
            throw image_reference_error("empty tag in '" + ref + "'");
        }
        if (result.digest) {
            throw image_reference_error("image reference '" + ref + "' has both a tag and a digest");
        }
        result.tag = std::move(tag);
        rest = rest.substr(0, colon);
        masked_rest = masked_rest.substr(0, colon);
    }

    // Registry: first component with '.', ':' or equal to "localhost"
    const auto first_slash = masked_rest.find('/');
    if (first_slash != std::string::npos) {
        const std::string first = rest.substr(0, first_slash);
        const std::string masked_first = masked_rest.substr(0, first_slash);
        if (masked_first.find('.') != std::string::npos ||
            masked_first.find(':') != std::string::npos ||
            first == "localhost") {
            result.registry = first;
            rest = rest.substr(first_slash + 1);
        }
    }

    if (rest.empty()) {
        throw image_reference_error("missing image name in '" + ref + "'");
    }
    if (has_empty_component(rest)) {
        throw image_reference_error("empty path component in '" + ref + "'");
    }
    result.name = std::move(rest);

    return result;
}

image_reference make_external_image(const std::string& ref) {
    return image_reference{ref, parse_image_components(ref)};
}

image_reference make_stage_image(const std::string& stage_name) {
    return image_reference{stage_name, std::nullopt};
}

bool is_placeholder_only(const std::string& ref) {
    if (ref.empty()) {
        return false;
    }
    std::size_t i = 0;
    while (i < ref.size()) {
        if (ref[i] != '$' || i + 1 >= ref.size()) {
            return false;
        }
        if (ref[i + 1] == '{') {
            const auto close = ref.find('}', i + 2);
            if (close == std::string::npos) {
                return false;
            }
            i = close + 1;
        } else if (std::isalpha(static_cast<unsigned char>(ref[i + 1])) || ref[i + 1] == '_') {
            i += 2;
            while (i < ref.size() &&
                   (std::isalnum(static_cast<unsigned char>(ref[i])) || ref[i] == '_')) {
                ++i;
            }
        } else {
            return false;
        }
    }
    return true;
}

} // namespace dfscan
