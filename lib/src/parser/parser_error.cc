//
// Analysis failure formatting
//

#include <dfscan/parser_error.hh>
#include <sstream>

namespace dfscan {

namespace {
    const char* code_for(error_kind kind) {
        switch (kind) {
            case error_kind::empty_input:
                return error_codes::E_EMPTY_INPUT;
            case error_kind::malformed_instruction:
                return error_codes::E_MALFORMED_INSTRUCTION;
            case error_kind::invalid_stage_reference:
                return error_codes::E_INVALID_STAGE_REFERENCE;
            case error_kind::invalid_image_reference:
                return error_codes::E_INVALID_IMAGE_REFERENCE;
        }
        return "";
    }
}

analysis_error::analysis_error(error_kind kind, std::size_t line, const std::string& keyword,
                               const std::string& reason)
    : std::runtime_error(build_message(kind, line, keyword, reason)),
      kind_(kind),
      line_(line),
      keyword_(keyword),
      reason_(reason) {
}

const char* analysis_error::code() const {
    return code_for(kind_);
}

// Format: line: error: KEYWORD: reason [code]
std::string analysis_error::build_message(error_kind kind, std::size_t line,
                                          const std::string& keyword, const std::string& reason) {
    std::ostringstream oss;
    if (line > 0) {
        oss << line << ": ";
    }
    oss << "error: ";
    if (!keyword.empty()) {
        oss << keyword << ": ";
    }
    oss << reason << " [" << code_for(kind) << "]";
    return oss.str();
}

} // namespace dfscan
