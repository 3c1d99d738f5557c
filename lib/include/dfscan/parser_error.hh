//
// Failure types raised by the Dockerfile parser and analyzer
//

#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace dfscan {
    enum class error_kind {
        empty_input,
        malformed_instruction,
        invalid_stage_reference,
        invalid_image_reference
    };

    namespace error_codes {
        constexpr const char* E_EMPTY_INPUT = "E001";             ///< No instructions in the document
        constexpr const char* E_MALFORMED_INSTRUCTION = "E010";   ///< Arguments do not fit the instruction shape
        constexpr const char* E_INVALID_STAGE_REFERENCE = "E020"; ///< Forward, self or out-of-range stage reference
        constexpr const char* E_INVALID_IMAGE_REFERENCE = "E030"; ///< Image text violates registry/name:tag@digest grammar
    }

    /// Base of all terminal analysis failures.
    ///
    /// Carries the first offending instruction: its 1-based line, its keyword
    /// (empty for empty_input) and the bare reason. what() is formatted as
    ///   "12: error: COPY: stage index 2 is not declared before this instruction [E020]"
    class analysis_error : public std::runtime_error {
        public:
            analysis_error(error_kind kind, std::size_t line, const std::string& keyword, const std::string& reason);

            [[nodiscard]] error_kind kind() const { return kind_; }
            [[nodiscard]] const char* code() const;
            [[nodiscard]] std::size_t line() const { return line_; }
            [[nodiscard]] const std::string& keyword() const { return keyword_; }
            [[nodiscard]] const std::string& reason() const { return reason_; }

        private:
            error_kind kind_;
            std::size_t line_;
            std::string keyword_;
            std::string reason_;

            static std::string build_message(error_kind kind, std::size_t line,
                                             const std::string& keyword, const std::string& reason);
    };

    class empty_input_error : public analysis_error {
        public:
            explicit empty_input_error(const std::string& reason)
                : analysis_error(error_kind::empty_input, 0, "", reason) {
            }
    };

    class malformed_instruction_error : public analysis_error {
        public:
            malformed_instruction_error(std::size_t line, const std::string& keyword, const std::string& reason)
                : analysis_error(error_kind::malformed_instruction, line, keyword, reason) {
            }
    };

    class invalid_stage_reference_error : public analysis_error {
        public:
            invalid_stage_reference_error(std::size_t line, const std::string& keyword, const std::string& reason)
                : analysis_error(error_kind::invalid_stage_reference, line, keyword, reason) {
            }
    };

    class invalid_image_reference_error : public analysis_error {
        public:
            invalid_image_reference_error(std::size_t line, const std::string& keyword, const std::string& reason)
                : analysis_error(error_kind::invalid_image_reference, line, keyword, reason) {
            }
    };

    // Position-less failures of the leaf extractors; the analyzer rethrows
    // them as the positioned kinds above.
    class image_reference_error : public std::runtime_error {
        public:
            explicit image_reference_error(const std::string& msg)
                : std::runtime_error(msg) {
            }
    };

    class key_value_error : public std::runtime_error {
        public:
            explicit key_value_error(const std::string& msg)
                : std::runtime_error(msg) {
            }
    };
}
