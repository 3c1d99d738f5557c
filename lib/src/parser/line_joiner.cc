/*
 * Dockerfile line joiner
 *
 * Turns raw text into logical instruction lines:
 *   - a line ending in an unescaped backslash (optionally followed by blanks)
 *     continues on the next line; the backslash and the continuation's
 *     leading whitespace are removed
 *   - lines whose first non-blank character is '#' are comments (parser
 *     directives such as "# syntax=" included) and are dropped, also in the
 *     middle of a continuation; inside an open quote they are text
 *   - a UTF-8 byte-order mark at the start of the document is skipped
 *   - blank lines are dropped
 *   - quotes are tracked so that a quote left open when the logical line
 *     ends is reported instead of silently swallowing text
 */

#include <dfscan/parser.hh>
#include <dfscan/parser_error.hh>
#include <cctype>
#include <string_view>

#include "parser/scanner_context.h"

namespace dfscan {

namespace {
    constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

    bool is_blank(char c) {
        return c == ' ' || c == '\t';
    }

    std::string_view ltrim(std::string_view sv) {
        std::size_t i = 0;
        while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i]))) {
            ++i;
        }
        return sv.substr(i);
    }

    std::string first_word_upper(const std::string& text) {
        std::string word;
        for (char c : text) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                break;
            }
            word += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return word;
    }

    class line_scanner {
        public:
            explicit line_scanner(const std::string& text) {
                m_ctx.cursor = text.data();
                m_ctx.eof = text.data() + text.size();
                m_ctx.line = 0;

                if (std::string_view(text).substr(0, UTF8_BOM.size()) == UTF8_BOM) {
                    m_ctx.cursor += UTF8_BOM.size();
                }
            }

            /* Next physical line without its terminator; false at end of input */
            bool next(std::string_view& out, std::size_t& line_no) {
                if (m_ctx.cursor >= m_ctx.eof) {
                    return false;
                }
                const char* start = m_ctx.cursor;
                const char* p = start;
                while (p < m_ctx.eof && *p != '\n') {
                    ++p;
                }
                const char* end = p;
                if (end > start && *(end - 1) == '\r') {
                    --end;
                }
                m_ctx.cursor = (p < m_ctx.eof) ? p + 1 : p;
                ++m_ctx.line;

                out = std::string_view(start, static_cast<std::size_t>(end - start));
                line_no = m_ctx.line;
                return true;
            }

        private:
            scanner_context m_ctx{};
    };

    /* Strip a continuation backslash; returns true if the line continues */
    bool strip_continuation(std::string_view& content) {
        std::size_t end = content.size();
        while (end > 0 && is_blank(content[end - 1])) {
            --end;
        }
        std::size_t slashes = 0;
        while (slashes < end && content[end - 1 - slashes] == '\\') {
            ++slashes;
        }
        if (slashes % 2 == 1) {
            content = content.substr(0, end - 1);
            return true;
        }
        return false;
    }

    /* Advance the quote state over one chunk of logical-line text */
    void track_quotes(std::string_view content, std::size_t line_no, quote_state& quotes) {
        for (std::size_t i = 0; i < content.size(); ++i) {
            const char c = content[i];
            if (quotes.open == 0) {
                if (c == '\\') {
                    ++i;
                } else if (c == '"' || c == '\'') {
                    quotes.open = c;
                    quotes.opened_line = line_no;
                }
            } else if (quotes.open == '"') {
                if (c == '\\') {
                    ++i;
                } else if (c == '"') {
                    quotes.open = 0;
                }
            } else if (c == '\'') {
                quotes.open = 0;
            }
        }
    }
}

std::vector<logical_line> join_lines(const std::string& text) {
    std::vector<logical_line> result;
    line_scanner scanner(text);

    std::string current;
    std::size_t start_line = 0;
    bool continuing = false;
    quote_state quotes;

    auto finish = [&]() {
        if (quotes.open != 0) {
            throw malformed_instruction_error(
                start_line, first_word_upper(current),
                std::string("unterminated ") + (quotes.open == '"' ? "double" : "single") +
                " quote opened on line " + std::to_string(quotes.opened_line));
        }
        if (!ltrim(current).empty()) {
            result.push_back(logical_line{current, start_line});
        }
        current.clear();
        continuing = false;
    };

    std::string_view physical;
    std::size_t line_no = 0;
    while (scanner.next(physical, line_no)) {
        std::string_view content = ltrim(physical);

        // Comments and blank lines vanish, even inside a continuation.
        // A '#' line is text while a quote from an earlier line is open.
        if (content.empty() || (quotes.open == 0 && content.front() == '#')) {
            continue;
        }

        if (!continuing) {
            start_line = line_no;
        }

        continuing = strip_continuation(content);
        track_quotes(content, line_no, quotes);
        current.append(content.data(), content.size());

        if (!continuing) {
            finish();
        }
    }

    // Document ended inside a continuation: the partial line still counts
    if (continuing) {
        finish();
    }

    return result;
}

} // namespace dfscan
