//
// Key/value extraction for ARG, ENV and LABEL
//

#include <dfscan/key_value.hh>
#include <dfscan/parser_error.hh>
#include <cctype>

namespace dfscan {

namespace {
    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    struct word_span {
        std::size_t begin;
        std::size_t end;
    };

    // Word boundaries on unquoted whitespace; quotes and escapes stay inside words
    std::vector<word_span> scan_words(const std::string& text) {
        std::vector<word_span> spans;
        std::size_t i = 0;
        const std::size_t n = text.size();

        while (i < n) {
            while (i < n && is_space(text[i])) {
                ++i;
            }
            if (i >= n) {
                break;
            }

            const std::size_t begin = i;
            char quote = 0;
            while (i < n) {
                const char c = text[i];
                if (quote == 0) {
                    if (is_space(c)) {
                        break;
                    }
                    if (c == '\\' && i + 1 < n) {
                        ++i;
                    } else if (c == '"' || c == '\'') {
                        quote = c;
                    }
                } else if (quote == '"') {
                    if (c == '\\' && i + 1 < n) {
                        ++i;
                    } else if (c == '"') {
                        quote = 0;
                    }
                } else if (c == '\'') {
                    quote = 0;
                }
                ++i;
            }

            if (quote != 0) {
                throw key_value_error(std::string("unterminated ") +
                                      (quote == '"' ? "double" : "single") + " quote");
            }
            spans.push_back(word_span{begin, i});
        }

        return spans;
    }

    // Position of the first '=' outside quotes, npos if none
    std::size_t find_assignment(const std::string& word) {
        char quote = 0;
        for (std::size_t i = 0; i < word.size(); ++i) {
            const char c = word[i];
            if (quote == 0) {
                if (c == '\\') {
                    ++i;
                } else if (c == '"' || c == '\'') {
                    quote = c;
                } else if (c == '=') {
                    return i;
                }
            } else if (quote == '"') {
                if (c == '\\') {
                    ++i;
                } else if (c == '"') {
                    quote = 0;
                }
            } else if (c == '\'') {
                quote = 0;
            }
        }
        return std::string::npos;
    }

    key_value split_assignment(const std::string& word, std::size_t eq) {
        std::string key = unquote(word.substr(0, eq));
        if (key.empty()) {
            throw key_value_error("empty key in '" + word + "'");
        }
        return key_value{std::move(key), unquote(word.substr(eq + 1))};
    }
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    for (const auto& span : scan_words(text)) {
        words.push_back(text.substr(span.begin, span.end - span.begin));
    }
    return words;
}

std::string unquote(const std::string& word) {
    std::string result;
    result.reserve(word.size());
    char quote = 0;

    for (std::size_t i = 0; i < word.size(); ++i) {
        const char c = word[i];
        if (quote == 0) {
            if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '\\' && i + 1 < word.size()) {
                const char next = word[i + 1];
                if (next == '\\' || next == '"' || next == '\'' || is_space(next)) {
                    result += next;
                } else {
                    result += c;
                    result += next;
                }
                ++i;
            } else {
                result += c;
            }
        } else if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < word.size()) {
                const char next = word[i + 1];
                if (next == '\\' || next == '"') {
                    result += next;
                } else {
                    result += c;
                    result += next;
                }
                ++i;
            } else {
                result += c;
            }
        } else if (c == '\'') {
            quote = 0;
        } else {
            result += c;
        }
    }

    if (quote != 0) {
        throw key_value_error(std::string("unterminated ") +
                              (quote == '"' ? "double" : "single") + " quote");
    }
    return result;
}

std::vector<key_value> parse_arg_arguments(const std::string& raw_args) {
    const auto words = split_words(raw_args);
    if (words.empty()) {
        throw key_value_error("missing argument name");
    }

    std::vector<key_value> result;
    for (const auto& word : words) {
        const auto eq = find_assignment(word);
        if (eq == std::string::npos) {
            std::string name = unquote(word);
            if (name.empty()) {
                throw key_value_error("empty argument name");
            }
            result.emplace_back(std::move(name), std::nullopt);
        } else {
            result.push_back(split_assignment(word, eq));
        }
    }
    return result;
}

std::vector<key_value> parse_assignment_arguments(const std::string& raw_args) {
    const auto spans = scan_words(raw_args);
    if (spans.empty()) {
        throw key_value_error("missing key-value pair");
    }

    const std::string first = raw_args.substr(spans[0].begin, spans[0].end - spans[0].begin);

    // Legacy form: "KEY the remaining text"
    if (find_assignment(first) == std::string::npos) {
        std::string key = unquote(first);
        if (key.empty()) {
            throw key_value_error("empty key");
        }
        if (spans.size() < 2) {
            throw key_value_error("missing value for '" + key + "' (expected KEY=VALUE or KEY VALUE)");
        }
        const std::size_t value_begin = spans[1].begin;
        const std::size_t value_end = spans.back().end;
        std::string value = unquote(raw_args.substr(value_begin, value_end - value_begin));
        return {key_value{std::move(key), std::move(value)}};
    }

    std::vector<key_value> result;
    for (const auto& span : spans) {
        const std::string word = raw_args.substr(span.begin, span.end - span.begin);
        const auto eq = find_assignment(word);
        if (eq == std::string::npos) {
            throw key_value_error("expected KEY=VALUE, found '" + word + "'");
        }
        result.push_back(split_assignment(word, eq));
    }
    return result;
}

} // namespace dfscan
