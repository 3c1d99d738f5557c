/*
 * Dockerfile Parser - instruction classification
 */

#include <dfscan/parser.hh>
#include <dfscan/ast.hh>
#include <dfscan/key_value.hh>
#include <dfscan/parser_error.hh>
#include <algorithm>
#include <cctype>

#include "parser/parser_constants.h"

namespace dfscan {

namespace {
    std::string to_upper(const std::string& text) {
        std::string result = text;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    std::string rtrim(const std::string& text) {
        std::size_t end = text.size();
        while (end > 0 && is_space(text[end - 1])) {
            --end;
        }
        return text.substr(0, end);
    }

    bool is_valid_stage_name(const std::string& name) {
        if (name.empty() || name.size() > parser::MAX_STAGE_NAME_LENGTH ||
            !std::isalpha(static_cast<unsigned char>(name.front()))) {
            return false;
        }
        return std::all_of(name.begin(), name.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '_' || c == '-' || c == '.';
        });
    }

    // Consume leading "--name[=value]" words
    std::vector<ast::flag> take_flags(const std::vector<std::string>& words, std::size_t& pos,
                                      std::size_t line, const std::string& kw) {
        std::vector<ast::flag> flags;
        while (pos < words.size() && words[pos].rfind("--", 0) == 0) {
            const std::string& word = words[pos];
            std::string name;
            std::optional<std::string> value;

            const auto eq = word.find('=');
            if (eq == std::string::npos) {
                name = word.substr(2);
            } else {
                name = word.substr(2, eq - 2);
                value = unquote(word.substr(eq + 1));
            }
            if (name.empty()) {
                throw malformed_instruction_error(line, kw, "flag without a name: '" + word + "'");
            }
            flags.push_back(ast::flag{name, value});
            ++pos;
        }
        return flags;
    }

    std::vector<std::string> words_of(const std::string& raw, std::size_t line, const std::string& kw) {
        try {
            return split_words(raw);
        } catch (const key_value_error& e) {
            throw malformed_instruction_error(line, kw, e.what());
        }
    }

    ast::from_instr parse_from(const std::string& raw, std::size_t line) {
        static const std::string kw = ast::keyword_name(ast::keyword::from);

        const auto words = words_of(raw, line, kw);
        std::size_t pos = 0;

        ast::from_instr instr{ast::source_pos{line}, raw, {}, {}, std::nullopt};
        try {
            instr.flags = take_flags(words, pos, line, kw);
        } catch (const key_value_error& e) {
            throw malformed_instruction_error(line, kw, e.what());
        }

        if (pos >= words.size()) {
            throw malformed_instruction_error(line, kw, "missing base image");
        }
        try {
            instr.image = unquote(words[pos++]);
        } catch (const key_value_error& e) {
            throw malformed_instruction_error(line, kw, e.what());
        }
        if (instr.image.empty()) {
            throw malformed_instruction_error(line, kw, "empty base image");
        }

        if (pos < words.size()) {
            if (to_upper(words[pos]) != "AS") {
                throw malformed_instruction_error(line, kw,
                    "unexpected '" + words[pos] + "' after base image (expected AS <name>)");
            }
            ++pos;
            if (pos >= words.size()) {
                throw malformed_instruction_error(line, kw, "AS requires a stage name");
            }
            const std::string& name = words[pos++];
            if (!is_valid_stage_name(name)) {
                throw malformed_instruction_error(line, kw, "invalid stage name '" + name + "'");
            }
            instr.stage_alias = name;
        }

        if (pos < words.size()) {
            throw malformed_instruction_error(line, kw,
                "unexpected '" + words[pos] + "' after stage name");
        }

        return instr;
    }

    template <typename Instr>
    Instr parse_transfer(const std::string& raw, std::size_t line, ast::keyword kind) {
        const std::string kw = ast::keyword_name(kind);
        const auto words = words_of(raw, line, kw);
        std::size_t pos = 0;

        Instr instr{ast::source_pos{line}, raw, {}};
        try {
            instr.flags = take_flags(words, pos, line, kw);
        } catch (const key_value_error& e) {
            throw malformed_instruction_error(line, kw, e.what());
        }
        return instr;
    }
}

ast::instruction parse_instruction(const logical_line& line) {
    const std::string& text = line.text;

    std::size_t i = 0;
    while (i < text.size() && is_space(text[i])) {
        ++i;
    }
    const std::size_t kw_start = i;
    while (i < text.size() && !is_space(text[i])) {
        ++i;
    }
    const std::string word = text.substr(kw_start, i - kw_start);
    while (i < text.size() && is_space(text[i])) {
        ++i;
    }
    const std::string raw = rtrim(text.substr(i));

    const ast::source_pos pos{line.line};
    const auto kw = ast::keyword_from_string(word);
    if (!kw) {
        return ast::instruction{ast::unknown_instr{pos, to_upper(word), raw}};
    }

    switch (*kw) {
        case ast::keyword::from:
            return ast::instruction{parse_from(raw, line.line)};
        case ast::keyword::copy:
            return ast::instruction{parse_transfer<ast::copy_instr>(raw, line.line, *kw)};
        case ast::keyword::add:
            return ast::instruction{parse_transfer<ast::add_instr>(raw, line.line, *kw)};
        case ast::keyword::arg:
            return ast::instruction{ast::arg_instr{pos, raw}};
        case ast::keyword::env:
            return ast::instruction{ast::env_instr{pos, raw}};
        case ast::keyword::label:
            return ast::instruction{ast::label_instr{pos, raw}};
        case ast::keyword::expose:
            return ast::instruction{ast::expose_instr{pos, raw}};
        case ast::keyword::cmd:
        case ast::keyword::entrypoint:
        case ast::keyword::healthcheck:
        case ast::keyword::maintainer:
        case ast::keyword::onbuild:
        case ast::keyword::run:
        case ast::keyword::shell:
        case ast::keyword::stopsignal:
        case ast::keyword::user:
        case ast::keyword::volume:
        case ast::keyword::workdir:
            return ast::instruction{ast::plain_instr{pos, *kw, raw}};
    }

    return ast::instruction{ast::unknown_instr{pos, to_upper(word), raw}};
}

ast::dockerfile parse_dockerfile(const std::string& text) {
    ast::dockerfile doc;
    for (const auto& line : join_lines(text)) {
        doc.instructions.push_back(parse_instruction(line));
    }
    return doc;
}

} // namespace dfscan
