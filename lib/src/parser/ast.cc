//
// Keyword tables and instruction accessors
//

#include <dfscan/ast.hh>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace dfscan::ast {

namespace {
    constexpr std::array<std::pair<keyword, const char*>, 18> KEYWORDS = {{
        {keyword::add, "ADD"},
        {keyword::arg, "ARG"},
        {keyword::cmd, "CMD"},
        {keyword::copy, "COPY"},
        {keyword::entrypoint, "ENTRYPOINT"},
        {keyword::env, "ENV"},
        {keyword::expose, "EXPOSE"},
        {keyword::from, "FROM"},
        {keyword::healthcheck, "HEALTHCHECK"},
        {keyword::label, "LABEL"},
        {keyword::maintainer, "MAINTAINER"},
        {keyword::onbuild, "ONBUILD"},
        {keyword::run, "RUN"},
        {keyword::shell, "SHELL"},
        {keyword::stopsignal, "STOPSIGNAL"},
        {keyword::user, "USER"},
        {keyword::volume, "VOLUME"},
        {keyword::workdir, "WORKDIR"},
    }};

    std::string to_upper(const std::string& text) {
        std::string result = text;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }
}

const char* keyword_name(keyword kw) {
    for (const auto& [k, name] : KEYWORDS) {
        if (k == kw) {
            return name;
        }
    }
    return "";
}

std::optional<keyword> keyword_from_string(const std::string& text) {
    const std::string upper = to_upper(text);
    for (const auto& [k, name] : KEYWORDS) {
        if (upper == name) {
            return k;
        }
    }
    return std::nullopt;
}

std::string keyword_text(const instruction& instr) {
    if (std::get_if<from_instr>(&instr.node)) return keyword_name(keyword::from);
    if (std::get_if<copy_instr>(&instr.node)) return keyword_name(keyword::copy);
    if (std::get_if<add_instr>(&instr.node)) return keyword_name(keyword::add);
    if (std::get_if<arg_instr>(&instr.node)) return keyword_name(keyword::arg);
    if (std::get_if<env_instr>(&instr.node)) return keyword_name(keyword::env);
    if (std::get_if<label_instr>(&instr.node)) return keyword_name(keyword::label);
    if (std::get_if<expose_instr>(&instr.node)) return keyword_name(keyword::expose);
    if (auto* plain = std::get_if<plain_instr>(&instr.node)) return keyword_name(plain->kind);
    return std::get<unknown_instr>(instr.node).keyword_text;
}

const source_pos& position(const instruction& instr) {
    return std::visit([](const auto& node) -> const source_pos& { return node.pos; }, instr.node);
}

const std::string& raw_args(const instruction& instr) {
    return std::visit([](const auto& node) -> const std::string& { return node.raw_args; }, instr.node);
}

std::optional<std::string> find_flag(const std::vector<flag>& flags, const std::string& name) {
    std::optional<std::string> result;
    for (const auto& f : flags) {
        if (f.name == name) {
            result = f.value.value_or("");
        }
    }
    return result;
}

} // namespace dfscan::ast
