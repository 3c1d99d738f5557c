//
// Dockerfile Parser - C++ Interface
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ast.hh"
#include "parser_error.hh"

namespace dfscan {
    // One instruction after continuation joining and comment removal
    struct logical_line {
        std::string text;
        std::size_t line; // 1-based line of the first physical line
    };

    // Stage 1: join backslash continuations, drop comments and blank lines.
    // Throws malformed_instruction_error for quotes left open at end of input.
    std::vector<logical_line> join_lines(const std::string& text);

    // Stage 2: classify a single logical line.
    // Throws malformed_instruction_error when the arguments do not fit.
    ast::instruction parse_instruction(const logical_line& line);

    // Both stages. An empty result is not an error here; the analyzer
    // reports it as empty_input_error.
    ast::dockerfile parse_dockerfile(const std::string& text);
}
