//
// Instruction model produced by the Dockerfile parser
//

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dfscan::ast {
    struct source_pos {
        explicit source_pos(std::size_t line_ = 0)
            : line(line_) {
        }

        std::size_t line;  // 1-based line where the logical line starts
    };

    // Closed keyword set; everything else parses as unknown_instr
    enum class keyword {
        add,
        arg,
        cmd,
        copy,
        entrypoint,
        env,
        expose,
        from,
        healthcheck,
        label,
        maintainer,
        onbuild,
        run,
        shell,
        stopsignal,
        user,
        volume,
        workdir
    };

    // "--name=value" or "--name" preceding the operands of FROM/COPY/ADD
    struct flag {
        std::string name;
        std::optional<std::string> value;
    };

    struct from_instr {
        source_pos pos;
        std::string raw_args;
        std::vector<flag> flags;
        std::string image;                      // base image text, verbatim
        std::optional<std::string> stage_alias; // name after AS
    };

    struct copy_instr {
        source_pos pos;
        std::string raw_args;
        std::vector<flag> flags;
    };

    struct add_instr {
        source_pos pos;
        std::string raw_args;
        std::vector<flag> flags;
    };

    struct arg_instr {
        source_pos pos;
        std::string raw_args;
    };

    struct env_instr {
        source_pos pos;
        std::string raw_args;
    };

    struct label_instr {
        source_pos pos;
        std::string raw_args;
    };

    struct expose_instr {
        source_pos pos;
        std::string raw_args;
    };

    // Instructions the analyzer only counts (RUN, CMD, WORKDIR, ...)
    struct plain_instr {
        source_pos pos;
        keyword kind;
        std::string raw_args;
    };

    struct unknown_instr {
        source_pos pos;
        std::string keyword_text; // upper-cased literal keyword
        std::string raw_args;
    };

    using instruction_node = std::variant <
        from_instr,
        copy_instr,
        add_instr,
        arg_instr,
        env_instr,
        label_instr,
        expose_instr,
        plain_instr,
        unknown_instr
    >;

    struct instruction {
        instruction_node node;
    };

    struct dockerfile {
        std::vector<instruction> instructions;
    };

    // Upper-case spelling of a keyword ("FROM", "RUN", ...)
    const char* keyword_name(keyword kw);

    // Case-insensitive keyword lookup; nullopt for unknown keywords
    std::optional<keyword> keyword_from_string(const std::string& text);

    // Keyword text used for statistics and diagnostics
    std::string keyword_text(const instruction& instr);

    const source_pos& position(const instruction& instr);
    const std::string& raw_args(const instruction& instr);

    // Value of the last "--name" flag, if present
    std::optional<std::string> find_flag(const std::vector<flag>& flags, const std::string& name);
}
