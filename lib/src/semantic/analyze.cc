//
// Main semantic analysis pass
//
// One walk over the instruction sequence, in order. The stage graph is
// updated as FROM instructions are met, so every reference is resolved
// against the stages declared before it.
//

#include <dfscan/semantic.hh>
#include <dfscan/key_value.hh>
#include <dfscan/parser_error.hh>
#include <algorithm>
#include <iterator>

namespace dfscan::semantic {

namespace {
    void add_warning(std::vector<diagnostic>& diags,
                     const char* code,
                     const std::string& message,
                     const ast::source_pos& pos) {
        diags.push_back(diagnostic{
            diagnostic_level::warning,
            code,
            message,
            pos
        });
    }

    void push_unique(std::vector<std::string>& values, const std::string& value) {
        if (std::find(values.begin(), values.end(), value) == values.end()) {
            values.push_back(value);
        }
    }

    class analyzer {
        public:
            analyzer(const ast::dockerfile& doc, std::vector<diagnostic>& diags)
                : m_graph(phases::collect_stage_names(doc)),
                  m_diags(diags) {
            }

            void visit(const ast::instruction& instr) {
                count(ast::keyword_text(instr));
                std::visit([this](const auto& node) { (*this)(node); }, instr.node);
            }

            analysis finish() {
                m_facts.num_stages = m_graph.size();
                m_facts.stages = m_graph.stages();
                m_facts.multistage = phases::compute_multistage(
                    m_graph.stages(), m_base_refs, m_copy_refs, m_add_refs);

                for (const auto& name : m_facts.multistage.unused_stages) {
                    const auto it = std::find_if(m_graph.stages().begin(), m_graph.stages().end(),
                        [&](const stage& s) { return s.name && *s.name == name; });
                    const std::size_t line = (it != m_graph.stages().end()) ? it->line : 0;
                    add_warning(m_diags, diag_codes::W_UNUSED_STAGE,
                                "stage '" + name + "' is never used by another stage",
                                ast::source_pos{line});
                }

                return std::move(m_facts);
            }

            // ================================================================
            // Per-instruction handlers
            // ================================================================

            void operator()(const ast::from_instr& from) {
                const std::size_t line = from.pos.line;
                const std::string kw = ast::keyword_name(ast::keyword::from);

                const auto lookup = m_graph.resolve(from.image, std::nullopt, false);
                image_reference base;
                switch (lookup.status) {
                    case lookup_status::found:
                    case lookup_status::self_reference: {
                        const std::string name = m_graph.display_name(lookup.index);
                        base = make_stage_image(name);
                        m_base_refs.push_back(name);
                        break;
                    }
                    case lookup_status::forward:
                        throw invalid_stage_reference_error(line, kw,
                            "stage '" + from.image + "' is used before it is declared");
                    case lookup_status::external:
                        base = external_image(from.image, line, kw);
                        if (!base.components->tag && !base.components->digest &&
                            base.components->name != "scratch" && !is_placeholder_only(from.image)) {
                            add_warning(m_diags, diag_codes::W_IMPLICIT_LATEST,
                                        "base image '" + from.image + "' has no tag or digest (implicit 'latest')",
                                        from.pos);
                        }
                        break;
                }

                if (from.stage_alias && m_graph.is_declared(*from.stage_alias)) {
                    add_warning(m_diags, diag_codes::W_STAGE_SHADOWING,
                                "stage name '" + *from.stage_alias + "' shadows an earlier stage",
                                from.pos);
                }

                const auto& declared = m_graph.declare(from.stage_alias, base, line);
                if (declared.name) {
                    m_facts.stage_names.push_back(*declared.name);
                }
                if (std::none_of(m_facts.images.begin(), m_facts.images.end(),
                                 [&](const image_reference& img) { return img.full == base.full; })) {
                    m_facts.images.push_back(base);
                }
            }

            void operator()(const ast::copy_instr& copy) {
                transfer_source(copy.flags, copy.pos, ast::keyword::copy,
                                m_facts.copy_from_stages, m_copy_refs);
            }

            void operator()(const ast::add_instr& add) {
                transfer_source(add.flags, add.pos, ast::keyword::add,
                                m_facts.add_from_stages, m_add_refs);
            }

            void operator()(const ast::arg_instr& arg) {
                for (auto& [name, value] : key_values(arg.raw_args, arg.pos, ast::keyword::arg, true)) {
                    m_facts.args.insert_or_assign(name, std::move(value));
                }
            }

            void operator()(const ast::env_instr& env) {
                for (auto& [name, value] : key_values(env.raw_args, env.pos, ast::keyword::env, false)) {
                    m_facts.env_vars.insert_or_assign(name, value.value_or(""));
                }
            }

            void operator()(const ast::label_instr& label) {
                for (auto& [name, value] : key_values(label.raw_args, label.pos, ast::keyword::label, false)) {
                    m_facts.labels.insert_or_assign(name, value.value_or(""));
                }
            }

            void operator()(const ast::expose_instr& expose) {
                std::vector<std::string> ports;
                try {
                    ports = split_words(expose.raw_args);
                } catch (const key_value_error& e) {
                    throw malformed_instruction_error(expose.pos.line,
                        ast::keyword_name(ast::keyword::expose), e.what());
                }
                if (ports.empty()) {
                    throw malformed_instruction_error(expose.pos.line,
                        ast::keyword_name(ast::keyword::expose), "missing port");
                }
                for (auto& port : ports) {
                    m_facts.exposed_ports.push_back(std::move(port));
                }
            }

            void operator()(const ast::plain_instr& plain) {
                if (plain.kind == ast::keyword::maintainer) {
                    add_warning(m_diags, diag_codes::W_DEPRECATED,
                                "MAINTAINER is deprecated, use LABEL maintainer=... instead",
                                plain.pos);
                }
            }

            void operator()(const ast::unknown_instr& unknown) {
                add_warning(m_diags, diag_codes::W_UNKNOWN_INSTRUCTION,
                            "unknown instruction '" + unknown.keyword_text + "'",
                            unknown.pos);
            }

        private:
            void count(const std::string& kw) {
                ++m_facts.instructions.total_count;
                const std::size_t* current = m_facts.instructions.by_type.find(kw);
                m_facts.instructions.by_type.insert_or_assign(kw, current ? *current + 1 : 1);
            }

            static image_reference external_image(const std::string& ref, std::size_t line,
                                                  const std::string& kw) {
                try {
                    return make_external_image(ref);
                } catch (const image_reference_error& e) {
                    throw invalid_image_reference_error(line, kw, e.what());
                }
            }

            static std::vector<key_value> key_values(const std::string& raw, const ast::source_pos& pos,
                                                     ast::keyword kind, bool optional_values) {
                try {
                    return optional_values ? parse_arg_arguments(raw) : parse_assignment_arguments(raw);
                } catch (const key_value_error& e) {
                    throw malformed_instruction_error(pos.line, ast::keyword_name(kind), e.what());
                }
            }

            // COPY/ADD --from=<stage name | stage index | image>
            void transfer_source(const std::vector<ast::flag>& flags, const ast::source_pos& pos,
                                 ast::keyword kind, std::vector<std::string>& sources,
                                 std::vector<std::string>& stage_refs) {
                const auto from = ast::find_flag(flags, "from");
                if (!from) {
                    return;
                }

                const std::string kw = ast::keyword_name(kind);
                if (from->empty()) {
                    throw malformed_instruction_error(pos.line, kw, "--from requires a value");
                }

                const auto lookup = m_graph.resolve(*from, m_graph.current());
                switch (lookup.status) {
                    case lookup_status::found: {
                        const std::string name = m_graph.display_name(lookup.index);
                        push_unique(sources, name);
                        if (m_graph.stages()[lookup.index].name) {
                            stage_refs.push_back(name);
                        }
                        break;
                    }
                    case lookup_status::self_reference:
                        throw invalid_stage_reference_error(pos.line, kw,
                            "stage '" + *from + "' refers to the stage containing it");
                    case lookup_status::forward:
                        throw invalid_stage_reference_error(pos.line, kw,
                            "stage '" + *from + "' is not declared before this instruction");
                    case lookup_status::external:
                        external_image(*from, pos.line, kw);
                        push_unique(sources, *from);
                        add_warning(m_diags, diag_codes::W_EXTERNAL_COPY_SOURCE,
                                    "--from='" + *from + "' is not a stage, reading from external image",
                                    pos);
                        break;
                }
            }

            stage_graph m_graph;
            std::vector<diagnostic>& m_diags;
            analysis m_facts;

            std::vector<std::string> m_base_refs;
            std::vector<std::string> m_copy_refs;
            std::vector<std::string> m_add_refs;
    };

    bool is_reported(const diagnostic& diag, const analysis_options& opts) {
        if (diag.level > opts.min_level) {
            return false;
        }
        return !(diag.level == diagnostic_level::warning && opts.disabled_warnings.contains(diag.code));
    }
}

analysis_result analyze(const ast::dockerfile& doc, const analysis_options& opts) {
    if (doc.instructions.empty()) {
        throw empty_input_error("no instructions found (input is empty or only comments)");
    }

    std::vector<diagnostic> diagnostics;
    analyzer pass(doc, diagnostics);
    for (const auto& instr : doc.instructions) {
        pass.visit(instr);
    }

    analysis_result result;
    result.facts = pass.finish();

    std::copy_if(diagnostics.begin(), diagnostics.end(), std::back_inserter(result.diagnostics),
                 [&](const diagnostic& d) { return is_reported(d, opts); });
    std::stable_sort(result.diagnostics.begin(), result.diagnostics.end(),
                     [](const diagnostic& a, const diagnostic& b) {
                         return a.position.line < b.position.line;
                     });

    return result;
}

} // namespace dfscan::semantic

namespace dfscan {

analysis analyze_dockerfile(const std::string& text) {
    return semantic::analyze(parse_dockerfile(text)).facts;
}

} // namespace dfscan
