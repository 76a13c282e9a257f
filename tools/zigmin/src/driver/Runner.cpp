// tools/zigmin/src/driver/Runner.cpp
#include "Runner.hpp"

#include "../dump/Dump.hpp"

#include <zigmin/diag/DiagCode.hpp>
#include <zigmin/diag/Diagnostic.hpp>
#include <zigmin/diag/Render.hpp>
#include <zigmin/lex/Lexer.hpp>
#include <zigmin/minify/Emitter.hpp>
#include <zigmin/os/File.hpp>
#include <zigmin/text/SourceManager.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace zigmin_cli::driver {

    namespace {

        constexpr std::string_view k_stdin_name = "<stdin>";

        /// @brief Renders every diagnostic to stderr; returns 1 when any of them is an error.
        int flush_diags(
            const zigmin::diag::Bag& bag,
            const zigmin::SourceManager& sm,
            uint32_t context_lines
        ) {
            for (const auto& d : bag.diags()) {
                std::cerr << zigmin::diag::render_one_context(d, sm, context_lines) << "\n";
            }
            return bag.has_error() ? 1 : 0;
        }

        zigmin::os::ReadTextResult read_input(const cli::Options& opt) {
            if (opt.input_path.empty()) {
                return zigmin::os::read_text_stream(std::cin, opt.max_source_size);
            }
            return zigmin::os::read_text_file(opt.input_path, opt.max_source_size);
        }

        /// @brief Reports an input that could not be read. No source text exists, so no snippet.
        int report_read_failure(
            const zigmin::os::ReadTextResult& rr,
            std::string_view name,
            const cli::Options& opt
        ) {
            zigmin::SourceManager sm;
            const uint32_t file_id = sm.add(std::string(name), std::string{});

            zigmin::diag::Diagnostic d(zigmin::diag::Severity::kFatal, rr.code, zigmin::Span{file_id, 0, 0});
            if (rr.code == zigmin::diag::Code::kSourceTooLarge) {
                d.add_arg_int(static_cast<long long>(opt.max_source_size));
            } else {
                d.add_arg(name);
                d.add_arg(rr.err);
            }

            std::cerr << zigmin::diag::render_one(d, sm) << "\n";
            return 1;
        }

        int run_dump(const zigmin::SourceManager& sm, uint32_t file_id, const cli::Options& opt) {
            zigmin::diag::Bag bag;
            zigmin::Lexer lex(sm.content(file_id), file_id, &bag);
            const auto tokens = lex.lex_all();

            dump::dump_tokens(tokens, std::cout);
            return flush_diags(bag, sm, opt.context_lines);
        }

        int run_minify(const zigmin::SourceManager& sm, uint32_t file_id, const cli::Options& opt) {
            zigmin::diag::Bag bag;
            const auto out = zigmin::minify::minify_source(sm.content(file_id), file_id, opt.minify, bag);

            if (!out) {
                flush_diags(bag, sm, opt.context_lines);
                return 1;
            }

            if (opt.output_path.empty()) {
                std::cout << *out;
                std::cout.flush();
                if (!std::cout) {
                    std::cerr << "error: failed to write output to stdout\n";
                    return 1;
                }
            } else if (!zigmin::os::write_text_file(opt.output_path, *out)) {
                std::cerr << "error: cannot write output file '" << opt.output_path << "'\n";
                return 1;
            }

            return flush_diags(bag, sm, opt.context_lines);
        }

    } // namespace

    int run(const cli::Options& opt) {
        const std::string_view name =
            opt.input_path.empty() ? k_stdin_name : std::string_view(opt.input_path);

        auto rr = read_input(opt);
        if (!rr.ok) return report_read_failure(rr, name, opt);

        zigmin::SourceManager sm;
        const uint32_t file_id = sm.add(std::string(name), std::move(rr.text));

        switch (opt.mode) {
            case cli::Mode::kDumpTokens:
                return run_dump(sm, file_id, opt);
            case cli::Mode::kMinify:
                return run_minify(sm, file_id, opt);
            case cli::Mode::kUsage:
            case cli::Mode::kVersion:
            default:
                return 0;
        }
    }

} // namespace zigmin_cli::driver
