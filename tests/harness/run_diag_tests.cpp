#include <zigmin/diag/DiagCode.hpp>
#include <zigmin/diag/Diagnostic.hpp>
#include <zigmin/diag/Render.hpp>
#include <zigmin/minify/Emitter.hpp>
#include <zigmin/os/File.hpp>
#include <zigmin/text/SourceManager.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool test_line_col_() {
        zigmin::SourceManager sm;
        const uint32_t id = sm.add("a.zig", "const a = 1;\nvar b = 2;\n");

        bool ok = true;
        const auto first = sm.line_col(id, 6);
        ok &= require_(first.line == 1 && first.col == 7, "offset 6 is 1:7");

        const auto second = sm.line_col(id, 17);
        ok &= require_(second.line == 2 && second.col == 5, "offset 17 is 2:5");

        ok &= require_(sm.name(id) == "a.zig", "name must round-trip");
        ok &= require_(sm.name(42) == "<unknown>", "unknown file id has a placeholder name");
        ok &= require_(sm.content(42).empty(), "unknown file id has no content");
        return ok;
    }

    static bool test_snippet_block_() {
        zigmin::SourceManager sm;
        const uint32_t id = sm.add("b.zig", "l1\nl2\nbad $ here\nl4\nl5\nl6\n");

        const auto blk = sm.snippet_block_for_span(zigmin::Span{id, 10, 11}, 1);

        bool ok = true;
        ok &= require_(blk.first_line_no == 2, "one line of context before the caret line");
        ok &= require_(blk.lines.size() == 3, "caret line plus one line each side");
        ok &= require_(blk.lines[1] == "bad $ here", "caret line text");
        ok &= require_(blk.caret_line_offset == 1, "caret line is the middle one");
        ok &= require_(blk.caret_cols_before == 4, "caret column");
        ok &= require_(blk.caret_cols_len == 1, "caret width");
        return ok;
    }

    static bool test_render_one_() {
        zigmin::SourceManager sm;
        const uint32_t id = sm.add("t.zig", "const x = $;");

        zigmin::diag::Diagnostic d(zigmin::diag::Severity::kFatal, zigmin::diag::Code::kInvalidSource,
                                   zigmin::Span{id, 10, 11});

        const std::string head = zigmin::diag::render_one(d, sm);
        const std::string full = zigmin::diag::render_one_context(d, sm, 0);

        bool ok = true;
        ok &= require_(head == "fatal[InvalidSource]: invalid source: minification aborted\n --> t.zig:1:11\n",
                       "header and locator");
        ok &= require_(full == head +
                               "    |\n"
                               "  1 | const x = $;\n"
                               "    |           ^\n",
                       "context snippet with caret");
        return ok;
    }

    static bool test_render_args_() {
        zigmin::SourceManager sm;
        const uint32_t id = sm.add("u.zig", "x");

        zigmin::diag::Diagnostic tok(zigmin::diag::Severity::kError, zigmin::diag::Code::kInvalidToken,
                                     zigmin::Span{id, 0, 1});
        tok.add_arg("$");

        zigmin::diag::Diagnostic big(zigmin::diag::Severity::kFatal, zigmin::diag::Code::kSourceTooLarge,
                                     zigmin::Span{id, 0, 0});
        big.add_arg_int(4096);

        bool ok = true;
        ok &= require_(zigmin::diag::render_message(tok) == "invalid token '$'", "lexeme argument");
        ok &= require_(zigmin::diag::render_message(big) == "source exceeds the maximum size of 4096 bytes",
                       "integer argument");
        ok &= require_(zigmin::diag::code_name(zigmin::diag::Code::kInvalidUtf8) == "InvalidUtf8", "code name");
        return ok;
    }

    static bool test_bag_counts_() {
        zigmin::diag::Bag bag;

        bool ok = true;
        ok &= require_(!bag.has_error(), "empty bag has no error");

        bag.add(zigmin::diag::Diagnostic(zigmin::diag::Severity::kError, zigmin::diag::Code::kInvalidToken, {}));
        ok &= require_(bag.has_error() && !bag.has_fatal(), "a plain error is not fatal");

        bag.add(zigmin::diag::Diagnostic(zigmin::diag::Severity::kFatal, zigmin::diag::Code::kInvalidSource, {}));
        ok &= require_(bag.has_error() && bag.has_fatal(), "error and fatal recorded");
        ok &= require_(bag.error_count() == 1 && bag.fatal_count() == 1, "counts by severity");
        ok &= require_(bag.diags().size() == 2, "all diagnostics kept in order");
        ok &= require_(bag.diags()[0].code() == zigmin::diag::Code::kInvalidToken, "insertion order");
        ok &= require_(!bag.has_code(zigmin::diag::Code::kInvalidUtf8), "absent code");
        return ok;
    }

    static bool test_read_stream_normalizes_newlines_() {
        std::istringstream in("const a = 1;\r\nvar b = 2;\r\n");
        const auto r = zigmin::os::read_text_stream(in, zigmin::os::k_default_max_source_size);

        bool ok = true;
        ok &= require_(r.ok, "stream read must succeed");
        ok &= require_(r.text == "const a = 1;\nvar b = 2;\n", "CRLF must become LF");
        return ok;
    }

    static bool test_read_stream_keeps_lone_cr_() {
        std::istringstream in("fn f(x: u8) u8 {\n    return\rx;\n}\r\n");
        const auto r = zigmin::os::read_text_stream(in, zigmin::os::k_default_max_source_size);

        bool ok = true;
        ok &= require_(r.ok, "stream read must succeed");
        ok &= require_(r.text == "fn f(x: u8) u8 {\n    return\rx;\n}\n", "lone CR kept, CRLF folded");

        zigmin::diag::Bag bag;
        const auto out = zigmin::minify::minify_source(r.text, 0, {}, bag);
        ok &= require_(out.has_value(), "source read from a stream must minify");
        ok &= require_(out && *out == "fn a(b:u8)u8{return b;}", "CR still separates 'return' from its operand");
        return ok;
    }

    static bool test_read_stream_size_limit_() {
        std::istringstream in("0123456789");

        bool ok = true;
        const auto r = zigmin::os::read_text_stream(in, 5);
        ok &= require_(!r.ok, "oversized input must be rejected");
        ok &= require_(r.code == zigmin::diag::Code::kSourceTooLarge, "rejection code is SourceTooLarge");

        std::istringstream exact("01234");
        const auto e = zigmin::os::read_text_stream(exact, 5);
        ok &= require_(e.ok && e.text == "01234", "input at the limit is accepted");
        return ok;
    }

    static bool test_read_missing_file_() {
        const auto r = zigmin::os::read_text_file("/nonexistent/zigmin/input.zig", 1024);

        bool ok = true;
        ok &= require_(!r.ok, "missing file must fail");
        ok &= require_(r.code == zigmin::diag::Code::kCannotOpenFile, "missing file is CannotOpenFile");
        ok &= require_(!r.err.empty(), "reason must be filled");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"line_col", test_line_col_},
        {"snippet_block", test_snippet_block_},
        {"render_one", test_render_one_},
        {"render_args", test_render_args_},
        {"bag_counts", test_bag_counts_},
        {"read_stream_normalizes_newlines", test_read_stream_normalizes_newlines_},
        {"read_stream_keeps_lone_cr", test_read_stream_keeps_lone_cr_},
        {"read_stream_size_limit", test_read_stream_size_limit_},
        {"read_missing_file", test_read_missing_file_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
