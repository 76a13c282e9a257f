// frontend/src/diag/render.cpp
#include <zigmin/diag/Render.hpp>

#include <sstream>


namespace zigmin::diag {

    static constexpr uint32_t digits10(uint32_t v) {
        uint32_t d = 1;
        while (v >= 10) { v /= 10; ++d; }
        return d;
    }

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }

        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    static std::string_view template_en(Code c) {
        switch (c) {
            case Code::kInvalidUtf8: return "source is not valid UTF-8 (offset {0}, byte 0x{1})";
            case Code::kInvalidToken: return "invalid token '{0}'";
            case Code::kInvalidSource: return "invalid source: minification aborted";
            case Code::kSourceTooLarge: return "source exceeds the maximum size of {0} bytes";
            case Code::kCannotOpenFile: return "cannot read '{0}': {1}";
        }
        return "unknown diagnostic";
    }

    static const char* severity_name(Severity sev) {
        return (sev == Severity::kFatal) ? "fatal" : "error";
    }

    std::string_view code_name(Code c) {
        switch (c) {
            case Code::kInvalidUtf8: return "InvalidUtf8";
            case Code::kInvalidToken: return "InvalidToken";
            case Code::kInvalidSource: return "InvalidSource";
            case Code::kSourceTooLarge: return "SourceTooLarge";
            case Code::kCannotOpenFile: return "CannotOpenFile";
        }
        return "Unknown";
    }

    std::string render_message(const Diagnostic& d) {
        return format_template(std::string(template_en(d.code())), d.args());
    }

    std::string render_one(const Diagnostic& d, const SourceManager& sm) {
        const auto sp = d.span();
        const auto lc = sm.line_col(sp.file_id, sp.lo);

        std::ostringstream oss;
        oss << severity_name(d.severity()) << "[" << code_name(d.code()) << "]: " << render_message(d) << "\n";
        oss << " --> " << sm.name(sp.file_id) << ":" << lc.line << ":" << lc.col << "\n";
        return oss.str();
    }

    std::string render_one_context(const Diagnostic& d, const SourceManager& sm, uint32_t context_lines) {
        std::string out_head = render_one(d, sm);

        const auto blk = sm.snippet_block_for_span(d.span(), context_lines);
        if (blk.lines.empty()) return out_head;

        const uint32_t last_line_no = blk.first_line_no + static_cast<uint32_t>(blk.lines.size()) - 1;
        const uint32_t w = digits10(last_line_no);

        std::ostringstream out;
        out << out_head;
        out << std::string(w + 3, ' ') << "|\n";

        for (uint32_t i = 0; i < blk.lines.size(); ++i) {
            const std::string num = std::to_string(blk.first_line_no + i);

            // "  12 | code..."
            out << std::string(2, ' ');
            out << std::string(w - static_cast<uint32_t>(num.size()), ' ') << num;
            out << " | " << blk.lines[i] << "\n";

            if (i == blk.caret_line_offset) {
                out << std::string(2, ' ');
                out << std::string(w, ' ') << " | ";
                out << std::string(blk.caret_cols_before, ' ');
                out << std::string(blk.caret_cols_len, '^') << "\n";
            }
        }

        return out.str();
    }

} // namespace zigmin::diag
