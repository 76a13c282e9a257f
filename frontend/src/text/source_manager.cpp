// frontend/src/text/source_manager.cpp
#include <zigmin/text/SourceManager.hpp>

#include <algorithm>


namespace zigmin {

    bool SourceManager::utf8_decode_one(std::string_view s, uint32_t& i, uint32_t& cp) {
        if (i >= s.size()) return false;
        const unsigned char c0 = static_cast<unsigned char>(s[i]);

        if (c0 < 0x80) {
            cp = c0;
            i += 1;
            return true;
        }

        auto cont = [&](uint32_t idx) -> bool {
            if (idx >= s.size()) return false;
            return (static_cast<unsigned char>(s[idx]) & 0xC0) == 0x80;
        };

        uint32_t need = 0;
        if ((c0 & 0xE0) == 0xC0) { need = 1; cp = c0 & 0x1F; }
        else if ((c0 & 0xF0) == 0xE0) { need = 2; cp = c0 & 0x0F; }
        else if ((c0 & 0xF8) == 0xF0) { need = 3; cp = c0 & 0x07; }
        else {
            cp = 0xFFFD;
            i += 1;
            return false;
        }

        for (uint32_t k = 1; k <= need; ++k) {
            if (!cont(i + k)) {
                cp = 0xFFFD;
                i += 1;
                return false;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
        }

        i += need + 1;
        return true;
    }

    // approximate terminal width: 0 for controls/combining marks, 2 for wide east-asian forms
    uint32_t SourceManager::unicode_display_width(uint32_t cp) {
        if (cp == '\t') return 4;
        if (cp < 32 || (cp >= 0x7F && cp < 0xA0)) return 0;

        if ((cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x1AB0 && cp <= 0x1AFF) ||
            (cp >= 0x1DC0 && cp <= 0x1DFF) || (cp >= 0x20D0 && cp <= 0x20FF) ||
            (cp >= 0xFE20 && cp <= 0xFE2F)) {
            return 0;
        }

        if ((cp >= 0x1100 && cp <= 0x115F) ||
            (cp >= 0x2E80 && cp <= 0xA4CF) ||
            (cp >= 0xAC00 && cp <= 0xD7A3) ||
            (cp >= 0xF900 && cp <= 0xFAFF) ||
            (cp >= 0xFE30 && cp <= 0xFE6F) ||
            (cp >= 0xFF00 && cp <= 0xFF60) ||
            (cp >= 0xFFE0 && cp <= 0xFFE6) ||
            (cp >= 0x1F300 && cp <= 0x1FAFF)) {
            return 2;
        }

        return 1;
    }

    uint32_t SourceManager::display_width_between(std::string_view s, uint32_t byte_lo, uint32_t byte_hi) {
        uint32_t i = byte_lo;
        uint32_t w = 0;
        while (i < byte_hi && i < s.size()) {
            uint32_t cp = 0;
            utf8_decode_one(s, i, cp);
            w += unicode_display_width(cp);
        }
        return w;
    }

    std::vector<uint32_t> SourceManager::build_line_starts(std::string_view s) {
        std::vector<uint32_t> starts;
        starts.push_back(0);

        for (uint32_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\n') starts.push_back(i + 1);
        }
        return starts;
    }

    uint32_t SourceManager::line_index_from_byte(const File& f, uint32_t byte_off) {
        const auto& starts = f.line_starts;
        auto it = std::upper_bound(starts.begin(), starts.end(), byte_off);
        return (it == starts.begin()) ? 0 : static_cast<uint32_t>((it - starts.begin()) - 1);
    }

    uint32_t SourceManager::line_end_byte(const File& f, uint32_t line_index) {
        const auto& starts = f.line_starts;
        if (line_index + 1 < starts.size()) return starts[line_index + 1] - 1; // drop '\n'
        return static_cast<uint32_t>(f.content.size());
    }

    const SourceManager::File* SourceManager::find(uint32_t file_id) const {
        if (file_id >= files_.size()) return nullptr;
        return &files_[file_id];
    }

    uint32_t SourceManager::add(std::string name, std::string content) {
        File f;
        f.name = std::move(name);
        f.content = std::move(content);
        f.line_starts = build_line_starts(f.content);
        files_.push_back(std::move(f));

        return static_cast<uint32_t>(files_.size() - 1);
    }

    std::string_view SourceManager::name(uint32_t file_id) const {
        const File* f = find(file_id);
        return f ? std::string_view(f->name) : std::string_view("<unknown>");
    }

    std::string_view SourceManager::content(uint32_t file_id) const {
        const File* f = find(file_id);
        return f ? std::string_view(f->content) : std::string_view{};
    }

    LineCol SourceManager::line_col(uint32_t file_id, uint32_t byte_off) const {
        LineCol lc;
        const File* f = find(file_id);
        if (!f) return lc;

        const uint32_t off = std::min<uint32_t>(byte_off, static_cast<uint32_t>(f->content.size()));
        const uint32_t idx = line_index_from_byte(*f, off);
        const uint32_t line_start = f->line_starts[idx];

        const std::string_view line_view = std::string_view(f->content).substr(line_start, off - line_start);

        lc.line = idx + 1;
        lc.col  = display_width_between(line_view, 0, static_cast<uint32_t>(line_view.size())) + 1;
        return lc;
    }

    SnippetBlock SourceManager::snippet_block_for_span(const Span& sp, uint32_t context_lines) const {
        SnippetBlock blk;
        const File* f = find(sp.file_id);
        if (!f) return blk;

        const uint32_t size = static_cast<uint32_t>(f->content.size());
        const uint32_t lo = std::min<uint32_t>(sp.lo, size);
        const uint32_t hi = std::min<uint32_t>(std::max(sp.hi, sp.lo), size);

        const uint32_t caret_idx = line_index_from_byte(*f, lo);
        const uint32_t line_count = static_cast<uint32_t>(f->line_starts.size());

        const uint32_t first = (caret_idx > context_lines) ? caret_idx - context_lines : 0;
        const uint32_t last = std::min<uint32_t>(caret_idx + context_lines, line_count - 1);

        const std::string_view text(f->content);
        for (uint32_t idx = first; idx <= last; ++idx) {
            const uint32_t s = f->line_starts[idx];
            const uint32_t e = line_end_byte(*f, idx);
            blk.lines.push_back(text.substr(s, e - s));
        }

        const uint32_t caret_line_start = f->line_starts[caret_idx];
        const uint32_t caret_line_end = line_end_byte(*f, caret_idx);
        const std::string_view caret_line = text.substr(caret_line_start, caret_line_end - caret_line_start);

        // highlight is clamped to the first line of the span
        const uint32_t hi_clamped = std::min<uint32_t>(hi, caret_line_end);

        blk.first_line_no = first + 1;
        blk.caret_line_offset = caret_idx - first;
        blk.caret_cols_before = display_width_between(caret_line, 0, lo - caret_line_start);
        blk.caret_cols_len = display_width_between(caret_line, lo - caret_line_start, hi_clamped - caret_line_start);
        if (blk.caret_cols_len == 0) blk.caret_cols_len = 1;
        return blk;
    }

} // namespace zigmin
