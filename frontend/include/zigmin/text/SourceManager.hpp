// frontend/include/zigmin/text/SourceManager.hpp
#pragma once
#include <zigmin/text/Span.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace zigmin {

    struct LineCol {
        uint32_t line = 1; // 1-based
        uint32_t col  = 1; // 1-based, DISPLAY COLUMNS
    };

    struct SnippetBlock {
        uint32_t first_line_no = 1;             // 1-based
        std::vector<std::string_view> lines;    // [first_line_no ...]
        uint32_t caret_line_offset = 0;         // index into lines of the caret line
        uint32_t caret_cols_before = 0;
        uint32_t caret_cols_len = 1;
    };

    class SourceManager {
    public:
        /// @brief Registers a source buffer (file or stdin) and returns its file_id.
        uint32_t add(std::string name, std::string content);

        std::string_view name(uint32_t file_id) const;
        std::string_view content(uint32_t file_id) const;

        // byte_off -> (line, display-col)
        LineCol line_col(uint32_t file_id, uint32_t byte_off) const;

        /// @brief Builds a multi-line context snippet around the first line of `sp`.
        SnippetBlock snippet_block_for_span(const Span& sp, uint32_t context_lines) const;

    private:
        struct File {
            std::string name;
            std::string content;
            std::vector<uint32_t> line_starts; // byte offsets, includes 0
        };

        static std::vector<uint32_t> build_line_starts(std::string_view s);

        static bool utf8_decode_one(std::string_view s, uint32_t& i, uint32_t& cp);
        static uint32_t unicode_display_width(uint32_t cp);
        static uint32_t display_width_between(std::string_view s, uint32_t byte_lo, uint32_t byte_hi);

        static uint32_t line_index_from_byte(const File& f, uint32_t byte_off);
        static uint32_t line_end_byte(const File& f, uint32_t line_index);

        const File* find(uint32_t file_id) const;

        std::vector<File> files_;
    };

} // namespace zigmin
