// frontend/src/minify/char_encode.cpp
#include <zigmin/minify/CharEncode.hpp>


namespace zigmin::minify {

    namespace {

        constexpr std::string_view k_escaped_newline = "'\\n'";

        bool is_single_raw_byte(std::string_view text) {
            return text.size() == 3 && text.front() == '\'' && text.back() == '\'' && text[1] != '\\';
        }

    } // namespace

    bool is_compact_char_literal(std::string_view text) {
        return text == k_escaped_newline || is_single_raw_byte(text);
    }

    std::string encode_char_literal(std::string_view text) {
        if (text == k_escaped_newline) return "10";

        if (is_single_raw_byte(text)) {
            const unsigned v = static_cast<unsigned char>(text[1]);
            return std::to_string(v);
        }

        return std::string(text);
    }

} // namespace zigmin::minify
