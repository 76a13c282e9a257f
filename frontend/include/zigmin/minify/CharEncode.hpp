// frontend/include/zigmin/minify/CharEncode.hpp
#pragma once
#include <string>
#include <string_view>


namespace zigmin::minify {

    /// @brief True when `text` is a char literal that encode_char_literal rewrites:
    ///        one raw byte between quotes, or the escaped newline.
    bool is_compact_char_literal(std::string_view text);

    /// @brief Char literal -> decimal code ('A' -> "65", '\n' -> "10").
    /// @details Escapes other than '\n', \x, \u{...} and multi-byte code points are returned unchanged.
    std::string encode_char_literal(std::string_view text);

} // namespace zigmin::minify
