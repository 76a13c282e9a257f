// frontend/include/zigmin/syntax/Keywords.hpp
#pragma once
#include <zigmin/syntax/TokenKind.hpp>

#include <string_view>


namespace zigmin::syntax {

    /// @brief Maps an identifier spelling to its keyword kind, or kIdent if it is not a keyword.
    TokenKind keyword_or_ident(std::string_view s);

    inline bool is_keyword_text(std::string_view s) {
        return keyword_or_ident(s) != TokenKind::kIdent;
    }

} // namespace zigmin::syntax
