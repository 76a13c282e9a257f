// frontend/include/zigmin/lex/Token.hpp
#pragma once
#include <string_view>
#include <zigmin/text/Span.hpp>
#include <zigmin/syntax/TokenKind.hpp>


namespace zigmin {

    struct Token {
        syntax::TokenKind kind = syntax::TokenKind::kInvalid;
        Span span{};
        std::string_view lexeme{};
    };

} // namespace zigmin
