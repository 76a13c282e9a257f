// frontend/include/zigmin/lex/Lexer.hpp
#pragma once
#include <zigmin/lex/Token.hpp>
#include <zigmin/diag/Diagnostic.hpp>

#include <string_view>
#include <vector>


namespace zigmin {

    /// @brief Zig tokenizer. Tokens are views into `source`, which must outlive them.
    class Lexer {
    public:
        Lexer(std::string_view source, uint32_t file_id)
            : Lexer(source, file_id, nullptr) {}

        Lexer(std::string_view source, uint32_t file_id, diag::Bag* diags);

        /// @brief Next token in source order. Keeps returning kEof once the input is exhausted.
        Token next();

        std::vector<Token> lex_all();

    private:
        char peek(size_t k = 0) const;
        bool eof() const;
        char bump();

        void skip_ws_and_comments();

        Token make(syntax::TokenKind kind, size_t start) const;
        Token invalid(size_t start);

        Token lex_doc_comment();
        Token lex_number();
        Token lex_ident_or_kw();
        Token lex_at();
        Token lex_string();
        Token lex_multiline_string_line();
        Token lex_char();
        Token lex_punct_or_invalid();

        bool scan_escape();
        bool scan_utf8_codepoint();

        bool validate_utf8_all(uint32_t& bad_off) const;
        void report_invalid_utf8(uint32_t bad_off);

        std::string_view source_;
        uint32_t file_id_ = 0;
        size_t pos_ = 0;

        bool utf8_checked_ = false;

        diag::Bag* diags_ = nullptr;
    };

} // namespace zigmin
