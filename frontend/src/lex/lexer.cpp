// frontend/src/lex/lexer.cpp
#include <zigmin/lex/Lexer.hpp>
#include <zigmin/syntax/Keywords.hpp>
#include <zigmin/syntax/Punct.hpp>
#include <zigmin/syntax/TokenKind.hpp>

#include <algorithm>
#include <cctype>


namespace zigmin {

    static bool utf8_validate_strict(std::string_view s, uint32_t& bad_off) {
        auto is_cont = [&](size_t idx) -> bool {
            if (idx >= s.size()) return false;
            return (static_cast<unsigned char>(s[idx]) & 0xC0) == 0x80;
        };

        size_t i = 0;
        while (i < s.size()) {
            const unsigned char b0 = static_cast<unsigned char>(s[i]);
            bad_off = static_cast<uint32_t>(i);

            if (b0 < 0x80) { i += 1; continue; }

            // 2-byte: C2..DF (C0/C1 would be overlong)
            if (b0 >= 0xC2 && b0 <= 0xDF) {
                if (!is_cont(i + 1)) return false;
                i += 2;
                continue;
            }

            // 3-byte: E0..EF
            if (b0 >= 0xE0 && b0 <= 0xEF) {
                if (!is_cont(i + 1) || !is_cont(i + 2)) return false;
                const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
                if (b0 == 0xE0 && b1 < 0xA0) return false;  // overlong
                if (b0 == 0xED && b1 >= 0xA0) return false; // surrogates
                i += 3;
                continue;
            }

            // 4-byte: F0..F4
            if (b0 >= 0xF0 && b0 <= 0xF4) {
                if (!is_cont(i + 1) || !is_cont(i + 2) || !is_cont(i + 3)) return false;
                const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
                if (b0 == 0xF0 && b1 < 0x90) return false;  // overlong
                if (b0 == 0xF4 && b1 > 0x8F) return false;  // > U+10FFFF
                i += 4;
                continue;
            }

            // stray continuation byte or invalid lead
            return false;
        }

        return true;
    }

    static size_t utf8_seq_len(unsigned char c0) {
        if ((c0 & 0x80u) == 0x00u) return 1;
        if ((c0 & 0xE0u) == 0xC0u) return 2;
        if ((c0 & 0xF0u) == 0xE0u) return 3;
        if ((c0 & 0xF8u) == 0xF0u) return 4;
        return 1;
    }

    static bool is_ident_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    static bool is_ident_cont(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    static bool is_digit_of(char c, int base) {
        const unsigned char u = static_cast<unsigned char>(c);
        switch (base) {
            case 2:  return c == '0' || c == '1';
            case 8:  return c >= '0' && c <= '7';
            case 16: return std::isxdigit(u) != 0;
            default: return std::isdigit(u) != 0;
        }
    }

    static std::string byte_hex2(unsigned char b) {
        static constexpr char kHex[] = "0123456789ABCDEF";
        std::string s;
        s.push_back(kHex[(b >> 4) & 0xF]);
        s.push_back(kHex[b & 0xF]);
        return s;
    }

    Lexer::Lexer(std::string_view source, uint32_t file_id, diag::Bag* diags)
        : source_(source), file_id_(file_id), diags_(diags) {}

    bool Lexer::validate_utf8_all(uint32_t& bad_off) const {
        return utf8_validate_strict(source_, bad_off);
    }

    void Lexer::report_invalid_utf8(uint32_t bad_off) {
        if (!diags_) return;

        const uint32_t hi = std::min<uint32_t>(bad_off + 1, static_cast<uint32_t>(source_.size()));
        diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kInvalidUtf8, Span{file_id_, bad_off, hi});

        d.add_arg_int(bad_off);
        d.add_arg(byte_hex2(static_cast<unsigned char>(source_[bad_off])));

        diags_->add(std::move(d));
    }

    char Lexer::peek(size_t k) const {
        const size_t i = pos_ + k;
        if (i >= source_.size()) return '\0';
        return source_[i];
    }

    bool Lexer::eof() const {
        return pos_ >= source_.size();
    }

    char Lexer::bump() {
        if (eof()) return '\0';
        return source_[pos_++];
    }

    Token Lexer::make(syntax::TokenKind kind, size_t start) const {
        Token t;
        t.kind = kind;
        t.span = Span{file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(pos_)};
        t.lexeme = source_.substr(start, pos_ - start);
        return t;
    }

    Token Lexer::invalid(size_t start) {
        Token t = make(syntax::TokenKind::kInvalid, start);
        if (diags_) {
            diag::Diagnostic d(diag::Severity::kError, diag::Code::kInvalidToken, t.span);
            d.add_arg(t.lexeme);
            diags_->add(std::move(d));
        }
        return t;
    }

    void Lexer::skip_ws_and_comments() {
        while (!eof()) {
            const char c = peek();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                bump();
                continue;
            }

            if (c == '/' && peek(1) == '/') {
                // "///x" and "//!" survive as tokens; "////" is a plain comment
                const bool doc = peek(2) == '/' && peek(3) != '/';
                const bool container_doc = peek(2) == '!';
                if (doc || container_doc) return;

                while (!eof() && peek() != '\n') bump();
                continue;
            }

            return;
        }
    }

    Token Lexer::lex_doc_comment() {
        const size_t start = pos_;
        const auto kind = (peek(2) == '!')
            ? syntax::TokenKind::kContainerDocComment
            : syntax::TokenKind::kDocComment;

        while (!eof() && peek() != '\n') bump();
        return make(kind, start);
    }

    Token Lexer::lex_number() {
        const size_t start = pos_;

        int base = 10;
        if (peek() == '0') {
            switch (peek(1)) {
                case 'x': base = 16; break;
                case 'o': base = 8;  break;
                case 'b': base = 2;  break;
                default: break;
            }
            if (base != 10) { bump(); bump(); }
        }

        // digits with single '_' separators, never leading/trailing/doubled
        auto scan_digits = [&](int b) -> bool {
            bool any = false;
            bool last_us = false;
            while (!eof()) {
                const char c = peek();
                if (is_digit_of(c, b)) { bump(); any = true; last_us = false; continue; }
                if (c == '_') {
                    if (!any || last_us) return false;
                    bump();
                    last_us = true;
                    continue;
                }
                break;
            }
            return any && !last_us;
        };

        bool ok = scan_digits(base);
        bool is_float = false;

        // fraction: "1.5", but "1..2" is int '..' int
        if (ok && (base == 10 || base == 16) && peek() == '.' && is_digit_of(peek(1), base)) {
            bump(); // .
            is_float = true;
            ok = scan_digits(base);
        }

        // exponent: e/E for decimal, p/P for hex
        const char e = peek();
        const bool has_exp = (base == 10 && (e == 'e' || e == 'E')) ||
                             (base == 16 && (e == 'p' || e == 'P'));
        if (ok && has_exp) {
            bump();
            if (peek() == '+' || peek() == '-') bump();
            is_float = true;
            ok = scan_digits(10);
        }

        if (!ok || is_ident_cont(peek())) {
            while (!eof() && is_ident_cont(peek())) bump();
            return invalid(start);
        }

        return make(is_float ? syntax::TokenKind::kFloatLit : syntax::TokenKind::kIntLit, start);
    }

    Token Lexer::lex_ident_or_kw() {
        const size_t start = pos_;
        bump(); // first char
        while (!eof() && is_ident_cont(peek())) bump();

        Token t = make(syntax::TokenKind::kIdent, start);
        t.kind = syntax::keyword_or_ident(t.lexeme);
        return t;
    }

    Token Lexer::lex_at() {
        const size_t start = pos_;
        bump(); // @

        // @"quoted identifier"
        if (peek() == '"') {
            Token s = lex_string();
            if (s.kind == syntax::TokenKind::kInvalid) return s;
            return make(syntax::TokenKind::kIdent, start);
        }

        if (is_ident_start(peek())) {
            while (!eof() && is_ident_cont(peek())) bump();
            return make(syntax::TokenKind::kBuiltin, start);
        }

        return invalid(start);
    }

    bool Lexer::scan_escape() {
        // assumes the backslash is already consumed
        const char c = peek();
        switch (c) {
            case 'n': case 'r': case 't':
            case '\\': case '\'': case '"':
                bump();
                return true;

            case 'x':
                bump();
                for (int i = 0; i < 2; ++i) {
                    if (!is_digit_of(peek(), 16)) return false;
                    bump();
                }
                return true;

            case 'u': {
                bump();
                if (peek() != '{') return false;
                bump();

                uint32_t cp = 0;
                int n = 0;
                while (is_digit_of(peek(), 16)) {
                    const char h = bump();
                    const uint32_t v = std::isdigit(static_cast<unsigned char>(h))
                        ? static_cast<uint32_t>(h - '0')
                        : static_cast<uint32_t>(std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                    cp = cp * 16 + v;
                    if (++n > 6) return false;
                }
                if (n == 0 || peek() != '}') return false;
                bump();
                return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
            }

            default:
                return false;
        }
    }

    bool Lexer::scan_utf8_codepoint() {
        const size_t need = utf8_seq_len(static_cast<unsigned char>(peek()));
        for (size_t i = 0; i < need; ++i) {
            if (eof()) return false;
            bump();
        }
        return true;
    }

    Token Lexer::lex_string() {
        const size_t start = pos_;
        bump(); // opening "

        bool ok = true;
        while (true) {
            if (eof() || peek() == '\n') return invalid(start);

            const char c = bump();
            if (c == '"') break;
            if (c == '\\' && !scan_escape()) ok = false;
        }

        return ok ? make(syntax::TokenKind::kStringLit, start) : invalid(start);
    }

    Token Lexer::lex_multiline_string_line() {
        const size_t start = pos_;
        bump(); bump(); // "\\"

        while (!eof()) {
            if (bump() == '\n') break;
        }

        return make(syntax::TokenKind::kMultilineStringLine, start);
    }

    Token Lexer::lex_char() {
        const size_t start = pos_;
        bump(); // opening '

        bool ok = false;
        if (peek() == '\\') {
            bump();
            ok = scan_escape();
        } else if (!eof() && peek() != '\'' && peek() != '\n') {
            ok = scan_utf8_codepoint();
        }

        if (ok && peek() == '\'') {
            bump();
            return make(syntax::TokenKind::kCharLit, start);
        }

        // empty, unterminated or more than one code point
        while (!eof() && peek() != '\'' && peek() != '\n') bump();
        if (peek() == '\'') bump();
        return invalid(start);
    }

    Token Lexer::lex_punct_or_invalid() {
        const size_t start = pos_;

        for (const auto& e : syntax::k_punct_table) {
            const auto s = e.text;
            bool ok = true;
            for (size_t i = 0; i < s.size(); ++i) {
                if (peek(i) != s[i]) { ok = false; break; }
            }
            if (!ok) continue;

            pos_ += s.size();
            return make(e.kind, start);
        }

        // stray byte: take the whole code point so the lexeme stays printable
        (void)scan_utf8_codepoint();
        return invalid(start);
    }

    Token Lexer::next() {
        using K = syntax::TokenKind;

        if (!utf8_checked_) {
            utf8_checked_ = true;

            uint32_t bad_off = 0;
            if (!validate_utf8_all(bad_off)) {
                report_invalid_utf8(bad_off);

                // nothing after a malformed byte is trustworthy
                Token t;
                t.kind = K::kInvalid;
                t.span = Span{file_id_, bad_off, bad_off + 1};
                t.lexeme = source_.substr(bad_off, 1);
                pos_ = source_.size();
                return t;
            }
        }

        skip_ws_and_comments();
        if (eof()) return make(K::kEof, pos_);

        const char c = peek();

        if (c == '/' && peek(1) == '/') return lex_doc_comment();
        if (std::isdigit(static_cast<unsigned char>(c))) return lex_number();
        if (c == '"') return lex_string();
        if (c == '\'') return lex_char();
        if (c == '\\' && peek(1) == '\\') return lex_multiline_string_line();
        if (c == '@') return lex_at();
        if (is_ident_start(c)) return lex_ident_or_kw();

        return lex_punct_or_invalid();
    }

    std::vector<Token> Lexer::lex_all() {
        std::vector<Token> out;
        out.reserve(source_.size() / 4 + 1);

        while (true) {
            Token t = next();
            out.push_back(t);
            if (t.kind == syntax::TokenKind::kEof) break;
        }

        return out;
    }

} // namespace zigmin
