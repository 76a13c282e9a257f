#include <zigmin/diag/Diagnostic.hpp>
#include <zigmin/lex/Lexer.hpp>
#include <zigmin/syntax/TokenKind.hpp>

#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using K = zigmin::syntax::TokenKind;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static std::vector<zigmin::Token> lex_(std::string_view src, zigmin::diag::Bag* bag = nullptr) {
        zigmin::Lexer lex(src, 0, bag);
        return lex.lex_all();
    }

    /// @brief Compares the kind sequence (eof excluded) and prints the first mismatch.
    static bool kinds_are_(std::string_view src, std::initializer_list<K> expected) {
        const auto toks = lex_(src);
        if (toks.empty() || toks.back().kind != K::kEof) {
            std::cerr << "  - token stream must end with eof\n";
            return false;
        }

        std::vector<K> got;
        for (size_t i = 0; i + 1 < toks.size(); ++i) got.push_back(toks[i].kind);

        if (got.size() != expected.size()) {
            std::cerr << "  - '" << src << "': expected " << expected.size()
                      << " tokens, got " << got.size() << "\n";
            return false;
        }

        size_t i = 0;
        for (const auto k : expected) {
            if (got[i] != k) {
                std::cerr << "  - '" << src << "': token " << i << " is "
                          << zigmin::syntax::token_kind_name(got[i]) << ", expected "
                          << zigmin::syntax::token_kind_name(k) << "\n";
                return false;
            }
            ++i;
        }
        return true;
    }

    static K first_kind_(std::string_view src) {
        const auto toks = lex_(src);
        return toks.front().kind;
    }

    static bool test_keywords_and_identifiers_() {
        bool ok = true;
        ok &= require_(kinds_are_("const x = y;", {K::kKwConst, K::kIdent, K::kAssign, K::kIdent, K::kSemicolon}),
                       "declaration must lex as kw ident = ident ;");
        ok &= require_(first_kind_("pub") == K::kKwPub, "pub must be a keyword");
        ok &= require_(first_kind_("usingnamespace") == K::kKwUsingnamespace, "usingnamespace must be a keyword");
        ok &= require_(first_kind_("constant") == K::kIdent, "keyword prefix must not split an identifier");
        ok &= require_(first_kind_("_") == K::kIdent, "discard must be an identifier");
        ok &= require_(first_kind_("i64") == K::kIdent, "primitive types are identifiers");
        ok &= require_(first_kind_("true") == K::kIdent, "primitive values are identifiers");
        return ok;
    }

    static bool test_builtins_and_quoted_identifiers_() {
        bool ok = true;
        ok &= require_(kinds_are_("@import(\"std\")", {K::kBuiltin, K::kLParen, K::kStringLit, K::kRParen}),
                       "builtin call must lex");

        const auto toks = lex_("@\"with space\" @as");
        ok &= require_(toks.size() == 3, "quoted ident + builtin + eof");
        ok &= require_(toks[0].kind == K::kIdent, "@\"...\" must be an identifier");
        ok &= require_(toks[0].lexeme == "@\"with space\"", "quoted identifier lexeme must include the sigil");
        ok &= require_(toks[1].kind == K::kBuiltin && toks[1].lexeme == "@as", "@as must be a builtin");

        zigmin::diag::Bag bag;
        const auto bad = lex_("@ x", &bag);
        ok &= require_(bad[0].kind == K::kInvalid, "bare '@' must be invalid");
        ok &= require_(bag.has_code(zigmin::diag::Code::kInvalidToken), "bare '@' must report InvalidToken");
        return ok;
    }

    static bool test_comments_() {
        bool ok = true;
        ok &= require_(kinds_are_("// plain\nconst", {K::kKwConst}), "line comment must be skipped");
        ok &= require_(kinds_are_("//// four slashes\nconst", {K::kKwConst}), "//// must be a plain comment");
        ok &= require_(kinds_are_("/// doc\nconst", {K::kDocComment, K::kKwConst}), "/// must be a doc comment");
        ok &= require_(kinds_are_("//! top\nconst", {K::kContainerDocComment, K::kKwConst}),
                       "//! must be a container doc comment");

        const auto toks = lex_("/// doc text\nx");
        ok &= require_(toks[0].lexeme == "/// doc text", "doc comment lexeme stops before the newline");
        return ok;
    }

    static bool test_numbers_() {
        bool ok = true;
        ok &= require_(first_kind_("42") == K::kIntLit, "decimal int");
        ok &= require_(first_kind_("1_000_000") == K::kIntLit, "underscore separators");
        ok &= require_(first_kind_("0xFF") == K::kIntLit, "hex int");
        ok &= require_(first_kind_("0o17") == K::kIntLit, "octal int");
        ok &= require_(first_kind_("0b1010") == K::kIntLit, "binary int");
        ok &= require_(first_kind_("1.5") == K::kFloatLit, "decimal float");
        ok &= require_(first_kind_("1e10") == K::kFloatLit, "exponent float");
        ok &= require_(first_kind_("2.5e-3") == K::kFloatLit, "signed exponent float");
        ok &= require_(first_kind_("0x1.8p3") == K::kFloatLit, "hex float");
        ok &= require_(kinds_are_("0..10", {K::kIntLit, K::kDotDot, K::kIntLit}), "range must not lex as a float");
        ok &= require_(kinds_are_("t.0", {K::kIdent, K::kPeriod, K::kIntLit}), "tuple index");

        ok &= require_(first_kind_("1abc") == K::kInvalid, "identifier glued to a number is invalid");
        ok &= require_(first_kind_("1__0") == K::kInvalid, "doubled underscore is invalid");
        ok &= require_(first_kind_("1_") == K::kInvalid, "trailing underscore is invalid");
        ok &= require_(first_kind_("0b102") == K::kInvalid, "digit outside the base is invalid");
        return ok;
    }

    static bool test_strings_() {
        bool ok = true;
        ok &= require_(first_kind_("\"hello\"") == K::kStringLit, "plain string");
        ok &= require_(first_kind_("\"a\\n\\t\\\"\\\\b\"") == K::kStringLit, "simple escapes");
        ok &= require_(first_kind_("\"\\x41\\u{1F600}\"") == K::kStringLit, "hex and unicode escapes");
        ok &= require_(first_kind_("\"caf\xC3\xA9\"") == K::kStringLit, "UTF-8 content");

        ok &= require_(first_kind_("\"\\q\"") == K::kInvalid, "unknown escape is invalid");
        ok &= require_(first_kind_("\"\\u{D800}\"") == K::kInvalid, "surrogate escape is invalid");
        ok &= require_(first_kind_("\"open") == K::kInvalid, "unterminated string is invalid");
        ok &= require_(first_kind_("\"line\nbreak\"") == K::kInvalid, "newline inside a string is invalid");
        return ok;
    }

    static bool test_multiline_strings_() {
        const auto toks = lex_("const s =\n    \\\\first\n    \\\\second\n;");

        bool ok = true;
        ok &= require_(toks.size() == 7, "const s = line line ; eof");
        ok &= require_(toks[3].kind == K::kMultilineStringLine, "first line");
        ok &= require_(toks[3].lexeme == "\\\\first\n", "line lexeme includes the newline");
        ok &= require_(toks[4].kind == K::kMultilineStringLine, "second line");
        ok &= require_(toks[5].kind == K::kSemicolon, "statement continues after the lines");

        const auto last = lex_("\\\\tail");
        ok &= require_(last[0].kind == K::kMultilineStringLine && last[0].lexeme == "\\\\tail",
                       "line at end of input has no newline");
        return ok;
    }

    static bool test_char_literals_() {
        bool ok = true;
        ok &= require_(first_kind_("'a'") == K::kCharLit, "ascii char");
        ok &= require_(first_kind_("'\\n'") == K::kCharLit, "escaped newline");
        ok &= require_(first_kind_("'\\x41'") == K::kCharLit, "hex escape");
        ok &= require_(first_kind_("'\\u{41}'") == K::kCharLit, "unicode escape");
        ok &= require_(first_kind_("'\xC3\xA9'") == K::kCharLit, "multi-byte code point");

        ok &= require_(first_kind_("''") == K::kInvalid, "empty char literal is invalid");
        ok &= require_(first_kind_("'ab'") == K::kInvalid, "two code points are invalid");
        ok &= require_(first_kind_("'a") == K::kInvalid, "unterminated char literal is invalid");
        return ok;
    }

    static bool test_punct_maximal_munch_() {
        bool ok = true;
        ok &= require_(kinds_are_("a+%=b", {K::kIdent, K::kPlusPercentAssign, K::kIdent}), "+%=");
        ok &= require_(kinds_are_("x<<|=1", {K::kIdent, K::kShiftLeftPipeAssign, K::kIntLit}), "<<|=");
        ok &= require_(kinds_are_("p.*", {K::kIdent, K::kPeriodStar}), ".*");
        ok &= require_(kinds_are_("a...b", {K::kIdent, K::kEllipsis, K::kIdent}), "...");
        ok &= require_(kinds_are_("x=>y", {K::kIdent, K::kFatArrow, K::kIdent}), "=>");
        ok &= require_(kinds_are_("a**b", {K::kIdent, K::kStarStar, K::kIdent}), "**");
        ok &= require_(kinds_are_("a- -b", {K::kIdent, K::kMinus, K::kMinus, K::kIdent}), "no '--' token");
        ok &= require_(kinds_are_(".{.x=1}", {
            K::kPeriod, K::kLBrace, K::kPeriod, K::kIdent, K::kAssign, K::kIntLit, K::kRBrace,
        }), "anonymous struct literal");
        return ok;
    }

    static bool test_spans_() {
        const auto toks = lex_("const  abc");

        bool ok = true;
        ok &= require_(toks[1].span.lo == 7 && toks[1].span.hi == 10, "identifier span must be [7,10)");
        ok &= require_(toks[2].kind == K::kEof && toks[2].span.lo == 10, "eof span sits at the end");
        return ok;
    }

    static bool test_invalid_utf8_() {
        zigmin::diag::Bag bag;
        const auto toks = lex_("const x = \"\xFF\";", &bag);

        bool ok = true;
        ok &= require_(toks.size() == 2, "invalid UTF-8 yields one invalid token then eof");
        ok &= require_(toks[0].kind == K::kInvalid, "first token must be invalid");
        ok &= require_(toks[0].span.lo == 11, "invalid token points at the bad byte");
        ok &= require_(bag.has_code(zigmin::diag::Code::kInvalidUtf8), "InvalidUtf8 must be reported");
        ok &= require_(bag.has_fatal(), "InvalidUtf8 must be fatal");

        zigmin::diag::Bag overlong;
        (void)lex_("\xC0\xAF", &overlong);
        ok &= require_(overlong.has_code(zigmin::diag::Code::kInvalidUtf8), "overlong encoding must be rejected");
        return ok;
    }

    static bool test_stray_byte_() {
        zigmin::diag::Bag bag;
        const auto toks = lex_("a $ b", &bag);

        bool ok = true;
        ok &= require_(toks[1].kind == K::kInvalid && toks[1].lexeme == "$", "'$' is not a Zig token");
        ok &= require_(toks[2].kind == K::kIdent, "lexing continues after an invalid token");
        ok &= require_(bag.error_count() == 1, "one InvalidToken error");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"keywords_and_identifiers", test_keywords_and_identifiers_},
        {"builtins_and_quoted_identifiers", test_builtins_and_quoted_identifiers_},
        {"comments", test_comments_},
        {"numbers", test_numbers_},
        {"strings", test_strings_},
        {"multiline_strings", test_multiline_strings_},
        {"char_literals", test_char_literals_},
        {"punct_maximal_munch", test_punct_maximal_munch_},
        {"spans", test_spans_},
        {"invalid_utf8", test_invalid_utf8_},
        {"stray_byte", test_stray_byte_},
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
