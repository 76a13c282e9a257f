// frontend/include/zigmin/syntax/TokenKind.hpp
#pragma once
#include <string_view>
#include <cstddef>
#include <cstdint>


namespace zigmin::syntax {

    enum class TokenKind : uint16_t {
        // special
        kEof = 0,
        kInvalid,

        // identifiers / literals
        kIdent,                 // foo, @"foo bar"
        kBuiltin,               // @import
        kStringLit,             // "..."
        kMultilineStringLine,   // \\... (one line, including the trailing newline)
        kCharLit,               // 'a', '\n', '\u{1F600}'
        kIntLit,
        kFloatLit,

        // comments that survive lexing
        kDocComment,            // ///
        kContainerDocComment,   // //!

        // punct / delimiters
        kLParen,    // (
        kRParen,    // )
        kLBrace,    // {
        kRBrace,    // }
        kLBracket,  // [
        kRBracket,  // ]
        kSemicolon, // ;
        kColon,     // :
        kComma,     // ,
        kQuestion,  // ?
        kTilde,     // ~
        kArrow,     // ->
        kFatArrow,  // =>

        kPeriod,     // .
        kPeriodStar, // .*
        kDotDot,     // ..
        kEllipsis,   // ...

        // operators
        kAssign,    // =
        kEqEq,      // ==
        kBang,      // !
        kBangEq,    // !=

        kPipe,        // |
        kPipePipe,    // ||
        kPipeAssign,  // |=
        kAmp,         // &
        kAmpAssign,   // &=
        kCaret,       // ^
        kCaretAssign, // ^=

        kPercent,       // %
        kPercentAssign, // %=
        kSlash,         // /
        kSlashAssign,   // /=

        kPlus,               // +
        kPlusPlus,           // ++
        kPlusAssign,         // +=
        kPlusPercent,        // +%
        kPlusPercentAssign,  // +%=
        kPlusPipe,           // +|
        kPlusPipeAssign,     // +|=

        kMinus,              // -
        kMinusAssign,        // -=
        kMinusPercent,       // -%
        kMinusPercentAssign, // -%=
        kMinusPipe,          // -|
        kMinusPipeAssign,    // -|=

        kStar,               // *
        kStarStar,           // **
        kStarAssign,         // *=
        kStarPercent,        // *%
        kStarPercentAssign,  // *%=
        kStarPipe,           // *|
        kStarPipeAssign,     // *|=

        kLt,                   // <
        kLtEq,                 // <=
        kShiftLeft,            // <<
        kShiftLeftAssign,      // <<=
        kShiftLeftPipe,        // <<|
        kShiftLeftPipeAssign,  // <<|=
        kGt,                   // >
        kGtEq,                 // >=
        kShiftRight,           // >>
        kShiftRightAssign,     // >>=

        // keywords (kKwAddrspace..kKwWhile must stay contiguous)
        kKwAddrspace,
        kKwAlign,
        kKwAllowzero,
        kKwAnd,
        kKwAnyframe,
        kKwAnytype,
        kKwAsm,
        kKwAsync,
        kKwAwait,
        kKwBreak,
        kKwCallconv,
        kKwCatch,
        kKwComptime,
        kKwConst,
        kKwContinue,
        kKwDefer,
        kKwElse,
        kKwEnum,
        kKwErrdefer,
        kKwError,
        kKwExport,
        kKwExtern,
        kKwFn,
        kKwFor,
        kKwIf,
        kKwInline,
        kKwLinksection,
        kKwNoalias,
        kKwNoinline,
        kKwNosuspend,
        kKwOpaque,
        kKwOr,
        kKwOrelse,
        kKwPacked,
        kKwPub,
        kKwResume,
        kKwReturn,
        kKwStruct,
        kKwSuspend,
        kKwSwitch,
        kKwTest,
        kKwThreadlocal,
        kKwTry,
        kKwUnion,
        kKwUnreachable,
        kKwUsingnamespace,
        kKwVar,
        kKwVolatile,
        kKwWhile,

        kCount_, // number of kinds, not a token
    };

    inline constexpr std::size_t k_token_kind_count = static_cast<std::size_t>(TokenKind::kCount_);

    constexpr bool is_keyword(TokenKind k) {
        return k >= TokenKind::kKwAddrspace && k <= TokenKind::kKwWhile;
    }

    constexpr bool is_doc_comment(TokenKind k) {
        return k == TokenKind::kDocComment || k == TokenKind::kContainerDocComment;
    }

    constexpr std::string_view token_kind_name(TokenKind k) {
        switch (k) {
            case TokenKind::kEof: return "eof";
            case TokenKind::kInvalid: return "invalid";
            case TokenKind::kIdent: return "ident";
            case TokenKind::kBuiltin: return "builtin";
            case TokenKind::kStringLit: return "string_lit";
            case TokenKind::kMultilineStringLine: return "multiline_string_line";
            case TokenKind::kCharLit: return "char_lit";
            case TokenKind::kIntLit: return "int_lit";
            case TokenKind::kFloatLit: return "float_lit";
            case TokenKind::kDocComment: return "doc_comment";
            case TokenKind::kContainerDocComment: return "container_doc_comment";

            case TokenKind::kLParen: return "(";
            case TokenKind::kRParen: return ")";
            case TokenKind::kLBrace: return "{";
            case TokenKind::kRBrace: return "}";
            case TokenKind::kLBracket: return "[";
            case TokenKind::kRBracket: return "]";
            case TokenKind::kSemicolon: return ";";
            case TokenKind::kColon: return ":";
            case TokenKind::kComma: return ",";
            case TokenKind::kQuestion: return "?";
            case TokenKind::kTilde: return "~";
            case TokenKind::kArrow: return "->";
            case TokenKind::kFatArrow: return "=>";

            case TokenKind::kPeriod: return ".";
            case TokenKind::kPeriodStar: return ".*";
            case TokenKind::kDotDot: return "..";
            case TokenKind::kEllipsis: return "...";

            case TokenKind::kAssign: return "=";
            case TokenKind::kEqEq: return "==";
            case TokenKind::kBang: return "!";
            case TokenKind::kBangEq: return "!=";

            case TokenKind::kPipe: return "|";
            case TokenKind::kPipePipe: return "||";
            case TokenKind::kPipeAssign: return "|=";
            case TokenKind::kAmp: return "&";
            case TokenKind::kAmpAssign: return "&=";
            case TokenKind::kCaret: return "^";
            case TokenKind::kCaretAssign: return "^=";

            case TokenKind::kPercent: return "%";
            case TokenKind::kPercentAssign: return "%=";
            case TokenKind::kSlash: return "/";
            case TokenKind::kSlashAssign: return "/=";

            case TokenKind::kPlus: return "+";
            case TokenKind::kPlusPlus: return "++";
            case TokenKind::kPlusAssign: return "+=";
            case TokenKind::kPlusPercent: return "+%";
            case TokenKind::kPlusPercentAssign: return "+%=";
            case TokenKind::kPlusPipe: return "+|";
            case TokenKind::kPlusPipeAssign: return "+|=";

            case TokenKind::kMinus: return "-";
            case TokenKind::kMinusAssign: return "-=";
            case TokenKind::kMinusPercent: return "-%";
            case TokenKind::kMinusPercentAssign: return "-%=";
            case TokenKind::kMinusPipe: return "-|";
            case TokenKind::kMinusPipeAssign: return "-|=";

            case TokenKind::kStar: return "*";
            case TokenKind::kStarStar: return "**";
            case TokenKind::kStarAssign: return "*=";
            case TokenKind::kStarPercent: return "*%";
            case TokenKind::kStarPercentAssign: return "*%=";
            case TokenKind::kStarPipe: return "*|";
            case TokenKind::kStarPipeAssign: return "*|=";

            case TokenKind::kLt: return "<";
            case TokenKind::kLtEq: return "<=";
            case TokenKind::kShiftLeft: return "<<";
            case TokenKind::kShiftLeftAssign: return "<<=";
            case TokenKind::kShiftLeftPipe: return "<<|";
            case TokenKind::kShiftLeftPipeAssign: return "<<|=";
            case TokenKind::kGt: return ">";
            case TokenKind::kGtEq: return ">=";
            case TokenKind::kShiftRight: return ">>";
            case TokenKind::kShiftRightAssign: return ">>=";

            case TokenKind::kKwAddrspace: return "addrspace";
            case TokenKind::kKwAlign: return "align";
            case TokenKind::kKwAllowzero: return "allowzero";
            case TokenKind::kKwAnd: return "and";
            case TokenKind::kKwAnyframe: return "anyframe";
            case TokenKind::kKwAnytype: return "anytype";
            case TokenKind::kKwAsm: return "asm";
            case TokenKind::kKwAsync: return "async";
            case TokenKind::kKwAwait: return "await";
            case TokenKind::kKwBreak: return "break";
            case TokenKind::kKwCallconv: return "callconv";
            case TokenKind::kKwCatch: return "catch";
            case TokenKind::kKwComptime: return "comptime";
            case TokenKind::kKwConst: return "const";
            case TokenKind::kKwContinue: return "continue";
            case TokenKind::kKwDefer: return "defer";
            case TokenKind::kKwElse: return "else";
            case TokenKind::kKwEnum: return "enum";
            case TokenKind::kKwErrdefer: return "errdefer";
            case TokenKind::kKwError: return "error";
            case TokenKind::kKwExport: return "export";
            case TokenKind::kKwExtern: return "extern";
            case TokenKind::kKwFn: return "fn";
            case TokenKind::kKwFor: return "for";
            case TokenKind::kKwIf: return "if";
            case TokenKind::kKwInline: return "inline";
            case TokenKind::kKwLinksection: return "linksection";
            case TokenKind::kKwNoalias: return "noalias";
            case TokenKind::kKwNoinline: return "noinline";
            case TokenKind::kKwNosuspend: return "nosuspend";
            case TokenKind::kKwOpaque: return "opaque";
            case TokenKind::kKwOr: return "or";
            case TokenKind::kKwOrelse: return "orelse";
            case TokenKind::kKwPacked: return "packed";
            case TokenKind::kKwPub: return "pub";
            case TokenKind::kKwResume: return "resume";
            case TokenKind::kKwReturn: return "return";
            case TokenKind::kKwStruct: return "struct";
            case TokenKind::kKwSuspend: return "suspend";
            case TokenKind::kKwSwitch: return "switch";
            case TokenKind::kKwTest: return "test";
            case TokenKind::kKwThreadlocal: return "threadlocal";
            case TokenKind::kKwTry: return "try";
            case TokenKind::kKwUnion: return "union";
            case TokenKind::kKwUnreachable: return "unreachable";
            case TokenKind::kKwUsingnamespace: return "usingnamespace";
            case TokenKind::kKwVar: return "var";
            case TokenKind::kKwVolatile: return "volatile";
            case TokenKind::kKwWhile: return "while";

            case TokenKind::kCount_: break;
        }

        return "unknown";
    }

} // namespace zigmin::syntax
