// frontend/include/zigmin/syntax/Punct.hpp
#pragma once
#include <zigmin/syntax/TokenKind.hpp>

#include <array>
#include <string_view>


namespace zigmin::syntax {

    // Maximal munch: longer punctuations first.
    struct PunctEntry {
        std::string_view text;
        TokenKind kind;
    };


    inline constexpr std::array<PunctEntry, 62> k_punct_table = {{
        {"<<|=", TokenKind::kShiftLeftPipeAssign},

        {"<<=", TokenKind::kShiftLeftAssign},
        {"<<|", TokenKind::kShiftLeftPipe},
        {">>=", TokenKind::kShiftRightAssign},
        {"...", TokenKind::kEllipsis},
        {"+%=", TokenKind::kPlusPercentAssign},
        {"+|=", TokenKind::kPlusPipeAssign},
        {"-%=", TokenKind::kMinusPercentAssign},
        {"-|=", TokenKind::kMinusPipeAssign},
        {"*%=", TokenKind::kStarPercentAssign},
        {"*|=", TokenKind::kStarPipeAssign},

        {"||", TokenKind::kPipePipe},
        {"|=", TokenKind::kPipeAssign},
        {"==", TokenKind::kEqEq},
        {"=>", TokenKind::kFatArrow},
        {"!=", TokenKind::kBangEq},
        {"%=", TokenKind::kPercentAssign},
        {".*", TokenKind::kPeriodStar},
        {"..", TokenKind::kDotDot},
        {"^=", TokenKind::kCaretAssign},
        {"++", TokenKind::kPlusPlus},
        {"+=", TokenKind::kPlusAssign},
        {"+%", TokenKind::kPlusPercent},
        {"+|", TokenKind::kPlusPipe},
        {"-=", TokenKind::kMinusAssign},
        {"-%", TokenKind::kMinusPercent},
        {"-|", TokenKind::kMinusPipe},
        {"->", TokenKind::kArrow},
        {"*=", TokenKind::kStarAssign},
        {"**", TokenKind::kStarStar},
        {"*%", TokenKind::kStarPercent},
        {"*|", TokenKind::kStarPipe},
        {"/=", TokenKind::kSlashAssign},
        {"&=", TokenKind::kAmpAssign},
        {"<=", TokenKind::kLtEq},
        {"<<", TokenKind::kShiftLeft},
        {">=", TokenKind::kGtEq},
        {">>", TokenKind::kShiftRight},

        {"!", TokenKind::kBang},
        {"|", TokenKind::kPipe},
        {"=", TokenKind::kAssign},
        {"(", TokenKind::kLParen},
        {")", TokenKind::kRParen},
        {";", TokenKind::kSemicolon},
        {"%", TokenKind::kPercent},
        {"{", TokenKind::kLBrace},
        {"}", TokenKind::kRBrace},
        {"[", TokenKind::kLBracket},
        {"]", TokenKind::kRBracket},
        {".", TokenKind::kPeriod},
        {"^", TokenKind::kCaret},
        {"+", TokenKind::kPlus},
        {"-", TokenKind::kMinus},
        {"*", TokenKind::kStar},
        {":", TokenKind::kColon},
        {"/", TokenKind::kSlash},
        {",", TokenKind::kComma},
        {"&", TokenKind::kAmp},
        {"?", TokenKind::kQuestion},
        {"<", TokenKind::kLt},
        {">", TokenKind::kGt},
        {"~", TokenKind::kTilde},
    }};

} // namespace zigmin::syntax
