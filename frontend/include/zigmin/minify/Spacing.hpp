// frontend/include/zigmin/minify/Spacing.hpp
#pragma once
#include <zigmin/syntax/TokenKind.hpp>

#include <array>
#include <cstddef>
#include <string_view>


namespace zigmin::minify {

    // Categories that re-lex as a different token when glued to one another
    // (e.g. `const` `x` -> `constx`, `1` `e` -> `1e`).
    inline constexpr std::array<bool, syntax::k_token_kind_count> k_space_sensitive = [] {
        using K = syntax::TokenKind;

        std::array<bool, syntax::k_token_kind_count> t{};
        t[static_cast<std::size_t>(K::kIdent)] = true;
        t[static_cast<std::size_t>(K::kBuiltin)] = true;
        t[static_cast<std::size_t>(K::kIntLit)] = true;
        t[static_cast<std::size_t>(K::kFloatLit)] = true;

        for (std::size_t k = 0; k < t.size(); ++k) {
            if (syntax::is_keyword(static_cast<K>(k))) t[k] = true;
        }
        return t;
    }();

    constexpr bool is_space_sensitive(syntax::TokenKind k) {
        const auto i = static_cast<std::size_t>(k);
        return i < k_space_sensitive.size() && k_space_sensitive[i];
    }

    /// @brief `@"..."` text is closed off by its sigil and quotes on both sides.
    constexpr bool is_quoted_ident(std::string_view text) {
        return text.size() > 1 && text.front() == '@';
    }

    /// @brief Whether one space must separate `prev` and `cur` in the output.
    constexpr bool needs_space(syntax::TokenKind prev, syntax::TokenKind cur) {
        // the '@' sigil already separates a builtin from whatever precedes it
        if (cur == syntax::TokenKind::kBuiltin) return false;

        return is_space_sensitive(prev) && is_space_sensitive(cur);
    }

} // namespace zigmin::minify
