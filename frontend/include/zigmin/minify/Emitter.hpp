// frontend/include/zigmin/minify/Emitter.hpp
#pragma once
#include <zigmin/diag/Diagnostic.hpp>
#include <zigmin/lex/Lexer.hpp>
#include <zigmin/minify/Renamer.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>


namespace zigmin::minify {

    struct MinifyOptions {
        RenamerOptions rename{};
    };

    /// @brief Drives one minification run over a token stream.
    /// @details Holds the previous emitted category; the Renamer it borrows
    ///          carries the rename table. Both belong to exactly one run.
    class Emitter {
    public:
        enum class State : uint8_t {
            kRunning,
            kDone,
        };

        Emitter(Renamer& renamer, diag::Bag& diags)
            : renamer_(renamer), diags_(diags) {}

        /// @brief Pulls tokens from `lexer` until kEof and appends the minified text to `out`.
        /// @return false (and `out` untouched) when an invalid token aborts the run.
        bool run(Lexer& lexer, std::string& out);

        State state() const {  return state_;  }

    private:
        bool step(const Token& tok, std::string& buf);

        Renamer& renamer_;
        diag::Bag& diags_;

        syntax::TokenKind prev_ = syntax::TokenKind::kInvalid;
        bool prev_quoted_ = false; // previous emitted text was @"..."
        State state_ = State::kRunning;
    };

    /// @brief Lex + minify `source` with fresh per-run state.
    /// @return the minified text, or nullopt when the source does not lex (see `diags`).
    std::optional<std::string> minify_source(
        std::string_view source,
        uint32_t file_id,
        const MinifyOptions& opt,
        diag::Bag& diags
    );

} // namespace zigmin::minify
