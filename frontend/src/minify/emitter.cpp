// frontend/src/minify/emitter.cpp
#include <zigmin/minify/Emitter.hpp>
#include <zigmin/minify/CharEncode.hpp>
#include <zigmin/minify/Spacing.hpp>


namespace zigmin::minify {

    bool Emitter::step(const Token& tok, std::string& buf) {
        using K = syntax::TokenKind;

        if (tok.kind == K::kInvalid) {
            diags_.add(diag::Diagnostic(diag::Severity::kFatal, diag::Code::kInvalidSource, tok.span));
            return false;
        }

        // doc comments vanish without a trace, so they must not count as the previous token either
        if (syntax::is_doc_comment(tok.kind)) return true;

        K emitted = tok.kind;
        std::string_view text = tok.lexeme;
        std::string encoded;

        switch (tok.kind) {
            case K::kIdent:
                // member names (std.mem, .{ .x = 1 }) are not bindings
                if (prev_ != K::kPeriod) text = renamer_.rename(renamer_.binding_key(tok.lexeme));
                break;

            case K::kCharLit:
                if (is_compact_char_literal(tok.lexeme)) {
                    encoded = encode_char_literal(tok.lexeme);
                    text = encoded;
                    emitted = K::kIntLit;
                }
                break;

            default:
                break;
        }

        const bool quoted = emitted == K::kIdent && is_quoted_ident(text);
        if (!quoted && !prev_quoted_ && needs_space(prev_, emitted)) buf.push_back(' ');
        buf.append(text);

        prev_ = emitted;
        prev_quoted_ = quoted;
        return true;
    }

    bool Emitter::run(Lexer& lexer, std::string& out) {
        std::string buf;

        for (Token tok = lexer.next(); tok.kind != syntax::TokenKind::kEof; tok = lexer.next()) {
            if (!step(tok, buf)) {
                state_ = State::kDone;
                return false;
            }
        }

        state_ = State::kDone;
        out += buf;
        return true;
    }

    std::optional<std::string> minify_source(
        std::string_view source,
        uint32_t file_id,
        const MinifyOptions& opt,
        diag::Bag& diags
    ) {
        Lexer lexer(source, file_id, &diags);
        Renamer renamer(opt.rename);
        Emitter emitter(renamer, diags);

        std::string out;
        if (!emitter.run(lexer, out)) return std::nullopt;
        return out;
    }

} // namespace zigmin::minify
