// tools/zigmin/src/dump/Dump.cpp
#include "Dump.hpp"

#include <zigmin/syntax/TokenKind.hpp>

#include <string_view>


namespace zigmin_cli::dump {

    void dump_tokens(const std::vector<zigmin::Token>& tokens, std::ostream& os) {
        os << "TOKENS:\n";
        for (const auto& t : tokens) {
            os << "  " << zigmin::syntax::token_kind_name(t.kind);
            // multiline string lines carry their newline; keep one token per output line
            std::string_view lx = t.lexeme;
            if (!lx.empty() && lx.back() == '\n') lx.remove_suffix(1);
            os << " '" << lx << "'"
               << " @" << t.span.lo << ".." << t.span.hi << "\n";
        }
    }

} // namespace zigmin_cli::dump
