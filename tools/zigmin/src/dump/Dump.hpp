// tools/zigmin/src/dump/Dump.hpp
#pragma once

#include <zigmin/lex/Token.hpp>

#include <ostream>
#include <vector>

namespace zigmin_cli::dump {

    /// @brief Prints one line per token: kind, lexeme and byte range.
    void dump_tokens(const std::vector<zigmin::Token>& tokens, std::ostream& os);

} // namespace zigmin_cli::dump
