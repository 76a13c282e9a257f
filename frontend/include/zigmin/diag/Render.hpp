// frontend/include/zigmin/diag/Render.hpp
#pragma once
#include <zigmin/diag/Diagnostic.hpp>
#include <zigmin/text/SourceManager.hpp>

#include <cstdint>
#include <string>
#include <string_view>


namespace zigmin::diag {

    std::string_view code_name(Code c);

    /// @brief Message text with the diagnostic's args substituted, no location.
    std::string render_message(const Diagnostic& d);

    std::string render_one(const Diagnostic& d, const SourceManager& sm);

    /// @brief Renders a diagnostic with `context_lines` lines of source above and below the caret line.
    std::string render_one_context(const Diagnostic& d, const SourceManager& sm, uint32_t context_lines);

} // namespace zigmin::diag
