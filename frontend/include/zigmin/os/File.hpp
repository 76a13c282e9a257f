// frontend/include/zigmin/os/File.hpp
#pragma once
#include <zigmin/diag/DiagCode.hpp>

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>


namespace zigmin::os {

    inline constexpr std::size_t k_default_max_source_size = 1024 * 1024;

    struct ReadTextResult {
        bool ok = false;
        std::string text{};
        diag::Code code = diag::Code::kCannotOpenFile; // meaningful only when !ok
        std::string err{};
    };

    /// @brief Reads a whole file, rejecting anything larger than `max_bytes`.
    /// @details CRLF is normalized to LF; a lone CR is kept.
    ReadTextResult read_text_file(std::string_view path, std::size_t max_bytes);

    /// @brief Same as read_text_file, for an already-open stream such as stdin.
    ReadTextResult read_text_stream(std::istream& in, std::size_t max_bytes);

    bool write_text_file(const std::string& path, std::string_view text);

} // namespace zigmin::os
