// tools/zigmin/src/cli/Options.hpp
#pragma once

#include <zigmin/minify/Emitter.hpp>
#include <zigmin/os/File.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>


namespace zigmin_cli::cli {

    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kMinify,
        kDumpTokens,
    };

    struct Options {
        Mode mode = Mode::kMinify;

        std::string input_path{};   // empty: stdin
        std::string output_path{};  // empty: stdout

        zigmin::minify::MinifyOptions minify{};

        uint32_t context_lines = 2;
        std::size_t max_source_size = zigmin::os::k_default_max_source_size;

        bool ok = true;
        std::string error{};
    };

    /// @brief Prints `zigmin` usage.
    void print_usage(std::ostream& os);

    /// @brief Parses argv into Options. On a usage error `ok` is false and `error` says why.
    Options parse_options(int argc, char** argv);

} // namespace zigmin_cli::cli
