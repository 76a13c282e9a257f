// tools/zigmin/src/cli/Options.cpp
#include "Options.hpp"

#include <charconv>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>


namespace zigmin_cli::cli {

    namespace {

        /// @brief Parses a non-negative decimal integer; nullopt on junk or overflow.
        std::optional<unsigned long long> parse_uint(std::string_view s) {
            unsigned long long v = 0;
            const char* first = s.data();
            const char* last = s.data() + s.size();
            auto [p, ec] = std::from_chars(first, last, v);
            if (ec != std::errc{} || p != last || s.empty()) return std::nullopt;
            return v;
        }

        Options fail(Options opt, std::string msg) {
            opt.ok = false;
            opt.error = std::move(msg);
            return opt;
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "zigmin - minify Zig source for code golf\n"
            << "\n"
            << "usage:\n"
            << "  zigmin [<path> | --file <path>] [-o <path>] [options]\n"
            << "  zigmin --version\n"
            << "  zigmin --help\n"
            << "\n"
            << "Reads stdin when no path (or \"-\") is given and writes stdout unless -o is set.\n"
            << "\n"
            << "Options:\n"
            << "  --ptr64                 rename isize/usize to i64/u64 (64-bit targets)\n"
            << "  --dump-tokens           print the token stream instead of minifying\n"
            << "  --context N             source lines shown around diagnostics (default 2)\n"
            << "  -fmax-source-size=N     reject inputs larger than N bytes (default 1048576)\n";
    }

    Options parse_options(int argc, char** argv) {
        Options opt{};

        std::vector<std::string_view> args;
        args.reserve(argc > 1 ? static_cast<size_t>(argc - 1) : 0);
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        bool input_set = false;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto a = args[i];

            if (a == "--help" || a == "-h") {
                opt.mode = Mode::kUsage;
                return opt;
            }
            if (a == "--version") {
                opt.mode = Mode::kVersion;
                return opt;
            }
            if (a == "--ptr64") {
                opt.minify.rename.ptr64 = true;
                continue;
            }
            if (a == "--dump-tokens") {
                opt.mode = Mode::kDumpTokens;
                continue;
            }
            if (a == "-o") {
                if (i + 1 >= args.size()) return fail(std::move(opt), "-o requires a path");
                opt.output_path = std::string(args[++i]);
                continue;
            }
            if (a == "--context") {
                if (i + 1 >= args.size()) return fail(std::move(opt), "--context requires a number");
                const auto v = parse_uint(args[++i]);
                if (!v || *v > UINT32_MAX) return fail(std::move(opt), "--context requires a non-negative integer");
                opt.context_lines = static_cast<uint32_t>(*v);
                continue;
            }

            constexpr std::string_view max_size_key = "-fmax-source-size=";
            if (a.substr(0, max_size_key.size()) == max_size_key) {
                const auto v = parse_uint(a.substr(max_size_key.size()));
                if (!v) return fail(std::move(opt), "-fmax-source-size requires a non-negative integer");
                opt.max_source_size = static_cast<std::size_t>(*v < 1 ? 1 : *v);
                continue;
            }

            std::string_view path{};
            if (a == "--file") {
                if (i + 1 >= args.size()) return fail(std::move(opt), "--file requires a path");
                path = args[++i];
            } else if (a.size() > 1 && a[0] == '-') {
                return fail(std::move(opt), "unknown option: " + std::string(a));
            } else {
                path = a;
            }

            if (input_set) return fail(std::move(opt), "multiple input files are not supported");
            input_set = true;
            if (path != "-") opt.input_path = std::string(path);
        }

        return opt;
    }

} // namespace zigmin_cli::cli
