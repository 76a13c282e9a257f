// frontend/include/zigmin/minify/Renamer.hpp
#pragma once
#include <zigmin/minify/ShortNames.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>


namespace zigmin::minify {

    struct RenamerOptions {
        bool ptr64 = false; // isize/usize -> i64/u64
    };

    /// @brief `i` or `u` followed by one or more decimal digits (no bit-width validation).
    bool is_arbitrary_width_int(std::string_view name);

    /// @brief Per-run identifier rename table.
    /// @details Seeded with the reserved names, each mapped to itself (or to its
    ///          pointer-width alias). Entries are only ever added, never changed.
    class Renamer {
    public:
        explicit Renamer(RenamerOptions opt = {});

        /// @brief Short name for `original`, assigning a fresh one on first sight.
        /// @return a view into the table, or `original` itself for arbitrary-width integers.
        std::string_view rename(std::string_view original);

        /// @brief Table key for an identifier lexeme: `@"name"` shares the key of `name` when
        ///        the quotes are redundant (plain name, not a keyword or primitive), else the lexeme itself.
        std::string_view binding_key(std::string_view lexeme) const;

        /// @brief True for a seeded name or a seeded replacement; such spellings are never handed out.
        bool is_reserved(std::string_view name) const;

        /// @brief Number of fresh short names handed out so far.
        std::size_t assigned_count() const {  return assigned_;  }

    private:
        void seed(std::string_view name, std::string_view replacement);
        std::string next_free_candidate();

        std::unordered_map<std::string, std::string> table_;
        std::unordered_set<std::string> reserved_; // seeded names and their replacements
        ShortNameGenerator names_;
        std::size_t assigned_ = 0;
    };

} // namespace zigmin::minify
