// frontend/include/zigmin/minify/ShortNames.hpp
#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <string_view>


namespace zigmin::minify {

    inline constexpr std::array<std::string_view, 52> k_short_names = {{
        "a", "b", "c", "d", "e", "f", "g", "h", "i", "j", "k", "l", "m",
        "n", "o", "p", "q", "r", "s", "t", "u", "v", "w", "x", "y", "z",
        "A", "B", "C", "D", "E", "F", "G", "H", "I", "J", "K", "L", "M",
        "N", "O", "P", "Q", "R", "S", "T", "U", "V", "W", "X", "Y", "Z",
    }};

    /// @brief Candidate name at position `index` of the generator sequence.
    /// @details 0..51 are the single letters above; after that every two-letter
    ///          name in the same letter order, then three letters, and so on.
    std::string short_name_at(std::size_t index);

    /// @brief Monotonic cursor over the candidate sequence.
    class ShortNameGenerator {
    public:
        std::string next() {  return short_name_at(cursor_++);  }

        std::size_t cursor() const {  return cursor_;  }

    private:
        std::size_t cursor_ = 0;
    };

} // namespace zigmin::minify
