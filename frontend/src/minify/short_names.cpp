// frontend/src/minify/short_names.cpp
#include <zigmin/minify/ShortNames.hpp>


namespace zigmin::minify {

    std::string short_name_at(std::size_t index) {
        constexpr std::size_t n = k_short_names.size();
        if (index < n) return std::string(k_short_names[index]);

        // skip past the single letters, then find the length block holding `index`
        index -= n;
        std::size_t len = 2;
        std::size_t block = n * n;
        while (index >= block) {
            index -= block;
            block *= n;
            ++len;
        }

        std::string s(len, 'a');
        for (std::size_t i = len; i-- > 0;) {
            s[i] = k_short_names[index % n][0];
            index /= n;
        }
        return s;
    }

} // namespace zigmin::minify
