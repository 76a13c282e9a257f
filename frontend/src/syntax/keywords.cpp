// frontend/src/syntax/keywords.cpp
#include <zigmin/syntax/Keywords.hpp>

#include <unordered_map>


namespace zigmin::syntax {

    TokenKind keyword_or_ident(std::string_view s) {
        using K = TokenKind;
        static const std::unordered_map<std::string_view, K> kMap = [] {
            std::unordered_map<std::string_view, K> m;
            for (auto k = static_cast<uint16_t>(K::kKwAddrspace);
                 k <= static_cast<uint16_t>(K::kKwWhile); ++k) {
                const auto kind = static_cast<K>(k);
                m.emplace(token_kind_name(kind), kind);
            }
            return m;
        }();

        auto it = kMap.find(s);
        if (it == kMap.end()) return K::kIdent;
        return it->second;
    }

} // namespace zigmin::syntax
