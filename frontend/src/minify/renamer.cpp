// frontend/src/minify/renamer.cpp
#include <zigmin/minify/Renamer.hpp>
#include <zigmin/minify/Reserved.hpp>
#include <zigmin/syntax/Keywords.hpp>

#include <cctype>


namespace zigmin::minify {

    bool is_arbitrary_width_int(std::string_view name) {
        if (name.size() < 2) return false;
        if (name[0] != 'i' && name[0] != 'u') return false;

        for (size_t i = 1; i < name.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(name[i]))) return false;
        }
        return true;
    }

    namespace {

        bool is_plain_name(std::string_view s) {
            if (s.empty()) return false;
            if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
            for (const char c : s) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
            }
            return true;
        }

    } // namespace

    Renamer::Renamer(RenamerOptions opt) {
        for (const auto t : k_primitive_types) {
            std::string_view replacement = t;
            if (opt.ptr64) {
                for (const auto& a : k_ptr64_aliases) {
                    if (a.name == t) replacement = a.replacement;
                }
            }
            seed(t, replacement);
        }

        for (const auto v : k_primitive_values) seed(v, v);

        seed(k_discard_name, k_discard_name);
        seed(k_entry_name, k_entry_name);
    }

    void Renamer::seed(std::string_view name, std::string_view replacement) {
        table_.emplace(std::string(name), std::string(replacement));
        reserved_.emplace(name);
        reserved_.emplace(replacement);
    }

    std::string_view Renamer::binding_key(std::string_view lexeme) const {
        if (lexeme.size() < 3 || lexeme.substr(0, 2) != "@\"" || lexeme.back() != '"') return lexeme;

        const std::string_view inner = lexeme.substr(2, lexeme.size() - 3);
        if (!is_plain_name(inner)) return lexeme;
        if (syntax::is_keyword_text(inner)) return lexeme;

        // @"u8", @"bool", @"_" name user bindings, not the primitive or the discard
        if (is_arbitrary_width_int(inner)) return lexeme;
        if (inner != k_entry_name && is_reserved(inner)) return lexeme;

        return inner;
    }

    bool Renamer::is_reserved(std::string_view name) const {
        return reserved_.count(std::string(name)) != 0;
    }

    std::string Renamer::next_free_candidate() {
        // only multi-letter candidates can collide with keywords ("if", "or") or reserved names ("bool")
        while (true) {
            std::string cand = names_.next();
            if (syntax::is_keyword_text(cand)) continue;
            if (reserved_.count(cand) != 0) continue;
            return cand;
        }
    }

    std::string_view Renamer::rename(std::string_view original) {
        const std::string key(original);

        auto it = table_.find(key);
        if (it != table_.end()) return it->second;

        if (is_arbitrary_width_int(original)) return original;

        auto ins = table_.emplace(key, next_free_candidate()).first;
        ++assigned_;
        return ins->second;
    }

} // namespace zigmin::minify
