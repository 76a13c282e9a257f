// frontend/include/zigmin/minify/Reserved.hpp
#pragma once
#include <array>
#include <string_view>


namespace zigmin::minify {

    struct ReservedName {
        std::string_view name;
        std::string_view replacement;
    };

    // Zig primitive types. Arbitrary-width integers (i7, u64, ...) are matched by pattern instead.
    inline constexpr std::array<std::string_view, 25> k_primitive_types = {{
        "isize", "usize",
        "f16", "f32", "f64", "f80", "f128",
        "bool", "void", "noreturn", "type",
        "anyerror", "anyopaque",
        "comptime_int", "comptime_float",
        "c_char", "c_short", "c_ushort", "c_int", "c_uint",
        "c_long", "c_ulong", "c_longlong", "c_ulonglong", "c_longdouble",
    }};

    // Primitive values lex as identifiers but must keep their spelling.
    inline constexpr std::array<std::string_view, 4> k_primitive_values = {{
        "true", "false", "null", "undefined",
    }};

    inline constexpr std::string_view k_discard_name = "_";
    inline constexpr std::string_view k_entry_name = "main";

    // code.golf runs on a 64-bit target, where the pointer-sized integers have shorter spellings.
    inline constexpr std::array<ReservedName, 2> k_ptr64_aliases = {{
        {"isize", "i64"},
        {"usize", "u64"},
    }};

} // namespace zigmin::minify
