// frontend/include/zigmin/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace zigmin::diag {

    enum class Severity : uint8_t {
        kError,
        kFatal,
    };

    enum class Code : uint16_t {
        kInvalidUtf8,       // args[0]=offset, args[1]=byte hex
        kInvalidToken,      // args[0]=lexeme

        // minify
        kInvalidSource,     // run aborted on an invalid token

        // io
        kSourceTooLarge,    // args[0]=limit in bytes
        kCannotOpenFile,    // args[0]=path, args[1]=reason
    };

} // namespace zigmin::diag
