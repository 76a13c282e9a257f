// tools/zigmin/src/driver/Runner.hpp
#pragma once

#include "../cli/Options.hpp"

namespace zigmin_cli::driver {

    /// @brief Reads the input, minifies (or dumps) it and writes the result.
    /// @return process exit code.
    int run(const cli::Options& opt);

} // namespace zigmin_cli::driver
