#pragma once

#include "opfreq/config.hpp"

#include <string_view>

#ifndef OPFREQ_VERSION
#define OPFREQ_VERSION "0.0.0"
#endif

namespace opfreq::internal::platform {
    inline constexpr auto version = std::string_view{OPFREQ_VERSION};

    namespace tool {
        inline constexpr auto default_compiler = std::string_view{OPFREQ_DEFAULT_COMPILER};
    }  // namespace tool

}  // namespace opfreq::internal::platform
