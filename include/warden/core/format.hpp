#pragma once

#if defined(WARDEN_USE_FMT) && __has_include(<fmt/core.h>)
    #include <fmt/core.h>
    namespace warden::compat {
        using fmt::format;
    }
#elif __has_include(<format>)
    #include <format>
    namespace warden::compat {
        using std::format;
    }
#else
    #error "Neither fmt nor std::format available"
#endif
