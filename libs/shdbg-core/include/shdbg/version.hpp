#pragma once

#ifndef SHDBG_VERSION
    #define SHDBG_VERSION "0.0.0"
#endif

namespace shdbg::version {

inline constexpr const char *string = SHDBG_VERSION;

} // namespace shdbg::version
