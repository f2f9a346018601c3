/// @file icu_api.hpp
/// @brief ICU C API include
///
/// Windows 10 and later ship ICU as part of the OS (icu.h / icu.lib).
/// Elsewhere the same C API comes from the system ICU packages.

#pragma once

#ifdef _WIN32
    #include <icu.h>
#else
    #include <unicode/uloc.h>
    #include <unicode/umsg.h>
    #include <unicode/ustring.h>
    #include <unicode/utypes.h>
#endif
