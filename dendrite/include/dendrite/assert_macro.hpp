#pragma once

#ifdef DEND_WITH_ASSERTIONS

#include <dendrite/assert.hpp>

#define dend_assert(condition) \
do { \
    if (!(condition)) { \
        dend::global_failed_assertion_handler(#condition, __FILE__, __LINE__, __func__); \
    } \
} while(false)

#else

#define dend_assert(condition) \
do { \
    if (false) { (void)(condition); } \
} while(false)

#endif
