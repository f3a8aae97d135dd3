#pragma once
/* 
 * Macros for general purpose use.
 */

// standard
#include <stdexcept>
#include <string>

#define RUBUS_THROW_UNLESS(exception, message, condition)   \
    do {                                                    \
        if (!(condition)) {                                 \
            throw exception(message);                       \
        }                                                   \
    } while (false)

#define RUBUS_ENSURE_NOT_NULL(ptr)                              \
    do {                                                        \
        if ((ptr) == nullptr) {                                 \
            throw std::runtime_error("pointer is null");        \
        }                                                       \
    } while (false)
