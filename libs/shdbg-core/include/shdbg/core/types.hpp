#pragma once

/**
@file
@brief Fixed-width integer aliases used throughout shdbg.
*/

#include <cstddef>
#include <cstdint>

using uint8 = uint8_t;   ///< 8-bit unsigned integer
using uint16 = uint16_t; ///< 16-bit unsigned integer
using uint32 = uint32_t; ///< 32-bit unsigned integer
using uint64 = uint64_t; ///< 64-bit unsigned integer

using sint8 = int8_t;   ///< 8-bit signed integer
using sint16 = int16_t; ///< 16-bit signed integer
using sint32 = int32_t; ///< 32-bit signed integer
using sint64 = int64_t; ///< 64-bit signed integer
