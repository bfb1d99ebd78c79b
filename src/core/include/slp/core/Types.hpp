/**
 * @file Types.hpp
 * @brief Fixed-width aliases for the wire and snapshot types.
 *
 * Wire fields are at most 32 bits wide; raw stream buffers are spans of
 * core::byte.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef SLP_CORE_TYPES_HPP
    #define SLP_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace slp::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;

using i8  = std::int8_t;
using i32 = std::int32_t;

using f32 = float;

using usize = std::size_t;

using byte = std::byte;

} // namespace slp::core

#endif // SLP_CORE_TYPES_HPP
