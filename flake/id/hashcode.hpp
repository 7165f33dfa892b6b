/*
 * hashcode.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-6

Description: Polynomial string hash used to derive worker ids

**************************************************/

#ifndef FLAKE_ID_HASHCODE_HPP
#define FLAKE_ID_HASHCODE_HPP

#include <string_view>

#include "flake/id/numeric.hpp"

namespace flake::id {

/**
 * @brief Multiplier of the polynomial hash: 31.
 */
inline constexpr u64 HASH_BASE = (1ULL << 5) - 1;

/**
 * @brief Computes h = h * HASH_BASE + c over the bytes of str, wrapping at
 * 64 bits.
 */
[[nodiscard]] constexpr auto hashCode(std::string_view str) noexcept -> u64 {
    u64 hash = 0;
    for (char c : str) {
        hash = HASH_BASE * hash + static_cast<u8>(c);
    }
    return hash;
}

}  // namespace flake::id

#endif  // FLAKE_ID_HASHCODE_HPP
