// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025 TJDev

#ifndef SENTINEL_CPP23_COMPAT_H
#define SENTINEL_CPP23_COMPAT_H

/**
 * @file Cpp23Compat.h
 * @brief Index check between protobuf (int) sizes and STL (size_t) indices
 */

#include <cstddef>

namespace Sentinel::compat {

/**
 * @brief Check if index is within bounds of a protobuf repeated field
 * @param index Index to check
 * @param size Container size as reported by protobuf (int)
 */
template<typename T>
[[nodiscard]] constexpr bool is_valid_index(size_t index, T size) noexcept {
    if (size < 0) return false;
    return index < static_cast<size_t>(size);
}

} // namespace Sentinel::compat

#endif // SENTINEL_CPP23_COMPAT_H
