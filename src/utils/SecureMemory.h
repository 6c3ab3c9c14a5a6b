// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef SENTINEL_SECURE_MEMORY_H
#define SENTINEL_SECURE_MEMORY_H

#include <memory>
#include <string>
#include <vector>
#include <openssl/crypto.h>

namespace Sentinel {

/**
 * @brief Allocator that zeroizes memory before releasing it
 *
 * Used for decoded TOTP key material so raw secret bytes do not
 * linger on the heap after code generation.
 *
 * @code
 * SecureVector<uint8_t> key = Base32::decode_lenient(secret);
 * // ... HMAC with key ...
 * // Zeroized on destruction
 * @endcode
 */
template<typename T>
class SecureAllocator : public std::allocator<T> {
public:
    template<typename U>
    struct rebind {
        using other = SecureAllocator<U>;
    };

    SecureAllocator() noexcept = default;

    template<typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    void deallocate(T* p, std::size_t n) {
        if (p) {
            OPENSSL_cleanse(p, n * sizeof(T));
            std::allocator<T>::deallocate(p, n);
        }
    }
};

template<typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/**
 * @brief Overwrite a string's buffer and empty it
 *
 * For temporaries holding secrets or recovery codes (clipboard text,
 * edit buffers) once they have been consumed.
 */
inline void secure_clear(std::string& text) noexcept {
    if (!text.empty()) {
        OPENSSL_cleanse(text.data(), text.size());
    }
    text.clear();
}

} // namespace Sentinel

#endif // SENTINEL_SECURE_MEMORY_H
