// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_CRYPTO_RANDOM_H
#define CONTINUITY_CRYPTO_RANDOM_H

#include <cstddef>
#include <cstdint>

/**
 * Fill buf with len bytes from the operating system CSPRNG (/dev/urandom).
 *
 * Never deterministic and never seeded by the caller.
 *
 * @return false if the OS source cannot be opened or read
 */
bool GetStrongRandBytes(uint8_t* buf, size_t len);

#endif // CONTINUITY_CRYPTO_RANDOM_H
