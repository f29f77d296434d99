/**
 * @file pairing_crypto.hpp
 * @brief Cryptographic helpers for pairing codes and trust credentials
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Backed by libsodium: random pairing codes, constant-time proof comparison
 * and SHA-256 credential derivation.
 */

#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <sodium.h>

namespace lanconnect {

/**
 * @brief PairingCrypto - Cryptographic operations used by pairing
 */
class PairingCrypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup, safe to repeat)
     * @return true if successful, false otherwise
     */
    static bool initialize();

    /**
     * @brief Generate a uniformly random numeric code
     * @param digits Number of digits (leading zeros kept)
     * @return Code string of exactly @p digits characters
     */
    static std::string generate_pairing_code(size_t digits);

    /**
     * @brief Constant-time comparison of two strings
     * @return true if equal, false otherwise
     */
    static bool constant_time_equals(const std::string& a, const std::string& b);

    /**
     * @brief Derive the credential both sides store after a proof-based pairing
     *
     * SHA-256 over the two peer ids in sorted order and the proof, so the
     * result does not depend on which side initiated.
     *
     * @return Lowercase hex digest
     */
    static std::string derive_credential(
        const std::string& local_id,
        const std::string& peer_id,
        const std::string& proof
    );
};

} // namespace lanconnect
