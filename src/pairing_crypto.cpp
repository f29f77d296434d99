/**
 * @file pairing_crypto.cpp
 * @brief Implementation of pairing code and credential helpers
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanconnect/pairing_crypto.hpp"
#include "lanconnect/utilities.hpp"
#include <stdexcept>

namespace lanconnect {

// ============================================================================
// Initialization
// ============================================================================

bool PairingCrypto::initialize() {
    // sodium_init returns 1 when already initialized
    return sodium_init() >= 0;
}

// ============================================================================
// Pairing Codes
// ============================================================================

std::string PairingCrypto::generate_pairing_code(size_t digits) {
    if (digits == 0) {
        throw std::invalid_argument("Pairing code needs at least one digit");
    }

    std::string code;
    code.reserve(digits);
    for (size_t i = 0; i < digits; ++i) {
        code.push_back(static_cast<char>('0' + randombytes_uniform(10)));
    }
    return code;
}

bool PairingCrypto::constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string PairingCrypto::derive_credential(
    const std::string& local_id,
    const std::string& peer_id,
    const std::string& proof
) {
    const std::string& first = local_id < peer_id ? local_id : peer_id;
    const std::string& second = local_id < peer_id ? peer_id : local_id;
    std::string input = first + "|" + second + "|" + proof;

    return utilities::sha256_hex(input);
}

} // namespace lanconnect
