#pragma once

/**
 * @file cipher_suites.h
 * @brief Cipher suite registry used for probe eligibility
 *
 * Maps the cipher suites known to the scanner onto their key exchange
 * algorithm and records whether the handshake execution engine can run
 * crafted workflows with them.
 */

#include "raccoon/types.h"

#include <optional>
#include <vector>

namespace raccoon {

/**
 * @brief Static properties of a known cipher suite
 */
struct CipherSuiteInfo {
    CipherSuite suite;
    const char* name;
    KeyExchangeAlgorithm key_exchange;
    bool implemented;   ///< engine can build crafted handshakes for it
};

/**
 * @brief Look up registry information for a suite.
 * @return Properties, or std::nullopt for suites the registry does not know
 */
RACCOON_API std::optional<CipherSuiteInfo> get_cipher_suite_info(CipherSuite suite);

/// Key exchange of @p suite; NULL_KEX for unknown suites.
RACCOON_API KeyExchangeAlgorithm key_exchange_of(CipherSuite suite);

/// True for finite-field DH key exchanges (static, ephemeral, anonymous, DHE_PSK).
RACCOON_API bool uses_dh(CipherSuite suite);
RACCOON_API bool uses_dh(KeyExchangeAlgorithm kex) noexcept;

/// True if the suite is known and the engine implements it.
RACCOON_API bool is_implemented(CipherSuite suite);

RACCOON_API std::vector<CipherSuite> implemented_cipher_suites();

} // namespace raccoon
