#ifndef _TC_CRYPTO_
#define _TC_CRYPTO_

#include "pchheader.hpp"
#include "util/h32.hpp"

/**
 * Offers convenience functions for cryptographic operations wrapping libsodium.
 * These functions are used for ledger hashing and transaction input authentication.
 */
namespace crypto
{

    // Prefix byte to append to ed25519 keys.
    constexpr const unsigned char KEYPFX_ed25519 = 0xED;

    // Sizes of the prefixed key encodings.
    constexpr const size_t PFXD_PUBKEY_BYTES = crypto_sign_ed25519_PUBLICKEYBYTES + 1;
    constexpr const size_t PFXD_SECKEY_BYTES = crypto_sign_ed25519_SECRETKEYBYTES + 1;
    constexpr const size_t SIGNATURE_BYTES = crypto_sign_ed25519_BYTES;

    int init();

    void generate_signing_keys(std::string &pubkey, std::string &seckey);

    int derive_public_key(std::string &pubkey, std::string_view seckey);

    int sign(std::string &sig, std::string_view msg, std::string_view seckey);

    int verify(std::string_view msg, std::string_view sig, std::string_view pubkey);

    bool is_canonical_pubkey(std::string_view pubkey);

    int get_pubkey_hash(util::h32 &hash, std::string_view pubkey);

    const std::string get_hash(std::string_view data);

    const std::string get_hash(std::string_view s1, std::string_view s2);

    const std::string get_hash(const std::vector<std::string_view> &sw_vect);

} // namespace crypto

#endif
