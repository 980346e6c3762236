#include "pchheader.hpp"
#include "crypto.hpp"

namespace crypto
{

    /**
     * Initializes the crypto subsystem. Must be called once during application startup.
     * @return 0 for successful initialization. -1 for failure.
     */
    int init()
    {
        if (sodium_init() < 0)
        {
            std::cerr << "sodium_init failed.\n";
            return -1;
        }

        return 0;
    }

    /**
     * Generates a signing key pair using libsodium and assigns them to the provided strings.
     */
    void generate_signing_keys(std::string &pubkey, std::string &seckey)
    {
        // Generate key pair using libsodium default algorithm.
        // Currently using ed25519. So append prefix byte to represent that.

        pubkey.resize(PFXD_PUBKEY_BYTES);
        pubkey[0] = KEYPFX_ed25519;

        seckey.resize(PFXD_SECKEY_BYTES);
        seckey[0] = KEYPFX_ed25519;

        crypto_sign_ed25519_keypair(
            reinterpret_cast<unsigned char *>(pubkey.data() + 1),  // +1 to skip the prefix byte.
            reinterpret_cast<unsigned char *>(seckey.data() + 1)); // +1 to skip the prefix byte.
    }

    /**
     * Extracts the prefixed public key embedded in a prefixed ed25519 secret key.
     * @return 0 on success. -1 if the secret key is not a prefixed ed25519 key.
     */
    int derive_public_key(std::string &pubkey, std::string_view seckey)
    {
        if (seckey.size() != PFXD_SECKEY_BYTES || (unsigned char)seckey[0] != KEYPFX_ed25519)
            return -1;

        pubkey.resize(PFXD_PUBKEY_BYTES);
        pubkey[0] = KEYPFX_ed25519;

        if (crypto_sign_ed25519_sk_to_pk(
                reinterpret_cast<unsigned char *>(pubkey.data() + 1),
                reinterpret_cast<const unsigned char *>(seckey.data() + 1)) != 0)
            return -1;

        return 0;
    }

    /**
     * Generates the signature bytes for a message.
     * 
     * @param sig String to populate with the signature bytes.
     * @param msg Message bytes to sign.
     * @param seckey Prefixed private key bytes.
     * @return 0 on success. -1 if the key is malformed or signing failed.
     */
    int sign(std::string &sig, std::string_view msg, std::string_view seckey)
    {
        if (seckey.size() != PFXD_SECKEY_BYTES || (unsigned char)seckey[0] != KEYPFX_ed25519)
            return -1;

        sig.resize(SIGNATURE_BYTES);
        if (crypto_sign_ed25519_detached(
                reinterpret_cast<unsigned char *>(sig.data()),
                NULL,
                reinterpret_cast<const unsigned char *>(msg.data()),
                msg.length(),
                reinterpret_cast<const unsigned char *>(seckey.data() + 1)) != 0) // +1 to skip the prefix byte.
        {
            sig.clear();
            return -1;
        }

        return 0;
    }

    /**
     * Verifies the given signature bytes for the message.
     * Malformed signatures and keys are reported as ordinary verification failures.
     * 
     * @param msg Message bytes.
     * @param sig Signature bytes.
     * @param pubkey Prefixed public key bytes.
     * @return 0 for successful verification. -1 for failure.
     */
    int verify(std::string_view msg, std::string_view sig, std::string_view pubkey)
    {
        if (sig.size() != SIGNATURE_BYTES || !is_canonical_pubkey(pubkey))
            return -1;

        if (crypto_sign_ed25519_verify_detached(
                reinterpret_cast<const unsigned char *>(sig.data()),
                reinterpret_cast<const unsigned char *>(msg.data()),
                msg.length(),
                reinterpret_cast<const unsigned char *>(pubkey.data() + 1)) != 0) // +1 to skip prefix byte.
            return -1;

        return 0;
    }

    /**
     * Returns whether the public key is in the canonical prefixed ed25519 encoding.
     */
    bool is_canonical_pubkey(std::string_view pubkey)
    {
        return pubkey.size() == PFXD_PUBKEY_BYTES && (unsigned char)pubkey[0] == KEYPFX_ed25519;
    }

    /**
     * Calculates the address hash of a public key (sha256 of the canonical key encoding).
     * @return 0 on success. -1 if the key cannot be canonically encoded.
     */
    int get_pubkey_hash(util::h32 &hash, std::string_view pubkey)
    {
        if (!is_canonical_pubkey(pubkey))
            return -1;

        hash = get_hash(pubkey);
        return 0;
    }

    /**
     * Generate sha256 hash for a given message.
     * @param data String to hash.
     * @return The sha256 hash of the given string.
     */
    const std::string get_hash(std::string_view data)
    {
        std::string hash;
        hash.resize(crypto_hash_sha256_BYTES);

        crypto_hash_sha256(
            reinterpret_cast<unsigned char *>(hash.data()),
            reinterpret_cast<const unsigned char *>(data.data()),
            data.length());

        return hash;
    }

    /**
     * Generates sha256 hash for the given set of strings using stream hashing.
     */
    const std::string get_hash(std::string_view s1, std::string_view s2)
    {
        return get_hash(std::vector<std::string_view>{s1, s2});
    }

    /**
     * Generates sha256 hash for the given string view vector using stream hashing.
     * The result equals the hash of the concatenation of all the views in order.
     */
    const std::string get_hash(const std::vector<std::string_view> &sw_vect)
    {
        std::string hash;
        hash.resize(crypto_hash_sha256_BYTES);

        // Init stream hashing.
        crypto_hash_sha256_state state;
        crypto_hash_sha256_init(&state);

        for (std::string_view sw : sw_vect)
            crypto_hash_sha256_update(&state, reinterpret_cast<const unsigned char *>(sw.data()), sw.length());

        // Get the final hash.
        crypto_hash_sha256_final(&state, reinterpret_cast<unsigned char *>(hash.data()));

        return hash;
    }

} // namespace crypto
