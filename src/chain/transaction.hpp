#ifndef _TC_CHAIN_TRANSACTION_
#define _TC_CHAIN_TRANSACTION_

#include "../pchheader.hpp"
#include "../util/h32.hpp"

namespace chain
{
    /**
     * Value owned by an address. Spendable by the holder of the key which hashes to the address.
     */
    struct tx_out
    {
        util::h32 address;   // Hash of the receiver's public key.
        uint64_t amount = 0; // Value transferred to the receiver.
    };

    /**
     * Points to an output of a previous transaction.
     */
    struct tx_out_ptr
    {
        util::h32 tx_hash;  // Hash of the transaction holding the output.
        uint64_t index = 0; // Index of the output within the transaction outputs.

        bool operator==(const tx_out_ptr &other) const
        {
            return tx_hash == other.tx_hash && index == other.index;
        }
    };

    // Helper class to use tx_out_ptr as an unordered container key.
    class tx_out_ptr_std_key_hasher
    {
    public:
        size_t operator()(const tx_out_ptr &ptr) const
        {
            return util::h32_std_key_hasher()(ptr.tx_hash) * 31 + std::hash<uint64_t>()(ptr.index);
        }
    };

    /**
     * Spends a previous output. The signature proves ownership of the source output.
     */
    struct tx_in
    {
        std::string sig;   // Signature over the signing hash of this input.
        std::string pubkey; // Prefixed public key used to verify the signature.
        tx_out_ptr source; // The output being spent.
    };

    struct transaction
    {
        std::vector<tx_in> inputs;
        std::vector<tx_out> outputs;
    };

    // Committed transactions keyed by transaction hash.
    typedef std::unordered_map<util::h32, transaction, util::h32_std_key_hasher> transaction_map;

    // Non-owning view of transactions (eg. the ones inside a candidate block) keyed by transaction hash.
    typedef std::unordered_map<util::h32, const transaction *, util::h32_std_key_hasher> transaction_ref_map;

    const util::h32 get_tx_out_hash(const tx_out &out);

    int get_tx_in_signing_hash(util::h32 &hash, const tx_in &in);

    int get_tx_in_hash(util::h32 &hash, const tx_in &in);

    int get_transaction_hash(util::h32 &hash, const transaction &tx);

    int sign_tx_in(tx_in &in, std::string_view seckey);

    const char *find_source(const tx_out *&source, const tx_out_ptr &ptr, const transaction_ref_map &local_transactions,
                            const transaction_map &chain_transactions);

} // namespace chain

#endif
