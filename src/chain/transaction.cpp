#include "../pchheader.hpp"
#include "../crypto.hpp"
#include "../util/util.hpp"
#include "transaction.hpp"
#include "chain_common.hpp"

namespace chain
{
    /**
     * Output hash = sha256(receiver address, amount as 8 byte little endian).
     */
    const util::h32 get_tx_out_hash(const tx_out &out)
    {
        const std::string amount_bytes = util::uint64_to_le_string_bytes(out.amount);

        util::h32 hash;
        hash = crypto::get_hash(out.address.to_string_view(), amount_bytes);
        return hash;
    }

    /**
     * Calculates the hash which the owner of the source output signs when spending it.
     * Signing hash = sha256(pubkey hash, source tx hash, source index as 8 byte little endian).
     * The signature only binds the source output and the signer key. Other inputs and the
     * outputs of the enclosing transaction are not covered.
     * @return 0 on success. -1 if the public key is not canonically encoded.
     */
    int get_tx_in_signing_hash(util::h32 &hash, const tx_in &in)
    {
        util::h32 pubkey_hash;
        if (crypto::get_pubkey_hash(pubkey_hash, in.pubkey) == -1)
            return -1;

        const std::string index_bytes = util::uint64_to_le_string_bytes(in.source.index);
        hash = crypto::get_hash({pubkey_hash.to_string_view(),
                                 in.source.tx_hash.to_string_view(),
                                 index_bytes});
        return 0;
    }

    /**
     * Input hash = sha256(signature, pubkey hash, source tx hash, source index as 8 byte little endian).
     * This is the input fingerprint folded into the transaction hash.
     * @return 0 on success. -1 if the public key is not canonically encoded.
     */
    int get_tx_in_hash(util::h32 &hash, const tx_in &in)
    {
        util::h32 pubkey_hash;
        if (crypto::get_pubkey_hash(pubkey_hash, in.pubkey) == -1)
            return -1;

        const std::string index_bytes = util::uint64_to_le_string_bytes(in.source.index);
        hash = crypto::get_hash({in.sig,
                                 pubkey_hash.to_string_view(),
                                 in.source.tx_hash.to_string_view(),
                                 index_bytes});
        return 0;
    }

    /**
     * Transaction hash = sha256 over all input hashes followed by all output hashes, in order.
     * @return 0 on success. -1 if any input public key is not canonically encoded.
     */
    int get_transaction_hash(util::h32 &hash, const transaction &tx)
    {
        std::vector<util::h32> parts;
        parts.reserve(tx.inputs.size() + tx.outputs.size());

        for (const tx_in &in : tx.inputs)
        {
            util::h32 in_hash;
            if (get_tx_in_hash(in_hash, in) == -1)
                return -1;
            parts.push_back(in_hash);
        }

        for (const tx_out &out : tx.outputs)
            parts.push_back(get_tx_out_hash(out));

        std::vector<std::string_view> views;
        views.reserve(parts.size());
        for (const util::h32 &part : parts)
            views.push_back(part.to_string_view());

        hash = crypto::get_hash(views);
        return 0;
    }

    /**
     * Signs the input with the given private key. Populates the input public key with the
     * key derived from the private key and the signature over the input signing hash.
     * The input source must be set before signing.
     * @return 0 on success. -1 on malformed key or signing failure.
     */
    int sign_tx_in(tx_in &in, std::string_view seckey)
    {
        if (crypto::derive_public_key(in.pubkey, seckey) == -1)
        {
            LOG_ERROR << "Transaction input signing failed. Malformed private key.";
            return -1;
        }

        util::h32 signing_hash;
        if (get_tx_in_signing_hash(signing_hash, in) == -1 ||
            crypto::sign(in.sig, signing_hash.to_string_view(), seckey) == -1)
        {
            LOG_ERROR << "Transaction input signing failed.";
            return -1;
        }

        return 0;
    }

    /**
     * Resolves the output referred by an input. Transactions of the candidate block are
     * looked up first and the committed chain transactions second.
     * @param source Populated with the resolved output on success.
     * @param ptr The output pointer to resolve.
     * @param local_transactions Transactions contained in the candidate block.
     * @param chain_transactions Transactions committed to the ledger.
     * @return NULL on success. Rejection reason if the pointer does not resolve.
     */
    const char *find_source(const tx_out *&source, const tx_out_ptr &ptr, const transaction_ref_map &local_transactions,
                            const transaction_map &chain_transactions)
    {
        const transaction *tx = NULL;

        const auto local_itr = local_transactions.find(ptr.tx_hash);
        if (local_itr != local_transactions.end())
        {
            tx = local_itr->second;
        }
        else
        {
            const auto chain_itr = chain_transactions.find(ptr.tx_hash);
            if (chain_itr != chain_transactions.end())
                tx = &chain_itr->second;
        }

        if (tx == NULL)
        {
            LOG_DEBUG << "Source transaction " << ptr.tx_hash << " not found.";
            return REASON_DANGLING_REFERENCE;
        }

        if (ptr.index >= tx->outputs.size())
        {
            LOG_DEBUG << "Source output index " << ptr.index << " out of bounds in transaction " << ptr.tx_hash;
            return REASON_DANGLING_REFERENCE;
        }

        source = &tx->outputs[ptr.index];
        return NULL;
    }

} // namespace chain
