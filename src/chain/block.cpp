#include "../pchheader.hpp"
#include "../crypto.hpp"
#include "block.hpp"
#include "chain_common.hpp"

namespace chain
{
    /**
     * Creates a block on top of the given parent. Nonce starts at zero and is adjusted
     * by an external miner if the ledger demands proof of work.
     */
    block create_block(std::vector<transaction> &&transactions, const util::h32 &parent_hash)
    {
        block b;
        b.desc.parent_hash = parent_hash;
        b.desc.nonce = 0;
        b.body.transactions = std::move(transactions);
        return b;
    }

    /**
     * Block hash = sha256(parent hash, each transaction hash in order, nonce as 16 byte little endian).
     * @return 0 on success. -1 if a contained transaction cannot be hashed.
     */
    int get_block_hash(util::h32 &hash, const block &b)
    {
        std::vector<util::h32> tx_hashes(b.body.transactions.size());
        for (size_t i = 0; i < b.body.transactions.size(); i++)
        {
            if (get_transaction_hash(tx_hashes[i], b.body.transactions[i]) == -1)
                return -1;
        }

        const std::string nonce_bytes = util::uint128_to_le_string_bytes(b.desc.nonce);

        std::vector<std::string_view> views;
        views.reserve(tx_hashes.size() + 2);
        views.push_back(b.desc.parent_hash.to_string_view());
        for (const util::h32 &tx_hash : tx_hashes)
            views.push_back(tx_hash.to_string_view());
        views.push_back(nonce_bytes);

        hash = crypto::get_hash(views);
        return 0;
    }

    /**
     * Checks whether the hash satisfies the proof of work difficulty. The top 'difficulty'
     * bits of the first hash byte must be zero. Difficulty 0 is always satisfied and
     * difficulties beyond 8 bits are never satisfied.
     */
    bool pow_verified(const util::h32 &hash, const size_t difficulty)
    {
        if (difficulty > MAX_POW_DIFFICULTY)
            return false;

        const uint8_t mask = (uint8_t)~(0xffu >> difficulty);
        return (hash.first_byte() & mask) == 0;
    }

} // namespace chain
