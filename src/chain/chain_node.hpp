#ifndef _TC_CHAIN_CHAIN_NODE_
#define _TC_CHAIN_CHAIN_NODE_

#include "../pchheader.hpp"
#include "blockchain.hpp"

namespace chain
{
    /**
     * Owns the ledger and serializes access to it. Submissions take the exclusive lock.
     * Tip queries share the lock among themselves.
     */
    class chain_node
    {
    private:
        blockchain chain;
        mutable std::shared_mutex chain_mutex;

    public:
        int init(const chain_params &params);

        const char *submit_transaction(const transaction &tx, action &act, std::vector<transaction> &rejected_batch);

        const char *submit_block(const block &b, block_body &committed);

        const util::h32 current_tip() const;

        uint64_t current_height() const;

        void get_tip(util::h32 &hash, uint64_t &height) const;

        int get_height(uint64_t &height, const util::h32 &hash) const;
    };

} // namespace chain

#endif
