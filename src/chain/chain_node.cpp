#include "../pchheader.hpp"
#include "chain_node.hpp"

namespace chain
{
    int chain_node::init(const chain_params &params)
    {
        std::unique_lock lock(chain_mutex);
        return chain.init(params);
    }

    /**
     * Queues a transaction submitted by a peer or user.
     * @return NULL on success. Rejection reason otherwise.
     */
    const char *chain_node::submit_transaction(const transaction &tx, action &act, std::vector<transaction> &rejected_batch)
    {
        std::unique_lock lock(chain_mutex);
        return chain.queue(tx, act, rejected_batch);
    }

    /**
     * Commits a block received from a peer.
     * @return NULL on success. Rejection reason otherwise.
     */
    const char *chain_node::submit_block(const block &b, block_body &committed)
    {
        std::unique_lock lock(chain_mutex);
        return chain.push(b, committed);
    }

    const util::h32 chain_node::current_tip() const
    {
        std::shared_lock lock(chain_mutex);
        return chain.current_hash();
    }

    uint64_t chain_node::current_height() const
    {
        std::shared_lock lock(chain_mutex);
        return chain.current_height();
    }

    /**
     * Reads the tip hash and its height under a single lock so both belong to the same chain state.
     */
    void chain_node::get_tip(util::h32 &hash, uint64_t &height) const
    {
        std::shared_lock lock(chain_mutex);
        hash = chain.current_hash();
        height = chain.current_height();
    }

    int chain_node::get_height(uint64_t &height, const util::h32 &hash) const
    {
        std::shared_lock lock(chain_mutex);
        return chain.get_height(height, hash);
    }

} // namespace chain
