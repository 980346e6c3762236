#ifndef _TC_CHAIN_BLOCKCHAIN_
#define _TC_CHAIN_BLOCKCHAIN_

#include "../pchheader.hpp"
#include "../util/h32.hpp"
#include "transaction.hpp"
#include "block.hpp"
#include "chain_common.hpp"

namespace chain
{
    // Side effects the ledger asks the network layer to carry out.
    enum ACTION_TYPE
    {
        NONE = 0,           // Nothing to do.
        BROADCAST_BLOCK = 1 // A block was accepted and should be propagated to peers.
    };

    struct action
    {
        ACTION_TYPE type = ACTION_TYPE::NONE;
        std::optional<block> blk; // Only set for BROADCAST_BLOCK.
    };

    /**
     * Parameters the ledger is constructed with.
     */
    struct chain_params
    {
        size_t pow_difficulty = 0;              // Leading zero bits required in block hashes (0-8).
        size_t batch_size = DEFAULT_BATCH_SIZE; // Pooled transaction count which triggers block assembly.
        util::h32 reward_address;               // Receiver of the base transaction output of assembled blocks.
        block genesis;                          // Root of the block tree. Committed without verification.
    };

    typedef std::unordered_set<util::h32, util::h32_std_key_hasher> hash_set;

    /**
     * Tree of blocks with the longest (highest) branch as the trusted chain.
     * Not thread-safe. Callers must serialize mutations (see chain_node).
     */
    class blockchain
    {
    private:
        transaction_map transactions;                                                     // Committed transactions.
        std::unordered_map<util::h32, block_desc, util::h32_std_key_hasher> blocks;       // Committed block descriptors.
        std::unordered_map<util::h32, uint64_t, util::h32_std_key_hasher> block_heights;  // Height of each committed block.
        std::unordered_map<util::h32, std::vector<util::h32>, util::h32_std_key_hasher> tx_blocks;        // Committing blocks of each transaction.
        std::unordered_map<tx_out_ptr, std::vector<util::h32>, tx_out_ptr_std_key_hasher> spent_outputs; // Spending blocks of each output.
        uint64_t max_height = 0;
        util::h32 max_height_block_hash;
        util::h32 genesis_hash;
        size_t pow_difficulty = 0;
        size_t batch_size = DEFAULT_BATCH_SIZE;
        util::h32 reward_address;

        std::vector<transaction> pending; // Transaction pool awaiting block assembly.
        hash_set pending_hashes;

        size_t count_on_branch(const std::vector<util::h32> &block_hashes, const util::h32 &branch_tip, std::optional<hash_set> &branch) const;
        void commit_transactions(const block &b, const util::h32 &block_hash);
        void collect_branch(hash_set &branch, const util::h32 &branch_tip) const;
        transaction create_base_transaction(const std::vector<transaction> &batch) const;

    public:
        int init(const chain_params &params);

        const char *verify(const block &b) const;

        const char *push(const block &b, block_body &committed);

        const char *queue(const transaction &tx, action &act, std::vector<transaction> &rejected_batch);

        const util::h32 current_hash() const;

        uint64_t current_height() const;

        int get_height(uint64_t &height, const util::h32 &hash) const;

        const block_desc *get_block_desc(const util::h32 &hash) const;

        const transaction *get_transaction(const util::h32 &hash) const;

        bool contains_block(const util::h32 &hash) const;

        size_t block_count() const;

        size_t pending_count() const;

        size_t get_pow_difficulty() const;

        const util::h32 &get_genesis_hash() const;
    };

} // namespace chain

#endif
