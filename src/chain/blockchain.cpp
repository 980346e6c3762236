#include "../pchheader.hpp"
#include "../crypto.hpp"
#include "blockchain.hpp"

namespace chain
{
    /**
     * Adds an amount to a running total.
     * @return false if the addition overflowed. The total is left unchanged in that case.
     */
    static bool add_amount(uint64_t &total, const uint64_t amount)
    {
        if (amount > std::numeric_limits<uint64_t>::max() - total)
            return false;

        total += amount;
        return true;
    }

    /**
     * Initializes the ledger with the genesis block as the only block at height 0.
     * Genesis transactions are committed without verification so they can seed the initial outputs.
     * @return 0 on success. -1 on invalid parameters.
     */
    int blockchain::init(const chain_params &params)
    {
        if (params.pow_difficulty > MAX_POW_DIFFICULTY)
        {
            LOG_ERROR << "PoW difficulty " << params.pow_difficulty << " exceeds maximum " << MAX_POW_DIFFICULTY;
            return -1;
        }

        if (params.batch_size == 0)
        {
            LOG_ERROR << "Block batch size must be positive.";
            return -1;
        }

        if (get_block_hash(genesis_hash, params.genesis) == -1)
        {
            LOG_ERROR << "Genesis block hashing failed.";
            return -1;
        }

        pow_difficulty = params.pow_difficulty;
        batch_size = params.batch_size;
        reward_address = params.reward_address;

        transactions.clear();
        blocks.clear();
        block_heights.clear();
        tx_blocks.clear();
        spent_outputs.clear();
        pending.clear();
        pending_hashes.clear();

        commit_transactions(params.genesis, genesis_hash);

        blocks.emplace(genesis_hash, params.genesis.desc);
        block_heights.emplace(genesis_hash, 0);
        max_height = 0;
        max_height_block_hash = genesis_hash;

        LOG_INFO << "Ledger initialized. Genesis:" << genesis_hash << " difficulty:" << pow_difficulty << " batch:" << batch_size;
        return 0;
    }

    /**
     * Verifies a candidate block against the ledger without modifying it.
     * @return NULL if the block is valid. Rejection reason otherwise.
     */
    const char *blockchain::verify(const block &b) const
    {
        util::h32 block_hash;
        if (get_block_hash(block_hash, b) == -1)
        {
            LOG_DEBUG << "Block contains an input with a malformed public key.";
            return REASON_OWNERSHIP_MISMATCH;
        }

        if (!pow_verified(block_hash, pow_difficulty))
        {
            LOG_DEBUG << "Block " << block_hash << " does not meet PoW difficulty " << pow_difficulty;
            return REASON_INSUFFICIENT_WORK;
        }

        if (b.body.transactions.empty())
        {
            LOG_DEBUG << "Block " << block_hash << " has no base transaction.";
            return REASON_MALFORMED_BASE_TX;
        }

        // Transactions of the block itself can be spent within the same block.
        // Identical transactions (eg. equal base transactions) count as separate instances.
        transaction_ref_map local_transactions;
        std::unordered_map<util::h32, size_t, util::h32_std_key_hasher> local_instances;
        for (const transaction &tx : b.body.transactions)
        {
            util::h32 tx_hash;
            get_transaction_hash(tx_hash, tx);
            local_transactions.try_emplace(tx_hash, &tx);
            local_instances[tx_hash]++;
        }

        std::unordered_map<tx_out_ptr, size_t, tx_out_ptr_std_key_hasher> block_spends;
        std::optional<hash_set> branch; // Built on demand when a committed output is referenced.

        uint64_t block_input_amount = 0;
        uint64_t block_output_amount = 0;

        for (size_t i = 0; i < b.body.transactions.size(); i++)
        {
            const transaction &tx = b.body.transactions[i];

            uint64_t tx_input_amount = 0;
            for (const tx_in &in : tx.inputs)
            {
                const tx_out *source = NULL;
                const char *reason = find_source(source, in.source, local_transactions, transactions);
                if (reason != NULL)
                    return reason;

                // Hash of the public key must match the receiver address of the source output.
                util::h32 pubkey_hash;
                if (crypto::get_pubkey_hash(pubkey_hash, in.pubkey) == -1 || pubkey_hash != source->address)
                {
                    LOG_DEBUG << "Input public key does not match the address of output " << in.source.tx_hash << ":" << in.source.index;
                    return REASON_OWNERSHIP_MISMATCH;
                }

                util::h32 signing_hash;
                get_tx_in_signing_hash(signing_hash, in);
                if (crypto::verify(signing_hash.to_string_view(), in.sig, in.pubkey) == -1)
                {
                    LOG_DEBUG << "Input signature verification failed for output " << in.source.tx_hash << ":" << in.source.index;
                    return REASON_INVALID_SIGNATURE;
                }

                // An output can be spent once per committed instance of its transaction on the branch.
                const auto committed_itr = tx_blocks.find(in.source.tx_hash);
                size_t instances = (committed_itr == tx_blocks.end() ? 0 : count_on_branch(committed_itr->second, b.desc.parent_hash, branch));
                const auto local_itr = local_instances.find(in.source.tx_hash);
                if (local_itr != local_instances.end())
                    instances += local_itr->second;

                // Source committed only on another branch.
                if (instances == 0)
                    instances = 1;

                const auto spent_itr = spent_outputs.find(in.source);
                const size_t spends = ++block_spends[in.source] +
                                      (spent_itr == spent_outputs.end() ? 0 : count_on_branch(spent_itr->second, b.desc.parent_hash, branch));
                if (spends > instances)
                {
                    LOG_DEBUG << "Output " << in.source.tx_hash << ":" << in.source.index << " already spent.";
                    return REASON_DOUBLE_SPEND;
                }

                if (!add_amount(tx_input_amount, source->amount))
                {
                    LOG_DEBUG << "Transaction input amount overflow.";
                    return REASON_UNBALANCED_TX;
                }
            }

            uint64_t tx_output_amount = 0;
            for (const tx_out &out : tx.outputs)
            {
                if (!add_amount(tx_output_amount, out.amount))
                {
                    LOG_DEBUG << "Transaction output amount overflow.";
                    return REASON_UNBALANCED_TX;
                }
            }

            // Transactions other than the base transaction cannot create value.
            if (i != 0 && tx_output_amount > tx_input_amount)
            {
                LOG_DEBUG << "Transaction " << i << " output amount " << tx_output_amount << " exceeds input amount " << tx_input_amount;
                return REASON_UNBALANCED_TX;
            }

            if (!add_amount(block_input_amount, tx_input_amount) || !add_amount(block_output_amount, tx_output_amount))
            {
                LOG_DEBUG << "Block amount overflow.";
                return REASON_UNBALANCED_BLOCK;
            }
        }

        if (block_input_amount != block_output_amount)
        {
            LOG_DEBUG << "Block input amount " << block_input_amount << " and output amount " << block_output_amount << " are not balanced.";
            return REASON_UNBALANCED_BLOCK;
        }

        const transaction &base_tx = b.body.transactions[0];
        if (!base_tx.inputs.empty() || base_tx.outputs.size() != 1)
        {
            LOG_DEBUG << "Base transaction must have no inputs and exactly one output.";
            return REASON_MALFORMED_BASE_TX;
        }

        return NULL;
    }

    /**
     * Verifies and commits a block. The trusted tip moves to the block only if it is strictly
     * higher than the current tip. Blocks at the same height as the tip never replace it.
     * @param b The block to commit.
     * @param committed Populated with the committed block body on success.
     * @return NULL on success. Rejection reason otherwise. The ledger is unchanged on rejection.
     */
    const char *blockchain::push(const block &b, block_body &committed)
    {
        const char *reason = verify(b);
        if (reason != NULL)
            return reason;

        util::h32 block_hash;
        get_block_hash(block_hash, b);

        const auto parent_itr = block_heights.find(b.desc.parent_hash);
        if (parent_itr == block_heights.end())
        {
            LOG_DEBUG << "Parent " << b.desc.parent_hash << " of block " << block_hash << " not found.";
            return REASON_UNKNOWN_PARENT;
        }

        if (parent_itr->second == std::numeric_limits<uint64_t>::max())
        {
            LOG_ERROR << "Block height overflow at parent " << b.desc.parent_hash;
            return REASON_HEIGHT_OVERFLOW;
        }
        const uint64_t height = parent_itr->second + 1;

        if (blocks.count(block_hash) == 1)
        {
            LOG_DEBUG << "Block " << block_hash << " already committed.";
            return REASON_DUPLICATE_BLOCK;
        }

        block_heights.emplace(block_hash, height);
        blocks.emplace(block_hash, b.desc);

        commit_transactions(b, block_hash);

        if (height > max_height)
        {
            max_height = height;
            max_height_block_hash = block_hash;
            LOG_INFO << "New tip " << block_hash << " at height " << height;
        }
        else
        {
            LOG_INFO << "Block " << block_hash << " committed at height " << height << " on a side branch.";
        }

        committed = b.body;
        return NULL;
    }

    /**
     * Adds a transaction to the pool. When the pool reaches the batch size, a block is assembled
     * on top of the current tip and pushed.
     * @param tx The transaction to queue.
     * @param act Populated with BROADCAST_BLOCK if a block was accepted. NONE otherwise.
     * @param rejected_batch Populated with the drained pool transactions if the assembled block was rejected.
     * @return NULL on success. Rejection reason otherwise.
     */
    const char *blockchain::queue(const transaction &tx, action &act, std::vector<transaction> &rejected_batch)
    {
        act.type = ACTION_TYPE::NONE;
        act.blk.reset();

        util::h32 tx_hash;
        if (get_transaction_hash(tx_hash, tx) == -1)
        {
            LOG_DEBUG << "Queued transaction contains an input with a malformed public key.";
            return REASON_OWNERSHIP_MISMATCH;
        }

        if (pending_hashes.count(tx_hash) == 1 || transactions.count(tx_hash) == 1)
        {
            LOG_DEBUG << "Transaction " << tx_hash << " already queued or committed.";
            return REASON_DUPLICATE_TX;
        }

        pending.push_back(tx);
        pending_hashes.emplace(tx_hash);

        if (pending.size() < batch_size)
            return NULL;

        // Drain the pool into a candidate block. The batch is not requeued if the block is rejected.
        std::vector<transaction> batch;
        batch.swap(pending);
        pending_hashes.clear();

        std::vector<transaction> block_txs;
        block_txs.reserve(batch.size() + 1);
        block_txs.push_back(create_base_transaction(batch));
        block_txs.insert(block_txs.end(), batch.begin(), batch.end());

        block candidate = create_block(std::move(block_txs), current_hash());

        block_body committed;
        const char *reason = push(candidate, committed);
        if (reason != NULL)
        {
            LOG_WARNING << "Assembled block rejected: " << reason << ". Dropping " << batch.size() << " pooled transactions.";
            rejected_batch = std::move(batch);
            return reason;
        }

        act.type = ACTION_TYPE::BROADCAST_BLOCK;
        act.blk = std::move(candidate);
        return NULL;
    }

    /**
     * Creates the base transaction of an assembled block. The single output pays the batch fees
     * (resolved input amounts minus output amounts) to the reward address so the block balances.
     */
    transaction blockchain::create_base_transaction(const std::vector<transaction> &batch) const
    {
        transaction_ref_map local_transactions;
        for (const transaction &tx : batch)
        {
            util::h32 tx_hash;
            if (get_transaction_hash(tx_hash, tx) == 0)
                local_transactions.try_emplace(tx_hash, &tx);
        }

        uint64_t fees = 0;
        for (const transaction &tx : batch)
        {
            uint64_t input_amount = 0;
            uint64_t output_amount = 0;
            bool resolved = true;

            for (const tx_in &in : tx.inputs)
            {
                const tx_out *source = NULL;
                if (find_source(source, in.source, local_transactions, transactions) != NULL ||
                    !add_amount(input_amount, source->amount))
                {
                    resolved = false;
                    break;
                }
            }

            for (const tx_out &out : tx.outputs)
            {
                if (!add_amount(output_amount, out.amount))
                    resolved = false;
            }

            // Unresolvable or unbalanced transactions are rejected by verification anyway.
            if (resolved && input_amount > output_amount)
                add_amount(fees, input_amount - output_amount);
        }

        transaction base_tx;
        base_tx.outputs.push_back(tx_out{reward_address, fees});
        return base_tx;
    }

    /**
     * Records the transactions of a block and the outputs they spend against the block hash.
     */
    void blockchain::commit_transactions(const block &b, const util::h32 &block_hash)
    {
        for (const transaction &tx : b.body.transactions)
        {
            util::h32 tx_hash;
            get_transaction_hash(tx_hash, tx); // Cannot fail for a hashed block.
            transactions.insert_or_assign(tx_hash, tx);
            tx_blocks[tx_hash].push_back(block_hash);

            for (const tx_in &in : tx.inputs)
                spent_outputs[in.source].push_back(block_hash);
        }
    }

    /**
     * Counts the entries which belong to the branch ending at the given tip.
     * @param branch Cache of the branch block hashes. Populated on first use.
     */
    size_t blockchain::count_on_branch(const std::vector<util::h32> &block_hashes, const util::h32 &branch_tip, std::optional<hash_set> &branch) const
    {
        if (!branch)
        {
            branch.emplace();
            collect_branch(*branch, branch_tip);
        }

        size_t count = 0;
        for (const util::h32 &hash : block_hashes)
        {
            if (branch->count(hash) == 1)
                count++;
        }
        return count;
    }

    /**
     * Collects the hashes of all committed blocks from the given tip down to the genesis block.
     */
    void blockchain::collect_branch(hash_set &branch, const util::h32 &branch_tip) const
    {
        util::h32 hash = branch_tip;
        while (true)
        {
            const auto itr = blocks.find(hash);
            if (itr == blocks.end() || !branch.emplace(hash).second)
                break;

            if (hash == genesis_hash)
                break;

            hash = itr->second.parent_hash;
        }
    }

    const util::h32 blockchain::current_hash() const
    {
        return max_height_block_hash;
    }

    uint64_t blockchain::current_height() const
    {
        return max_height;
    }

    /**
     * Looks up the height of a committed block.
     * @return 0 if found. -1 if the block is not committed.
     */
    int blockchain::get_height(uint64_t &height, const util::h32 &hash) const
    {
        const auto itr = block_heights.find(hash);
        if (itr == block_heights.end())
            return -1;

        height = itr->second;
        return 0;
    }

    const block_desc *blockchain::get_block_desc(const util::h32 &hash) const
    {
        const auto itr = blocks.find(hash);
        return itr == blocks.end() ? NULL : &itr->second;
    }

    const transaction *blockchain::get_transaction(const util::h32 &hash) const
    {
        const auto itr = transactions.find(hash);
        return itr == transactions.end() ? NULL : &itr->second;
    }

    bool blockchain::contains_block(const util::h32 &hash) const
    {
        return blocks.count(hash) == 1;
    }

    size_t blockchain::block_count() const
    {
        return blocks.size();
    }

    size_t blockchain::pending_count() const
    {
        return pending.size();
    }

    size_t blockchain::get_pow_difficulty() const
    {
        return pow_difficulty;
    }

    const util::h32 &blockchain::get_genesis_hash() const
    {
        return genesis_hash;
    }

} // namespace chain
