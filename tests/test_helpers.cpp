#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "crypto.hpp"

namespace tctest
{
    keypair create_keypair()
    {
        keypair kp;
        crypto::generate_signing_keys(kp.pubkey, kp.seckey);
        crypto::get_pubkey_hash(kp.address, kp.pubkey);
        return kp;
    }

    util::h32 random_hash()
    {
        std::string bytes(sizeof(util::h32), '\0');
        randombytes_buf(bytes.data(), bytes.size());
        util::h32 hash;
        hash = bytes;
        return hash;
    }

    util::h32 tx_hash(const chain::transaction &tx)
    {
        util::h32 hash;
        EXPECT_EQ(0, chain::get_transaction_hash(hash, tx));
        return hash;
    }

    util::h32 block_hash(const chain::block &b)
    {
        util::h32 hash;
        EXPECT_EQ(0, chain::get_block_hash(hash, b));
        return hash;
    }

    chain::transaction create_seed_transaction(const std::vector<chain::tx_out> &outputs)
    {
        chain::transaction tx;
        tx.outputs = outputs;
        return tx;
    }

    chain::chain_params create_params(const std::vector<chain::tx_out> &genesis_outputs, const size_t difficulty,
                                      const size_t batch_size, const util::h32 &reward_address)
    {
        chain::chain_params params;
        params.pow_difficulty = difficulty;
        params.batch_size = batch_size;
        params.reward_address = reward_address;
        params.genesis = chain::create_block({create_seed_transaction(genesis_outputs)}, util::h32_empty);
        return params;
    }

    chain::tx_in create_signed_input(const util::h32 &source_tx, const uint64_t index, const keypair &owner)
    {
        chain::tx_in in;
        in.source.tx_hash = source_tx;
        in.source.index = index;
        EXPECT_EQ(0, chain::sign_tx_in(in, owner.seckey));
        return in;
    }

    chain::transaction create_transfer(const util::h32 &source_tx, const uint64_t index, const keypair &owner,
                                       const util::h32 &receiver, const uint64_t amount)
    {
        chain::transaction tx;
        tx.inputs.push_back(create_signed_input(source_tx, index, owner));
        tx.outputs.push_back(chain::tx_out{receiver, amount});
        return tx;
    }

    chain::transaction create_base_transaction(const util::h32 &receiver, const uint64_t amount)
    {
        chain::transaction tx;
        tx.outputs.push_back(chain::tx_out{receiver, amount});
        return tx;
    }

    chain::block create_block_with_base(const util::h32 &parent, std::vector<chain::transaction> txs,
                                        const uint64_t base_amount, const util::h32 &reward_address)
    {
        txs.insert(txs.begin(), create_base_transaction(reward_address, base_amount));
        return chain::create_block(std::move(txs), parent);
    }

    // Searches nonces until the block hash satisfies the difficulty.
    void mine(chain::block &b, const size_t difficulty)
    {
        while (!chain::pow_verified(block_hash(b), difficulty))
            b.desc.nonce++;
    }

    // Searches nonces until the block hash fails the difficulty.
    void unmine(chain::block &b, const size_t difficulty)
    {
        while (chain::pow_verified(block_hash(b), difficulty))
            b.desc.nonce++;
    }

} // namespace tctest
