#ifndef _TC_TESTS_TEST_HELPERS_
#define _TC_TESTS_TEST_HELPERS_

#include "pchheader.hpp"
#include "util/h32.hpp"
#include "chain/transaction.hpp"
#include "chain/block.hpp"
#include "chain/blockchain.hpp"

namespace tctest
{
    struct keypair
    {
        std::string pubkey;
        std::string seckey;
        util::h32 address;
    };

    keypair create_keypair();

    util::h32 random_hash();

    util::h32 tx_hash(const chain::transaction &tx);

    util::h32 block_hash(const chain::block &b);

    chain::transaction create_seed_transaction(const std::vector<chain::tx_out> &outputs);

    chain::chain_params create_params(const std::vector<chain::tx_out> &genesis_outputs, const size_t difficulty = 0,
                                      const size_t batch_size = chain::DEFAULT_BATCH_SIZE,
                                      const util::h32 &reward_address = util::h32_empty);

    chain::tx_in create_signed_input(const util::h32 &source_tx, const uint64_t index, const keypair &owner);

    chain::transaction create_transfer(const util::h32 &source_tx, const uint64_t index, const keypair &owner,
                                       const util::h32 &receiver, const uint64_t amount);

    chain::transaction create_base_transaction(const util::h32 &receiver, const uint64_t amount);

    chain::block create_block_with_base(const util::h32 &parent, std::vector<chain::transaction> txs,
                                        const uint64_t base_amount, const util::h32 &reward_address = util::h32_empty);

    void mine(chain::block &b, const size_t difficulty);

    void unmine(chain::block &b, const size_t difficulty);

} // namespace tctest

#endif
