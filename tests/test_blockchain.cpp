#include <gtest/gtest.h>
#include "pchheader.hpp"
#include "chain/blockchain.hpp"
#include "chain/chain_common.hpp"
#include "test_helpers.hpp"

namespace
{
    class BlockchainTest : public ::testing::Test
    {
    protected:
        tctest::keypair alice;
        tctest::keypair bob;
        util::h32 seed_hash; // Genesis seed transaction: alice 100, alice 50.
        chain::chain_params params;
        chain::blockchain chain;

        void SetUp() override
        {
            alice = tctest::create_keypair();
            bob = tctest::create_keypair();
            init_chain(0);
        }

        void init_chain(const size_t difficulty)
        {
            const std::vector<chain::tx_out> outputs = {chain::tx_out{alice.address, 100}, chain::tx_out{alice.address, 50}};
            seed_hash = tctest::tx_hash(tctest::create_seed_transaction(outputs));
            params = tctest::create_params(outputs, difficulty);
            ASSERT_EQ(0, chain.init(params));
        }

        // Block on the given parent paying alice's first genesis output to bob minus a fee of 10.
        chain::block create_spend_block(const util::h32 &parent)
        {
            return tctest::create_block_with_base(parent, {tctest::create_transfer(seed_hash, 0, alice, bob.address, 90)}, 10);
        }

        const char *push(const chain::block &b)
        {
            chain::block_body committed;
            return chain.push(b, committed);
        }
    };

    TEST_F(BlockchainTest, InitCommitsGenesisAtHeightZero)
    {
        const util::h32 genesis = tctest::block_hash(params.genesis);
        EXPECT_EQ(genesis, chain.current_hash());
        EXPECT_EQ(genesis, chain.get_genesis_hash());
        EXPECT_EQ(0u, chain.current_height());
        EXPECT_EQ(1u, chain.block_count());
        ASSERT_NE(nullptr, chain.get_transaction(seed_hash));
        EXPECT_EQ(2u, chain.get_transaction(seed_hash)->outputs.size());

        uint64_t height = 99;
        EXPECT_EQ(0, chain.get_height(height, genesis));
        EXPECT_EQ(0u, height);
        EXPECT_EQ(-1, chain.get_height(height, tctest::random_hash()));
    }

    TEST_F(BlockchainTest, InitRejectsInvalidParameters)
    {
        chain::blockchain other;
        chain::chain_params bad = params;
        bad.pow_difficulty = chain::MAX_POW_DIFFICULTY + 1;
        EXPECT_EQ(-1, other.init(bad));

        bad = params;
        bad.batch_size = 0;
        EXPECT_EQ(-1, other.init(bad));
    }

    TEST_F(BlockchainTest, ValidBlockIsCommitted)
    {
        const chain::block b = create_spend_block(chain.current_hash());
        EXPECT_EQ(nullptr, chain.verify(b));

        chain::block_body committed;
        ASSERT_EQ(nullptr, chain.push(b, committed));
        EXPECT_EQ(2u, committed.transactions.size());

        const util::h32 hash = tctest::block_hash(b);
        EXPECT_EQ(hash, chain.current_hash());
        EXPECT_EQ(1u, chain.current_height());
        EXPECT_TRUE(chain.contains_block(hash));
        ASSERT_NE(nullptr, chain.get_block_desc(hash));
        EXPECT_EQ(tctest::block_hash(params.genesis), chain.get_block_desc(hash)->parent_hash);
        EXPECT_NE(nullptr, chain.get_transaction(tctest::tx_hash(b.body.transactions[1])));
    }

    TEST_F(BlockchainTest, CommittedOutputsCanBeSpentLater)
    {
        const chain::block first = create_spend_block(chain.current_hash());
        ASSERT_EQ(nullptr, push(first));

        const util::h32 bob_tx = tctest::tx_hash(first.body.transactions[1]);
        const chain::block second = tctest::create_block_with_base(
            chain.current_hash(), {tctest::create_transfer(bob_tx, 0, bob, alice.address, 90)}, 0);
        EXPECT_EQ(nullptr, push(second));
        EXPECT_EQ(2u, chain.current_height());
    }

    TEST_F(BlockchainTest, OutputsOfTheSameBlockCanBeSpent)
    {
        const chain::transaction to_bob = tctest::create_transfer(seed_hash, 0, alice, bob.address, 100);
        const chain::transaction back_to_alice = tctest::create_transfer(tctest::tx_hash(to_bob), 0, bob, alice.address, 100);
        const chain::block b = tctest::create_block_with_base(chain.current_hash(), {to_bob, back_to_alice}, 0);
        EXPECT_EQ(nullptr, push(b));
    }

    TEST_F(BlockchainTest, RejectsOwnershipMismatch)
    {
        const chain::block b = tctest::create_block_with_base(
            chain.current_hash(), {tctest::create_transfer(seed_hash, 0, bob, bob.address, 100)}, 0);
        EXPECT_STREQ(chain::REASON_OWNERSHIP_MISMATCH, push(b));
        EXPECT_EQ(0u, chain.current_height());
    }

    TEST_F(BlockchainTest, RejectsMalformedPubkey)
    {
        chain::block b = create_spend_block(chain.current_hash());
        b.body.transactions[1].inputs[0].pubkey.pop_back();
        EXPECT_STREQ(chain::REASON_OWNERSHIP_MISMATCH, push(b));
    }

    TEST_F(BlockchainTest, RejectsInvalidSignature)
    {
        chain::block b = create_spend_block(chain.current_hash());
        b.body.transactions[1].inputs[0].sig[5] ^= 0x01;
        EXPECT_STREQ(chain::REASON_INVALID_SIGNATURE, push(b));
    }

    TEST_F(BlockchainTest, RejectsUnbalancedTransaction)
    {
        // Transfer creates 50 more than it spends. Base finances nothing.
        const chain::block b = tctest::create_block_with_base(
            chain.current_hash(), {tctest::create_transfer(seed_hash, 0, alice, bob.address, 150)}, 0);
        EXPECT_STREQ(chain::REASON_UNBALANCED_TX, push(b));
    }

    TEST_F(BlockchainTest, RejectsUnbalancedBlock)
    {
        // Base output exceeds the fee.
        const chain::block over = tctest::create_block_with_base(
            chain.current_hash(), {tctest::create_transfer(seed_hash, 0, alice, bob.address, 90)}, 20);
        EXPECT_STREQ(chain::REASON_UNBALANCED_BLOCK, push(over));

        // Fee left unclaimed.
        const chain::block under = tctest::create_block_with_base(
            chain.current_hash(), {tctest::create_transfer(seed_hash, 0, alice, bob.address, 90)}, 0);
        EXPECT_STREQ(chain::REASON_UNBALANCED_BLOCK, push(under));
    }

    TEST_F(BlockchainTest, RejectsMalformedBaseTransaction)
    {
        // Base with two outputs.
        chain::block two_outputs = create_spend_block(chain.current_hash());
        two_outputs.body.transactions[0].outputs = {chain::tx_out{util::h32_empty, 5}, chain::tx_out{util::h32_empty, 5}};
        EXPECT_STREQ(chain::REASON_MALFORMED_BASE_TX, push(two_outputs));

        // Base which spends an input.
        const chain::block with_input = chain::create_block(
            {tctest::create_transfer(seed_hash, 0, alice, bob.address, 100)}, chain.current_hash());
        EXPECT_STREQ(chain::REASON_MALFORMED_BASE_TX, push(with_input));

        // No transactions at all.
        const chain::block empty = chain::create_block({}, chain.current_hash());
        EXPECT_STREQ(chain::REASON_MALFORMED_BASE_TX, push(empty));

        EXPECT_EQ(0u, chain.current_height());
    }

    TEST_F(BlockchainTest, RejectsDanglingReference)
    {
        const chain::block missing_tx = tctest::create_block_with_base(
            chain.current_hash(), {tctest::create_transfer(tctest::random_hash(), 0, alice, bob.address, 100)}, 0);
        EXPECT_STREQ(chain::REASON_DANGLING_REFERENCE, push(missing_tx));

        const chain::block bad_index = tctest::create_block_with_base(
            chain.current_hash(), {tctest::create_transfer(seed_hash, 2, alice, bob.address, 100)}, 0);
        EXPECT_STREQ(chain::REASON_DANGLING_REFERENCE, push(bad_index));
    }

    TEST_F(BlockchainTest, ProofOfWorkIsEnforced)
    {
        init_chain(4);

        chain::block b = create_spend_block(chain.current_hash());
        tctest::unmine(b, 4);
        EXPECT_STREQ(chain::REASON_INSUFFICIENT_WORK, push(b));

        tctest::mine(b, 4);
        EXPECT_EQ(nullptr, push(b));
        EXPECT_EQ(1u, chain.current_height());
    }

    TEST_F(BlockchainTest, RejectsDoubleSpendOnSameBranch)
    {
        const chain::block first = create_spend_block(chain.current_hash());
        ASSERT_EQ(nullptr, push(first));

        const chain::block again = tctest::create_block_with_base(
            chain.current_hash(), {tctest::create_transfer(seed_hash, 0, alice, alice.address, 100)}, 0);
        EXPECT_STREQ(chain::REASON_DOUBLE_SPEND, push(again));
        EXPECT_EQ(1u, chain.current_height());
    }

    TEST_F(BlockchainTest, RejectsDoubleSpendWithinBlock)
    {
        const chain::block b = tctest::create_block_with_base(
            chain.current_hash(),
            {tctest::create_transfer(seed_hash, 0, alice, bob.address, 100),
             tctest::create_transfer(seed_hash, 0, alice, alice.address, 100)},
            0);
        EXPECT_STREQ(chain::REASON_DOUBLE_SPEND, push(b));
    }

    TEST_F(BlockchainTest, SameOutputCanBeSpentOnCompetingBranches)
    {
        const util::h32 genesis = chain.current_hash();
        ASSERT_EQ(nullptr, push(create_spend_block(genesis)));

        const chain::block competing = tctest::create_block_with_base(
            genesis, {tctest::create_transfer(seed_hash, 0, alice, alice.address, 100)}, 0);
        EXPECT_EQ(nullptr, push(competing));
        EXPECT_EQ(3u, chain.block_count());
    }

    TEST_F(BlockchainTest, UnknownParentLeavesLedgerUnchanged)
    {
        const util::h32 tip = chain.current_hash();
        const chain::block orphan = create_spend_block(tctest::random_hash());
        EXPECT_STREQ(chain::REASON_UNKNOWN_PARENT, push(orphan));

        EXPECT_EQ(tip, chain.current_hash());
        EXPECT_EQ(0u, chain.current_height());
        EXPECT_EQ(1u, chain.block_count());
        EXPECT_FALSE(chain.contains_block(tctest::block_hash(orphan)));
        EXPECT_EQ(nullptr, chain.get_transaction(tctest::tx_hash(orphan.body.transactions[1])));

        // The output referenced by the orphan is still spendable.
        EXPECT_EQ(nullptr, push(create_spend_block(tip)));
    }

    TEST_F(BlockchainTest, RejectsDuplicateBlock)
    {
        const chain::block b = create_spend_block(chain.current_hash());
        ASSERT_EQ(nullptr, push(b));
        EXPECT_STREQ(chain::REASON_DUPLICATE_BLOCK, push(b));

        const chain::block empty = tctest::create_block_with_base(chain.current_hash(), {}, 0);
        ASSERT_EQ(nullptr, push(empty));
        EXPECT_STREQ(chain::REASON_DUPLICATE_BLOCK, push(empty));
        EXPECT_EQ(3u, chain.block_count());
    }

    TEST_F(BlockchainTest, LongestBranchBecomesTip)
    {
        const util::h32 genesis = chain.current_hash();

        const chain::block a = tctest::create_block_with_base(genesis, {}, 0, alice.address);
        ASSERT_EQ(nullptr, push(a));
        const util::h32 a_hash = tctest::block_hash(a);
        EXPECT_EQ(a_hash, chain.current_hash());

        // Same height as the tip. Committed but the tip stays.
        const chain::block b = tctest::create_block_with_base(genesis, {}, 0, bob.address);
        ASSERT_EQ(nullptr, push(b));
        const util::h32 b_hash = tctest::block_hash(b);
        EXPECT_TRUE(chain.contains_block(b_hash));
        EXPECT_EQ(a_hash, chain.current_hash());
        EXPECT_EQ(1u, chain.current_height());

        // Extending the side branch overtakes the tip.
        const chain::block c = tctest::create_block_with_base(b_hash, {}, 0, bob.address);
        ASSERT_EQ(nullptr, push(c));
        EXPECT_EQ(tctest::block_hash(c), chain.current_hash());
        EXPECT_EQ(2u, chain.current_height());

        uint64_t height = 0;
        ASSERT_EQ(0, chain.get_height(height, b_hash));
        EXPECT_EQ(1u, height);
    }

} // namespace
