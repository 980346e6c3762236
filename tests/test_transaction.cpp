#include <gtest/gtest.h>
#include "pchheader.hpp"
#include "crypto.hpp"
#include "chain/transaction.hpp"
#include "chain/chain_common.hpp"
#include "test_helpers.hpp"

namespace
{
    TEST(TransactionTest, OutputHashCoversAddressAndAmount)
    {
        const tctest::keypair alice = tctest::create_keypair();
        const tctest::keypair bob = tctest::create_keypair();

        const util::h32 h = chain::get_tx_out_hash(chain::tx_out{alice.address, 10});
        EXPECT_EQ(h, chain::get_tx_out_hash(chain::tx_out{alice.address, 10}));
        EXPECT_NE(h, chain::get_tx_out_hash(chain::tx_out{alice.address, 11}));
        EXPECT_NE(h, chain::get_tx_out_hash(chain::tx_out{bob.address, 10}));
    }

    TEST(TransactionTest, SignedInputVerifiesAgainstSigningHash)
    {
        const tctest::keypair alice = tctest::create_keypair();
        const util::h32 source = tctest::random_hash();

        const chain::tx_in in = tctest::create_signed_input(source, 3, alice);
        EXPECT_EQ(alice.pubkey, in.pubkey);
        EXPECT_EQ(crypto::SIGNATURE_BYTES, in.sig.size());

        util::h32 signing_hash;
        ASSERT_EQ(0, chain::get_tx_in_signing_hash(signing_hash, in));
        EXPECT_EQ(0, crypto::verify(signing_hash.to_string_view(), in.sig, in.pubkey));

        // Signature is bound to the source output.
        chain::tx_in moved = in;
        moved.source.index = 4;
        ASSERT_EQ(0, chain::get_tx_in_signing_hash(signing_hash, moved));
        EXPECT_EQ(-1, crypto::verify(signing_hash.to_string_view(), moved.sig, moved.pubkey));
    }

    TEST(TransactionTest, InputHashIncludesSignature)
    {
        const tctest::keypair alice = tctest::create_keypair();
        chain::tx_in in = tctest::create_signed_input(tctest::random_hash(), 0, alice);

        util::h32 signing_before, hash_before;
        ASSERT_EQ(0, chain::get_tx_in_signing_hash(signing_before, in));
        ASSERT_EQ(0, chain::get_tx_in_hash(hash_before, in));

        in.sig[0] ^= 0x01;

        util::h32 signing_after, hash_after;
        ASSERT_EQ(0, chain::get_tx_in_signing_hash(signing_after, in));
        ASSERT_EQ(0, chain::get_tx_in_hash(hash_after, in));

        EXPECT_EQ(signing_before, signing_after);
        EXPECT_NE(hash_before, hash_after);
    }

    TEST(TransactionTest, HashDependsOnOutputOrder)
    {
        const tctest::keypair alice = tctest::create_keypair();
        const tctest::keypair bob = tctest::create_keypair();

        chain::transaction a;
        a.outputs = {chain::tx_out{alice.address, 1}, chain::tx_out{bob.address, 2}};
        chain::transaction b;
        b.outputs = {chain::tx_out{bob.address, 2}, chain::tx_out{alice.address, 1}};

        EXPECT_NE(tctest::tx_hash(a), tctest::tx_hash(b));
    }

    TEST(TransactionTest, MalformedPubkeyFailsHashing)
    {
        const tctest::keypair alice = tctest::create_keypair();
        chain::transaction tx = tctest::create_transfer(tctest::random_hash(), 0, alice, alice.address, 1);
        tx.inputs[0].pubkey = tx.inputs[0].pubkey.substr(1);

        util::h32 hash;
        EXPECT_EQ(-1, chain::get_transaction_hash(hash, tx));
    }

    TEST(TransactionTest, SigningWithMalformedKeyFails)
    {
        chain::tx_in in;
        in.source.tx_hash = tctest::random_hash();
        EXPECT_EQ(-1, chain::sign_tx_in(in, "not a key"));
    }

    TEST(TransactionTest, FindSourcePrefersLocalTransactions)
    {
        const tctest::keypair alice = tctest::create_keypair();
        const tctest::keypair bob = tctest::create_keypair();

        const chain::transaction local_tx = tctest::create_seed_transaction({chain::tx_out{alice.address, 5}});
        const chain::transaction chain_tx = tctest::create_seed_transaction({chain::tx_out{bob.address, 7}, chain::tx_out{bob.address, 8}});
        const util::h32 shared_hash = tctest::random_hash();
        const util::h32 chain_only_hash = tctest::random_hash();

        chain::transaction_ref_map local;
        local.emplace(shared_hash, &local_tx);

        chain::transaction_map committed;
        committed.emplace(shared_hash, chain_tx);
        committed.emplace(chain_only_hash, chain_tx);

        const chain::tx_out *source = NULL;
        ASSERT_EQ(nullptr, chain::find_source(source, chain::tx_out_ptr{shared_hash, 0}, local, committed));
        EXPECT_EQ(5u, source->amount);
        EXPECT_EQ(alice.address, source->address);

        ASSERT_EQ(nullptr, chain::find_source(source, chain::tx_out_ptr{chain_only_hash, 1}, local, committed));
        EXPECT_EQ(8u, source->amount);
    }

    TEST(TransactionTest, FindSourceRejectsDanglingPointers)
    {
        const tctest::keypair alice = tctest::create_keypair();
        const chain::transaction tx = tctest::create_seed_transaction({chain::tx_out{alice.address, 5}});
        const util::h32 hash = tctest::tx_hash(tx);

        chain::transaction_ref_map local;
        chain::transaction_map committed;
        committed.emplace(hash, tx);

        const chain::tx_out *source = NULL;
        EXPECT_STREQ(chain::REASON_DANGLING_REFERENCE, chain::find_source(source, chain::tx_out_ptr{hash, 1}, local, committed));
        EXPECT_STREQ(chain::REASON_DANGLING_REFERENCE, chain::find_source(source, chain::tx_out_ptr{tctest::random_hash(), 0}, local, committed));
        EXPECT_EQ(nullptr, source);
    }

} // namespace
