#ifndef _TC_CHAIN_BLOCK_
#define _TC_CHAIN_BLOCK_

#include "../pchheader.hpp"
#include "../util/h32.hpp"
#include "../util/util.hpp"
#include "transaction.hpp"

namespace chain
{
    /**
     * Header data attached to a block.
     */
    struct block_desc
    {
        util::h32 parent_hash;      // The block preceding this block in the tree.
        util::uint128_t nonce = 0;  // Adjusted by miners to satisfy proof of work.
    };

    /**
     * Transactions contained in a block. The first transaction is the base transaction.
     */
    struct block_body
    {
        std::vector<transaction> transactions;
    };

    struct block
    {
        block_desc desc;
        block_body body;
    };

    block create_block(std::vector<transaction> &&transactions, const util::h32 &parent_hash);

    int get_block_hash(util::h32 &hash, const block &b);

    bool pow_verified(const util::h32 &hash, const size_t difficulty);

} // namespace chain

#endif
