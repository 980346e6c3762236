#ifndef _TC_CHAIN_CHAIN_COMMON_
#define _TC_CHAIN_CHAIN_COMMON_

#include "../pchheader.hpp"

namespace chain
{
    constexpr size_t DEFAULT_BATCH_SIZE = 16; // No. of pooled transactions that triggers block assembly.
    constexpr size_t MAX_POW_DIFFICULTY = 8;  // PoW difficulty is counted in leading zero bits of the first hash byte.

    // Rejection reasons reported by ledger operations. NULL indicates success.
    constexpr const char *REASON_INSUFFICIENT_WORK = "insufficient_work";
    constexpr const char *REASON_DANGLING_REFERENCE = "dangling_reference";
    constexpr const char *REASON_OWNERSHIP_MISMATCH = "ownership_mismatch";
    constexpr const char *REASON_INVALID_SIGNATURE = "invalid_signature";
    constexpr const char *REASON_DOUBLE_SPEND = "double_spend";
    constexpr const char *REASON_UNBALANCED_TX = "unbalanced_tx";
    constexpr const char *REASON_UNBALANCED_BLOCK = "unbalanced_block";
    constexpr const char *REASON_MALFORMED_BASE_TX = "malformed_base_tx";
    constexpr const char *REASON_UNKNOWN_PARENT = "unknown_parent";
    constexpr const char *REASON_HEIGHT_OVERFLOW = "height_overflow";
    constexpr const char *REASON_DUPLICATE_BLOCK = "duplicate_block";
    constexpr const char *REASON_DUPLICATE_TX = "duplicate_tx";

} // namespace chain

#endif
