#ifndef _TC_MSG_CHAINMSG_COMMON_
#define _TC_MSG_CHAINMSG_COMMON_

#include "../pchheader.hpp"

namespace msg::chainmsg
{
    // Message field names
    constexpr const char *FLD_TYPE = "type";
    constexpr const char *FLD_TRANSACTION = "transaction";
    constexpr const char *FLD_TRANSACTIONS = "transactions";
    constexpr const char *FLD_BLOCK = "block";
    constexpr const char *FLD_INPUTS = "inputs";
    constexpr const char *FLD_OUTPUTS = "outputs";
    constexpr const char *FLD_SIG = "sig";
    constexpr const char *FLD_PUBKEY = "pubkey";
    constexpr const char *FLD_SOURCE = "source";
    constexpr const char *FLD_TX = "tx";
    constexpr const char *FLD_INDEX = "index";
    constexpr const char *FLD_ADDRESS = "address";
    constexpr const char *FLD_AMOUNT = "amount";
    constexpr const char *FLD_PARENT = "parent";
    constexpr const char *FLD_NONCE = "nonce";
    constexpr const char *FLD_HASH = "hash";
    constexpr const char *FLD_HEIGHT = "height";
    constexpr const char *FLD_REASON = "reason";

    // Message types
    constexpr const char *MSGTYPE_TRANSACTION = "transaction";
    constexpr const char *MSGTYPE_BLOCK = "block";
    constexpr const char *MSGTYPE_TIP = "tip";
    constexpr const char *MSGTYPE_BROADCAST_BLOCK = "broadcast_block";
    constexpr const char *MSGTYPE_ACCEPTED = "accepted";
    constexpr const char *MSGTYPE_QUEUED = "queued";
    constexpr const char *MSGTYPE_REJECTED = "rejected";

    // Reason for feed messages which could not be parsed.
    constexpr const char *REASON_BAD_MSG_FORMAT = "bad_msg_format";
    constexpr const char *REASON_INVALID_MSG_TYPE = "invalid_msg_type";

} // namespace msg::chainmsg

#endif
