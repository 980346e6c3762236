#ifndef _TC_MSG_JSON_CHAINMSG_JSON_
#define _TC_MSG_JSON_CHAINMSG_JSON_

#include "../../pchheader.hpp"
#include "../../util/h32.hpp"
#include "../../chain/transaction.hpp"
#include "../../chain/block.hpp"

namespace msg::chainmsg::json
{
    int extract_hash_field(util::h32 &hash, const jsoncons::json &d, const char *field);

    int extract_hex_field(std::string &bin, const jsoncons::json &d, const char *field);

    void populate_transaction(jsoncons::json &d, const chain::transaction &tx);

    void populate_block(jsoncons::json &d, const chain::block &b);

    int extract_transaction(chain::transaction &tx, const jsoncons::json &d);

    int extract_block(chain::block &b, const jsoncons::json &d);

    int parse_feed_message(jsoncons::json &d, std::string_view message);

    int extract_type(std::string &extracted_type, const jsoncons::json &d);

    void create_broadcast_block(std::string &msg, const chain::block &b);

    void create_accepted_response(std::string &msg, const util::h32 &block_hash);

    void create_queued_response(std::string &msg);

    void create_rejected_response(std::string &msg, std::string_view reason);

    void create_tip_response(std::string &msg, const util::h32 &tip_hash, const uint64_t height);

} // namespace msg::chainmsg::json

#endif
