#include "../pchheader.hpp"
#include "../msg/chainmsg_common.hpp"
#include "../msg/json/chainmsg_json.hpp"
#include "feed.hpp"

namespace jmsg = msg::chainmsg::json;

namespace feed
{
    /**
     * Handles a single feed message and collects the node replies for it.
     * A transaction which completes a batch produces the queued reply followed by the broadcast of the new block.
     * @param node The node to submit to.
     * @param message One line of the feed. A json object with a 'type' field.
     * @param replies Serialized replies to be written back in order.
     * @return 0 if the message was processed successfully. -1 if it was rejected.
     */
    int handle_feed_message(chain::chain_node &node, std::string_view message, std::vector<std::string> &replies)
    {
        std::string reply;

        jsoncons::json d;
        if (jmsg::parse_feed_message(d, message) == -1)
        {
            jmsg::create_rejected_response(reply, msg::chainmsg::REASON_BAD_MSG_FORMAT);
            replies.push_back(std::move(reply));
            return -1;
        }

        std::string msg_type;
        jmsg::extract_type(msg_type, d);

        if (msg_type == msg::chainmsg::MSGTYPE_TRANSACTION)
        {
            chain::transaction tx;
            if (!d.contains(msg::chainmsg::FLD_TRANSACTION) || jmsg::extract_transaction(tx, d[msg::chainmsg::FLD_TRANSACTION]) == -1)
            {
                jmsg::create_rejected_response(reply, msg::chainmsg::REASON_BAD_MSG_FORMAT);
                replies.push_back(std::move(reply));
                return -1;
            }

            chain::action act;
            std::vector<chain::transaction> rejected_batch;
            const char *reject_reason = node.submit_transaction(tx, act, rejected_batch);
            if (reject_reason != NULL)
            {
                if (!rejected_batch.empty())
                    LOG_WARNING << "Dropped " << rejected_batch.size() << " pooled transactions. Block assembly failed: " << reject_reason;

                jmsg::create_rejected_response(reply, reject_reason);
                replies.push_back(std::move(reply));
                return -1;
            }

            jmsg::create_queued_response(reply);
            replies.push_back(std::move(reply));

            if (act.type == chain::ACTION_TYPE::BROADCAST_BLOCK && act.blk)
            {
                std::string broadcast;
                jmsg::create_broadcast_block(broadcast, *act.blk);
                replies.push_back(std::move(broadcast));
            }
            return 0;
        }
        else if (msg_type == msg::chainmsg::MSGTYPE_BLOCK)
        {
            chain::block b;
            if (!d.contains(msg::chainmsg::FLD_BLOCK) || jmsg::extract_block(b, d[msg::chainmsg::FLD_BLOCK]) == -1)
            {
                jmsg::create_rejected_response(reply, msg::chainmsg::REASON_BAD_MSG_FORMAT);
                replies.push_back(std::move(reply));
                return -1;
            }

            chain::block_body committed;
            const char *reject_reason = node.submit_block(b, committed);
            util::h32 block_hash;
            if (reject_reason == NULL && chain::get_block_hash(block_hash, b) == -1)
                reject_reason = chain::REASON_OWNERSHIP_MISMATCH;

            if (reject_reason != NULL)
            {
                jmsg::create_rejected_response(reply, reject_reason);
                replies.push_back(std::move(reply));
                return -1;
            }

            jmsg::create_accepted_response(reply, block_hash);
            replies.push_back(std::move(reply));
            return 0;
        }
        else if (msg_type == msg::chainmsg::MSGTYPE_TIP)
        {
            util::h32 tip;
            uint64_t height = 0;
            node.get_tip(tip, height);
            jmsg::create_tip_response(reply, tip, height);
            replies.push_back(std::move(reply));
            return 0;
        }

        LOG_DEBUG << "Invalid feed message type: " << msg_type;
        jmsg::create_rejected_response(reply, msg::chainmsg::REASON_INVALID_MSG_TYPE);
        replies.push_back(std::move(reply));
        return -1;
    }

    /**
     * Processes newline delimited feed messages until the input stream ends.
     * Empty lines are skipped. Every other line gets at least one reply line.
     * @return 0 when the input is exhausted. -1 if the output stream fails.
     */
    int run(chain::chain_node &node, std::istream &in, std::ostream &out)
    {
        std::string line;
        while (std::getline(in, line))
        {
            if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos)
                continue;

            std::vector<std::string> replies;
            handle_feed_message(node, line, replies);

            for (const std::string &reply : replies)
                out << reply << '\n';
            out.flush();

            if (!out)
            {
                LOG_ERROR << "Error writing feed replies.";
                return -1;
            }
        }

        return 0;
    }

} // namespace feed
