#include "../../pchheader.hpp"
#include "../../util/util.hpp"
#include "../../crypto.hpp"
#include "../chainmsg_common.hpp"
#include "chainmsg_json.hpp"

namespace msg::chainmsg::json
{
    /**
     * Reads a hex encoded 32 byte hash field.
     * @return 0 on success. -1 if the field is missing or not a 32 byte hex string.
     */
    int extract_hash_field(util::h32 &hash, const jsoncons::json &d, const char *field)
    {
        if (!d.contains(field) || !d[field].is<std::string>())
            return -1;

        const std::string bin = util::to_bin(d[field].as<std::string_view>());
        if (bin.size() != sizeof(util::h32))
            return -1;

        hash = bin;
        return 0;
    }

    /**
     * Reads a hex encoded binary field of any non-zero length.
     * @return 0 on success. -1 if the field is missing or not valid hex.
     */
    int extract_hex_field(std::string &bin, const jsoncons::json &d, const char *field)
    {
        if (!d.contains(field) || !d[field].is<std::string>())
            return -1;

        bin = util::to_bin(d[field].as<std::string_view>());
        return bin.empty() ? -1 : 0;
    }

    /**
     * Populates the json object with the transaction.
     *          {
     *            "inputs": [{ "sig": "<hex>", "pubkey": "<hex>", "source": { "tx": "<hex>", "index": <integer> } }],
     *            "outputs": [{ "address": "<hex>", "amount": <integer> }]
     *          }
     */
    void populate_transaction(jsoncons::json &d, const chain::transaction &tx)
    {
        jsoncons::json inputs(jsoncons::json_array_arg);
        for (const chain::tx_in &in : tx.inputs)
        {
            jsoncons::json source;
            source.insert_or_assign(FLD_TX, util::to_hex(in.source.tx_hash.to_string_view()));
            source.insert_or_assign(FLD_INDEX, in.source.index);

            jsoncons::json input;
            input.insert_or_assign(FLD_SIG, util::to_hex(in.sig));
            input.insert_or_assign(FLD_PUBKEY, util::to_hex(in.pubkey));
            input.insert_or_assign(FLD_SOURCE, source);
            inputs.push_back(input);
        }

        jsoncons::json outputs(jsoncons::json_array_arg);
        for (const chain::tx_out &out : tx.outputs)
        {
            jsoncons::json output;
            output.insert_or_assign(FLD_ADDRESS, util::to_hex(out.address.to_string_view()));
            output.insert_or_assign(FLD_AMOUNT, out.amount);
            outputs.push_back(output);
        }

        d.insert_or_assign(FLD_INPUTS, inputs);
        d.insert_or_assign(FLD_OUTPUTS, outputs);
    }

    /**
     * Populates the json object with the block.
     *          {
     *            "parent": "<hex>",
     *            "nonce": "<hex of 16 byte little endian nonce>",
     *            "transactions": [<transaction>, ...]
     *          }
     */
    void populate_block(jsoncons::json &d, const chain::block &b)
    {
        jsoncons::json transactions(jsoncons::json_array_arg);
        for (const chain::transaction &tx : b.body.transactions)
        {
            jsoncons::json tx_json;
            populate_transaction(tx_json, tx);
            transactions.push_back(tx_json);
        }

        d.insert_or_assign(FLD_PARENT, util::to_hex(b.desc.parent_hash.to_string_view()));
        d.insert_or_assign(FLD_NONCE, util::to_hex(util::uint128_to_le_string_bytes(b.desc.nonce)));
        d.insert_or_assign(FLD_TRANSACTIONS, transactions);
    }

    /**
     * Extracts a transaction from the json object. Format as in populate_transaction().
     * Only the encoding is checked here. Keys and signatures are checked by the ledger.
     * @return 0 on successful extraction. -1 for failure.
     */
    int extract_transaction(chain::transaction &tx, const jsoncons::json &d)
    {
        if (!d.is_object() ||
            !d.contains(FLD_INPUTS) || !d[FLD_INPUTS].is_array() ||
            !d.contains(FLD_OUTPUTS) || !d[FLD_OUTPUTS].is_array())
        {
            LOG_DEBUG << "Transaction inputs/outputs missing or invalid.";
            return -1;
        }

        tx.inputs.clear();
        tx.outputs.clear();

        for (const auto &input : d[FLD_INPUTS].array_range())
        {
            chain::tx_in in;
            if (!input.is_object() ||
                extract_hex_field(in.sig, input, FLD_SIG) == -1 ||
                extract_hex_field(in.pubkey, input, FLD_PUBKEY) == -1 ||
                !input.contains(FLD_SOURCE) || !input[FLD_SOURCE].is_object())
            {
                LOG_DEBUG << "Transaction input fields missing or invalid.";
                return -1;
            }

            const jsoncons::json &source = input[FLD_SOURCE];
            if (extract_hash_field(in.source.tx_hash, source, FLD_TX) == -1 ||
                !source.contains(FLD_INDEX) || !source[FLD_INDEX].is<uint64_t>())
            {
                LOG_DEBUG << "Transaction input source missing or invalid.";
                return -1;
            }
            in.source.index = source[FLD_INDEX].as<uint64_t>();

            tx.inputs.push_back(std::move(in));
        }

        for (const auto &output : d[FLD_OUTPUTS].array_range())
        {
            chain::tx_out out;
            if (!output.is_object() ||
                extract_hash_field(out.address, output, FLD_ADDRESS) == -1 ||
                !output.contains(FLD_AMOUNT) || !output[FLD_AMOUNT].is<uint64_t>())
            {
                LOG_DEBUG << "Transaction output fields missing or invalid.";
                return -1;
            }
            out.amount = output[FLD_AMOUNT].as<uint64_t>();

            tx.outputs.push_back(std::move(out));
        }

        return 0;
    }

    /**
     * Extracts a block from the json object. Format as in populate_block().
     * @return 0 on successful extraction. -1 for failure.
     */
    int extract_block(chain::block &b, const jsoncons::json &d)
    {
        if (!d.is_object() || extract_hash_field(b.desc.parent_hash, d, FLD_PARENT) == -1)
        {
            LOG_DEBUG << "Block 'parent' field missing or invalid.";
            return -1;
        }

        std::string nonce_bytes;
        if (extract_hex_field(nonce_bytes, d, FLD_NONCE) == -1 ||
            util::uint128_from_le_string_bytes(b.desc.nonce, nonce_bytes) == -1)
        {
            LOG_DEBUG << "Block 'nonce' field missing or invalid.";
            return -1;
        }

        if (!d.contains(FLD_TRANSACTIONS) || !d[FLD_TRANSACTIONS].is_array())
        {
            LOG_DEBUG << "Block 'transactions' field missing or invalid.";
            return -1;
        }

        b.body.transactions.clear();
        for (const auto &tx_json : d[FLD_TRANSACTIONS].array_range())
        {
            chain::transaction tx;
            if (extract_transaction(tx, tx_json) == -1)
                return -1;
            b.body.transactions.push_back(std::move(tx));
        }

        return 0;
    }

    /**
     * Parses a json feed message submitted to the node.
     * @param d Jsoncons document to which the parsed json should be loaded.
     * @param message The message to parse.
     *                Accepted message format:
     *                {
     *                  'type': 'transaction' | 'block' | 'tip'
     *                  ...
     *                }
     * @return 0 on successful parsing. -1 for failure.
     */
    int parse_feed_message(jsoncons::json &d, std::string_view message)
    {
        try
        {
            d = jsoncons::json::parse(message, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            LOG_DEBUG << "Feed json message parsing failed. " << e.what();
            return -1;
        }

        // Check existence of msg type field.
        if (!d.is_object() || !d.contains(FLD_TYPE) || !d[FLD_TYPE].is<std::string>())
        {
            LOG_DEBUG << "Feed json message 'type' missing or invalid.";
            return -1;
        }

        return 0;
    }

    /**
     * Extracts the message 'type' value from the json document.
     */
    int extract_type(std::string &extracted_type, const jsoncons::json &d)
    {
        extracted_type = d[FLD_TYPE].as<std::string>();
        return 0;
    }

    /**
     * Constructs the message announcing an accepted block to peers.
     *          {
     *            "type": "broadcast_block",
     *            "hash": "<hex>",
     *            "block": <block>
     *          }
     */
    void create_broadcast_block(std::string &msg, const chain::block &b)
    {
        util::h32 block_hash;
        chain::get_block_hash(block_hash, b);

        jsoncons::json block_json;
        populate_block(block_json, b);

        jsoncons::json d;
        d.insert_or_assign(FLD_TYPE, MSGTYPE_BROADCAST_BLOCK);
        d.insert_or_assign(FLD_HASH, util::to_hex(block_hash.to_string_view()));
        d.insert_or_assign(FLD_BLOCK, block_json);
        d.dump(msg);
    }

    void create_accepted_response(std::string &msg, const util::h32 &block_hash)
    {
        jsoncons::json d;
        d.insert_or_assign(FLD_TYPE, MSGTYPE_ACCEPTED);
        d.insert_or_assign(FLD_HASH, util::to_hex(block_hash.to_string_view()));
        d.dump(msg);
    }

    void create_queued_response(std::string &msg)
    {
        jsoncons::json d;
        d.insert_or_assign(FLD_TYPE, MSGTYPE_QUEUED);
        d.dump(msg);
    }

    void create_rejected_response(std::string &msg, std::string_view reason)
    {
        jsoncons::json d;
        d.insert_or_assign(FLD_TYPE, MSGTYPE_REJECTED);
        d.insert_or_assign(FLD_REASON, std::string(reason));
        d.dump(msg);
    }

    void create_tip_response(std::string &msg, const util::h32 &tip_hash, const uint64_t height)
    {
        jsoncons::json d;
        d.insert_or_assign(FLD_TYPE, MSGTYPE_TIP);
        d.insert_or_assign(FLD_HASH, util::to_hex(tip_hash.to_string_view()));
        d.insert_or_assign(FLD_HEIGHT, height);
        d.dump(msg);
    }

} // namespace msg::chainmsg::json
