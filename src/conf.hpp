#ifndef _TC_CONF_
#define _TC_CONF_

#include "pchheader.hpp"
#include "util/util.hpp"
#include "chain/transaction.hpp"
#include "chain/blockchain.hpp"

/**
 * Manages the central config and context structs.
 * Contains functions to config operations such as create/rekey/load.
 */
namespace conf
{
    struct node_config
    {
        // Config elements which are initialized in memory (these are not directly loaded from the config file)
        std::string public_key;  // Node public key bytes
        std::string private_key; // Node private key bytes

        std::string public_key_hex;  // Node hex public key
        std::string private_key_hex; // Node hex private key
    };

    struct genesis_config
    {
        util::uint128_t nonce = 0;          // Nonce of the genesis block descriptor.
        std::vector<chain::tx_out> outputs; // Outputs seeded by the genesis transaction.
    };

    struct chain_config
    {
        size_t pow_difficulty = 0;                     // Leading zero bits required in block hashes (max: 8).
        size_t batch_size = chain::DEFAULT_BATCH_SIZE; // Pooled transactions per assembled block.
        genesis_config genesis;
    };

    // Holds contextual information about the currently loaded node.
    struct node_ctx
    {
        std::string command; // The CLI command issued to launch tipcore

        std::string node_dir;    // Node base directory full path.
        std::string log_dir;     // tipcore log dir full path.
        std::string config_dir;  // Config dir full path.
        std::string config_file; // Full path to the config file.

        int config_fd = -1;       // Config file file descriptor.
        struct flock config_lock; // Config file lock.
    };

    // Log severity levels used in tipcore.
    enum LOG_SEVERITY
    {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    struct log_config
    {
        std::string log_level;                   // Log severity level (dbg, inf, wrn, err)
        LOG_SEVERITY log_level_type;             // Log severity level enum (debug, info, warn, error)
        std::unordered_set<std::string> loggers; // List of enabled loggers (console, file)
        size_t max_mbytes_per_file = 0;          // Max MB size of a single log file.
        size_t max_file_count = 0;               // Max no. of log files to keep.
    };

    // Holds all the config values.
    struct tc_config
    {
        std::string version;
        node_config node;
        chain_config chain;
        log_config log;
    };

    // Global node context struct exposed to the application.
    // Other modules will access context values via this.
    extern node_ctx ctx;

    // Global configuration struct exposed to the application.
    // Other modules will access config values via this.
    extern tc_config cfg;

    int init();

    void deinit();

    int rekey();

    int create_node();

    int set_dir_paths(std::string basedir);

    int populate_chain_params(chain::chain_params &params, const tc_config &cfg);

    //------Internal-use functions for this namespace.

    int read_config(tc_config &cfg);

    int parse_config(tc_config &cfg, const jsoncons::ojson &d);

    int write_config(const tc_config &cfg);

    void populate_config_json(jsoncons::ojson &d, const tc_config &cfg);

    int validate_config(const tc_config &cfg);

    int validate_dir_paths();

    LOG_SEVERITY get_loglevel_type(std::string_view severity);

    int set_config_lock();

    int release_config_lock();

    int write_json_file(const std::string &file_path, const jsoncons::ojson &d);

} // namespace conf

#endif
