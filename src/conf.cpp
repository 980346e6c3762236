#include "pchheader.hpp"
#include "conf.hpp"
#include "crypto.hpp"
#include "util/util.hpp"
#include "util/version.hpp"

namespace conf
{

    // Global node context struct exposed to the application.
    node_ctx ctx;

    // Global configuration struct exposed to the application.
    tc_config cfg;

    constexpr int FILE_PERMS = 0644;

    // Amount seeded to the node's own address in the genesis of a newly created node.
    constexpr uint64_t DEFAULT_GENESIS_AMOUNT = 1000000;

    bool init_success = false;

    /**
     * Loads and initializes the config for execution. Must be called once during application startup.
     * @return 0 for success. -1 for failure.
     */
    int init()
    {
        // The validations/loading needs to be in this order.
        // 1. Validate node directories
        // 2. Lock the config file
        // 3. Read and load the config into memory
        // 4. Validate the loaded config values

        if (validate_dir_paths() == -1 ||
            set_config_lock() == -1)
            return -1;

        if (read_config(cfg) == -1 ||
            validate_config(cfg) == -1)
        {
            release_config_lock();
            return -1;
        }

        init_success = true;
        return 0;
    }

    /**
     * Cleanup any resources.
     */
    void deinit()
    {
        if (init_success)
        {
            // Releases the config file lock at the termination.
            release_config_lock();
            init_success = false;
        }
    }

    /**
     * Generates and saves new signing keys in the config.
     */
    int rekey()
    {
        // Locking the config file at the startup. To check whether there's any already running tipcore instances.
        if (set_config_lock() == -1)
            return -1;

        // Load the config and re-save with the newly generated keys.
        tc_config cfg = {};
        if (read_config(cfg) != 0)
        {
            release_config_lock();
            return -1;
        }

        crypto::generate_signing_keys(cfg.node.public_key, cfg.node.private_key);
        cfg.node.public_key_hex = util::to_hex(cfg.node.public_key);
        cfg.node.private_key_hex = util::to_hex(cfg.node.private_key);

        if (write_config(cfg) != 0)
        {
            release_config_lock();
            return -1;
        }

        std::cout << "New signing keys generated at " << ctx.config_file << std::endl;

        // Releases the config file lock at the termination.
        release_config_lock();

        return 0;
    }

    /**
     * Creates a new node directory with the default config.
     * By the time this gets called, the 'ctx' struct must be populated.
     * This function makes use of the paths populated in the ctx.
     */
    int create_node()
    {
        if (util::is_dir_exists(ctx.node_dir))
        {
            std::cerr << "Node dir already exists. Cannot create node at the same location.\n";
            return -1;
        }

        // Recursivly create node directories. Return an error if unable to create
        if (util::create_dir_tree_recursive(ctx.config_dir) == -1 ||
            util::create_dir_tree_recursive(ctx.log_dir) == -1)
        {
            std::cerr << "ERROR: unable to create directories.\n";
            return -1;
        }

        //Create config file with default settings.

        //We populate the in-memory struct with default settings and then save it to the file.
        {
            tc_config cfg = {};

            crypto::generate_signing_keys(cfg.node.public_key, cfg.node.private_key);
            cfg.node.public_key_hex = util::to_hex(cfg.node.public_key);
            cfg.node.private_key_hex = util::to_hex(cfg.node.private_key);

            cfg.version = version::TC_VERSION;

            cfg.chain.pow_difficulty = 0;
            cfg.chain.batch_size = chain::DEFAULT_BATCH_SIZE;

            // Seed the genesis with an output owned by this node.
            chain::tx_out seed;
            crypto::get_pubkey_hash(seed.address, cfg.node.public_key);
            seed.amount = DEFAULT_GENESIS_AMOUNT;
            cfg.chain.genesis.outputs.push_back(seed);

            cfg.log.max_file_count = 50;
            cfg.log.max_mbytes_per_file = 10;
            cfg.log.log_level = "inf";
            cfg.log.loggers.emplace("console");
            cfg.log.loggers.emplace("file");

            //Save the default settings into the config file.
            if (write_config(cfg) != 0)
                return -1;
        }

        std::cout << "Node directory created at " << ctx.node_dir << std::endl;

        return 0;
    }

    /**
     * Updates the node context with directory paths based on provided base directory.
     * This is called after parsing tipcore command line arg in order to populate the ctx.
     * @return 0 on success. -1 if the directory argument is empty.
     */
    int set_dir_paths(std::string basedir)
    {
        if (basedir.empty())
        {
            std::cerr << "a node directory must be specified\n";
            return -1;
        }

        // resolving the path through realpath will remove any trailing slash if present
        // The directory may not exist yet when creating a new node.
        const std::string resolved = util::realpath(basedir);
        if (!resolved.empty())
            basedir = resolved;
        else if (basedir.size() > 1 && basedir.back() == '/')
            basedir.pop_back();

        ctx.node_dir = basedir;
        ctx.config_dir = basedir + "/cfg";
        ctx.config_file = ctx.config_dir + "/tipcore.cfg";
        ctx.log_dir = basedir + "/log";
        return 0;
    }

    /**
     * Builds the ledger construction parameters from the loaded config.
     * @return 0 on success. -1 if the node public key cannot be hashed into a reward address.
     */
    int populate_chain_params(chain::chain_params &params, const tc_config &cfg)
    {
        params.pow_difficulty = cfg.chain.pow_difficulty;
        params.batch_size = cfg.chain.batch_size;

        if (crypto::get_pubkey_hash(params.reward_address, cfg.node.public_key) == -1)
        {
            std::cerr << "Invalid node public key. Cannot derive reward address.\n";
            return -1;
        }

        std::vector<chain::transaction> genesis_txs;
        if (!cfg.chain.genesis.outputs.empty())
        {
            chain::transaction seed_tx;
            seed_tx.outputs = cfg.chain.genesis.outputs;
            genesis_txs.push_back(std::move(seed_tx));
        }

        params.genesis = chain::create_block(std::move(genesis_txs), util::h32_empty);
        params.genesis.desc.nonce = cfg.chain.genesis.nonce;
        return 0;
    }

    /**
     * Reads the config file on disk and populates the in-memory 'cfg' struct.
     * @return 0 for successful loading of config. -1 for failure.
     */
    int read_config(tc_config &cfg)
    {
        // Read the config file into json document object.
        std::string buf;
        if (util::read_from_fd(ctx.config_fd, buf) == -1)
        {
            std::cerr << "Error reading from the config file. " << errno << '\n';
            return -1;
        }

        jsoncons::ojson d;
        try
        {
            d = jsoncons::ojson::parse(buf, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            std::cerr << "Invalid config file format. " << e.what() << '\n';
            return -1;
        }
        buf.clear();

        return parse_config(cfg, d);
    }

    /**
     * Extracts missing config field from the jsoncons exception message.
     * @param err_message Jsoncons error message.
     * @return Missing config field.
    */
    const std::string extract_missing_field(std::string err_message)
    {
        err_message.erase(0, err_message.find("'") + 1);
        return err_message.substr(0, err_message.find("'"));
    }

    /**
     * Populates the 'cfg' struct from the parsed config json document.
     * @return 0 for successful loading of config. -1 for failure.
     */
    int parse_config(tc_config &cfg, const jsoncons::ojson &d)
    {
        try
        {
            // Check whether the version is specified.
            cfg.version = d["version"].as<std::string>();
            if (cfg.version.empty())
            {
                std::cerr << "Config version missing.\n";
                return -1;
            }

            // Check whether this config complies with the min version requirement.
            const int verresult = version::check_config_version(cfg.version);
            if (verresult == -1)
            {
                std::cerr << "Config version too old. Minimum "
                          << version::MIN_CONFIG_VERSION << " required. "
                          << cfg.version << " found.\n";
                return -1;
            }
            else if (verresult == -2)
            {
                std::cerr << "Malformed config version " << cfg.version << ". Expected <major>.<minor>.<patch>\n";
                return -1;
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Required config field version missing at " << ctx.config_file << std::endl;
            return -1;
        }

        // node
        {
            try
            {
                const jsoncons::ojson &node = d["node"];
                cfg.node.public_key_hex = node["public_key"].as<std::string>();
                cfg.node.private_key_hex = node["private_key"].as<std::string>();

                // Convert the hex keys to binary.
                cfg.node.public_key = util::to_bin(cfg.node.public_key_hex);
                if (cfg.node.public_key.empty())
                {
                    std::cerr << "Error decoding hex public key.\n";
                    return -1;
                }

                cfg.node.private_key = util::to_bin(cfg.node.private_key_hex);
                if (cfg.node.private_key.empty())
                {
                    std::cerr << "Error decoding hex private key.\n";
                    return -1;
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required node config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // chain
        {
            try
            {
                const jsoncons::ojson &chain_json = d["chain"];
                cfg.chain.pow_difficulty = chain_json["pow_difficulty"].as<size_t>();
                cfg.chain.batch_size = chain_json["batch_size"].as<size_t>();

                const jsoncons::ojson &genesis = chain_json["genesis"];
                const std::string nonce_bytes = util::to_bin(genesis["nonce"].as<std::string>());
                if (util::uint128_from_le_string_bytes(cfg.chain.genesis.nonce, nonce_bytes) == -1)
                {
                    std::cerr << "Invalid genesis nonce. 16 byte hex expected.\n";
                    return -1;
                }

                cfg.chain.genesis.outputs.clear();
                for (const auto &output : genesis["outputs"].array_range())
                {
                    chain::tx_out out;
                    const std::string address = util::to_bin(output["address"].as<std::string>());
                    if (address.size() != sizeof(util::h32))
                    {
                        std::cerr << "Invalid genesis output address: " << output["address"].as<std::string>() << "\n";
                        return -1;
                    }
                    out.address = address;
                    out.amount = output["amount"].as<uint64_t>();
                    cfg.chain.genesis.outputs.push_back(out);
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required chain config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // log
        {
            try
            {
                const jsoncons::ojson &log = d["log"];
                cfg.log.log_level = log["log_level"].as<std::string>();
                cfg.log.log_level_type = get_loglevel_type(cfg.log.log_level);
                cfg.log.max_mbytes_per_file = log["max_mbytes_per_file"].as<size_t>();
                cfg.log.max_file_count = log["max_file_count"].as<size_t>();
                cfg.log.loggers.clear();
                for (auto &v : log["loggers"].array_range())
                    cfg.log.loggers.emplace(v.as<std::string>());
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required log config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        return 0;
    }

    /**
     * Saves the provided 'cfg' struct into the config file.
     * @return 0 for successful save. -1 for failure.
     */
    int write_config(const tc_config &cfg)
    {
        jsoncons::ojson d;
        populate_config_json(d, cfg);
        return write_json_file(ctx.config_file, d);
    }

    /**
     * Populates the json document with 'cfg' values.
     * ojson is used instead of json to preserve insertion order.
     */
    void populate_config_json(jsoncons::ojson &d, const tc_config &cfg)
    {
        d.insert_or_assign("version", cfg.version);

        // Node config.
        {
            jsoncons::ojson node_config;
            node_config.insert_or_assign("public_key", cfg.node.public_key_hex);
            node_config.insert_or_assign("private_key", cfg.node.private_key_hex);
            d.insert_or_assign("node", node_config);
        }

        // Chain config.
        {
            jsoncons::ojson chain_config;
            chain_config.insert_or_assign("pow_difficulty", cfg.chain.pow_difficulty);
            chain_config.insert_or_assign("batch_size", cfg.chain.batch_size);

            jsoncons::ojson outputs(jsoncons::json_array_arg);
            for (const chain::tx_out &out : cfg.chain.genesis.outputs)
            {
                jsoncons::ojson output;
                output.insert_or_assign("address", util::to_hex(out.address.to_string_view()));
                output.insert_or_assign("amount", out.amount);
                outputs.push_back(output);
            }

            jsoncons::ojson genesis_config;
            genesis_config.insert_or_assign("nonce", util::to_hex(util::uint128_to_le_string_bytes(cfg.chain.genesis.nonce)));
            genesis_config.insert_or_assign("outputs", outputs);
            chain_config.insert_or_assign("genesis", genesis_config);
            d.insert_or_assign("chain", chain_config);
        }

        // Log configs.
        {
            jsoncons::ojson log_config;
            log_config.insert_or_assign("log_level", cfg.log.log_level);
            log_config.insert_or_assign("max_mbytes_per_file", cfg.log.max_mbytes_per_file);
            log_config.insert_or_assign("max_file_count", cfg.log.max_file_count);

            jsoncons::ojson loggers(jsoncons::json_array_arg);
            for (const std::string &logger : cfg.log.loggers)
            {
                loggers.push_back(logger);
            }
            log_config.insert_or_assign("loggers", loggers);
            d.insert_or_assign("log", log_config);
        }
    }

    /**
     * Validates the 'cfg' struct for invalid values.
     *
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_config(const tc_config &cfg)
    {
        // Check for non-empty signing keys.
        // We also check for key pair validity as well in the below code.
        if (cfg.node.public_key_hex.empty() || cfg.node.private_key_hex.empty())
        {
            std::cerr << "Signing keys missing. Run with 'rekey' to generate new keys.\n";
            return -1;
        }

        // Other required fields.

        bool fields_missing = false;

        fields_missing |= cfg.chain.batch_size == 0 && std::cerr << "Missing cfg field: batch_size. Batch size must be positive.\n";
        fields_missing |= cfg.log.log_level.empty() && std::cerr << "Missing cfg field: log_level\n";
        fields_missing |= cfg.log.loggers.empty() && std::cerr << "Missing cfg field: loggers\n";

        if (fields_missing)
        {
            std::cerr << "Required configuration fields missing at " << ctx.config_file << std::endl;
            return -1;
        }

        // Chain settings
        if (cfg.chain.pow_difficulty > chain::MAX_POW_DIFFICULTY)
        {
            std::cerr << "Chain pow_difficulty cannot exceed " << chain::MAX_POW_DIFFICULTY << "\n";
            return -1;
        }

        // Log settings
        const std::unordered_set<std::string> valid_loglevels({"dbg", "inf", "wrn", "err"});
        if (valid_loglevels.count(cfg.log.log_level) != 1)
        {
            std::cerr << "Invalid log_level configured. Valid values: dbg|inf|wrn|err\n";
            return -1;
        }

        const std::unordered_set<std::string> valid_loggers({"console", "file"});
        for (const std::string &logger : cfg.log.loggers)
        {
            if (valid_loggers.count(logger) != 1)
            {
                std::cerr << "Invalid logger. Valid values: console|file\n";
                return -1;
            }
        }

        //Sign and verify a sample message to ensure we have a matching signing key pair.
        const std::string msg = "tipcore";
        std::string sig;
        if (crypto::sign(sig, msg, cfg.node.private_key) == -1 ||
            crypto::verify(msg, sig, cfg.node.public_key) != 0)
        {
            std::cerr << "Invalid signing keys. Run with 'rekey' to generate new keys.\n";
            return -1;
        }

        return 0;
    }

    /**
     * Checks for the existence of all node sub directories.
     *
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_dir_paths()
    {
        const std::string paths[3] = {
            ctx.node_dir,
            ctx.config_file,
            ctx.log_dir};

        for (const std::string &path : paths)
        {
            if (!util::is_file_exists(path) && !util::is_dir_exists(path))
            {
                std::cerr << path << " does not exist.\n";
                return -1;
            }
        }

        return 0;
    }

    /**
     * Convert string to Log Severity enum type.
     * @param severity log severity code.
     * @return log severity type.
     */
    LOG_SEVERITY get_loglevel_type(std::string_view severity)
    {
        if (severity == "dbg")
            return LOG_SEVERITY::DEBUG;
        else if (severity == "wrn")
            return LOG_SEVERITY::WARN;
        else if (severity == "inf")
            return LOG_SEVERITY::INFO;
        else
            return LOG_SEVERITY::ERROR;
    }

    /**
     * Locks the config file so only one tipcore instance can run on a node directory.
     * @return Returns 0 if lock is successfully aquired, -1 on error.
    */
    int set_config_lock()
    {
        ctx.config_fd = open(ctx.config_file.data(), O_RDWR, 444);
        if (ctx.config_fd == -1)
        {
            std::cerr << errno << ": Error opening the config file " << ctx.config_file << "\n";
            return -1;
        }

        if (util::set_lock(ctx.config_fd, ctx.config_lock, true, 0, 0) == -1)
        {
            if (errno == EACCES || errno == EAGAIN)
            {
                std::cerr << "Another tipcore instance is already running in directory " << ctx.node_dir << "\n";
            }
            // Close fd if lock aquiring failed.
            close(ctx.config_fd);
            ctx.config_fd = -1;
            return -1;
        }

        return 0;
    }

    /**
     * Releases the config file and closes the opened file descriptor.
     * @return Returns 0 if lock is successfully released, -1 on error.
    */
    int release_config_lock()
    {
        if (ctx.config_fd == -1)
            return 0;

        const int res = util::release_lock(ctx.config_fd, ctx.config_lock);
        // Close fd in termination.
        close(ctx.config_fd);
        ctx.config_fd = -1;
        return res;
    }

    /**
     * Writes the given json doc to a file.
     * @param file_path Path to the file.
     * @param d A valid JSON document.
     * @return 0 on success. -1 on failure.
     */
    int write_json_file(const std::string &file_path, const jsoncons::ojson &d)
    {
        std::string json;
        // Convert json object to a string.
        try
        {
            jsoncons::json_options options;
            options.object_array_line_splits(jsoncons::line_split_kind::multi_line);
            options.spaces_around_comma(jsoncons::spaces_option::no_spaces);
            std::ostringstream os;
            os << jsoncons::pretty_print(d, options);
            json = os.str();
            os.clear();
        }
        catch (const std::exception &e)
        {
            std::cerr << "Converting json to string failed. " << file_path << std::endl;
            return -1;
        }

        // O_TRUNC flag is used to trucate existing content from the file.
        const int fd = open(file_path.data(), O_CREAT | O_RDWR | O_TRUNC, FILE_PERMS);
        if (fd == -1 || write(fd, json.data(), json.size()) == -1)
        {
            std::cerr << "Writing file failed. " << file_path << std::endl;
            if (fd != -1)
                close(fd);
            return -1;
        }
        close(fd);
        return 0;
    }

} // namespace conf
