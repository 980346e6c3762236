/**
    Entry point for tipcore
**/

#include "pchheader.hpp"
#include "util/version.hpp"
#include "util/util.hpp"
#include "conf.hpp"
#include "crypto.hpp"
#include "tclog.hpp"
#include "chain/chain_node.hpp"
#include "feed/feed.hpp"

/**
 * Parses CLI args and extracts tipcore command and parameters given.
 * tipcore command line accepts command and the node directory(optional)
 */
int parse_cmd(int argc, char **argv)
{
    if (argc > 1) //We get working dir as an arg anyway. So we need to check for >1 args.
    {
        // We populate the global node ctx with the detected command.
        conf::ctx.command = argv[1];

        // For run/new/rekey, node directory argument must be specified.

        if (conf::ctx.command == "run" || conf::ctx.command == "new" || conf::ctx.command == "rekey")
        {
            if (argc != 3)
            {
                std::cerr << "Node directory not specified.\n";
            }
            else
            {
                // We inform the conf subsystem to populate the node directory context values
                // based on the directory argument from the command line.
                return conf::set_dir_paths(argv[2]);
            }
        }
        else if (conf::ctx.command == "version")
        {
            if (argc == 2)
                return 0;
        }
    }

    // If all extractions fail display help message.

    std::cerr << "Arguments mismatch.\n";
    std::cout << "Usage:\n";
    std::cout << "tipcore version\n";
    std::cout << "tipcore <command> <node dir> (command = run | new | rekey)\n";
    std::cout << "Example: tipcore run ~/mynode\n";

    return -1;
}

/**
 * Performs any cleanup on graceful application termination.
 */
void deinit()
{
    conf::deinit();
}

void sig_exit_handler(int signum)
{
    LOG_WARNING << "Interrupt signal (" << signum << ") received.";
    deinit();
    LOG_WARNING << "tipcore exited due to signal.";
    exit(signum);
}

void segfault_handler(int signum)
{
    std::cerr << boost::stacktrace::stacktrace() << "\n";
    exit(SIGABRT);
}

/**
 * Global exception handler for std exceptions.
 */
void std_terminate() noexcept
{
    std::exception_ptr exptr = std::current_exception();
    if (exptr != 0)
    {
        try
        {
            std::rethrow_exception(exptr);
        }
        catch (std::exception &ex)
        {
            LOG_ERROR << "std error: " << ex.what();
        }
        catch (...)
        {
            LOG_ERROR << "std error: Terminated due to unknown exception";
        }
    }
    else
    {
        LOG_ERROR << "std error: Terminated due to unknown reason";
    }

    LOG_ERROR << boost::stacktrace::stacktrace();

    exit(1);
}

/**
 * Builds the ledger from the configured genesis and serves the stdin feed until it closes.
 */
int run_node()
{
    chain::chain_params params;
    if (conf::populate_chain_params(params, conf::cfg) == -1)
        return -1;

    chain::chain_node node;
    if (node.init(params) == -1)
    {
        LOG_ERROR << "Ledger initialization failed.";
        return -1;
    }

    LOG_INFO << "Genesis: " << node.current_tip() << " pow difficulty: " << conf::cfg.chain.pow_difficulty
             << " batch size: " << conf::cfg.chain.batch_size;

    // Replies go to stdout one per line. Logs never share the stream.
    if (feed::run(node, std::cin, std::cout) == -1)
        return -1;

    LOG_INFO << "Feed closed. Tip: " << node.current_tip() << " height: " << node.current_height();
    return 0;
}

int main(int argc, char **argv)
{
    // Register exception and segfault handlers.
    std::set_terminate(&std_terminate);
    signal(SIGSEGV, &segfault_handler);
    signal(SIGABRT, &segfault_handler);

    // Extract the CLI args
    // This call will populate conf::ctx
    if (parse_cmd(argc, argv) != 0)
        return -1;

    if (conf::ctx.command == "version")
    {
        // Print the version
        std::cout << "tipcore " << version::TC_VERSION << std::endl;
    }
    else
    {
        // This block is about node operations (new/rekey/run)
        // All the node operations will be executed on the node directory specified
        // in the command line args. 'parse_cmd()' above takes care of populating the contexual directory paths.

        // For any node opreation to execute, we should init the crypto subsystem.
        if (crypto::init() != 0)
            return -1;

        if (conf::ctx.command == "new")
        {
            // This will create a new node with all the required files.
            if (conf::create_node() != 0)
                return -1;
        }
        else if (conf::ctx.command == "rekey")
        {
            // This will generate new signing keys for the node.
            if (conf::rekey() != 0)
                return -1;
        }
        else if (conf::ctx.command == "run")
        {
            if (conf::init() != 0)
                return -1;

            if (tclog::init(conf::cfg.log, conf::ctx.log_dir) == -1)
            {
                deinit();
                return -1;
            }

            LOG_INFO << "tipcore " << version::TC_VERSION;
            LOG_INFO << "Public key: " << conf::cfg.node.public_key_hex;

            signal(SIGINT, &sig_exit_handler);
            signal(SIGTERM, &sig_exit_handler);

            const int res = run_node();
            deinit();
            if (res == -1)
                return -1;
        }
    }

    std::cerr << "tipcore exited normally.\n";
    return 0;
}
