#ifndef _TC_FEED_FEED_
#define _TC_FEED_FEED_

#include "../pchheader.hpp"
#include "../chain/chain_node.hpp"

namespace feed
{
    int handle_feed_message(chain::chain_node &node, std::string_view message, std::vector<std::string> &replies);

    int run(chain::chain_node &node, std::istream &in, std::ostream &out);

} // namespace feed

#endif
