#ifndef _TC_UTIL_VERSION_
#define _TC_UTIL_VERSION_

#include "../pchheader.hpp"

namespace version
{
    // tipcore version. Written to new configs.
    constexpr const char *TC_VERSION = "0.1.0";

    // Oldest config version this build can load.
    constexpr const char *MIN_CONFIG_VERSION = "0.1.0";

    int parse_version(uint32_t (&numbers)[3], std::string_view str);

    int check_config_version(std::string_view config_version);

}

#endif
