#include "../pchheader.hpp"
#include "version.hpp"

namespace version
{
    /**
     * Parses a "<major>.<minor>.<patch>" version string as written by tipcore.
     * @param numbers Populated with the major, minor and patch numbers.
     * @return 0 on success. -1 if the string is not exactly three dot separated numbers.
     */
    int parse_version(uint32_t (&numbers)[3], std::string_view str)
    {
        const char *pos = str.data();
        const char *end = str.data() + str.size();

        for (size_t i = 0; i < 3; i++)
        {
            if (i > 0)
            {
                if (pos == end || *pos != '.')
                    return -1;
                pos++;
            }

            const std::from_chars_result res = std::from_chars(pos, end, numbers[i]);
            if (res.ec != std::errc() || res.ptr == pos)
                return -1;
            pos = res.ptr;
        }

        return pos == end ? 0 : -1;
    }

    /**
     * Checks whether a config file written with the given version can be loaded by this build.
     * @return 0 if compatible. -1 if older than MIN_CONFIG_VERSION. -2 if the version is malformed.
     */
    int check_config_version(std::string_view config_version)
    {
        uint32_t config[3];
        uint32_t minimum[3];
        if (parse_version(config, config_version) == -1 ||
            parse_version(minimum, MIN_CONFIG_VERSION) == -1)
            return -2;

        return std::lexicographical_compare(config, config + 3, minimum, minimum + 3) ? -1 : 0;
    }
}
