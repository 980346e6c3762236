#ifndef _TC_UTIL_UTIL_
#define _TC_UTIL_UTIL_

#include "../pchheader.hpp"

/**
 * Contains helper functions and data structures used by multiple other subsystems.
 */
namespace util
{
    // 128 bit unsigned integer used for block nonces.
    typedef unsigned __int128 uint128_t;

    constexpr size_t UINT128_BYTES = 16;

    const std::string to_hex(const std::string_view bin);

    const std::string to_bin(const std::string_view hex);

    const std::string realpath(const std::string &path);

    bool is_dir_exists(std::string_view path);

    bool is_file_exists(std::string_view path);

    int create_dir_tree_recursive(std::string_view path);

    int read_from_fd(const int fd, std::string &buf, const off_t offset = 0);

    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len);

    int release_lock(const int fd, struct flock &lock);

    void uint64_to_le_bytes(uint8_t *dest, const uint64_t x);

    uint64_t uint64_from_le_bytes(const uint8_t *data);

    const std::string uint64_to_le_string_bytes(const uint64_t x);

    const std::string uint128_to_le_string_bytes(const uint128_t x);

    int uint128_from_le_string_bytes(uint128_t &result, std::string_view bytes);

} // namespace util

#endif
