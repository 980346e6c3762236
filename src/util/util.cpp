#include "../pchheader.hpp"
#include "util.hpp"

namespace util
{
    constexpr mode_t DIR_PERMS = 0755;

    const std::string to_hex(const std::string_view bin)
    {
        // Allocate the target string.
        std::string encoded_string;
        encoded_string.resize(bin.size() * 2);

        // Get encoded string.
        sodium_bin2hex(
            encoded_string.data(),
            encoded_string.length() + 1, // + 1 because sodium writes ending '\0' character as well.
            reinterpret_cast<const unsigned char *>(bin.data()),
            bin.size());
        return encoded_string;
    }

    const std::string to_bin(const std::string_view hex)
    {
        std::string bin;
        bin.resize(hex.size() / 2);

        const char *hex_end;
        size_t bin_len;
        if (sodium_hex2bin(
                reinterpret_cast<unsigned char *>(bin.data()), bin.size(),
                hex.data(), hex.size(),
                "", &bin_len, &hex_end))
        {
            return ""; // Empty indicates error.
        }

        // Odd length or trailing garbage is treated as an error as well.
        if (bin_len != bin.size() || hex_end != hex.data() + hex.size())
            return "";

        return bin;
    }

    // Provide a safe std::string overload for realpath
    const std::string realpath(const std::string &path)
    {
        char buffer[PATH_MAX];
        if (!::realpath(path.c_str(), buffer))
            return {};

        buffer[PATH_MAX - 1] = '\0';
        return buffer;
    }

    /**
     * Check whether given directory exists. 
     * @param path Directory path.
     * @return Returns true if given directory exists otherwise false.
     */
    bool is_dir_exists(std::string_view path)
    {
        struct stat st;
        return (stat(path.data(), &st) == 0 && S_ISDIR(st.st_mode));
    }

    /**
     * Check whether given file exists. 
     * @param path File path.
     * @return Returns true if give file exists otherwise false.
     */
    bool is_file_exists(std::string_view path)
    {
        struct stat st;
        return (stat(path.data(), &st) == 0 && S_ISREG(st.st_mode));
    }

    /**
     * Recursively creates directories and sub-directories if not exist. 
     * @param path Directory path.
     * @return Returns 0 operations succeeded otherwise -1.
     */
    int create_dir_tree_recursive(std::string_view path)
    {
        if (strcmp(path.data(), "/") == 0 || strcmp(path.data(), ".") == 0) // No need of checking if we are at root.
            return 0;

        // Check whether this dir exists or not.
        struct stat st;
        if (stat(path.data(), &st) != 0 || !S_ISDIR(st.st_mode))
        {
            // Check and create parent dir tree first.
            char *path2 = strdup(path.data());
            char *parent_dir_path = dirname(path2);
            bool error_thrown = false;

            if (create_dir_tree_recursive(parent_dir_path) == -1)
                error_thrown = true;

            free(path2);

            // Create this dir.
            if (!error_thrown && mkdir(path.data(), DIR_PERMS) == -1)
            {
                std::cerr << errno << ": Error in recursive dir creation. " << path << "\n";
                error_thrown = true;
            }

            if (error_thrown)
                return -1;
        }

        return 0;
    }

    /**
     * Reads the entire file from given file discriptor. 
     * @param fd File descriptor to be read.
     * @param buf String buffer to be populated.
     * @param offset Begin offset of the file to read.
     * @return Returns number of bytes read in a successful read and -1 on error.
    */
    int read_from_fd(const int fd, std::string &buf, const off_t offset)
    {
        struct stat st;
        if (fstat(fd, &st) == -1)
        {
            std::cerr << errno << ": Error in stat for reading entire file.\n";
            return -1;
        }

        buf.resize(st.st_size - offset);

        return pread(fd, buf.data(), buf.size(), offset);
    }

    /**
     * Acquires a record lock on the file descriptor.
     * @param fd File descriptor to be locked.
     * @param lock File lock.
     * @param is_rwlock Whether the record lock is a write lock.
     * @param start Starting offset for the lock.
     * @param len Number of bytes to lock.
     * @return Returns 0 if lock is successfully acquired, -1 on error.
    */
    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len)
    {
        lock.l_type = is_rwlock ? F_WRLCK : F_RDLCK;
        lock.l_whence = SEEK_SET;
        lock.l_start = start,
        lock.l_len = len;
        return fcntl(fd, F_SETLK, &lock);
    }

    /**
     * Releases the lock on file descriptor.
     * @param fd File descriptor to be released.
     * @param lock File lock.
     * @return Returns 0 if lock is successfully released, -1 on error.
    */
    int release_lock(const int fd, struct flock &lock)
    {
        lock.l_type = F_UNLCK;
        return fcntl(fd, F_SETLKW, &lock);
    }

    /**
     * Write the given uint64_t number to the given memory location in little endian format.
     * @param dest Memory location to write. Must have room for 8 bytes.
     * @param x Number to write.
     */
    void uint64_to_le_bytes(uint8_t *dest, const uint64_t x)
    {
        for (int i = 0; i < 8; i++)
            dest[i] = (uint8_t)((x >> (8 * i)) & 0xff);
    }

    /**
     * Read the uint64_t number from the given byte array which is in little endian format.
     */
    uint64_t uint64_from_le_bytes(const uint8_t *data)
    {
        uint64_t x = 0;
        for (int i = 7; i >= 0; i--)
            x = (x << 8) | data[i];
        return x;
    }

    /**
     * Returns a string buffer containing little endian uint64 bytes.
     */
    const std::string uint64_to_le_string_bytes(const uint64_t x)
    {
        std::string s;
        s.resize(sizeof(uint64_t));
        uint64_to_le_bytes((uint8_t *)s.data(), x);
        return s;
    }

    /**
     * Returns a 16 byte string buffer containing the little endian bytes of a 128 bit number.
     */
    const std::string uint128_to_le_string_bytes(const uint128_t x)
    {
        std::string s;
        s.resize(UINT128_BYTES);
        uint64_to_le_bytes((uint8_t *)s.data(), (uint64_t)x);
        uint64_to_le_bytes((uint8_t *)s.data() + 8, (uint64_t)(x >> 64));
        return s;
    }

    /**
     * Reads a 128 bit number from 16 little endian bytes.
     * @return 0 on success. -1 if the buffer is not exactly 16 bytes.
     */
    int uint128_from_le_string_bytes(uint128_t &result, std::string_view bytes)
    {
        if (bytes.size() != UINT128_BYTES)
            return -1;

        const uint8_t *data = reinterpret_cast<const uint8_t *>(bytes.data());
        const uint128_t low = uint64_from_le_bytes(data);
        const uint128_t high = uint64_from_le_bytes(data + 8);
        result = (high << 64) | low;
        return 0;
    }

} // namespace util
