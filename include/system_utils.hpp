#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <map>
#include <string>
#include <vector>
#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace procutil {

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Used for the pipe
 * ends connecting the engine to child processes.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    void reset(int f = -1) noexcept {
        if (fd >= 0) {
#ifdef _WIN32
            _close(fd);
#else
            close(fd);
#endif
        }
        fd = f;
    }

  private:
    int fd;
};

/**
 * @brief Locate @p name on `PATH`.
 *
 * Names containing a directory separator are returned unchanged.
 *
 * @return Absolute path of the executable or an empty string when not found.
 */
std::string resolve_executable(const std::string& name);

/**
 * @brief Snapshot the current environment as `KEY=VALUE` strings.
 *
 * Entries in @p overrides replace inherited ones with the same key.
 */
std::vector<std::string> environment_with(const std::map<std::string, std::string>& overrides);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
