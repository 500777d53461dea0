#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format an elapsed time compactly, e.g. `850ms`, `2.4s` or `1m3s`.
 */
std::string format_elapsed(std::chrono::milliseconds dur);

/**
 * @brief Convert a delay expressed in fractional seconds to milliseconds.
 *
 * Negative input yields zero.
 */
std::chrono::milliseconds seconds_to_ms(double seconds);

#endif // TIME_UTILS_HPP
