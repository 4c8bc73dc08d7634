#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace objupload {
/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including whitespace.
 * @param s The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(std::string_view s, std::string_view err_on_empty);

/**
 * @brief Divide, rounding up.
 * @throw std::runtime_error if @p divisor is zero.
 */
uint64_t
ceil_div(uint64_t dividend, uint64_t divisor);

/**
 * @brief Format a byte count for display, e.g. "1.50 GiB".
 */
std::string
format_bytes(uint64_t nbytes);

/**
 * @brief How long to wait before retry number @p attempt (0-based).
 * @details 100 ms, doubling with each attempt, at most 10 s.
 */
std::chrono::milliseconds
retry_delay(uint32_t attempt);
} // namespace objupload
