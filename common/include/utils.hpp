#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace systemctl_mqtt::utils
{

// Longest accepted delay text
constexpr std::size_t maxDurationLength = 64;

// Longest accepted delay, ten years
constexpr std::chrono::hours maxDuration{24 * 365 * 10};

/**
 * @brief Renders a payload as a bytes literal, e.g. b'' or b'junk'.
 *        Non-printable bytes are written as \xNN escapes.
 */
std::string formatPayload(const std::string& payload);

/**
 * @brief Parses a relative delay.
 *
 * Accepts an empty string (no delay), a plain number of seconds ("90",
 * "2.5") or a sequence of number/unit pairs with units h, m, min, s, sec
 * ("1h30m", "45s").
 *
 * @throws systemctl_mqtt::ActionError on anything else, on text longer than
 *         maxDurationLength and on delays above maxDuration
 */
std::chrono::milliseconds parseDuration(const std::string& text);

/**
 * @brief Formats a point in time as local "YYYY-mm-dd HH:MM:SS"
 */
std::string formatTime(std::chrono::system_clock::time_point time);

/**
 * @brief Get the host name of this machine, empty on failure
 */
std::string getHostname();

} // namespace systemctl_mqtt::utils
