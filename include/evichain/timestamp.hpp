#ifndef EVICHAIN_TIMESTAMP_HPP
#define EVICHAIN_TIMESTAMP_HPP

#include <chrono>
#include <string>

namespace evichain {

/**
 * @brief ISO-8601 UTC timestamp with millisecond precision,
 * e.g. "2024-03-01T12:30:45.123Z".
 */
std::string isoTimestamp(std::chrono::system_clock::time_point tp);
std::string isoTimestamp();

/// ISO timestamp with ':' and '.' replaced by '-', safe for file names.
std::string fileSafeTimestamp(const std::string &iso);

} // namespace evichain

#endif // EVICHAIN_TIMESTAMP_HPP
