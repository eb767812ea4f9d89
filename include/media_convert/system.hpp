/**
 * @file system.hpp
 * @brief System and text utilities
 *
 * @details Provides:
 *
 *          - Executable lookup on PATH
 *
 *          - Case folding, trimming and extension helpers for locators
 *
 *          - Time formatting utilities
 */

#ifndef MEDIA_CONVERT_SYSTEM_HPP
#define MEDIA_CONVERT_SYSTEM_HPP

#include <string>

namespace media_convert {

// **---- Executables ----**

/**
 * @brief Resolve an executable name the way execvp would.
 *
 * @note Names containing '/' are checked as given. Bare names are searched
 *       in each PATH entry.
 *
 * @param name Executable name or path
 * @return Full path of the executable, or empty if not found
 */
std::string find_executable(const std::string &name);

// **---- Text ----**

/// ASCII lower-case copy
std::string to_lower(std::string text);

/// Copy without leading/trailing whitespace
std::string trim(const std::string &text);

/**
 * @brief Lower-case extension of a locator without the dot.
 * @note "clip.final.MKV" -> "mkv", "noext" -> ""
 */
std::string extension_of(const std::string &path);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format (hours may exceed two
 *         digits). Negative or non-finite input gives 00:00:00.
 */
std::string format_time(double seconds);

} // namespace media_convert

#endif // MEDIA_CONVERT_SYSTEM_HPP
