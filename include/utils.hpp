#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <ostream>
#include <iostream>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"

namespace Quiver {

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << COLOR_INFO << "[INFO] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::cerr << COLOR_WARN << "[WARN] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << COLOR_ERROR << "[ERROR] " << COLOR_RESET << message << std::endl;
}

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief libcurl write callback function.
 *
 * Appends data received from a libcurl request to a std::string.
 *
 * @param contents Pointer to the received data.
 * @param size Size of each element.
 * @param nmemb Number of elements.
 * @param userp Pointer to the std::string to append data to.
 * @return The total number of bytes processed.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

/**
 * @brief Downloads a document from a given URL into memory.
 *
 * @param url The URL to fetch.
 * @return The response body.
 * @throws std::runtime_error on transport errors or HTTP status >= 400.
 */
std::string fetchUrl(const std::string& url);

/**
 * @brief Streams the resource at `url` into the file at `outputPath`.
 *
 * The partially written file is removed on failure.
 *
 * @throws std::runtime_error on transport errors or HTTP status >= 400.
 */
void downloadToFile(const std::string& url, const std::string& outputPath);

/**
 * @brief Removes leading and trailing whitespace from the given string.
 */
void trim(std::string& s);

/**
 * @brief Splits `input` on runs of whitespace.
 */
std::vector<std::string> splitWhitespace(const std::string& input);

/**
 * @brief Joins `parts` with `separator`.
 */
std::string join(const std::vector<std::string>& parts, const std::string& separator);

} // namespace Quiver

#endif // UTILS_HPP
