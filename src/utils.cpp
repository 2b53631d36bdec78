#include "utils.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace Quiver {

namespace {

    // Owns a CURL easy handle for the duration of one transfer.
    struct CurlDeleter {
        void operator()(CURL* curl) const {
            if (curl) {
                curl_easy_cleanup(curl);
            }
        }
    };

    /**
     * Writes downloaded chunks straight into an output file stream.
     */
    size_t writeToStream(void* ptr, size_t size, size_t nmemb, void* userdata)
    {
        std::ofstream* outFile = static_cast<std::ofstream*>(userdata);
        size_t totalSize = size * nmemb;

        outFile->write(static_cast<char*>(ptr), totalSize);
        if (!outFile->good()) {
            std::cerr << "Error writing to download file stream!" << std::endl;
            return 0; // Signal error to cURL
        }
        return totalSize;
    }

    /**
     * Transfer progress for archive downloads, printed on one line.
     */
    int xferInfoCallback(void* /*ptr*/,
                         curl_off_t totalToDownload,
                         curl_off_t nowDownloaded,
                         curl_off_t /*totalToUpload*/,
                         curl_off_t /*nowUploaded*/)
    {
        if (totalToDownload <= 0) {
            if (nowDownloaded > 0) {
                double kiloBytes = static_cast<double>(nowDownloaded) / 1024;
                std::cout << "\r  Downloading... "
                          << std::fixed << std::setprecision(1)
                          << kiloBytes << " KiB" << std::flush;
            }
            return 0;
        }

        const int barWidth = 30;
        double progress = static_cast<double>(nowDownloaded)
                          / static_cast<double>(totalToDownload);
        if (progress > 1.0) {
            progress = 1.0;
        }
        int pos = static_cast<int>(barWidth * progress);

        std::cout << "\r  [";
        for (int i = 0; i < barWidth; ++i) {
            if (i < pos) {
                std::cout << "=";
            } else if (i == pos) {
                std::cout << ">";
            } else {
                std::cout << " ";
            }
        }
        std::cout << "] "
                  << std::fixed << std::setprecision(1)
                  << (progress * 100.0) << "%"
                  << std::flush;
        return 0;
    }

} // end anonymous namespace

/**
 * @brief libcurl callback function. Appends downloaded data into a std::string.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize      = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);

    try {
        response->append(static_cast<char*>(contents), totalSize);
    } catch (const std::exception& e) {
        std::cerr << "Error appending data to response: "
                  << e.what() << std::endl;
        return 0; // Signal failure to libcurl
    }

    return totalSize;
}

std::string fetchUrl(const std::string& url)
{
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "Quiver/1.0");

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw std::runtime_error(
            "Failed to fetch " + url + ": " +
            std::string(curl_easy_strerror(res))
        );
    }

    return response;
}

void downloadToFile(const std::string& url, const std::string& outputPath)
{
    fs::path parentDir = fs::path(outputPath).parent_path();
    if (!parentDir.empty() && !fs::exists(parentDir)) {
        fs::create_directories(parentDir);
    }

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    std::ofstream outFile(outputPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        throw std::runtime_error("Failed to open file for writing: " + outputPath);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToStream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &outFile);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferInfoCallback);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 300L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "Quiver/1.0");

    CURLcode res = curl_easy_perform(curl.get());
    outFile.close();
    std::cout << std::endl; // progress bar newline

    if (res != CURLE_OK) {
        std::error_code ec;
        fs::remove(outputPath, ec);
        throw std::runtime_error("Error downloading " + url + ": " +
                                 std::string(curl_easy_strerror(res)));
    }
}

void trim(std::string& s)
{
    const char *whitespace = " \t\n\r\f\v";
    s.erase(0, s.find_first_not_of(whitespace));
    s.erase(s.find_last_not_of(whitespace) + 1);
}

std::vector<std::string> splitWhitespace(const std::string& input)
{
    std::vector<std::string> parts;
    std::istringstream iss(input);
    std::string token;
    while (iss >> token) {
        parts.push_back(token);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

} // namespace Quiver
