/**
 * @file curl_support.hpp
 * @brief libcurl helpers shared by the AWS and SMB clients.
 *
 * @note Requires libcurl built with the HTTPS and SMB protocols and SigV4
 * support (7.75 or newer).
 */

#ifndef CURL_SUPPORT_HPP
#define CURL_SUPPORT_HPP

#include <curl/curl.h>
#include <chrono>
#include <memory>
#include <ostream>
#include <string>

struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

/**
 * @brief Creates an easy handle with the connect and total timeouts applied.
 *
 * @return CurlHandle Handle, or null if libcurl could not allocate one.
 */
CurlHandle makeCurlHandle(std::chrono::seconds timeout);

/**
 * @brief CURLOPT_WRITEFUNCTION that appends to a std::string passed as userdata.
 */
size_t writeToString(char* contents, size_t size, size_t nmemb, void* userp);

/**
 * @brief CURLOPT_WRITEFUNCTION that writes to a std::ostream passed as userdata.
 */
size_t writeToStream(char* contents, size_t size, size_t nmemb, void* userp);

/**
 * @brief CURLOPT_READFUNCTION that reads from a std::istream passed as userdata.
 */
size_t readFromStream(char* buffer, size_t size, size_t nitems, void* userp);

#endif // CURL_SUPPORT_HPP
