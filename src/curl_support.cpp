#include "curl_support.hpp"
#include <algorithm>
#include <istream>

CurlHandle makeCurlHandle(std::chrono::seconds timeout) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return curl;
    }
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(std::min<std::chrono::seconds::rep>(timeout.count(), 30)));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    return curl;
}

size_t writeToString(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(contents, size * nmemb);
    return size * nmemb;
}

size_t writeToStream(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::ostream*>(userp);
    out->write(contents, static_cast<std::streamsize>(size * nmemb));
    return out->good() ? size * nmemb : 0;
}

size_t readFromStream(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* in = static_cast<std::istream*>(userp);
    in->read(buffer, static_cast<std::streamsize>(size * nitems));
    return static_cast<size_t>(in->gcount());
}
