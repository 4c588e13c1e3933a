/**
 * @file encoding.hpp
 * @brief Text encodings needed by the AWS wire formats.
 */

#ifndef ENCODING_HPP
#define ENCODING_HPP

#include <string>
#include <string_view>
#include <optional>

/**
 * @brief Encodes bytes as standard base64 with padding.
 */
std::string base64Encode(std::string_view data);

/**
 * @brief Decodes standard base64. Whitespace is ignored.
 *
 * @return std::optional<std::string> Decoded bytes, or std::nullopt on malformed input.
 */
std::optional<std::string> base64Decode(std::string_view text);

/**
 * @brief Percent-encodes everything except RFC 3986 unreserved characters.
 *
 * @param text Text to encode.
 * @param keepSlash If true, '/' is left as is (for object keys in URL paths).
 */
std::string uriEncode(std::string_view text, bool keepSlash = false);

#endif // ENCODING_HPP
