/**
 * @file digest.hpp
 * @brief OpenSSL backed hashing and encoding helpers.
 */
#ifndef WORKFLOWHARVEST_UTIL_DIGEST_HPP
#define WORKFLOWHARVEST_UTIL_DIGEST_HPP

#include <string>

namespace wfh {

/// Lowercase hex SHA-256 of @p data; used as the snapshot content fingerprint.
std::string sha256_hex(const std::string &data);

/// Lowercase hex SHA-1 of @p data; names History Index files.
std::string sha1_hex(const std::string &data);

/// Standard base64 (with padding) of @p data.
std::string base64_encode(const std::string &data);

} // namespace wfh

#endif // WORKFLOWHARVEST_UTIL_DIGEST_HPP
