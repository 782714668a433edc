//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CLASSMAP_HASH_UTILS_HPP
#define CLASSMAP_HASH_UTILS_HPP

/**
 * @file hash_utils.hpp
 * @brief Digest helpers (OpenSSL EVP) for cache keys and generated ids.
 */

#include <string>
#include <string_view>

namespace classmap::hash_utils {

    /**
     * MD5 digest of the input as a lowercase hex string (32 characters).
     *
     * @throws std::runtime_error if the OpenSSL digest context fails.
     */
    std::string md5_hex(std::string_view data);

}  // namespace classmap::hash_utils

#endif //CLASSMAP_HASH_UTILS_HPP
