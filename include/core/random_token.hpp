#pragma once

#include <cstddef>
#include <string>

/**
 * @brief Lowercase hex string built from `byte_count` bytes of OpenSSL CSPRNG output.
 * @throws std::runtime_error if the generator fails
 */
std::string randomHexToken(size_t byte_count = 8);
