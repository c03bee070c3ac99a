#include "core/random_token.hpp"
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

std::string randomHexToken(size_t byte_count)
{
    std::vector<unsigned char> buffer(byte_count);
    if (byte_count > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1)
    {
        throw std::runtime_error("RAND_bytes failed");
    }

    std::stringstream ss;
    for (unsigned char b : buffer)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}
