#ifndef HASHING_HPP
#define HASHING_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace Hashing {

// Hex encoded SHA-256 of the concatenated parts. Throws std::runtime_error
// if the digest can't be computed.
std::string sha256_hex(const std::vector<std::string> &parts);

// Cryptographically random bytes. Throws std::runtime_error if the RNG fails.
std::vector<unsigned char> random_bytes(size_t count);

// Random RFC 4122 version 4 identifier.
std::string random_uuid();

} // namespace Hashing

#endif // HASHING_HPP
