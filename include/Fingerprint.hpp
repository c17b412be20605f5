#pragma once
#include <cstddef>
#include <string>

// SHA-256 of 'data' as lowercase hex, truncated to 'hex_chars'.
// Returns false if the digest could not be computed.
bool sha256_hex(const std::string& data, std::string& out, size_t hex_chars = 64);
