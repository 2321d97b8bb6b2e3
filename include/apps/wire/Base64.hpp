#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace wire {

// RFC 4648 standard alphabet with '=' padding.

// Append the encoding of data[0..len) to out (out is not cleared).
void Base64EncodeAppend(const uint8_t* data, std::size_t len, std::string& out);

std::string Base64Encode(const uint8_t* data, std::size_t len);

// Strict decode: input length must be a multiple of 4, only alphabet
// characters plus trailing padding. Returns false on any violation and
// leaves out in an unspecified state.
bool Base64Decode(const char* text, std::size_t len, std::vector<uint8_t>& out);

constexpr std::size_t Base64EncodedSize(std::size_t n) { return ((n + 2) / 3) * 4; }

} // namespace wire
