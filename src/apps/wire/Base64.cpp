#include "apps/wire/Base64.hpp"

namespace {

static const char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static constexpr int8_t BAD = -1;
static constexpr int8_t PAD = -2;

// Reverse lookup table, built once.
struct DecodeTable {
    int8_t v[256];
    DecodeTable() {
        for (int i = 0; i < 256; ++i) v[i] = BAD;
        for (int i = 0; i < 64; ++i) v[static_cast<uint8_t>(ALPHABET[i])] = static_cast<int8_t>(i);
        v[static_cast<uint8_t>('=')] = PAD;
    }
};

static const DecodeTable& table() {
    static const DecodeTable t;
    return t;
}

} // anonymous namespace

namespace wire {

void Base64EncodeAppend(const uint8_t* data, std::size_t len, std::string& out) {
    out.reserve(out.size() + Base64EncodedSize(len));

    std::size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        const uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(ALPHABET[(n >> 6) & 0x3F]);
        out.push_back(ALPHABET[n & 0x3F]);
    }

    const std::size_t rem = len - i;
    if (rem == 1) {
        const uint32_t n = uint32_t(data[i]) << 16;
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back('=');
        out.push_back('=');
    } else if (rem == 2) {
        const uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(ALPHABET[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
}

std::string Base64Encode(const uint8_t* data, std::size_t len) {
    std::string out;
    Base64EncodeAppend(data, len, out);
    return out;
}

bool Base64Decode(const char* text, std::size_t len, std::vector<uint8_t>& out) {
    out.clear();
    if (len % 4 != 0) return false;
    out.reserve((len / 4) * 3);

    const DecodeTable& t = table();

    for (std::size_t i = 0; i < len; i += 4) {
        int8_t q[4];
        for (int k = 0; k < 4; ++k) {
            q[k] = t.v[static_cast<uint8_t>(text[i + k])];
            if (q[k] == BAD) return false;
        }

        // Padding only allowed in the final quantum, positions 2..3.
        const bool last = (i + 4 == len);
        if (q[0] == PAD || q[1] == PAD) return false;
        if (q[2] == PAD && q[3] != PAD) return false;
        if ((q[2] == PAD || q[3] == PAD) && !last) return false;

        const uint32_t n = (uint32_t(q[0]) << 18) | (uint32_t(q[1]) << 12)
                         | (uint32_t(q[2] == PAD ? 0 : q[2]) << 6)
                         | uint32_t(q[3] == PAD ? 0 : q[3]);

        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (q[2] != PAD) out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (q[3] != PAD) out.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return true;
}

} // namespace wire
