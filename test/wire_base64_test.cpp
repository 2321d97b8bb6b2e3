// test/wire_base64_test.cpp
//
// Base64 codec against the RFC 4648 test vectors, and the strictness rules
// the device depends on to drop corrupted frame lines.

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "apps/wire/Base64.hpp"

static int g_failures = 0;

static void check(bool ok, int line, const char* what) {
    if (ok) return;
    std::cout << "  FAIL " << line << ": " << what << "\n";
    ++g_failures;
}

static std::string enc(const char* s) {
    return wire::Base64Encode(reinterpret_cast<const uint8_t*>(s), std::strlen(s));
}

static bool dec(const std::string& s, std::string& out) {
    std::vector<uint8_t> bytes;
    if (!wire::Base64Decode(s.data(), s.size(), bytes)) return false;
    out.assign(bytes.begin(), bytes.end());
    return true;
}

int main() {
    std::cout << "=== WIRE BASE64 TEST ===\n";

    std::cout << "-- RFC 4648 vectors\n";
    struct { const char* plain; const char* coded; } vectors[] = {
        {"",       ""},
        {"f",      "Zg=="},
        {"fo",     "Zm8="},
        {"foo",    "Zm9v"},
        {"foob",   "Zm9vYg=="},
        {"fooba",  "Zm9vYmE="},
        {"foobar", "Zm9vYmFy"},
    };
    for (const auto& v : vectors) {
        check(enc(v.plain) == v.coded, __LINE__, "enc(v.plain) == v.coded");
        std::string back;
        check(dec(v.coded, back) && back == v.plain, __LINE__, "dec(v.coded, back) && back == v.plain");
    }

    std::cout << "-- sizes\n";
    check(wire::Base64EncodedSize(0) == 0, __LINE__, "wire::Base64EncodedSize(0) == 0");
    check(wire::Base64EncodedSize(1) == 4, __LINE__, "wire::Base64EncodedSize(1) == 4");
    check(wire::Base64EncodedSize(3) == 4, __LINE__, "wire::Base64EncodedSize(3) == 4");
    check(wire::Base64EncodedSize(1024) == 1368, __LINE__, "wire::Base64EncodedSize(1024) == 1368");

    std::cout << "-- append keeps existing text\n";
    {
        std::string out = "x";
        const uint8_t bytes[] = {0xFF, 0x00};
        wire::Base64EncodeAppend(bytes, sizeof(bytes), out);
        check(out == "x/wA=", __LINE__, "out == \"x/wA=\"");
    }

    std::cout << "-- strict decode\n";
    std::string junk;
    check(!dec("Zg=", junk), __LINE__, "!dec(\"Zg=\", junk)");          // not a multiple of 4
    check(!dec("Z===", junk), __LINE__, "!dec(\"Z===\", junk)");         // padding too early
    check(!dec("Zg=a", junk), __LINE__, "!dec(\"Zg=a\", junk)");         // data after padding
    check(!dec("Zg==Zm8=", junk), __LINE__, "!dec(\"Zg==Zm8=\", junk)");     // padding mid-stream
    check(!dec("Zm9v!A==", junk), __LINE__, "!dec(\"Zm9v!A==\", junk)");     // outside the alphabet
    check(!dec("Zm9v\nYg==", junk), __LINE__, "!dec(\"Zm9v\\nYg==\", junk)");   // whitespace is not skipped

    std::cout << (g_failures == 0 ? "PASS" : "FAIL") << "\n";
    return g_failures == 0 ? 0 : 1;
}
