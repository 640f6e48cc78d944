#include <utils/base64.hpp>
#include <array>
#include <cstdint>
#include <stdexcept>

namespace Stonetrail {

namespace {

constexpr char k_alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int, 256> make_decode_table() {
    std::array<int, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(k_alphabet[i])] = i;
    }
    return table;
}

constexpr auto k_decode = make_decode_table();

} // namespace

std::string base64_encode(const Bytes& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= data.size()) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(k_alphabet[(n >> 18) & 0x3F]);
        out.push_back(k_alphabet[(n >> 12) & 0x3F]);
        out.push_back(k_alphabet[(n >> 6) & 0x3F]);
        out.push_back(k_alphabet[n & 0x3F]);
        i += 3;
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out.push_back(k_alphabet[(n >> 18) & 0x3F]);
        out.push_back(k_alphabet[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(k_alphabet[(n >> 18) & 0x3F]);
        out.push_back(k_alphabet[(n >> 12) & 0x3F]);
        out.push_back(k_alphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

Bytes base64_decode(const std::string& text) {
    Bytes out;
    out.reserve((text.size() / 4) * 3);

    uint32_t acc = 0;
    int bits = 0;
    for (char c : text) {
        if (c == '=') break;
        if (c == '\n' || c == '\r') continue;
        int v = k_decode[static_cast<unsigned char>(c)];
        if (v < 0) {
            throw std::invalid_argument("base64: invalid character");
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

} // namespace Stonetrail
