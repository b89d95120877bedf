#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace mediadl::core {

/**
 * Random (version 4) UUID in canonical lower-case form, e.g.
 * "1b4e28ba-2fa1-41d2-883f-0016d3cca427". Used as transfer identity.
 */
inline std::string generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        std::uint64_t word = rng();
        for (std::size_t j = 0; j < 8; ++j, word >>= 8)
            bytes[i + j] = static_cast<std::uint8_t>(word & 0xFF);
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

// "<prefix>-<uuid>", used for batch handles
inline std::string generatePrefixedId(const std::string& prefix) {
    return prefix + "-" + generateUUID();
}

} // namespace mediadl::core
