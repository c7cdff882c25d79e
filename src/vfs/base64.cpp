/// @file base64.cpp
/// @brief Base64 codec implementation

#include <vfsh/vfs/base64.hpp>

#include <array>
#include <cstdint>

namespace vfsh_vfs::base64 {

namespace {

constexpr std::string_view k_alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t k_invalid = 0xFF;

constexpr std::array<std::uint8_t, 256> make_decode_table() {
    std::array<std::uint8_t, 256> table{};
    for (auto& entry : table) {
        entry = k_invalid;
    }
    for (std::size_t i = 0; i < k_alphabet.size(); ++i) {
        table[static_cast<unsigned char>(k_alphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

constexpr auto k_decode_table = make_decode_table();

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // anonymous namespace

std::optional<std::string> decode(std::string_view encoded) {
    std::string symbols;
    symbols.reserve(encoded.size());
    for (char c : encoded) {
        if (!is_space(c)) {
            symbols += c;
        }
    }

    if (symbols.size() % 4 != 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    if (!symbols.empty() && symbols.back() == '=') {
        ++padding;
        if (symbols[symbols.size() - 2] == '=') {
            ++padding;
        }
    }

    std::string out;
    out.reserve(symbols.size() / 4 * 3);

    const std::size_t data_len = symbols.size() - padding;
    std::uint32_t buffer = 0;
    int bits = 0;

    for (std::size_t i = 0; i < data_len; ++i) {
        std::uint8_t value = k_decode_table[static_cast<unsigned char>(symbols[i])];
        if (value == k_invalid) {
            return std::nullopt;
        }

        buffer = (buffer << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }

    return out;
}

} // namespace vfsh_vfs::base64
