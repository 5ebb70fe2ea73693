#ifndef NKCHUNKMACTOOL_UTILS_HPP
#define NKCHUNKMACTOOL_UTILS_HPP

#include <string>
#include <vector>
#include <array>
#include <stdexcept>
#include <cstring>

// 16進文字列をバイト列に変換する (std::invalid_argument を投げる)
std::vector<unsigned char> parse_hex(const std::string& hex);

// バイト列を小文字の16進文字列に変換する
std::string to_hex(const unsigned char* data, size_t len);

template <size_t N>
std::array<unsigned char, N> parse_hex_array(const std::string& hex, const char* what) {
    std::vector<unsigned char> bytes = parse_hex(hex);
    if (bytes.size() != N) {
        throw std::invalid_argument(std::string(what) + " must be " + std::to_string(N) + " bytes (" +
                                    std::to_string(N * 2) + " hex characters)");
    }
    std::array<unsigned char, N> out{};
    std::memcpy(out.data(), bytes.data(), N);
    return out;
}

template <size_t N>
std::string to_hex(const std::array<unsigned char, N>& data) {
    return to_hex(data.data(), N);
}

// 鍵などをコンソールからエコーなしで入力するための関数
std::string get_masked_input(const std::string& prompt);

#endif // NKCHUNKMACTOOL_UTILS_HPP
