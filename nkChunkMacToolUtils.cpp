#include "nkChunkMacToolUtils.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cctype>

#include <termios.h>
#include <unistd.h>

std::vector<unsigned char> parse_hex(const std::string& hex) {
    auto hex2n = [](char c) -> int {
        if ('0' <= c && c <= '9') return c - '0';
        if ('a' <= c && c <= 'f') return 10 + c - 'a';
        if ('A' <= c && c <= 'F') return 10 + c - 'A';
        return -1;
    };
    std::string digits;
    for (char c : hex) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == ':') continue;
        digits.push_back(c);
    }
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits.erase(0, 2);
    }
    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has an odd number of digits: " + hex);
    }
    std::vector<unsigned char> out(digits.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = hex2n(digits[2 * i]);
        int lo = hex2n(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex string: " + hex);
        }
        out[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return out;
}

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string get_masked_input(const std::string& prompt) {
    std::string input;
    if (!isatty(STDIN_FILENO)) {
        std::getline(std::cin, input);
        return input;
    }
    std::cout << prompt;
    std::cout.flush();
    termios oldt;
    tcgetattr(STDIN_FILENO, &oldt);
    termios newt = oldt;
    newt.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    std::getline(std::cin, input);
    tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
    std::cout << std::endl;
    return input;
}
