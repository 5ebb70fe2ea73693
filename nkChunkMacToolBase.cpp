// nkChunkMacToolBase.cpp
/*
 * Copyright (c) 2024-2025 Naohiro KORIYAMA <nkoriyama@gmail.com>
 *
 * This file is part of nkChunkMacTool.
 *
 * nkChunkMacTool is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * nkChunkMacTool is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with nkChunkMacTool. If not, see <https://www.gnu.org/licenses/>.
 */

#include "nkChunkMacToolBase.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <mutex>
#include <thread>
#include <limits>
#include <stdexcept>
#include <format>
#include <openssl/err.h>

void EVP_CIPHER_CTX_Deleter::operator()(EVP_CIPHER_CTX *p) const { EVP_CIPHER_CTX_free(p); }

namespace {
const unsigned char ZERO_IV[AES_BLOCK_LEN] = {};
}

uint32_t load_be32(const unsigned char* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void store_be32(unsigned char* p, uint32_t v) {
    p[0] = static_cast<unsigned char>(v >> 24);
    p[1] = static_cast<unsigned char>(v >> 16);
    p[2] = static_cast<unsigned char>(v >> 8);
    p[3] = static_cast<unsigned char>(v);
}

MacWords loadMacBlock(const unsigned char* data, size_t len) {
    unsigned char padded[AES_BLOCK_LEN] = {};
    std::copy(data, data + std::min(len, AES_BLOCK_LEN), padded);
    return {load_be32(padded), load_be32(padded + 4), load_be32(padded + 8), load_be32(padded + 12)};
}

void storeMacBlock(const MacWords& words, unsigned char out[AES_BLOCK_LEN]) {
    for (size_t i = 0; i < words.size(); ++i) {
        store_be32(out + 4 * i, words[i]);
    }
}

MacWords chunkMacSeed(const AesIv& iv) {
    uint32_t hi = load_be32(iv.data());
    uint32_t lo = load_be32(iv.data() + 4);
    return {hi, lo, hi, lo};
}

FileTag tagFromFileMac(const MacWords& file_mac) {
    FileTag tag{};
    store_be32(tag.data(), file_mac[0] ^ file_mac[1]);
    store_be32(tag.data() + 4, file_mac[2] ^ file_mac[3]);
    return tag;
}

MacCipher::MacCipher(const AesKey& key) : ctx_(EVP_CIPHER_CTX_new()) {
    if (!ctx_) throw std::runtime_error("OpenSSL Error: Failed to create MAC cipher context.");
    if (EVP_EncryptInit_ex(ctx_.get(), EVP_aes_128_cbc(), nullptr, key.data(), ZERO_IV) != 1) {
        throw std::runtime_error("OpenSSL Error: Failed to initialize AES-128-CBC.");
    }
    EVP_CIPHER_CTX_set_padding(ctx_.get(), 0);
}

MacWords MacCipher::step(const MacWords& accumulator, const MacWords& block) {
    MacWords mixed;
    for (size_t i = 0; i < mixed.size(); ++i) {
        mixed[i] = accumulator[i] ^ block[i];
    }
    unsigned char in[AES_BLOCK_LEN];
    storeMacBlock(mixed, in);

    // Every step is a fresh CBC chain over one block.
    if (EVP_EncryptInit_ex(ctx_.get(), nullptr, nullptr, nullptr, ZERO_IV) != 1) {
        throw std::runtime_error("OpenSSL Error: Failed to reset CBC IV.");
    }
    unsigned char out[AES_BLOCK_LEN + EVP_MAX_BLOCK_LENGTH];
    int outlen = 0;
    if (EVP_EncryptUpdate(ctx_.get(), out, &outlen, in, static_cast<int>(AES_BLOCK_LEN)) != 1 ||
        outlen != static_cast<int>(AES_BLOCK_LEN)) {
        throw std::runtime_error("OpenSSL Error: MAC block encryption failed.");
    }
    return loadMacBlock(out, AES_BLOCK_LEN);
}

MacWords macStep(const MacWords& accumulator, const MacWords& block, const AesKey& key) {
    MacCipher cipher(key);
    return cipher.step(accumulator, block);
}

CtrCipher::CtrCipher(const AesKey& key, const AesIv& iv)
    : ctx_(EVP_CIPHER_CTX_new()), key_(key), iv_(iv) {
    if (!ctx_) throw std::runtime_error("OpenSSL Error: Failed to create CTR cipher context.");
    seek(0);
}

void CtrCipher::seek(uint64_t offset) {
    // counter = iv + offset / 16, 128-bit big-endian
    AesIv counter = iv_;
    uint64_t blocks = offset / AES_BLOCK_LEN;
    unsigned int carry = 0;
    for (int i = static_cast<int>(AES_BLOCK_LEN) - 1; i >= 0; --i) {
        unsigned int sum = counter[i] + static_cast<unsigned int>(blocks & 0xff) + carry;
        counter[i] = static_cast<unsigned char>(sum);
        carry = sum >> 8;
        blocks >>= 8;
    }

    if (EVP_EncryptInit_ex(ctx_.get(), EVP_aes_128_ctr(), nullptr, key_.data(), counter.data()) != 1) {
        throw std::runtime_error("OpenSSL Error: Failed to initialize AES-128-CTR.");
    }
    position_ = offset - offset % AES_BLOCK_LEN;

    size_t skip = static_cast<size_t>(offset % AES_BLOCK_LEN);
    if (skip > 0) {
        unsigned char discard[AES_BLOCK_LEN] = {};
        apply(discard, discard, skip);
    }
}

void CtrCipher::apply(const unsigned char* in, unsigned char* out, size_t len) {
    constexpr size_t MAX_UPDATE = static_cast<size_t>(std::numeric_limits<int>::max()) & ~(AES_BLOCK_LEN - 1);
    size_t done = 0;
    while (done < len) {
        int step = static_cast<int>(std::min(len - done, MAX_UPDATE));
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx_.get(), out + done, &outlen, in + done, step) != 1 || outlen != step) {
            throw std::runtime_error("OpenSSL Error: CTR keystream application failed.");
        }
        done += static_cast<size_t>(step);
    }
    position_ += len;
}

void printOpenSSLErrors() {
    std::string error_msg;
    unsigned long err_code;
    while ((err_code = ERR_get_error())) {
        char err_buf[256];
        ERR_error_string_n(err_code, err_buf, sizeof(err_buf));
        if (!error_msg.empty()) {
            error_msg += "; ";
        }
        error_msg += err_buf;
    }
    if (error_msg.empty()) {
        error_msg = "Unknown OpenSSL error.";
    }
    std::cerr << "OpenSSL Error: " << error_msg << std::endl;
}

void printProgress(double percentage) {
    constexpr int BAR_WIDTH = 40;
    if (percentage < 0.0) percentage = 0.0;
    if (percentage > 1.0) percentage = 1.0;
    int filled = static_cast<int>(percentage * BAR_WIDTH);
    std::cout << std::format("\r[{}{}] {:3d}%", std::string(filled, '#'), std::string(BAR_WIDTH - filled, '.'),
                             static_cast<int>(percentage * 100.0));
    if (percentage >= 1.0) {
        std::cout << std::endl;
    } else {
        std::cout.flush();
    }
}

void log_message(const std::string& msg) {
#if defined (DETAIL_LOG)
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);
    std::stringstream ss;
    ss << "[TID:" << std::this_thread::get_id() << "] " << msg << "\n";
    std::cout << ss.str();
    std::cout.flush();
#else
    (void)msg;
#endif
}
