// nkChunkMacToolBase.hpp
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

#ifndef NKCHUNKMACTOOLBASE_HPP
#define NKCHUNKMACTOOLBASE_HPP

#include <array>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <openssl/evp.h>

struct EVP_CIPHER_CTX_Deleter { void operator()(EVP_CIPHER_CTX *p) const; };

static constexpr size_t AES_KEY_LEN = 16;
static constexpr size_t AES_BLOCK_LEN = 16;
static constexpr size_t FILE_TAG_LEN = 8;

using AesKey = std::array<unsigned char, AES_KEY_LEN>;
using AesIv = std::array<unsigned char, AES_BLOCK_LEN>;
using FileTag = std::array<unsigned char, FILE_TAG_LEN>;

// A 16-byte block viewed as four big-endian 32-bit words.
using MacWords = std::array<uint32_t, 4>;

// Everything the caller has to supply for one file.
struct FileKeyMaterial {
    AesKey key{};
    AesIv iv{};
    FileTag expected_tag{};
};

uint32_t load_be32(const unsigned char* p);
void store_be32(unsigned char* p, uint32_t v);

// Reads up to 16 bytes as four big-endian words, zero padding a short block.
MacWords loadMacBlock(const unsigned char* data, size_t len);
void storeMacBlock(const MacWords& words, unsigned char out[AES_BLOCK_LEN]);

// Chunk MAC seed: the first 8 bytes of the IV, twice.
MacWords chunkMacSeed(const AesIv& iv);

// (w0 ^ w1, w2 ^ w3) as 8 big-endian bytes.
FileTag tagFromFileMac(const MacWords& file_mac);

// Single-block AES-128-CBC with a zero IV, keyed once and reused for every step.
class MacCipher {
public:
    explicit MacCipher(const AesKey& key);

    // XOR block into accumulator, encrypt, return the ciphertext block.
    MacWords step(const MacWords& accumulator, const MacWords& block);

private:
    std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter> ctx_;
};

MacWords macStep(const MacWords& accumulator, const MacWords& block, const AesKey& key);

// AES-128-CTR over a 128-bit big-endian counter starting at the IV.
// The keystream is addressable by absolute byte offset.
class CtrCipher {
public:
    CtrCipher(const AesKey& key, const AesIv& iv);

    void seek(uint64_t offset);
    void apply(const unsigned char* in, unsigned char* out, size_t len);
    uint64_t position() const { return position_; }

private:
    std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter> ctx_;
    AesKey key_;
    AesIv iv_;
    uint64_t position_ = 0;
};

void printOpenSSLErrors();
void printProgress(double percentage);

// Compiled in only with DETAIL_LOG.
void log_message(const std::string& msg);

#endif // NKCHUNKMACTOOLBASE_HPP
