// StreamingVerifier.hpp
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

#ifndef STREAMINGVERIFIER_HPP
#define STREAMINGVERIFIER_HPP

#include <cstdint>
#include <expected>
#include <functional>
#include <limits>
#include <system_error>
#include <vector>

#include "ChunkMacError.hpp"
#include "ChunkPlanner.hpp"
#include "nkChunkMacToolBase.hpp"

// Blocking byte input. Returns 0 at end of stream; errors go to ec.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read_some(unsigned char* buf, size_t len, std::error_code& ec) = 0;
};

// Blocking byte output. Writes all of buf or sets ec.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void write(const unsigned char* buf, size_t len, std::error_code& ec) = 0;
};

class MemorySource : public ByteSource {
public:
    // max_read caps every read_some so callers see short reads.
    explicit MemorySource(std::vector<unsigned char> data,
                          size_t max_read = std::numeric_limits<size_t>::max());
    size_t read_some(unsigned char* buf, size_t len, std::error_code& ec) override;

private:
    std::vector<unsigned char> data_;
    size_t pos_ = 0;
    size_t max_read_;
};

class MemorySink : public ByteSink {
public:
    void write(const unsigned char* buf, size_t len, std::error_code& ec) override;
    const std::vector<unsigned char>& data() const { return data_; }

private:
    std::vector<unsigned char> data_;
};

// Loops over read_some until len bytes arrive. Short input is StreamTruncated.
ChunkMacError readExact(ByteSource& source, unsigned char* buf, size_t len);

// Two-level MAC: a CBC-MAC per chunk, folded into a running file MAC.
class FileMacAccumulator {
public:
    FileMacAccumulator(const AesKey& key, const AesIv& iv);

    MacWords chunkMac(const unsigned char* plaintext, size_t len);
    void foldChunk(const unsigned char* plaintext, size_t len);

    FileTag tag() const { return tagFromFileMac(file_mac_); }

private:
    MacCipher cipher_;
    MacWords chunk_seed_;
    MacWords file_mac_{};
};

struct VerifyResult {
    uint64_t bytes_written = 0;
    bool match = false;
    FileTag computed_tag{};
    // Input continued past the end of the plan. Those bytes are not covered by the tag.
    bool trailing_input = false;
};

struct EncryptResult {
    uint64_t bytes_written = 0;
    FileTag tag{};
    bool trailing_input = false;
};

using ProgressCallback = std::function<void(uint64_t bytes_done, uint64_t total_bytes)>;

class StreamingVerifier {
public:
    StreamingVerifier(const AesKey& key, const AesIv& iv);

    void set_progress_callback(ProgressCallback cb);

    // Decrypts input into output and checks the MAC of the plaintext.
    std::expected<VerifyResult, ChunkMacError> verify(const ChunkPlan& plan, ByteSource& input, ByteSink& output,
                                                      const FileTag& expected_tag);

    // Encrypts input into output and returns the tag of the plaintext.
    std::expected<EncryptResult, ChunkMacError> encrypt(const ChunkPlan& plan, ByteSource& input, ByteSink& output);

    // Checks an already decrypted stream against the tag.
    std::expected<VerifyResult, ChunkMacError> verifyPlaintext(const ChunkPlan& plan, ByteSource& input,
                                                               const FileTag& expected_tag);

private:
    enum class Direction { Decrypt, Encrypt, MacOnly };

    std::expected<EncryptResult, ChunkMacError> runPipeline(const ChunkPlan& plan, ByteSource& input,
                                                            ByteSink* output, Direction direction);

    AesKey key_;
    AesIv iv_;
    ProgressCallback progress_callback_ = nullptr;
};

std::expected<VerifyResult, ChunkMacError> verify(const ChunkPlan& plan, ByteSource& input, ByteSink& output,
                                                  const FileKeyMaterial& material);

std::expected<EncryptResult, ChunkMacError> encryptStream(const ChunkPlan& plan, ByteSource& input, ByteSink& output,
                                                          const AesKey& key, const AesIv& iv);

std::expected<VerifyResult, ChunkMacError> verifyPlaintext(const ChunkPlan& plan, ByteSource& input,
                                                           const FileKeyMaterial& material);

#endif // STREAMINGVERIFIER_HPP
