// StreamingVerifier.cpp
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

#include "StreamingVerifier.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <format>

MemorySource::MemorySource(std::vector<unsigned char> data, size_t max_read)
    : data_(std::move(data)), max_read_(max_read == 0 ? 1 : max_read) {}

size_t MemorySource::read_some(unsigned char* buf, size_t len, std::error_code& ec) {
    ec.clear();
    size_t n = std::min({len, max_read_, data_.size() - pos_});
    std::copy(data_.begin() + pos_, data_.begin() + pos_ + n, buf);
    pos_ += n;
    return n;
}

void MemorySink::write(const unsigned char* buf, size_t len, std::error_code& ec) {
    ec.clear();
    data_.insert(data_.end(), buf, buf + len);
}

ChunkMacError readExact(ByteSource& source, unsigned char* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        std::error_code ec;
        size_t n = source.read_some(buf + done, len - done, ec);
        if (ec) {
            log_message("Read error: " + ec.message());
            return ChunkMacError::FileReadError;
        }
        if (n == 0) {
            log_message(std::format("End of stream after {} of {} bytes.", done, len));
            return ChunkMacError::StreamTruncated;
        }
        done += n;
    }
    return ChunkMacError::Success;
}

FileMacAccumulator::FileMacAccumulator(const AesKey& key, const AesIv& iv)
    : cipher_(key), chunk_seed_(chunkMacSeed(iv)) {}

MacWords FileMacAccumulator::chunkMac(const unsigned char* plaintext, size_t len) {
    MacWords chunk_mac = chunk_seed_;
    // The final block of a chunk may be short; loadMacBlock zero pads it.
    for (size_t i = 0; i < len; i += AES_BLOCK_LEN) {
        chunk_mac = cipher_.step(chunk_mac, loadMacBlock(plaintext + i, std::min(AES_BLOCK_LEN, len - i)));
    }
    return chunk_mac;
}

void FileMacAccumulator::foldChunk(const unsigned char* plaintext, size_t len) {
    file_mac_ = cipher_.step(file_mac_, chunkMac(plaintext, len));
}

StreamingVerifier::StreamingVerifier(const AesKey& key, const AesIv& iv) : key_(key), iv_(iv) {}

void StreamingVerifier::set_progress_callback(ProgressCallback cb) {
    progress_callback_ = std::move(cb);
}

std::expected<VerifyResult, ChunkMacError> StreamingVerifier::verify(const ChunkPlan& plan, ByteSource& input,
                                                                     ByteSink& output, const FileTag& expected_tag) {
    auto result = runPipeline(plan, input, &output, Direction::Decrypt);
    if (!result) {
        return std::unexpected(result.error());
    }
    return VerifyResult{result->bytes_written, result->tag == expected_tag, result->tag, result->trailing_input};
}

std::expected<EncryptResult, ChunkMacError> StreamingVerifier::encrypt(const ChunkPlan& plan, ByteSource& input,
                                                                       ByteSink& output) {
    return runPipeline(plan, input, &output, Direction::Encrypt);
}

std::expected<VerifyResult, ChunkMacError> StreamingVerifier::verifyPlaintext(const ChunkPlan& plan, ByteSource& input,
                                                                              const FileTag& expected_tag) {
    auto result = runPipeline(plan, input, nullptr, Direction::MacOnly);
    if (!result) {
        return std::unexpected(result.error());
    }
    return VerifyResult{0, result->tag == expected_tag, result->tag, result->trailing_input};
}

std::expected<EncryptResult, ChunkMacError> StreamingVerifier::runPipeline(const ChunkPlan& plan, ByteSource& input,
                                                                           ByteSink* output, Direction direction) {
    const uint64_t total_size = ChunkPlanner::totalLength(plan);
    try {
        FileMacAccumulator mac(key_, iv_);
        std::unique_ptr<CtrCipher> cipher;
        if (direction != Direction::MacOnly) {
            cipher = std::make_unique<CtrCipher>(key_, iv_);
        }
        std::vector<unsigned char> buffer(static_cast<size_t>(ChunkPlanner::maxChunkLength(plan)));
        uint64_t bytes_written = 0;

        for (const auto& chunk : plan) {
            const size_t len = static_cast<size_t>(chunk.length);
            ChunkMacError read_result = readExact(input, buffer.data(), len);
            if (read_result != ChunkMacError::Success) {
                log_message(std::format("Chunk at offset {} failed: {}", chunk.offset, toString(read_result)));
                return std::unexpected(read_result);
            }

            if (cipher && cipher->position() != chunk.offset) {
                cipher->seek(chunk.offset);
            }
            // The MAC always covers the plaintext.
            if (direction == Direction::Encrypt) {
                mac.foldChunk(buffer.data(), len);
                cipher->apply(buffer.data(), buffer.data(), len);
            } else {
                if (cipher) {
                    cipher->apply(buffer.data(), buffer.data(), len);
                }
                mac.foldChunk(buffer.data(), len);
            }

            if (output) {
                std::error_code ec;
                output->write(buffer.data(), len, ec);
                if (ec) {
                    log_message("Write error: " + ec.message());
                    return std::unexpected(ChunkMacError::FileWriteError);
                }
                bytes_written += len;
            }

            log_message(std::format("Chunk {}+{} done.", chunk.offset, chunk.length));
            if (progress_callback_) {
                progress_callback_(chunk.offset + chunk.length, total_size);
            }
        }

        // One more read tells a complete stream from one the plan only partly covers.
        unsigned char extra = 0;
        std::error_code ec;
        bool trailing_input = input.read_some(&extra, 1, ec) > 0;
        if (ec) {
            log_message("Read error after last chunk: " + ec.message());
            return std::unexpected(ChunkMacError::FileReadError);
        }
        if (trailing_input) {
            log_message(std::format("Input continues past {} bytes.", total_size));
        }
        return EncryptResult{bytes_written, mac.tag(), trailing_input};
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        printOpenSSLErrors();
        return std::unexpected(ChunkMacError::DecryptionError);
    }
}

std::expected<VerifyResult, ChunkMacError> verify(const ChunkPlan& plan, ByteSource& input, ByteSink& output,
                                                  const FileKeyMaterial& material) {
    StreamingVerifier verifier(material.key, material.iv);
    return verifier.verify(plan, input, output, material.expected_tag);
}

std::expected<EncryptResult, ChunkMacError> encryptStream(const ChunkPlan& plan, ByteSource& input, ByteSink& output,
                                                          const AesKey& key, const AesIv& iv) {
    StreamingVerifier verifier(key, iv);
    return verifier.encrypt(plan, input, output);
}

std::expected<VerifyResult, ChunkMacError> verifyPlaintext(const ChunkPlan& plan, ByteSource& input,
                                                           const FileKeyMaterial& material) {
    StreamingVerifier verifier(material.key, material.iv);
    return verifier.verifyPlaintext(plan, input, material.expected_tag);
}
