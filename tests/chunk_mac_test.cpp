#include "gtest/gtest.h"
#include "ChunkPlanner.hpp"
#include "StreamingVerifier.hpp"
#include "ChunkMacProcessor.hpp"
#include "ChunkMacConfig.hpp"
#include "nkChunkMacToolBase.hpp"
#include "nkChunkMacToolUtils.hpp"
#include "nkchunkmac_ffi.hpp"

#include <openssl/evp.h>
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <format>
#include <iterator>
#include <fstream>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace {

const AesKey TEST_KEY = {161, 141, 109, 44, 84, 62, 135, 130, 36, 158, 235, 166, 55, 235, 206, 43};
const AesIv TEST_IV = {182, 162, 49, 236, 174, 124, 29, 100, 0, 0, 0, 0, 0, 0, 0, 0};

std::vector<unsigned char> make_plaintext(size_t size, uint32_t seed = 42) {
    std::mt19937 rng(seed);
    std::vector<unsigned char> data(size);
    for (auto& b : data) b = static_cast<unsigned char>(rng());
    return data;
}

// --- 検証用の参照実装 (OpenSSL を直接使う) ---

std::vector<unsigned char> reference_ctr(const std::vector<unsigned char>& in, const AesKey& key, const AesIv& iv) {
    std::vector<unsigned char> out(in.size() + 16);
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    int outlen = 0;
    EVP_EncryptInit_ex(ctx, EVP_aes_128_ctr(), nullptr, key.data(), iv.data());
    EVP_EncryptUpdate(ctx, out.data(), &outlen, in.data(), static_cast<int>(in.size()));
    EVP_CIPHER_CTX_free(ctx);
    out.resize(in.size());
    return out;
}

void reference_aes_block(const AesKey& key, unsigned char block[16]) {
    unsigned char out[32];
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    int outlen = 0;
    EVP_EncryptInit_ex(ctx, EVP_aes_128_ecb(), nullptr, key.data(), nullptr);
    EVP_CIPHER_CTX_set_padding(ctx, 0);
    EVP_EncryptUpdate(ctx, out, &outlen, block, 16);
    EVP_CIPHER_CTX_free(ctx);
    std::memcpy(block, out, 16);
}

std::map<uint64_t, uint64_t> reference_chunks(uint64_t size) {
    std::map<uint64_t, uint64_t> chunks;
    uint64_t p = 0, pp = 0;
    for (uint64_t i = 1; i <= 8 && p + i * 0x20000 < size; ++i) {
        chunks[p] = i * 0x20000;
        pp = p;
        p += chunks[p];
    }
    while (p < size) {
        chunks[p] = 0x100000;
        pp = p;
        p += chunks[p];
    }
    chunks[pp] = size - pp;
    if (chunks[pp] == 0) chunks.erase(pp);
    return chunks;
}

FileTag reference_tag(const std::vector<unsigned char>& plain, const AesKey& key, const AesIv& iv) {
    unsigned char file_mac[16] = {};
    for (const auto& [start, len] : reference_chunks(plain.size())) {
        unsigned char chunk_mac[16];
        std::memcpy(chunk_mac, iv.data(), 8);
        std::memcpy(chunk_mac + 8, iv.data(), 8);
        for (uint64_t i = 0; i < len; i += 16) {
            unsigned char block[16] = {};
            std::memcpy(block, plain.data() + start + i, std::min<uint64_t>(16, len - i));
            for (int j = 0; j < 16; ++j) chunk_mac[j] ^= block[j];
            reference_aes_block(key, chunk_mac);
        }
        for (int j = 0; j < 16; ++j) file_mac[j] ^= chunk_mac[j];
        reference_aes_block(key, file_mac);
    }
    FileTag tag{};
    for (int j = 0; j < 4; ++j) {
        tag[j] = file_mac[j] ^ file_mac[4 + j];
        tag[4 + j] = file_mac[8 + j] ^ file_mac[12 + j];
    }
    return tag;
}

void expect_contiguous(const ChunkPlan& plan, uint64_t total_size) {
    uint64_t expected_offset = 0;
    for (const auto& entry : plan) {
        EXPECT_EQ(entry.offset, expected_offset) << "size " << total_size;
        EXPECT_GT(entry.length, 0u) << "size " << total_size;
        expected_offset += entry.length;
    }
    EXPECT_EQ(expected_offset, total_size);
}

} // namespace

// ===============================================================================
// ChunkPlanner
// ===============================================================================

TEST(ChunkPlannerTest, ZeroSizeGivesEmptyPlan) {
    EXPECT_TRUE(ChunkPlanner::plan(0).empty());
}

TEST(ChunkPlannerTest, SmallSizesGiveSingleChunk) {
    for (uint64_t size : {1ull, 15ull, 16ull, 1000ull, 131071ull, 131072ull}) {
        ChunkPlan plan = ChunkPlanner::plan(size);
        ASSERT_EQ(plan.size(), 1u) << "size " << size;
        EXPECT_EQ(plan[0], (ChunkEntry{0, size}));
    }
}

TEST(ChunkPlannerTest, ReferenceScenarioSize) {
    ChunkPlan expected = {
        {0, 131072},
        {131072, 262144},
        {393216, 393216},
        {786432, 199040},
    };
    EXPECT_EQ(ChunkPlanner::plan(985472), expected);
}

TEST(ChunkPlannerTest, TenMebibytes) {
    const uint64_t size = 1024 * 1024 * 10;
    ChunkPlan plan = ChunkPlanner::plan(size);
    ASSERT_EQ(plan.size(), 14u);

    uint64_t offset = 0;
    for (uint64_t i = 1; i <= 8; ++i) {
        EXPECT_EQ(plan[i - 1], (ChunkEntry{offset, i * ChunkPlanner::RAMP_STEP}));
        offset += i * ChunkPlanner::RAMP_STEP;
    }
    EXPECT_EQ(offset, 4718592u);
    for (size_t i = 8; i < 13; ++i) {
        EXPECT_EQ(plan[i].length, ChunkPlanner::PLATEAU_SIZE);
    }
    EXPECT_EQ(plan.back(), (ChunkEntry{9961472, 524288}));
    EXPECT_EQ(plan.back().length, size - plan.back().offset);
}

TEST(ChunkPlannerTest, RampSumSizesHaveNoEmptyTrailingChunk) {
    for (uint64_t k = 1; k <= 8; ++k) {
        const uint64_t size = k * (k + 1) / 2 * ChunkPlanner::RAMP_STEP;
        ChunkPlan plan = ChunkPlanner::plan(size);
        expect_contiguous(plan, size);
        ASSERT_FALSE(plan.empty());
        EXPECT_NE(plan.back().length, 0u);
    }
    // 36 steps: the eighth ramp step would end exactly at the size, so it
    // becomes the trimmed final chunk instead.
    ChunkPlan plan = ChunkPlanner::plan(36 * ChunkPlanner::RAMP_STEP);
    ASSERT_EQ(plan.size(), 8u);
    EXPECT_EQ(plan.back(), (ChunkEntry{28 * ChunkPlanner::RAMP_STEP, 8 * ChunkPlanner::RAMP_STEP}));
}

TEST(ChunkPlannerTest, PlansAreContiguousAndMatchReference) {
    std::vector<uint64_t> sizes = {2, 17, 131073, 393215, 393216, 393217, 4718591, 4718592, 4718593,
                                   5767168, 9961472, 9961473, 10485760, 33554432 + 7};
    std::mt19937_64 rng(7);
    for (int i = 0; i < 50; ++i) sizes.push_back(rng() % (64ull << 20));

    for (uint64_t size : sizes) {
        ChunkPlan plan = ChunkPlanner::plan(size);
        expect_contiguous(plan, size);
        EXPECT_EQ(ChunkPlanner::totalLength(plan), size);

        auto reference = reference_chunks(size);
        ASSERT_EQ(plan.size(), reference.size()) << "size " << size;
        size_t idx = 0;
        for (const auto& [offset, length] : reference) {
            EXPECT_EQ(plan[idx], (ChunkEntry{offset, length})) << "size " << size;
            ++idx;
        }
    }
}

// ===============================================================================
// MAC primitive / CTR keystream
// ===============================================================================

TEST(MacPrimitiveTest, MacStepIsSingleBlockAes) {
    // FIPS-197 Appendix C.1
    AesKey key = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f};
    MacWords block = {0x00112233, 0x44556677, 0x8899aabb, 0xccddeeff};
    MacWords expected = {0x69c4e0d8, 0x6a7b0430, 0xd8cdb780, 0x70b4c55a};

    EXPECT_EQ(macStep(MacWords{}, block, key), expected);
    // XOR is applied before encryption, whichever side the data comes from.
    EXPECT_EQ(macStep(block, MacWords{}, key), expected);

    MacCipher cipher(key);
    EXPECT_EQ(cipher.step(MacWords{}, block), expected);
    EXPECT_EQ(cipher.step(MacWords{}, block), expected) << "IV must be reset between steps";
}

TEST(MacPrimitiveTest, SeedAndTag) {
    MacWords seed = chunkMacSeed(TEST_IV);
    EXPECT_EQ(seed, (MacWords{0xb6a231ec, 0xae7c1d64, 0xb6a231ec, 0xae7c1d64}));

    FileTag tag = tagFromFileMac({0x11111111, 0x22222222, 0xf0f0f0f0, 0x0f0f0f0f});
    EXPECT_EQ(tag, (FileTag{0x33, 0x33, 0x33, 0x33, 0xff, 0xff, 0xff, 0xff}));
    EXPECT_EQ(tagFromFileMac(MacWords{}), FileTag{});
}

TEST(MacPrimitiveTest, ShortBlockIsZeroPadded) {
    unsigned char data[5] = {1, 2, 3, 4, 5};
    EXPECT_EQ(loadMacBlock(data, 5), (MacWords{0x01020304, 0x05000000, 0, 0}));
}

TEST(CtrCipherTest, SeekMatchesContinuousKeystream) {
    // Low counter bytes near overflow so seeking exercises the carry.
    AesIv iv = {0, 1, 2, 3, 4, 5, 6, 7, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xf0};
    std::vector<unsigned char> zeros(4096, 0);
    std::vector<unsigned char> keystream = reference_ctr(zeros, TEST_KEY, iv);

    CtrCipher cipher(TEST_KEY, iv);
    for (uint64_t offset : {0ull, 1ull, 15ull, 16ull, 255ull, 256ull, 257ull, 1000ull, 4000ull}) {
        const size_t len = static_cast<size_t>(std::min<uint64_t>(64, 4096 - offset));
        std::vector<unsigned char> out(len, 0);
        cipher.seek(offset);
        EXPECT_EQ(cipher.position(), offset);
        cipher.apply(out.data(), out.data(), len);
        EXPECT_EQ(cipher.position(), offset + len);
        EXPECT_TRUE(std::equal(out.begin(), out.end(), keystream.begin() + offset)) << "offset " << offset;
    }
}

// ===============================================================================
// StreamingVerifier
// ===============================================================================

TEST(StreamingVerifierTest, RoundTripMatchesReference) {
    for (size_t size : {1u, 15u, 16u, 17u, 131072u, 131089u, 985472u, 2097155u}) {
        std::vector<unsigned char> plain = make_plaintext(size);
        std::vector<unsigned char> cipher = reference_ctr(plain, TEST_KEY, TEST_IV);
        FileTag expected = reference_tag(plain, TEST_KEY, TEST_IV);

        MemorySource source(cipher);
        MemorySink sink;
        StreamingVerifier verifier(TEST_KEY, TEST_IV);
        auto result = verifier.verify(ChunkPlanner::plan(size), source, sink, expected);

        ASSERT_TRUE(result.has_value()) << "size " << size << ": " << toString(result.error());
        EXPECT_TRUE(result->match) << "size " << size;
        EXPECT_EQ(result->computed_tag, expected);
        EXPECT_EQ(result->bytes_written, size);
        EXPECT_EQ(sink.data(), plain) << "size " << size;
    }
}

TEST(StreamingVerifierTest, ShortReadsAreReassembled) {
    const size_t size = 300000;
    std::vector<unsigned char> plain = make_plaintext(size, 3);
    std::vector<unsigned char> cipher = reference_ctr(plain, TEST_KEY, TEST_IV);
    FileKeyMaterial material{TEST_KEY, TEST_IV, reference_tag(plain, TEST_KEY, TEST_IV)};

    MemorySource source(cipher, 7);
    MemorySink sink;
    auto result = verify(ChunkPlanner::plan(size), source, sink, material);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->match);
    EXPECT_EQ(sink.data(), plain);
}

TEST(StreamingVerifierTest, EmptyPlanFinalizesFromInitialState) {
    MemorySource source(std::vector<unsigned char>{});
    MemorySink sink;
    StreamingVerifier verifier(TEST_KEY, TEST_IV);
    auto result = verifier.verify(ChunkPlanner::plan(0), source, sink, FileTag{});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->match);
    EXPECT_EQ(result->bytes_written, 0u);
    EXPECT_TRUE(sink.data().empty());
}

TEST(StreamingVerifierTest, SingleBitFlipIsDetected) {
    const size_t size = 700001;
    std::vector<unsigned char> plain = make_plaintext(size, 11);
    std::vector<unsigned char> cipher = reference_ctr(plain, TEST_KEY, TEST_IV);
    FileTag expected = reference_tag(plain, TEST_KEY, TEST_IV);

    for (size_t pos : {size_t{0}, size_t{131071}, size_t{131072}, size / 2, size - 1}) {
        for (int bit : {0, 7}) {
            std::vector<unsigned char> mutated = cipher;
            mutated[pos] ^= static_cast<unsigned char>(1u << bit);

            MemorySource source(mutated);
            MemorySink sink;
            StreamingVerifier verifier(TEST_KEY, TEST_IV);
            auto result = verifier.verify(ChunkPlanner::plan(size), source, sink, expected);
            ASSERT_TRUE(result.has_value());
            EXPECT_FALSE(result->match) << "pos " << pos << " bit " << bit;
            EXPECT_NE(result->computed_tag, expected);
            EXPECT_EQ(result->bytes_written, size) << "output is still written in full";
        }
    }
}

TEST(StreamingVerifierTest, TruncatedStreamAborts) {
    const size_t size = 400000;
    std::vector<unsigned char> plain = make_plaintext(size, 5);
    std::vector<unsigned char> cipher = reference_ctr(plain, TEST_KEY, TEST_IV);
    FileTag expected = reference_tag(plain, TEST_KEY, TEST_IV);
    cipher.resize(size - 1);

    MemorySource source(cipher, 4096);
    MemorySink sink;
    StreamingVerifier verifier(TEST_KEY, TEST_IV);
    auto result = verifier.verify(ChunkPlanner::plan(size), source, sink, expected);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ChunkMacError::StreamTruncated);
}

TEST(StreamingVerifierTest, TrailingInputIsReported) {
    const size_t size = 200000;
    std::vector<unsigned char> plain = make_plaintext(size, 17);
    std::vector<unsigned char> cipher = reference_ctr(plain, TEST_KEY, TEST_IV);
    FileTag expected = reference_tag(plain, TEST_KEY, TEST_IV);

    MemorySource exact(cipher);
    MemorySink exact_sink;
    StreamingVerifier verifier(TEST_KEY, TEST_IV);
    auto complete = verifier.verify(ChunkPlanner::plan(size), exact, exact_sink, expected);
    ASSERT_TRUE(complete.has_value());
    EXPECT_TRUE(complete->match);
    EXPECT_FALSE(complete->trailing_input);

    // A plan shorter than the stream still verifies its prefix, but says so.
    const size_t prefix = 150000;
    std::vector<unsigned char> head(plain.begin(), plain.begin() + prefix);
    MemorySource longer(cipher);
    MemorySink prefix_sink;
    auto partial = verifier.verify(ChunkPlanner::plan(prefix), longer, prefix_sink,
                                   reference_tag(head, TEST_KEY, TEST_IV));
    ASSERT_TRUE(partial.has_value());
    EXPECT_TRUE(partial->match);
    EXPECT_TRUE(partial->trailing_input);
    EXPECT_EQ(prefix_sink.data(), head);

    MemorySource plain_longer(plain);
    auto plain_partial = verifier.verifyPlaintext(ChunkPlanner::plan(prefix), plain_longer,
                                                  reference_tag(head, TEST_KEY, TEST_IV));
    ASSERT_TRUE(plain_partial.has_value());
    EXPECT_TRUE(plain_partial->trailing_input);
}

TEST(StreamingVerifierTest, EncryptThenVerify) {
    const size_t size = 1234567;
    std::vector<unsigned char> plain = make_plaintext(size, 9);

    StreamingVerifier verifier(TEST_KEY, TEST_IV);
    MemorySource plain_source(plain);
    MemorySink cipher_sink;
    auto encrypted = encryptStream(ChunkPlanner::plan(size), plain_source, cipher_sink, TEST_KEY, TEST_IV);
    ASSERT_TRUE(encrypted.has_value());
    EXPECT_EQ(encrypted->bytes_written, size);
    EXPECT_EQ(cipher_sink.data(), reference_ctr(plain, TEST_KEY, TEST_IV));
    EXPECT_EQ(encrypted->tag, reference_tag(plain, TEST_KEY, TEST_IV));

    MemorySource cipher_source(cipher_sink.data());
    MemorySink plain_sink;
    auto verified = verifier.verify(ChunkPlanner::plan(size), cipher_source, plain_sink, encrypted->tag);
    ASSERT_TRUE(verified.has_value());
    EXPECT_TRUE(verified->match);
    EXPECT_EQ(plain_sink.data(), plain);
}

TEST(StreamingVerifierTest, VerifyPlaintext) {
    const size_t size = 262145;
    std::vector<unsigned char> plain = make_plaintext(size, 13);
    FileTag expected = reference_tag(plain, TEST_KEY, TEST_IV);

    StreamingVerifier verifier(TEST_KEY, TEST_IV);
    MemorySource good(plain);
    auto ok = verifier.verifyPlaintext(ChunkPlanner::plan(size), good, expected);
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(ok->match);

    MemorySource again(plain);
    auto free_ok = verifyPlaintext(ChunkPlanner::plan(size), again, FileKeyMaterial{TEST_KEY, TEST_IV, expected});
    ASSERT_TRUE(free_ok.has_value());
    EXPECT_TRUE(free_ok->match);

    plain[size - 1] ^= 0x80;
    MemorySource bad(plain);
    auto mismatch = verifier.verifyPlaintext(ChunkPlanner::plan(size), bad, expected);
    ASSERT_TRUE(mismatch.has_value());
    EXPECT_FALSE(mismatch->match);
}

TEST(StreamingVerifierTest, ProgressIsReportedPerChunk) {
    const size_t size = 985472;
    std::vector<unsigned char> plain = make_plaintext(size);
    MemorySource source(plain);

    std::vector<uint64_t> reported;
    StreamingVerifier verifier(TEST_KEY, TEST_IV);
    verifier.set_progress_callback([&](uint64_t done, uint64_t total) {
        EXPECT_EQ(total, size);
        reported.push_back(done);
    });
    auto result = verifier.verifyPlaintext(ChunkPlanner::plan(size), source, FileTag{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(reported, (std::vector<uint64_t>{131072, 393216, 786432, 985472}));
}

// ===============================================================================
// Configuration / utilities
// ===============================================================================

TEST(ConfigTest, LoadFromJson) {
    ChunkMacConfig config = load_config_from_json(R"({
        "operation": "decrypt",
        "input_file": "in.enc",
        "output_file": "out.bin",
        "key": "a18d6d2c543e8782249eeba637ebce2b",
        "iv": "b6a231ecae7c1d640000000000000000",
        "expected_tag": "b1eaa2b0e0317e2f",
        "total_size": 985472,
        "show_progress": true
    })");
    EXPECT_EQ(config.operation, Operation::Decrypt);
    EXPECT_EQ(config.input_file, "in.enc");
    EXPECT_EQ(config.output_file, "out.bin");
    EXPECT_EQ(config.expected_tag_hex, "b1eaa2b0e0317e2f");
    ASSERT_TRUE(config.total_size.has_value());
    EXPECT_EQ(*config.total_size, 985472u);
    EXPECT_TRUE(config.show_progress);

    EXPECT_THROW(load_config_from_json(R"({"operation": "upload"})"), std::invalid_argument);
    EXPECT_THROW(load_config_from_json(R"({"total_size": -1})"), std::invalid_argument);
}

TEST(UtilsTest, HexRoundTrip) {
    EXPECT_EQ(parse_hex_array<AES_KEY_LEN>("a18d6d2c543e8782249eeba637ebce2b", "key"), TEST_KEY);
    EXPECT_EQ(to_hex(TEST_KEY), "a18d6d2c543e8782249eeba637ebce2b");
    EXPECT_EQ(parse_hex("0xAB:cd"), (std::vector<unsigned char>{0xab, 0xcd}));
    EXPECT_THROW(parse_hex("abc"), std::invalid_argument);
    EXPECT_THROW(parse_hex("zz"), std::invalid_argument);
    EXPECT_THROW(parse_hex_array<FILE_TAG_LEN>("abcd", "tag"), std::invalid_argument);
}

// ===============================================================================
// ChunkMacProcessor (ファイルを使った結合テスト)
// ===============================================================================

// テストフィクスチャ: 一時ディレクトリの作成と後処理をまとめるクラス
class ChunkMacToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = "temp_chunkmac_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directory(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write_file(const std::filesystem::path& path, const std::vector<unsigned char>& data) {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        ofs.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    std::vector<unsigned char> read_file(const std::filesystem::path& path) {
        std::ifstream ifs(path, std::ios::binary);
        return std::vector<unsigned char>(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    }

    ChunkMacConfig decrypt_config(const FileTag& tag) {
        ChunkMacConfig config;
        config.operation = Operation::Decrypt;
        config.input_file = (test_dir / "file.enc").string();
        config.output_file = (test_dir / "file.bin").string();
        config.key_hex = to_hex(TEST_KEY);
        config.iv_hex = to_hex(TEST_IV);
        config.expected_tag_hex = to_hex(tag);
        return config;
    }

    ChunkMacConfig encrypt_config() {
        ChunkMacConfig config;
        config.operation = Operation::Encrypt;
        config.input_file = (test_dir / "file.bin").string();
        config.output_file = (test_dir / "file.enc").string();
        config.key_hex = to_hex(TEST_KEY);
        config.iv_hex = to_hex(TEST_IV);
        return config;
    }

    std::filesystem::path test_dir;
};

TEST_F(ChunkMacToolTest, DecryptFileSucceeds) {
    std::vector<unsigned char> plain = make_plaintext(985472);
    write_file(test_dir / "file.enc", reference_ctr(plain, TEST_KEY, TEST_IV));

    ChunkMacProcessor processor(decrypt_config(reference_tag(plain, TEST_KEY, TEST_IV)));
    ASSERT_NO_THROW(processor.run().get());
    EXPECT_EQ(read_file(test_dir / "file.bin"), plain) << "復号結果が平文と一致しません。";
}

TEST_F(ChunkMacToolTest, DecryptFileReportsIntegrityMismatch) {
    std::vector<unsigned char> plain = make_plaintext(50000);
    write_file(test_dir / "file.enc", reference_ctr(plain, TEST_KEY, TEST_IV));

    FileTag wrong_tag = reference_tag(plain, TEST_KEY, TEST_IV);
    wrong_tag[0] ^= 1;
    ChunkMacProcessor processor(decrypt_config(wrong_tag));
    try {
        processor.run().get();
        FAIL() << "MAC不一致が検出されませんでした。";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), ChunkMacError::IntegrityMismatch);
    }
    EXPECT_TRUE(std::filesystem::exists(test_dir / "file.bin"));
}

TEST_F(ChunkMacToolTest, DecryptFileReportsTruncation) {
    std::vector<unsigned char> plain = make_plaintext(50000);
    write_file(test_dir / "file.enc", reference_ctr(plain, TEST_KEY, TEST_IV));

    ChunkMacConfig config = decrypt_config(reference_tag(plain, TEST_KEY, TEST_IV));
    config.total_size = 60000;
    ChunkMacProcessor processor(config);
    try {
        processor.run().get();
        FAIL() << "入力の途切れが検出されませんでした。";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), ChunkMacError::StreamTruncated);
    }
    EXPECT_FALSE(std::filesystem::exists(test_dir / "file.bin"));
}

TEST_F(ChunkMacToolTest, InvalidKeyIsParameterError) {
    ChunkMacConfig config = decrypt_config(FileTag{});
    config.key_hex = "1234";
    write_file(test_dir / "file.enc", {1, 2, 3});
    try {
        ChunkMacProcessor(config).run().get();
        FAIL();
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), ChunkMacError::ParameterError);
    }
}

TEST_F(ChunkMacToolTest, EncryptFileThenDecrypt) {
    std::vector<unsigned char> plain = make_plaintext(985473, 21);
    write_file(test_dir / "file.bin", plain);

    ASSERT_NO_THROW(ChunkMacProcessor(encrypt_config()).run().get());
    EXPECT_EQ(read_file(test_dir / "file.enc"), reference_ctr(plain, TEST_KEY, TEST_IV)) << "暗号文が一致しません。";

    ChunkMacConfig config = decrypt_config(reference_tag(plain, TEST_KEY, TEST_IV));
    config.output_file = (test_dir / "file.out").string();
    ASSERT_NO_THROW(ChunkMacProcessor(config).run().get());
    EXPECT_EQ(read_file(test_dir / "file.out"), plain) << "復号結果が平文と一致しません。";
}

TEST_F(ChunkMacToolTest, OutputSameAsInputIsRejected) {
    std::vector<unsigned char> plain = make_plaintext(50000);
    std::vector<unsigned char> cipher = reference_ctr(plain, TEST_KEY, TEST_IV);
    write_file(test_dir / "file.enc", cipher);

    ChunkMacConfig config = decrypt_config(reference_tag(plain, TEST_KEY, TEST_IV));
    config.output_file = config.input_file;
    try {
        ChunkMacProcessor(config).run().get();
        FAIL() << "入力と同じ出力先が受け付けられました。";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), ChunkMacError::ParameterError);
    }
    ASSERT_TRUE(std::filesystem::exists(test_dir / "file.enc"));
    EXPECT_EQ(read_file(test_dir / "file.enc"), cipher) << "入力ファイルが変更されました。";

    // Same file through a different spelling of the path.
    write_file(test_dir / "file.bin", plain);
    ChunkMacConfig enc = encrypt_config();
    enc.output_file = (test_dir / "." / "file.bin").string();
    try {
        ChunkMacProcessor(enc).run().get();
        FAIL() << "入力と同じ出力先が受け付けられました。";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), ChunkMacError::ParameterError);
    }
    EXPECT_EQ(read_file(test_dir / "file.bin"), plain) << "入力ファイルが変更されました。";
}

TEST_F(ChunkMacToolTest, FfiReturnCodes) {
    EXPECT_EQ(run_chunkmac_op_json("{not json", nullptr, nullptr), 1);
    EXPECT_EQ(run_chunkmac_op_json(R"({"operation": "upload"})", nullptr, nullptr), 3);
    EXPECT_EQ(run_chunkmac_op_json(R"({"input_file": "file.bin"})", nullptr, nullptr), 3);
    EXPECT_EQ(run_chunkmac_op_json(R"({"operation": "plan", "total_size": 10485760})", nullptr, nullptr), 0);

    std::vector<unsigned char> plain = make_plaintext(20000);
    write_file(test_dir / "file.bin", plain);
    FileTag tag = reference_tag(plain, TEST_KEY, TEST_IV);
    std::string json = std::format(
        R"({{"operation": "verify_plain", "input_file": "{}", "key": "{}", "iv": "{}", "expected_tag": "{}"}})",
        (test_dir / "file.bin").string(), to_hex(TEST_KEY), to_hex(TEST_IV), to_hex(tag));
    EXPECT_EQ(run_chunkmac_op_json(json.c_str(), nullptr, nullptr), 0);

    tag[7] ^= 0x40;
    json = std::format(
        R"({{"operation": "verify_plain", "input_file": "{}", "key": "{}", "iv": "{}", "expected_tag": "{}"}})",
        (test_dir / "file.bin").string(), to_hex(TEST_KEY), to_hex(TEST_IV), to_hex(tag));
    EXPECT_EQ(run_chunkmac_op_json(json.c_str(), nullptr, nullptr), 6);
}
