/*
 * Copyright (C) 2026 MTS contributors
 *
 * This file is part of MTS.
 *
 * MTS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * MTS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with MTS.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

#include <gtest/gtest.h>

#include "core/Random.hpp"
#include "crypto/ICryptoPipeline.hpp"
#include "crypto/Sha256Hasher.hpp"
#include "crypto/Types.hpp"

namespace mts::crypto::tests
{
    namespace
    {
        constexpr std::size_t testChunkSize{ 1024 };

        std::vector<std::byte> generateBytes(std::size_t size)
        {
            std::vector<std::byte> res(size);
            for (std::byte& b : res)
                b = static_cast<std::byte>(core::random::getRandom<unsigned>(0, 255));
            return res;
        }

        std::vector<std::byte> makeSecret()
        {
            return std::vector<std::byte>(32, std::byte{ 0x5a });
        }

        class ScopedTmpFile
        {
        public:
            ScopedTmpFile(std::string_view name)
                : _path{ std::filesystem::temp_directory_path() / ("mts-crypto-" + std::to_string(core::random::getRandom<unsigned>(0, 0xFFFFFFF)) + "-" + std::string{ name }) }
            {
            }
            ~ScopedTmpFile()
            {
                std::error_code ec;
                std::filesystem::remove(_path, ec);
            }
            ScopedTmpFile(const ScopedTmpFile&) = delete;
            ScopedTmpFile& operator=(const ScopedTmpFile&) = delete;

            const std::filesystem::path& getPath() const { return _path; }

        private:
            const std::filesystem::path _path;
        };

        void writeFile(const std::filesystem::path& path, std::span<const std::byte> content)
        {
            std::ofstream ofs{ path, std::ios::binary | std::ios::trunc };
            ofs.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        }

        std::vector<std::byte> readFile(const std::filesystem::path& path)
        {
            std::ifstream ifs{ path, std::ios::binary };
            std::vector<char> content{ std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{} };
            std::vector<std::byte> res(content.size());
            std::transform(std::cbegin(content), std::cend(content), std::begin(res), [](char c) { return static_cast<std::byte>(c); });
            return res;
        }
    } // namespace

    TEST(CryptoPipeline, sealOpen)
    {
        auto pipeline{ createCryptoPipeline(makeSecret(), testChunkSize) };
        const core::UUID jobId{ core::UUID::generate() };

        for (const std::size_t size : { std::size_t{ 0 }, std::size_t{ 1 }, testChunkSize - 1, testChunkSize, testChunkSize + 1, 5 * testChunkSize + 17 })
        {
            const std::vector<std::byte> plaintext{ generateBytes(size) };
            const SealedBuffer sealed{ pipeline->seal(plaintext, jobId) };

            EXPECT_EQ(sealed.contentHash, Sha256Hasher::computeAsHex(plaintext));
            const std::size_t chunkCount{ size == 0 ? 1 : (size + testChunkSize - 1) / testChunkSize };
            EXPECT_EQ(sealed.ciphertext.size(), sealHeaderSize + size + chunkCount * sealTagSize) << "size = " << size;

            const OpenBufferResult opened{ pipeline->open(sealed.ciphertext, jobId) };
            ASSERT_TRUE(std::holds_alternative<std::vector<std::byte>>(opened)) << "size = " << size;
            EXPECT_EQ(std::get<std::vector<std::byte>>(opened), plaintext);
        }
    }

    TEST(CryptoPipeline, sealIsNotDeterministic)
    {
        auto pipeline{ createCryptoPipeline(makeSecret(), testChunkSize) };
        const core::UUID jobId{ core::UUID::generate() };
        const std::vector<std::byte> plaintext{ generateBytes(100) };

        const SealedBuffer sealed1{ pipeline->seal(plaintext, jobId) };
        const SealedBuffer sealed2{ pipeline->seal(plaintext, jobId) };
        EXPECT_EQ(sealed1.contentHash, sealed2.contentHash);
        EXPECT_NE(sealed1.ciphertext, sealed2.ciphertext);
    }

    TEST(CryptoPipeline, wrongJob)
    {
        auto pipeline{ createCryptoPipeline(makeSecret(), testChunkSize) };
        const SealedBuffer sealed{ pipeline->seal(generateBytes(100), core::UUID::generate()) };

        const OpenBufferResult opened{ pipeline->open(sealed.ciphertext, core::UUID::generate()) };
        ASSERT_TRUE(std::holds_alternative<OpenError>(opened));
        EXPECT_EQ(std::get<OpenError>(opened), OpenError::IntegrityFailure);
    }

    TEST(CryptoPipeline, wrongSecret)
    {
        const core::UUID jobId{ core::UUID::generate() };
        const SealedBuffer sealed{ createCryptoPipeline(makeSecret(), testChunkSize)->seal(generateBytes(100), jobId) };

        const OpenBufferResult opened{ createCryptoPipeline(std::vector<std::byte>(32, std::byte{ 0x01 }), testChunkSize)->open(sealed.ciphertext, jobId) };
        ASSERT_TRUE(std::holds_alternative<OpenError>(opened));
        EXPECT_EQ(std::get<OpenError>(opened), OpenError::IntegrityFailure);
    }

    TEST(CryptoPipeline, tampering)
    {
        auto pipeline{ createCryptoPipeline(makeSecret(), testChunkSize) };
        const core::UUID jobId{ core::UUID::generate() };
        const SealedBuffer sealed{ pipeline->seal(generateBytes(3 * testChunkSize), jobId) };

        {
            std::vector<std::byte> corrupted{ sealed.ciphertext };
            corrupted[sealHeaderSize + testChunkSize + 10] ^= std::byte{ 0x01 };

            const OpenBufferResult opened{ pipeline->open(corrupted, jobId) };
            ASSERT_TRUE(std::holds_alternative<OpenError>(opened));
            EXPECT_EQ(std::get<OpenError>(opened), OpenError::IntegrityFailure);
        }

        {
            // drop the last whole chunk
            std::vector<std::byte> truncated{ sealed.ciphertext };
            truncated.resize(truncated.size() - (testChunkSize + sealTagSize));

            const OpenBufferResult opened{ pipeline->open(truncated, jobId) };
            ASSERT_TRUE(std::holds_alternative<OpenError>(opened));
            EXPECT_EQ(std::get<OpenError>(opened), OpenError::IntegrityFailure);
        }

        {
            // swap the first two chunks
            std::vector<std::byte> reordered{ sealed.ciphertext };
            const auto first{ std::begin(reordered) + sealHeaderSize };
            std::swap_ranges(first, first + testChunkSize + sealTagSize, first + testChunkSize + sealTagSize);

            const OpenBufferResult opened{ pipeline->open(reordered, jobId) };
            ASSERT_TRUE(std::holds_alternative<OpenError>(opened));
            EXPECT_EQ(std::get<OpenError>(opened), OpenError::IntegrityFailure);
        }

        {
            std::vector<std::byte> badHeader{ sealed.ciphertext };
            badHeader[0] = std::byte{ 'X' };

            const OpenBufferResult opened{ pipeline->open(badHeader, jobId) };
            ASSERT_TRUE(std::holds_alternative<OpenError>(opened));
            EXPECT_EQ(std::get<OpenError>(opened), OpenError::InvalidHeader);
        }

        {
            const std::vector<std::byte> headerOnly(std::cbegin(sealed.ciphertext), std::cbegin(sealed.ciphertext) + sealHeaderSize + 4);

            const OpenBufferResult opened{ pipeline->open(headerOnly, jobId) };
            ASSERT_TRUE(std::holds_alternative<OpenError>(opened));
            EXPECT_EQ(std::get<OpenError>(opened), OpenError::Truncated);
        }
    }

    TEST(CryptoPipeline, sealFile)
    {
        auto pipeline{ createCryptoPipeline(makeSecret(), testChunkSize) };
        const core::UUID jobId{ core::UUID::generate() };

        const ScopedTmpFile input{ "input" };
        const ScopedTmpFile sealedFile{ "sealed" };
        const ScopedTmpFile output{ "output" };

        const std::vector<std::byte> plaintext{ generateBytes(10 * testChunkSize + 123) };
        writeFile(input.getPath(), plaintext);

        const SealResult sealResult{ pipeline->sealFile(input.getPath(), sealedFile.getPath(), jobId) };
        EXPECT_EQ(sealResult.contentHash, Sha256Hasher::computeAsHex(plaintext));
        EXPECT_EQ(sealResult.encryptedSize, std::filesystem::file_size(sealedFile.getPath()));
        EXPECT_EQ(sealResult.ciphertextHash, Sha256Hasher::computeFileAsHex(sealedFile.getPath()));

        // verify only
        {
            const OpenResult openResult{ pipeline->openFile(sealedFile.getPath(), std::nullopt, jobId) };
            ASSERT_TRUE(std::holds_alternative<OpenSuccess>(openResult));
            EXPECT_EQ(std::get<OpenSuccess>(openResult).contentHash, sealResult.contentHash);
            EXPECT_EQ(std::get<OpenSuccess>(openResult).plaintextSize, plaintext.size());
        }

        {
            const OpenResult openResult{ pipeline->openFile(sealedFile.getPath(), output.getPath(), jobId) };
            ASSERT_TRUE(std::holds_alternative<OpenSuccess>(openResult));
            EXPECT_EQ(readFile(output.getPath()), plaintext);
        }

        // memory and file variants share the same layout
        {
            const OpenBufferResult opened{ pipeline->open(readFile(sealedFile.getPath()), jobId) };
            ASSERT_TRUE(std::holds_alternative<std::vector<std::byte>>(opened));
            EXPECT_EQ(std::get<std::vector<std::byte>>(opened), plaintext);
        }
    }

    TEST(CryptoPipeline, openFileCorrupted)
    {
        auto pipeline{ createCryptoPipeline(makeSecret(), testChunkSize) };
        const core::UUID jobId{ core::UUID::generate() };

        const ScopedTmpFile input{ "input" };
        const ScopedTmpFile sealedFile{ "sealed" };

        writeFile(input.getPath(), generateBytes(4 * testChunkSize));
        pipeline->sealFile(input.getPath(), sealedFile.getPath(), jobId);

        std::vector<std::byte> sealed{ readFile(sealedFile.getPath()) };
        sealed.back() ^= std::byte{ 0x80 };
        writeFile(sealedFile.getPath(), sealed);

        const OpenResult openResult{ pipeline->openFile(sealedFile.getPath(), std::nullopt, jobId) };
        ASSERT_TRUE(std::holds_alternative<OpenError>(openResult));
        EXPECT_EQ(std::get<OpenError>(openResult), OpenError::IntegrityFailure);
    }

    TEST(CryptoPipeline, sealFileMissingInput)
    {
        auto pipeline{ createCryptoPipeline(makeSecret(), testChunkSize) };
        const ScopedTmpFile input{ "missing" };
        const ScopedTmpFile sealedFile{ "sealed" };

        EXPECT_THROW(pipeline->sealFile(input.getPath(), sealedFile.getPath(), core::UUID::generate()), CryptoException);
    }

    TEST(CryptoPipeline, invalidParameters)
    {
        EXPECT_THROW(createCryptoPipeline(std::vector<std::byte>(8, std::byte{ 1 })), CryptoException);
        EXPECT_THROW(createCryptoPipeline(makeSecret(), 1000), CryptoException);
    }
} // namespace mts::crypto::tests
