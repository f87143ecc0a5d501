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

#include "CryptoPipeline.hpp"

#include <algorithm>
#include <bit>
#include <fstream>

#include <openssl/rand.h>

#include "core/ILogger.hpp"
#include "crypto/KeyDerivation.hpp"
#include "crypto/Sha256Hasher.hpp"

#include "OpenSslUtils.hpp"

namespace mts::crypto
{
    namespace
    {
        constexpr std::array<std::byte, 4> magic{ std::byte{ 'M' }, std::byte{ 'T' }, std::byte{ 'S' }, std::byte{ '1' } };
        constexpr std::uint8_t minChunkSizeLog2{ 10 };
        constexpr std::uint8_t maxChunkSizeLog2{ 24 };

        class ChunkCipher
        {
        public:
            ChunkCipher(const Key& key)
                : _key{ key }
            {
                if (!_context)
                    openssl::throwError("EVP_CIPHER_CTX_new");
            }

            // appends ciphertext and tag to output
            void encrypt(std::uint64_t index, bool last, std::span<const std::byte> plaintext, std::vector<std::byte>& output)
            {
                const Nonce nonce{ makeNonce(index) };
                if (EVP_EncryptInit_ex(_context.get(), EVP_chacha20_poly1305(), nullptr, openssl::toUChar(_key.data()), nonce.data()) != 1)
                    openssl::throwError("EVP_EncryptInit_ex");

                const Aad aad{ makeAad(index, last) };
                int aadLength{};
                if (EVP_EncryptUpdate(_context.get(), nullptr, &aadLength, aad.data(), static_cast<int>(aad.size())) != 1)
                    openssl::throwError("EVP_EncryptUpdate");

                const std::size_t offset{ output.size() };
                output.resize(offset + plaintext.size() + sealTagSize);

                int length{};
                if (!plaintext.empty() && EVP_EncryptUpdate(_context.get(), openssl::toUChar(output.data() + offset), &length, openssl::toUChar(plaintext.data()), static_cast<int>(plaintext.size())) != 1)
                    openssl::throwError("EVP_EncryptUpdate");

                int finalLength{};
                if (EVP_EncryptFinal_ex(_context.get(), openssl::toUChar(output.data() + offset + length), &finalLength) != 1)
                    openssl::throwError("EVP_EncryptFinal_ex");

                if (static_cast<std::size_t>(length + finalLength) != plaintext.size())
                    throw CryptoException{ "Unexpected ciphertext size" };

                if (EVP_CIPHER_CTX_ctrl(_context.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(sealTagSize), output.data() + offset + plaintext.size()) != 1)
                    openssl::throwError("EVP_CTRL_AEAD_GET_TAG");
            }

            // appends plaintext to output, returns false if the chunk cannot be authenticated
            bool decrypt(std::uint64_t index, bool last, std::span<const std::byte> sealedChunk, std::vector<std::byte>& output)
            {
                if (sealedChunk.size() < sealTagSize)
                    return false;

                const std::span<const std::byte> ciphertext{ sealedChunk.first(sealedChunk.size() - sealTagSize) };
                std::array<std::byte, sealTagSize> tag;
                std::copy(std::cend(sealedChunk) - sealTagSize, std::cend(sealedChunk), std::begin(tag));

                const Nonce nonce{ makeNonce(index) };
                if (EVP_DecryptInit_ex(_context.get(), EVP_chacha20_poly1305(), nullptr, openssl::toUChar(_key.data()), nonce.data()) != 1)
                    openssl::throwError("EVP_DecryptInit_ex");

                const Aad aad{ makeAad(index, last) };
                int aadLength{};
                if (EVP_DecryptUpdate(_context.get(), nullptr, &aadLength, aad.data(), static_cast<int>(aad.size())) != 1)
                    openssl::throwError("EVP_DecryptUpdate");

                const std::size_t offset{ output.size() };
                output.resize(offset + ciphertext.size());

                int length{};
                if (!ciphertext.empty() && EVP_DecryptUpdate(_context.get(), openssl::toUChar(output.data() + offset), &length, openssl::toUChar(ciphertext.data()), static_cast<int>(ciphertext.size())) != 1)
                    openssl::throwError("EVP_DecryptUpdate");

                if (EVP_CIPHER_CTX_ctrl(_context.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1)
                    openssl::throwError("EVP_CTRL_AEAD_SET_TAG");

                int finalLength{};
                if (EVP_DecryptFinal_ex(_context.get(), openssl::toUChar(output.data() + offset + length), &finalLength) != 1)
                {
                    ERR_clear_error();
                    output.resize(offset);
                    return false;
                }

                return true;
            }

        private:
            using Nonce = std::array<unsigned char, 12>;
            using Aad = std::array<unsigned char, 9>;

            static Nonce makeNonce(std::uint64_t index)
            {
                Nonce nonce{};
                for (std::size_t i{}; i < 8; ++i)
                    nonce[nonce.size() - 1 - i] = static_cast<unsigned char>(index >> (i * 8));
                return nonce;
            }

            static Aad makeAad(std::uint64_t index, bool last)
            {
                Aad aad{};
                for (std::size_t i{}; i < 8; ++i)
                    aad[7 - i] = static_cast<unsigned char>(index >> (i * 8));
                aad[8] = last ? 1 : 0;
                return aad;
            }

            const Key _key;
            openssl::CipherContextPtr _context{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        };

        // number of sealed chunks in a payload, or nothing if the payload cannot be split
        std::optional<std::size_t> computeChunkCount(std::size_t payloadSize, std::size_t chunkSize)
        {
            if (payloadSize < sealTagSize)
                return std::nullopt;

            const std::size_t sealedChunkSize{ chunkSize + sealTagSize };
            const std::size_t chunkCount{ (payloadSize + sealedChunkSize - 1) / sealedChunkSize };
            const std::size_t lastChunkSize{ payloadSize - (chunkCount - 1) * sealedChunkSize };
            if (lastChunkSize < sealTagSize)
                return std::nullopt;

            return chunkCount;
        }

        std::uint8_t computeChunkSizeLog2(std::size_t chunkSize)
        {
            if (!std::has_single_bit(chunkSize))
                throw CryptoException{ "Seal chunk size must be a power of 2" };

            const auto chunkSizeLog2{ static_cast<std::uint8_t>(std::countr_zero(chunkSize)) };
            if (chunkSizeLog2 < minChunkSizeLog2 || chunkSizeLog2 > maxChunkSizeLog2)
                throw CryptoException{ "Seal chunk size out of range" };

            return chunkSizeLog2;
        }
    } // namespace

    std::string_view toString(OpenError error)
    {
        switch (error)
        {
        case OpenError::InvalidHeader:
            return "invalid header";
        case OpenError::Truncated:
            return "truncated";
        case OpenError::IntegrityFailure:
            return "integrity failure";
        }

        return "unknown";
    }

    std::unique_ptr<ICryptoPipeline> createCryptoPipeline(std::vector<std::byte> secret, std::size_t chunkSize)
    {
        return std::make_unique<CryptoPipeline>(std::move(secret), chunkSize);
    }

    CryptoPipeline::CryptoPipeline(std::vector<std::byte> secret, std::size_t chunkSize)
        : _secret{ std::move(secret) }
        , _chunkSizeLog2{ computeChunkSizeLog2(chunkSize) }
    {
        if (_secret.size() < minSecretSize)
            throw CryptoException{ "Encryption secret too short" };
    }

    SealedBuffer CryptoPipeline::seal(std::span<const std::byte> plaintext, const core::UUID& jobId)
    {
        const Header header{ createHeader() };
        ChunkCipher cipher{ deriveJobKey(header, jobId) };
        const std::size_t chunkSize{ std::size_t{ 1 } << header.chunkSizeLog2 };

        SealedBuffer res;
        const auto serializedHeader{ serializeHeader(header) };
        res.ciphertext.reserve(serializedHeader.size() + plaintext.size() + (plaintext.size() / chunkSize + 1) * sealTagSize);
        res.ciphertext.insert(std::end(res.ciphertext), std::cbegin(serializedHeader), std::cend(serializedHeader));

        std::uint64_t index{};
        std::size_t offset{};
        do
        {
            const std::size_t size{ std::min(chunkSize, plaintext.size() - offset) };
            const bool last{ offset + size == plaintext.size() };

            cipher.encrypt(index++, last, plaintext.subspan(offset, size), res.ciphertext);
            offset += size;
        } while (offset < plaintext.size());

        res.contentHash = Sha256Hasher::computeAsHex(plaintext);
        return res;
    }

    OpenBufferResult CryptoPipeline::open(std::span<const std::byte> sealed, const core::UUID& jobId)
    {
        if (sealed.size() < sealHeaderSize)
            return OpenError::InvalidHeader;

        const std::optional<Header> header{ parseHeader(sealed.first(sealHeaderSize)) };
        if (!header)
            return OpenError::InvalidHeader;

        const std::size_t chunkSize{ std::size_t{ 1 } << header->chunkSizeLog2 };
        const std::size_t sealedChunkSize{ chunkSize + sealTagSize };
        const std::span<const std::byte> payload{ sealed.subspan(sealHeaderSize) };

        const std::optional<std::size_t> chunkCount{ computeChunkCount(payload.size(), chunkSize) };
        if (!chunkCount)
            return OpenError::Truncated;

        ChunkCipher cipher{ deriveJobKey(*header, jobId) };

        std::vector<std::byte> plaintext;
        plaintext.reserve(payload.size());
        for (std::size_t index{}; index < *chunkCount; ++index)
        {
            const std::size_t offset{ index * sealedChunkSize };
            const std::span<const std::byte> chunk{ payload.subspan(offset, std::min(sealedChunkSize, payload.size() - offset)) };

            if (!cipher.decrypt(index, index + 1 == *chunkCount, chunk, plaintext))
                return OpenError::IntegrityFailure;
        }

        return plaintext;
    }

    SealResult CryptoPipeline::sealFile(const std::filesystem::path& input, const std::filesystem::path& output, const core::UUID& jobId)
    {
        std::error_code ec;
        const std::uintmax_t inputSize{ std::filesystem::file_size(input, ec) };
        if (ec)
            throw CryptoException{ "Cannot get size of '" + input.string() + "': " + ec.message() };

        std::ifstream ifs{ input, std::ios::binary };
        if (!ifs)
            throw CryptoException{ "Cannot open '" + input.string() + "' for reading" };

        std::ofstream ofs{ output, std::ios::binary | std::ios::trunc };
        if (!ofs)
            throw CryptoException{ "Cannot open '" + output.string() + "' for writing" };

        MTS_LOG(CRYPTO, DEBUG, "Sealing " << input << " (" << inputSize << " bytes) into " << output);

        const Header header{ createHeader() };
        ChunkCipher cipher{ deriveJobKey(header, jobId) };
        const std::size_t chunkSize{ std::size_t{ 1 } << header.chunkSizeLog2 };

        Sha256Hasher plaintextHasher;
        Sha256Hasher sealedHasher;
        SealResult res;

        const auto serializedHeader{ serializeHeader(header) };
        ofs.write(reinterpret_cast<const char*>(serializedHeader.data()), serializedHeader.size());
        sealedHasher.update(serializedHeader);
        res.encryptedSize = serializedHeader.size();

        std::vector<std::byte> plaintextBuffer(chunkSize);
        std::vector<std::byte> sealedBuffer;
        sealedBuffer.reserve(chunkSize + sealTagSize);

        std::uint64_t index{};
        std::uintmax_t remaining{ inputSize };
        do
        {
            const std::size_t size{ static_cast<std::size_t>(std::min<std::uintmax_t>(chunkSize, remaining)) };
            ifs.read(reinterpret_cast<char*>(plaintextBuffer.data()), static_cast<std::streamsize>(size));
            if (static_cast<std::size_t>(ifs.gcount()) != size)
                throw CryptoException{ "Unexpected end of file while sealing '" + input.string() + "'" };

            const std::span<const std::byte> plaintext{ plaintextBuffer.data(), size };
            plaintextHasher.update(plaintext);

            sealedBuffer.clear();
            cipher.encrypt(index++, remaining == size, plaintext, sealedBuffer);

            ofs.write(reinterpret_cast<const char*>(sealedBuffer.data()), static_cast<std::streamsize>(sealedBuffer.size()));
            sealedHasher.update(sealedBuffer);
            res.encryptedSize += sealedBuffer.size();

            remaining -= size;
        } while (remaining > 0);

        ofs.flush();
        if (!ofs)
            throw CryptoException{ "Write error while sealing into '" + output.string() + "'" };

        res.contentHash = plaintextHasher.finalizeAsHex();
        res.ciphertextHash = sealedHasher.finalizeAsHex();

        MTS_LOG(CRYPTO, DEBUG, "Sealed " << output << ": " << res.encryptedSize << " bytes, " << index << " chunks");

        return res;
    }

    OpenResult CryptoPipeline::openFile(const std::filesystem::path& input, const std::optional<std::filesystem::path>& output, const core::UUID& jobId)
    {
        std::error_code ec;
        const std::uintmax_t inputSize{ std::filesystem::file_size(input, ec) };
        if (ec)
            throw CryptoException{ "Cannot get size of '" + input.string() + "': " + ec.message() };

        if (inputSize < sealHeaderSize)
            return OpenError::InvalidHeader;

        std::ifstream ifs{ input, std::ios::binary };
        if (!ifs)
            throw CryptoException{ "Cannot open '" + input.string() + "' for reading" };

        std::array<std::byte, sealHeaderSize> headerBuffer;
        ifs.read(reinterpret_cast<char*>(headerBuffer.data()), headerBuffer.size());
        if (static_cast<std::size_t>(ifs.gcount()) != headerBuffer.size())
            throw CryptoException{ "Cannot read header of '" + input.string() + "'" };

        const std::optional<Header> header{ parseHeader(headerBuffer) };
        if (!header)
            return OpenError::InvalidHeader;

        const std::size_t chunkSize{ std::size_t{ 1 } << header->chunkSizeLog2 };
        const std::size_t sealedChunkSize{ chunkSize + sealTagSize };
        const std::size_t payloadSize{ static_cast<std::size_t>(inputSize - sealHeaderSize) };

        const std::optional<std::size_t> chunkCount{ computeChunkCount(payloadSize, chunkSize) };
        if (!chunkCount)
            return OpenError::Truncated;

        std::ofstream ofs;
        if (output)
        {
            ofs.open(*output, std::ios::binary | std::ios::trunc);
            if (!ofs)
                throw CryptoException{ "Cannot open '" + output->string() + "' for writing" };
        }

        ChunkCipher cipher{ deriveJobKey(*header, jobId) };
        Sha256Hasher plaintextHasher;
        OpenSuccess res;

        std::vector<std::byte> sealedBuffer(sealedChunkSize);
        std::vector<std::byte> plaintextBuffer;
        plaintextBuffer.reserve(chunkSize);

        std::size_t remaining{ payloadSize };
        for (std::size_t index{}; index < *chunkCount; ++index)
        {
            const std::size_t size{ std::min(sealedChunkSize, remaining) };
            ifs.read(reinterpret_cast<char*>(sealedBuffer.data()), static_cast<std::streamsize>(size));
            if (static_cast<std::size_t>(ifs.gcount()) != size)
                throw CryptoException{ "Unexpected end of file while opening '" + input.string() + "'" };

            plaintextBuffer.clear();
            if (!cipher.decrypt(index, index + 1 == *chunkCount, std::span{ sealedBuffer.data(), size }, plaintextBuffer))
            {
                MTS_LOG(CRYPTO, DEBUG, "Authentication failed for chunk " << index << " of " << input);
                return OpenError::IntegrityFailure;
            }

            plaintextHasher.update(plaintextBuffer);
            res.plaintextSize += plaintextBuffer.size();
            if (output)
                ofs.write(reinterpret_cast<const char*>(plaintextBuffer.data()), static_cast<std::streamsize>(plaintextBuffer.size()));

            remaining -= size;
        }

        if (output)
        {
            ofs.flush();
            if (!ofs)
                throw CryptoException{ "Write error while opening into '" + output->string() + "'" };
        }

        res.contentHash = plaintextHasher.finalizeAsHex();
        return res;
    }

    CryptoPipeline::Header CryptoPipeline::createHeader() const
    {
        Header header;
        header.chunkSizeLog2 = _chunkSizeLog2;
        if (RAND_bytes(openssl::toUChar(header.salt.data()), static_cast<int>(header.salt.size())) != 1)
            openssl::throwError("RAND_bytes");

        return header;
    }

    std::array<std::byte, sealHeaderSize> CryptoPipeline::serializeHeader(const Header& header)
    {
        std::array<std::byte, sealHeaderSize> res{};

        auto it{ std::copy(std::cbegin(magic), std::cend(magic), std::begin(res)) };
        *it++ = std::byte{ header.chunkSizeLog2 };
        it += 3; // reserved
        std::copy(std::cbegin(header.salt), std::cend(header.salt), it);

        return res;
    }

    std::optional<CryptoPipeline::Header> CryptoPipeline::parseHeader(std::span<const std::byte> buffer)
    {
        if (buffer.size() != sealHeaderSize)
            return std::nullopt;

        if (!std::equal(std::cbegin(magic), std::cend(magic), std::cbegin(buffer)))
            return std::nullopt;

        Header header;
        header.chunkSizeLog2 = static_cast<std::uint8_t>(buffer[4]);
        if (header.chunkSizeLog2 < minChunkSizeLog2 || header.chunkSizeLog2 > maxChunkSizeLog2)
            return std::nullopt;

        if (std::any_of(std::cbegin(buffer) + 5, std::cbegin(buffer) + 8, [](std::byte b) { return b != std::byte{ 0 }; }))
            return std::nullopt;

        std::copy(std::cbegin(buffer) + 8, std::cend(buffer), std::begin(header.salt));
        return header;
    }

    Key CryptoPipeline::deriveJobKey(const Header& header, const core::UUID& jobId) const
    {
        return deriveKey(_secret, header.salt, jobId.getAsString());
    }
} // namespace mts::crypto
