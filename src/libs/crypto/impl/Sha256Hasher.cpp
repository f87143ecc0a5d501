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

#include "crypto/Sha256Hasher.hpp"

#include <fstream>
#include <vector>

#include "core/String.hpp"

#include "OpenSslUtils.hpp"

namespace mts::crypto
{
    struct Sha256Hasher::Context
    {
        openssl::DigestContextPtr digest{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
    };

    Sha256Hasher::Sha256Hasher()
        : _context{ std::make_unique<Context>() }
    {
        if (!_context->digest)
            openssl::throwError("EVP_MD_CTX_new");

        if (EVP_DigestInit_ex(_context->digest.get(), EVP_sha256(), nullptr) != 1)
            openssl::throwError("EVP_DigestInit_ex");
    }

    Sha256Hasher::~Sha256Hasher() = default;

    void Sha256Hasher::update(std::span<const std::byte> buffer)
    {
        if (buffer.empty())
            return;

        if (EVP_DigestUpdate(_context->digest.get(), buffer.data(), buffer.size()) != 1)
            openssl::throwError("EVP_DigestUpdate");
    }

    Sha256Digest Sha256Hasher::finalize()
    {
        Sha256Digest digest;
        unsigned int length{};

        if (EVP_DigestFinal_ex(_context->digest.get(), openssl::toUChar(digest.data()), &length) != 1 || length != digest.size())
            openssl::throwError("EVP_DigestFinal_ex");

        return digest;
    }

    std::string Sha256Hasher::finalizeAsHex()
    {
        const Sha256Digest digest{ finalize() };
        return core::stringUtils::toHexString(digest);
    }

    std::string Sha256Hasher::computeAsHex(std::span<const std::byte> buffer)
    {
        Sha256Hasher hasher;
        hasher.update(buffer);
        return hasher.finalizeAsHex();
    }

    std::string Sha256Hasher::computeFileAsHex(const std::filesystem::path& file)
    {
        std::ifstream ifs{ file, std::ios::binary };
        if (!ifs)
            throw CryptoException{ "Cannot open file '" + file.string() + "' for hashing" };

        Sha256Hasher hasher;

        std::vector<std::byte> buffer(64 * 1024);
        while (ifs)
        {
            ifs.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            hasher.update(std::span{ buffer.data(), static_cast<std::size_t>(ifs.gcount()) });
        }

        if (ifs.bad())
            throw CryptoException{ "Read error while hashing file '" + file.string() + "'" };

        return hasher.finalizeAsHex();
    }
} // namespace mts::crypto
