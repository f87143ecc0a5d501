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

#include "crypto/KeyDerivation.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include <openssl/kdf.h>

#include "core/ILogger.hpp"

#include "OpenSslUtils.hpp"

namespace mts::crypto
{
    std::vector<std::byte> readSecretFile(const std::filesystem::path& secretFile)
    {
        std::ifstream ifs{ secretFile, std::ios::binary };
        if (!ifs)
            throw CryptoException{ "Cannot open secret file '" + secretFile.string() + "'" };

        std::vector<char> content{ std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{} };
        if (ifs.bad())
            throw CryptoException{ "Cannot read secret file '" + secretFile.string() + "'" };

        if (content.size() < minSecretSize)
            throw CryptoException{ "Secret file '" + secretFile.string() + "' is too short: at least " + std::to_string(minSecretSize) + " bytes expected" };

        MTS_LOG(CRYPTO, DEBUG, "Loaded " << content.size() << " bytes secret from " << secretFile);

        std::vector<std::byte> secret(content.size());
        std::transform(std::cbegin(content), std::cend(content), std::begin(secret), [](char c) { return static_cast<std::byte>(c); });
        return secret;
    }

    Key deriveKey(std::span<const std::byte> secret, std::span<const std::byte> salt, std::string_view info)
    {
        openssl::PKeyContextPtr context{ EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr), &EVP_PKEY_CTX_free };
        if (!context)
            openssl::throwError("EVP_PKEY_CTX_new_id");

        if (EVP_PKEY_derive_init(context.get()) <= 0)
            openssl::throwError("EVP_PKEY_derive_init");
        if (EVP_PKEY_CTX_set_hkdf_md(context.get(), EVP_sha256()) <= 0)
            openssl::throwError("EVP_PKEY_CTX_set_hkdf_md");
        if (EVP_PKEY_CTX_set1_hkdf_salt(context.get(), openssl::toUChar(salt.data()), static_cast<int>(salt.size())) <= 0)
            openssl::throwError("EVP_PKEY_CTX_set1_hkdf_salt");
        if (EVP_PKEY_CTX_set1_hkdf_key(context.get(), openssl::toUChar(secret.data()), static_cast<int>(secret.size())) <= 0)
            openssl::throwError("EVP_PKEY_CTX_set1_hkdf_key");
        if (EVP_PKEY_CTX_add1_hkdf_info(context.get(), reinterpret_cast<const unsigned char*>(info.data()), static_cast<int>(info.size())) <= 0)
            openssl::throwError("EVP_PKEY_CTX_add1_hkdf_info");

        Key key;
        std::size_t keySize{ key.size() };
        if (EVP_PKEY_derive(context.get(), openssl::toUChar(key.data()), &keySize) <= 0 || keySize != key.size())
            openssl::throwError("EVP_PKEY_derive");

        return key;
    }
} // namespace mts::crypto
