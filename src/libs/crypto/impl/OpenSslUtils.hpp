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

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <openssl/err.h>
#include <openssl/evp.h>

#include "crypto/Types.hpp"

namespace mts::crypto::openssl
{
    using CipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
    using DigestContextPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
    using PKeyContextPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

    [[noreturn]] inline void throwError(std::string_view operation)
    {
        std::string message{ operation };
        message += " failed";

        if (const unsigned long error{ ERR_get_error() }; error != 0)
        {
            char buffer[256];
            ERR_error_string_n(error, buffer, sizeof(buffer));
            message += ": ";
            message += buffer;
        }
        ERR_clear_error();

        throw CryptoException{ message };
    }

    inline const unsigned char* toUChar(const std::byte* data)
    {
        return reinterpret_cast<const unsigned char*>(data);
    }

    inline unsigned char* toUChar(std::byte* data)
    {
        return reinterpret_cast<unsigned char*>(data);
    }
} // namespace mts::crypto::openssl
