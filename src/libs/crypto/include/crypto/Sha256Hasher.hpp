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

#include <filesystem>
#include <memory>
#include <span>
#include <string>

#include "crypto/Types.hpp"

namespace mts::crypto
{
    class Sha256Hasher
    {
    public:
        Sha256Hasher();
        ~Sha256Hasher();
        Sha256Hasher(const Sha256Hasher&) = delete;
        Sha256Hasher& operator=(const Sha256Hasher&) = delete;

        void update(std::span<const std::byte> buffer);
        Sha256Digest finalize(); // hasher cannot be updated afterwards
        std::string finalizeAsHex();

        static std::string computeAsHex(std::span<const std::byte> buffer);
        static std::string computeFileAsHex(const std::filesystem::path& file); // throws CryptoException on read failure

    private:
        struct Context;
        std::unique_ptr<Context> _context;
    };
} // namespace mts::crypto
