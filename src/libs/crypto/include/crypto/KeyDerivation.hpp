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

#include <cstddef>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

#include "crypto/Types.hpp"

namespace mts::crypto
{
    static constexpr std::size_t minSecretSize{ 32 };

    // Whole file content is the secret, throws CryptoException if too short or unreadable
    std::vector<std::byte> readSecretFile(const std::filesystem::path& secretFile);

    // HKDF-SHA256
    Key deriveKey(std::span<const std::byte> secret, std::span<const std::byte> salt, std::string_view info);
} // namespace mts::crypto
