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

#include "core/UUID.hpp"

#include <cassert>
#include <iomanip>
#include <regex>
#include <sstream>

#include "core/Random.hpp"

namespace mts::core
{
    namespace stringUtils
    {
        template<>
        std::optional<UUID> readAs(std::string_view str)
        {
            return UUID::fromString(str);
        }
    } // namespace stringUtils

    namespace
    {
        bool stringIsUUID(std::string_view str)
        {
            static const std::regex re{ R"([0-9a-fA-F]{8}\-[0-9a-fA-F]{4}\-[0-9a-fA-F]{4}\-[0-9a-fA-F]{4}\-[0-9a-fA-F]{12})" };

            return std::regex_match(std::cbegin(str), std::cend(str), re);
        }
    } // namespace

    UUID::UUID(std::string_view str)
        : _value{ stringUtils::stringToLower(str) }
    {
    }

    std::optional<UUID> UUID::fromString(std::string_view str)
    {
        if (!stringIsUUID(str))
            return std::nullopt;

        return UUID{ str };
    }

    UUID UUID::generate()
    {
        unsigned char bytes[16];
        for (unsigned char& byte : bytes)
            byte = static_cast<unsigned char>(random::getRandom<unsigned>(0, 255));

        bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
        bytes[8] = (bytes[8] & 0x3F) | 0x80; // RFC 4122 variant

        std::ostringstream oss;
        for (std::size_t i{}; i < sizeof(bytes); ++i)
        {
            if (i == 4 || i == 6 || i == 8 || i == 10)
                oss << '-';
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
        }

        const auto uuid{ fromString(oss.str()) };
        assert(uuid);
        return uuid.value();
    }
} // namespace mts::core
