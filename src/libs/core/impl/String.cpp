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

#include "core/String.hpp"

#include <algorithm>
#include <array>

#include <Wt/WDateTime.h>

namespace mts::core::stringUtils
{
    template<>
    std::optional<std::string> readAs(std::string_view str)
    {
        return std::string{ str };
    }

    template<>
    std::optional<bool> readAs(std::string_view str)
    {
        if (str == "1" || stringCaseInsensitiveEqual(str, "true"))
            return true;
        else if (str == "0" || stringCaseInsensitiveEqual(str, "false"))
            return false;

        return std::nullopt;
    }

    std::vector<std::string_view> splitString(std::string_view str, char separator)
    {
        std::vector<std::string_view> res;

        std::string_view::size_type pos{};
        while (true)
        {
            const auto separatorPos{ str.find(separator, pos) };
            if (separatorPos == std::string_view::npos)
            {
                res.push_back(str.substr(pos));
                break;
            }

            res.push_back(str.substr(pos, separatorPos - pos));
            pos = separatorPos + 1;
        }

        return res;
    }

    std::string_view stringTrim(std::string_view str, std::string_view whitespaces)
    {
        std::string_view res;

        const auto strBegin{ str.find_first_not_of(whitespaces) };
        if (strBegin != std::string_view::npos)
        {
            const auto strEnd{ str.find_last_not_of(whitespaces) };
            res = str.substr(strBegin, strEnd - strBegin + 1);
        }

        return res;
    }

    std::string stringToLower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        std::transform(std::cbegin(str), std::cend(str), std::back_inserter(res), [](unsigned char c) { return std::tolower(c); });

        return res;
    }

    bool stringCaseInsensitiveEqual(std::string_view strA, std::string_view strB)
    {
        return std::equal(std::cbegin(strA), std::cend(strA), std::cbegin(strB), std::cend(strB), [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
    }

    bool stringStartsWith(std::string_view str, std::string_view prefix)
    {
        return str.substr(0, prefix.size()) == prefix;
    }

    std::string toHexString(std::span<const std::byte> data)
    {
        static constexpr std::array<char, 16> digits{ '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };

        std::string res;
        res.reserve(data.size() * 2);
        for (const std::byte b : data)
        {
            res.push_back(digits[std::to_integer<unsigned>(b) >> 4]);
            res.push_back(digits[std::to_integer<unsigned>(b) & 0x0F]);
        }

        return res;
    }

    std::string toISO8601String(const Wt::WDateTime& dateTime)
    {
        if (dateTime.isValid())
        {
            // assume UTC
            return dateTime.toString("yyyy-MM-ddThh:mm:ss.zzz", false).toUTF8() + 'Z';
        }

        return "";
    }

    Wt::WDateTime fromHttpDateString(std::string_view dateTime)
    {
        return Wt::WDateTime::fromString(Wt::WString{ std::string{ stringTrim(dateTime) } }, "ddd, dd MMM yyyy hh:mm:ss 'GMT'");
    }
} // namespace mts::core::stringUtils
