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

#include "UrlUtils.hpp"

#include "core/String.hpp"

namespace mts::transfer::urlUtils
{
    std::string resolveLocation(std::string_view requestUrl, std::string_view location)
    {
        if (core::stringUtils::stringStartsWith(location, "http://") || core::stringUtils::stringStartsWith(location, "https://"))
            return std::string{ location };

        const std::size_t schemeEnd{ requestUrl.find("://") };
        if (schemeEnd == std::string_view::npos)
            return std::string{ location };

        const std::size_t authorityEnd{ requestUrl.find('/', schemeEnd + 3) };
        const std::string_view origin{ requestUrl.substr(0, authorityEnd) };

        if (core::stringUtils::stringStartsWith(location, "/"))
            return std::string{ origin } + std::string{ location };

        // relative to the last path segment
        if (authorityEnd == std::string_view::npos)
            return std::string{ origin } + "/" + std::string{ location };

        const std::string_view path{ requestUrl.substr(0, requestUrl.find_first_of("?#")) };
        return std::string{ path.substr(0, path.rfind('/') + 1) } + std::string{ location };
    }
} // namespace mts::transfer::urlUtils
