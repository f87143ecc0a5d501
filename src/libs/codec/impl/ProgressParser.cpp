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

#include "codec/ProgressParser.hpp"

#include <algorithm>

#include "core/String.hpp"

namespace mts::codec
{
    namespace
    {
        bool isProgressKey(std::string_view key)
        {
            return !key.empty() && std::all_of(std::cbegin(key), std::cend(key), [](char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_'; });
        }
    } // namespace

    ProgressParser::ProgressParser(std::optional<std::chrono::microseconds> duration, std::size_t maxDiagnosticLines)
        : _duration{ duration && duration->count() > 0 ? duration : std::nullopt }
        , _maxDiagnosticLines{ maxDiagnosticLines }
    {
    }

    bool ProgressParser::feed(std::string_view data)
    {
        bool progressChanged{};

        while (!data.empty())
        {
            const std::size_t lineEnd{ data.find_first_of("\r\n") };
            if (lineEnd == std::string_view::npos)
            {
                _pendingLine.append(data);
                break;
            }

            _pendingLine.append(data.substr(0, lineEnd));
            data.remove_prefix(lineEnd + 1);

            progressChanged |= processLine(_pendingLine);
            _pendingLine.clear();
        }

        return progressChanged;
    }

    bool ProgressParser::flush()
    {
        if (_pendingLine.empty())
            return false;

        const bool progressChanged{ processLine(_pendingLine) };
        _pendingLine.clear();
        return progressChanged;
    }

    bool ProgressParser::processLine(std::string_view line)
    {
        line = core::stringUtils::stringTrim(line);
        if (line.empty())
            return false;

        const std::size_t separator{ line.find('=') };
        if (separator != std::string_view::npos && isProgressKey(line.substr(0, separator)))
        {
            const std::string_view key{ line.substr(0, separator) };
            const std::string_view value{ core::stringUtils::stringTrim(line.substr(separator + 1)) };

            if (key == "progress")
            {
                if (value != "end")
                    return false;

                const bool progressChanged{ _progress < 1 };
                _ended = true;
                _progress = 1;
                return progressChanged;
            }

            if (key == "out_time_us" && _duration)
            {
                // "N/A" until the first frame is out
                const std::optional<long long> outTime{ core::stringUtils::readAs<long long>(value) };
                if (!outTime || *outTime < 0)
                    return false;

                const float progress{ std::clamp(static_cast<float>(*outTime) / static_cast<float>(_duration->count()), 0.f, 1.f) };
                if (progress <= _progress)
                    return false;

                _progress = progress;
                return true;
            }

            return false;
        }

        if (_maxDiagnosticLines == 0)
            return false;

        if (_diagnostics.size() == _maxDiagnosticLines)
            _diagnostics.pop_front();
        _diagnostics.emplace_back(line);

        return false;
    }
} // namespace mts::codec
