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

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace mts::codec
{
    // Parses the "-progress" key=value stream, other lines are kept as diagnostics
    class ProgressParser
    {
    public:
        ProgressParser(std::optional<std::chrono::microseconds> duration, std::size_t maxDiagnosticLines = 20);

        // Returns true if the progress changed
        bool feed(std::string_view data);
        bool flush(); // processes a pending incomplete line

        float getProgress() const { return _progress; }
        bool isEnded() const { return _ended; }
        const std::deque<std::string>& getDiagnostics() const { return _diagnostics; }

    private:
        bool processLine(std::string_view line);

        const std::optional<std::chrono::microseconds> _duration;
        const std::size_t _maxDiagnosticLines;
        std::string _pendingLine;
        float _progress{};
        bool _ended{};
        std::deque<std::string> _diagnostics;
    };
} // namespace mts::codec
