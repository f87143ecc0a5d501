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

#include <mutex>
#include <ostream>

#include "core/ILogger.hpp"

namespace mts::core::logging
{
    // Logs everything at or above minSeverity into a single stream (tests, command line tools)
    class StreamLogger final : public ILogger
    {
    public:
        StreamLogger(std::ostream& os, Severity minSeverity = Severity::INFO);

        bool isSeverityActive(Severity severity) const override { return static_cast<int>(severity) <= static_cast<int>(_minSeverity); }
        void processLog(const Log& log) override;

    private:
        std::ostream& _os;
        const Severity _minSeverity;
        std::mutex _mutex;
    };
} // namespace mts::core::logging
