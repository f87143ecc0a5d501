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

#include "Logger.hpp"

#include <cassert>
#include <iostream>
#include <thread>

#include <Wt/WDateTime.h>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace mts::core::logging
{
    const char* getModuleName(Module mod)
    {
        switch (mod)
        {
        case Module::CHILDPROCESS:
            return "CHILDPROC";
        case Module::CODEC:
            return "CODEC";
        case Module::CRYPTO:
            return "CRYPTO";
        case Module::DB:
            return "DB";
        case Module::ENCODER:
            return "ENCODER";
        case Module::HTTP:
            return "HTTP";
        case Module::MAIN:
            return "MAIN";
        case Module::ORCHESTRATOR:
            return "ORCHESTRATOR";
        case Module::TRANSFER:
            return "TRANSFER";
        case Module::UTILS:
            return "UTILS";
        }
        return "";
    }

    const char* getSeverityName(Severity sev)
    {
        switch (sev)
        {
        case Severity::FATAL:
            return "fatal";
        case Severity::ERROR:
            return "error";
        case Severity::WARNING:
            return "warning";
        case Severity::INFO:
            return "info";
        case Severity::DEBUG:
            return "debug";
        }
        return "";
    }

    std::optional<Severity> parseSeverity(std::string_view str)
    {
        for (const Severity severity : { Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG })
        {
            if (str == getSeverityName(severity))
                return severity;
        }

        return std::nullopt;
    }

    Log::Log(ILogger& logger, Module module, Severity severity)
        : _logger{ logger }
        , _module{ module }
        , _severity{ severity }
    {
    }

    Log::~Log()
    {
        assert(_logger.isSeverityActive(_severity));
        _logger.processLog(*this);
    }

    std::string Log::getMessage() const
    {
        return _oss.str();
    }

    std::unique_ptr<ILogger> createLogger(Severity minSeverity, const std::filesystem::path& logFilePath)
    {
        return std::make_unique<Logger>(minSeverity, logFilePath);
    }

    Logger::Logger(Severity minSeverity, const std::filesystem::path& logFilePath)
        : _minSeverity{ minSeverity }
    {
        if (!logFilePath.empty())
        {
            _logFileStream = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);
            if (!_logFileStream->is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw MtsException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
            }
        }
    }

    Logger::~Logger() = default;

    bool Logger::isSeverityActive(Severity severity) const
    {
        // enum is ordered from the most to the least severe
        return static_cast<int>(severity) <= static_cast<int>(_minSeverity);
    }

    void Logger::processLog(const Log& log)
    {
        assert(isSeverityActive(log.getSeverity())); // should have been filtered out by a isSeverityActive call

        std::ostream* stream{};
        std::mutex* mutex{};
        if (_logFileStream)
        {
            stream = _logFileStream.get();
            mutex = &_fileMutex;
        }
        else if (static_cast<int>(log.getSeverity()) <= static_cast<int>(Severity::WARNING))
        {
            stream = &std::cerr;
            mutex = &_stderrMutex;
        }
        else
        {
            stream = &std::cout;
            mutex = &_stdoutMutex;
        }

        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };
        const std::string message{ log.getMessage() };

        const std::scoped_lock lock{ *mutex };
        *stream << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(log.getSeverity()) << "] [" << getModuleName(log.getModule()) << "] " << message << std::endl;
    }
} // namespace mts::core::logging
