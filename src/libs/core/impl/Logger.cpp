/*
 * Copyright (C) 2025 The GroupRank Authors
 *
 * This file is part of GroupRank.
 *
 * GroupRank is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * GroupRank is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with GroupRank.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Logger.hpp"

#include <Wt/WDateTime.h>

#include <cerrno>
#include <iostream>
#include <system_error>
#include <thread>

#include "core/Exception.hpp"
#include "core/String.hpp"

namespace grouprank::core::logging
{
    const char* getModuleName(Module module)
    {
        switch (module)
        {
        case Module::CONFIG:
            return "CONFIG";
        case Module::DB:
            return "DB";
        case Module::MAIN:
            return "MAIN";
        case Module::RANKING:
            return "RANKING";
        case Module::SIMILARITY:
            return "SIMILARITY";
        }
        return "";
    }

    const char* getSeverityName(Severity severity)
    {
        switch (severity)
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

    std::optional<Severity> severityFromString(std::string_view str)
    {
        for (Severity severity : { Severity::FATAL, Severity::ERROR, Severity::WARNING, Severity::INFO, Severity::DEBUG })
        {
            if (stringUtils::stringCaseInsensitiveEqual(str, getSeverityName(severity)))
                return severity;
        }

        return std::nullopt;
    }

    LogMessage::~LogMessage()
    {
        _logger.write(_module, _severity, _oss.view());
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
            _logFile.open(logFilePath, std::ios::out | std::ios::app);
            if (!_logFile.is_open())
            {
                const std::error_code ec{ errno, std::generic_category() };
                throw GroupRankException{ "Cannot open log file '" + logFilePath.string() + "' for writing: " + ec.message() };
            }
        }
    }

    bool Logger::isSeverityActive(Severity severity) const
    {
        // severities are ordered from the most to the least critical
        return severity <= _minSeverity;
    }

    std::ostream& Logger::getOutputStream(Severity severity)
    {
        if (_logFile.is_open())
            return _logFile;

        return severity <= Severity::WARNING ? std::cerr : std::cout;
    }

    void Logger::write(Module module, Severity severity, std::string_view message)
    {
        if (!isSeverityActive(severity))
            return;

        const Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };

        const std::scoped_lock lock{ _mutex };
        getOutputStream(severity) << stringUtils::toISO8601String(now) << " " << std::this_thread::get_id() << " [" << getSeverityName(severity) << "] [" << getModuleName(module) << "] " << message << std::endl;
    }
} // namespace grouprank::core::logging
