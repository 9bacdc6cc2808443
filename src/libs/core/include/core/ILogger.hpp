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

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace grouprank::core::logging
{
    enum class Severity
    {
        FATAL,
        ERROR,
        WARNING,
        INFO,
        DEBUG,
    };

    enum class Module
    {
        CONFIG,
        DB,
        MAIN,
        RANKING,
        SIMILARITY,
    };

    const char* getModuleName(Module module);
    const char* getSeverityName(Severity severity);
    std::optional<Severity> severityFromString(std::string_view str);

    class ILogger
    {
    public:
        virtual ~ILogger() = default;

        virtual bool isSeverityActive(Severity severity) const = 0;
        virtual void write(Module module, Severity severity, std::string_view message) = 0;
    };

    // Accumulates a message, written to the logger on destruction
    class LogMessage
    {
    public:
        LogMessage(ILogger& logger, Module module, Severity severity)
            : _logger{ logger }
            , _module{ module }
            , _severity{ severity } {}
        ~LogMessage();

        LogMessage(const LogMessage&) = delete;
        LogMessage& operator=(const LogMessage&) = delete;

        std::ostream& stream() { return _oss; }

    private:
        ILogger& _logger;
        const Module _module;
        const Severity _severity;
        std::ostringstream _oss;
    };

    static constexpr Severity defaultMinSeverity{ Severity::INFO };
    std::unique_ptr<ILogger> createLogger(Severity minSeverity = defaultMinSeverity, const std::filesystem::path& logFilePath = {});
} // namespace grouprank::core::logging

#define GROUPRANK_LOG_IF(logger, module, severity, cond, message)                                                                                                 \
    do                                                                                                                                                               \
    {                                                                                                                                                                \
        if (::grouprank::core::logging::ILogger& grouprankLogger_{ logger }; grouprankLogger_.isSeverityActive(::grouprank::core::logging::Severity::severity) && (cond)) \
            ::grouprank::core::logging::LogMessage{ grouprankLogger_, ::grouprank::core::logging::Module::module, ::grouprank::core::logging::Severity::severity }.stream() << message; \
    } while (0)

#define GROUPRANK_LOG(logger, module, severity, message) GROUPRANK_LOG_IF(logger, module, severity, true, message)
