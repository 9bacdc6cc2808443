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
#include <fstream>
#include <mutex>

#include "core/ILogger.hpp"

namespace grouprank::core::logging
{
    class Logger final : public ILogger
    {
    public:
        Logger(Severity minSeverity, const std::filesystem::path& logFilePath);
        ~Logger() override = default;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        bool isSeverityActive(Severity severity) const override;
        void write(Module module, Severity severity, std::string_view message) override;

        std::ostream& getOutputStream(Severity severity);

        const Severity _minSeverity;
        std::ofstream _logFile; // stdout/stderr used if not open
        std::mutex _mutex;
    };
} // namespace grouprank::core::logging
