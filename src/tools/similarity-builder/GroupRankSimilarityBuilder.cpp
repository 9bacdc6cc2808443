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

#include <cstddef>
#include <iostream>
#include <optional>
#include <stdlib.h>
#include <string>

#include <boost/program_options.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/SystemPaths.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/similarity/ISimilarityBuilderService.hpp"
#include "services/similarity/SimilarityBuilderSettings.hpp"

int main(int argc, char* argv[])
{
    try
    {
        using namespace grouprank;
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };

        // clang-format off
        options.add_options()
        ("conf,c", program_options::value<std::string>()->default_value(core::sysconfDirectory / "grouprank.conf"), "grouprank config file")
        ("top-k", program_options::value<unsigned>(), "Override 'similarity-top-k'")
        ("min-common", program_options::value<unsigned>(), "Override 'similarity-min-common'")
        ("min-sim", program_options::value<double>(), "Override 'similarity-min-sim'")
        ("lambda", program_options::value<double>(), "Override 'similarity-lambda'")
        ("interaction-limit", program_options::value<std::size_t>(), "Override 'similarity-interaction-limit' (0 = all)")
        ("verbose,v", "Log debug messages")
        ("help,h", "produce help message");
        // clang-format on

        program_options::variables_map vm;
        program_options::store(program_options::parse_command_line(argc, argv, options), vm);

        if (vm.count("help"))
        {
            std::cout << options << "\n";
            return EXIT_SUCCESS;
        }

        program_options::notify(vm);

        const std::unique_ptr<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };

        std::optional<core::logging::Severity> minSeverity{ core::logging::severityFromString(config->getString("log-min-severity", "info")) };
        if (!minSeverity)
            throw core::GroupRankException{ "Invalid value for 'log-min-severity'" };
        if (vm.count("verbose"))
            minSeverity = core::logging::Severity::DEBUG;
        const std::unique_ptr<core::logging::ILogger> logger{ core::logging::createLogger(*minSeverity, config->getPath("log-file", "")) };

        similarity::SimilarityBuilderSettings settings{ similarity::readSimilarityBuilderSettings(*config) };
        if (vm.count("top-k"))
            settings.topK = vm["top-k"].as<unsigned>();
        if (vm.count("min-common"))
            settings.minCommon = vm["min-common"].as<unsigned>();
        if (vm.count("min-sim"))
            settings.minSimilarity = vm["min-sim"].as<double>();
        if (vm.count("lambda"))
            settings.lambda = vm["lambda"].as<double>();
        if (vm.count("interaction-limit"))
            settings.interactionLimit = vm["interaction-limit"].as<std::size_t>();

        db::DbSettings dbSettings;
        dbSettings.connectionCount = config->getULong("db-connection-count", dbSettings.connectionCount);
        dbSettings.showQueries = config->getBool("db-show-queries", dbSettings.showQueries);

        const auto database{ db::createDb(config->getPath("working-dir", "/var/grouprank") / "grouprank.db", dbSettings, *logger) };
        {
            db::Session session{ *database };
            session.prepareTablesIfNeeded();
            session.createIndexesIfNeeded();
        }

        const auto builder{ similarity::createSimilarityBuilderService(*database, settings, *logger) };
        const similarity::SimilarityBuildReport report{ builder->run() };

        std::cout << "Interactions: " << report.interactionCount << std::endl;
        std::cout << "Users: " << report.userCount << std::endl;
        std::cout << "Listings: " << report.itemCount << std::endl;
        std::cout << "Stored similarities: " << report.storedPairCount << std::endl;
        std::cout << "Elapsed: " << report.elapsed.count() << " ms" << std::endl;
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
