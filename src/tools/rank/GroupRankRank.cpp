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

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <stdlib.h>
#include <string>

#include <boost/program_options.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/SystemPaths.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Listing.hpp"
#include "database/objects/User.hpp"
#include "services/ranking/IRankingDataSource.hpp"
#include "services/ranking/IRankingService.hpp"
#include "services/ranking/RankingSettings.hpp"

namespace grouprank
{
    db::UserId resolveUser(db::Session& session, const std::string& loginName)
    {
        auto transaction{ session.createReadTransaction() };

        const db::User::pointer user{ db::User::find(session, loginName) };
        if (!user)
            throw std::runtime_error{ "User '" + loginName + "' not found!" };

        return user->getId();
    }

    void dumpResult(db::Session& session, const ranking::RankingRequest& request, const ranking::RankingResult& result)
    {
        std::cout << "*** " << result.totalCount << " candidates, page " << request.page << " (" << result.listingIds.size() << " listings) ***" << std::endl;
        std::cout << std::fixed << std::setprecision(4);
        std::cout << "w0 = " << result.weights.w0 << ", w1 = " << result.weights.w1 << ", history strength = " << result.weights.historyStrength << ", coverage = " << result.weights.coverage << std::endl;

        const std::size_t firstRank{ (std::max<std::size_t>(request.page, 1) - 1) * request.size };

        auto transaction{ session.createReadTransaction() };

        for (std::size_t i{}; i < result.listingIds.size(); ++i)
        {
            const db::Listing::pointer listing{ db::Listing::find(session, result.listingIds[i]) };

            std::cout << "[" << firstRank + i + 1 << "] " << result.listingIds[i].toString();
            if (listing)
                std::cout << " '" << listing->getTitle() << "' {" << db::toString(listing->getCategory()) << ", " << db::toString(listing->getMarket()) << "}";
            if (result.scores)
            {
                const ranking::ScoreBreakdown& score{ (*result.scores)[i] };
                std::cout << " final = " << score.final << " (v0 = " << score.v0 << ", v1 = " << score.v1 << ")";
            }
            std::cout << std::endl;
        }
    }
} // namespace grouprank

int main(int argc, char* argv[])
{
    try
    {
        using namespace grouprank;
        namespace program_options = boost::program_options;

        const ranking::RankingRequest defaultRequest;

        program_options::options_description options{ "Options" };

        // clang-format off
        options.add_options()
        ("conf,c", program_options::value<std::string>()->default_value(core::sysconfDirectory / "grouprank.conf"), "grouprank config file")
        ("user,u", program_options::value<std::string>(), "Login name of the user to rank for (anonymous if not set)")
        ("latitude", program_options::value<double>()->required(), "Latitude of the user")
        ("longitude", program_options::value<double>()->required(), "Longitude of the user")
        ("radius,r", program_options::value<double>()->default_value(defaultRequest.radiusKm), "Search radius, in km")
        ("category", program_options::value<std::string>(), "Only consider listings in this category")
        ("market", program_options::value<std::string>(), "Only consider listings from this market")
        ("page,p", program_options::value<std::size_t>()->default_value(defaultRequest.page), "Page number, starting at 1")
        ("size,s", program_options::value<std::size_t>()->default_value(defaultRequest.size), "Page size")
        ("scores", "Display score breakdown")
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

        // notify required params
        program_options::notify(vm);

        const std::unique_ptr<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };

        std::optional<core::logging::Severity> minSeverity{ core::logging::severityFromString(config->getString("log-min-severity", "info")) };
        if (!minSeverity)
            throw core::GroupRankException{ "Invalid value for 'log-min-severity'" };
        if (vm.count("verbose"))
            minSeverity = core::logging::Severity::DEBUG;
        const std::unique_ptr<core::logging::ILogger> logger{ core::logging::createLogger(*minSeverity, config->getPath("log-file", "")) };

        const ranking::RankingSettings settings{ ranking::readRankingSettings(*config) };

        db::DbSettings dbSettings;
        dbSettings.connectionCount = config->getULong("db-connection-count", dbSettings.connectionCount);
        dbSettings.showQueries = config->getBool("db-show-queries", dbSettings.showQueries);

        const auto database{ db::createDb(config->getPath("working-dir", "/var/grouprank") / "grouprank.db", dbSettings, *logger) };
        db::Session session{ *database };
        session.prepareTablesIfNeeded();
        session.createIndexesIfNeeded();

        ranking::RankingRequest request;
        if (vm.count("user"))
            request.user = resolveUser(session, vm["user"].as<std::string>());
        request.location = ranking::GeoPoint{ vm["latitude"].as<double>(), vm["longitude"].as<double>() };
        request.radiusKm = vm["radius"].as<double>();
        request.page = vm["page"].as<std::size_t>();
        request.size = vm["size"].as<std::size_t>();
        request.withScores = vm.count("scores") > 0;

        if (vm.count("category"))
        {
            request.filters.category = db::listingCategoryFromString(vm["category"].as<std::string>());
            if (!request.filters.category)
                throw std::runtime_error{ "Unknown category '" + vm["category"].as<std::string>() + "'" };
        }
        if (vm.count("market"))
        {
            request.filters.market = db::marketFromString(vm["market"].as<std::string>());
            if (!request.filters.market)
                throw std::runtime_error{ "Unknown market '" + vm["market"].as<std::string>() + "'" };
        }

        const auto dataSource{ ranking::createDbRankingDataSource(*database, *logger) };
        const auto rankingService{ ranking::createRankingService(*dataSource, settings, *logger) };

        const ranking::RankingResult result{ rankingService->rank(request) };
        dumpResult(session, request, result);
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
