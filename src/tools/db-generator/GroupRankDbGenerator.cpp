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
#include <cmath>
#include <iostream>
#include <numbers>
#include <set>
#include <stdexcept>
#include <stdlib.h>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <Wt/WDateTime.h>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Random.hpp"
#include "core/SystemPaths.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "database/objects/Favorite.hpp"
#include "database/objects/Listing.hpp"
#include "database/objects/Participation.hpp"
#include "database/objects/Rating.hpp"
#include "database/objects/User.hpp"

namespace grouprank
{
    struct GeneratorParameters
    {
        std::size_t userCount{ 1000 };
        std::size_t listingCount{ 2000 };
        std::size_t interactionCountPerUser{ 20 };
        std::size_t ratingCountPerListing{ 1 };
        std::size_t userCountPerBatch{ 100 };
        double centerLatitude{ 37.5665 }; // Seoul city hall
        double centerLongitude{ 126.9780 };
        double spreadKm{ 10 };
        unsigned seed{ 42 };
    };

    struct GenerationContext
    {
        db::Session& session;
        core::random::RandGenerator generator;
        Wt::WDateTime now{ Wt::WDateTime::currentDateTime() };
        std::string loginPrefix;
        std::vector<db::User::pointer> users;
        std::vector<db::Listing::pointer> listings;

        GenerationContext(db::Session& _session, unsigned seed)
            : session{ _session }
            , generator{ core::random::createSeededGenerator(seed) }
            , loginPrefix{ "gen-" + std::to_string(now.toTime_t()) + "-" } {}
    };

    template<typename T, std::size_t Count>
    T pickRandomEnum(GenerationContext& context)
    {
        return static_cast<T>(core::random::getRandom<std::size_t>(context.generator, 0, Count - 1));
    }

    void generateUser(GenerationContext& context, std::size_t index)
    {
        db::User::pointer user{ context.session.create<db::User>(context.loginPrefix + std::to_string(index)) };

        db::ListingCategorySet categories;
        for (std::size_t i{}, count{ core::random::getRandom<std::size_t>(context.generator, 0, 2) }; i < count; ++i)
            categories.insert(pickRandomEnum<db::ListingCategory, db::listingCategoryCount>(context));

        db::MarketSet markets;
        for (std::size_t i{}, count{ core::random::getRandom<std::size_t>(context.generator, 0, 3) }; i < count; ++i)
            markets.insert(pickRandomEnum<db::Market, db::marketCount>(context));

        // contiguous slot of preferred hours
        db::HourMask hours;
        if (core::random::getRandom<int>(context.generator, 0, 3) > 0)
        {
            const std::size_t start{ core::random::getRandom<std::size_t>(context.generator, 8, 20) };
            const std::size_t duration{ core::random::getRandom<std::size_t>(context.generator, 1, 4) };
            for (std::size_t hour{ start }; hour < std::min(start + duration, db::hourCount); ++hour)
                hours.set(hour);
        }

        auto u{ user.modify() };
        u->setInterestedCategories(categories);
        u->setWishMarkets(markets);
        u->setWishHours(hours);

        context.users.push_back(user);
    }

    void generateListing(const GeneratorParameters& params, GenerationContext& context, std::size_t index)
    {
        const db::User::pointer host{ *core::random::pickRandom(context.generator, context.users) };
        db::Listing::pointer listing{ context.session.create<db::Listing>(host, "Listing-" + std::to_string(index)) };

        // ~111 km per latitude degree
        const double latitudeSpread{ params.spreadKm / 111.0 };
        const double longitudeSpread{ latitudeSpread / std::cos(params.centerLatitude * std::numbers::pi / 180.0) };

        auto l{ listing.modify() };
        l->setCategory(pickRandomEnum<db::ListingCategory, db::listingCategoryCount>(context));
        l->setMarket(pickRandomEnum<db::Market, db::marketCount>(context));
        l->setStatus(core::random::getRandom<int>(context.generator, 0, 9) > 0 ? db::ListingStatus::Recruiting : db::ListingStatus::Completed);
        l->setLocation(params.centerLatitude + core::random::getRealRandom(context.generator, -latitudeSpread, latitudeSpread),
                       params.centerLongitude + core::random::getRealRandom(context.generator, -longitudeSpread, longitudeSpread));
        l->setCreatedDateTime(context.now.addSecs(-core::random::getRandom<int>(context.generator, 0, 30 * 24 * 3600)));
        l->setScheduledDateTime(context.now.addSecs(core::random::getRandom<int>(context.generator, 3600, 14 * 24 * 3600)));

        context.listings.push_back(listing);
    }

    void generateInteractions(const GeneratorParameters& params, GenerationContext& context, const db::User::pointer& user)
    {
        std::set<db::ListingId> favorites;
        std::set<db::ListingId> participations;

        for (std::size_t i{}; i < params.interactionCountPerUser; ++i)
        {
            const db::Listing::pointer listing{ *core::random::pickRandom(context.generator, context.listings) };
            const Wt::WDateTime dateTime{ context.now.addSecs(-core::random::getRandom<int>(context.generator, 0, 60 * 24 * 3600)) };

            if (core::random::getRandom<int>(context.generator, 0, 1) == 0)
            {
                if (favorites.insert(listing->getId()).second)
                    context.session.create<db::Favorite>(user, listing, dateTime);
            }
            else if (participations.insert(listing->getId()).second)
            {
                db::Participation::pointer participation{ context.session.create<db::Participation>(user, listing, dateTime) };

                static constexpr db::ParticipationStatus decidedStatuses[]{ db::ParticipationStatus::Accepted, db::ParticipationStatus::Rejected, db::ParticipationStatus::Canceled, db::ParticipationStatus::NoShow, db::ParticipationStatus::Fulfilled };
                const std::size_t statusIndex{ core::random::getRandom<std::size_t>(context.generator, 0, std::size(decidedStatuses)) };
                if (statusIndex < std::size(decidedStatuses)) // otherwise stays applied
                    participation.modify()->setStatus(decidedStatuses[statusIndex], dateTime.addSecs(core::random::getRandom<int>(context.generator, 60, 24 * 3600)));
            }
        }
    }

    void generateRatings(const GeneratorParameters& params, GenerationContext& context)
    {
        if (context.users.size() < 2)
            return;

        for (const db::Listing::pointer& listing : context.listings)
        {
            for (std::size_t i{}; i < params.ratingCountPerListing; ++i)
            {
                const db::User::pointer reviewer{ *core::random::pickRandom(context.generator, context.users) };
                if (reviewer->getId() == listing->getHostId())
                    continue;

                context.session.create<db::Rating>(listing, reviewer, listing->getHost(), core::random::getRandom<int>(context.generator, 1, 5));
            }
        }
    }

    void generate(const GeneratorParameters& params, GenerationContext& context)
    {
        for (std::size_t generatedCount{}; generatedCount < params.userCount;)
        {
            auto transaction{ context.session.createWriteTransaction() };
            std::cout << "Generating user #" << generatedCount << " / " << params.userCount << std::endl;

            for (std::size_t i{}; i < params.userCountPerBatch && generatedCount < params.userCount; ++i)
                generateUser(context, generatedCount++);
        }

        {
            auto transaction{ context.session.createWriteTransaction() };
            std::cout << "Generating " << params.listingCount << " listings" << std::endl;

            for (std::size_t i{}; i < params.listingCount; ++i)
                generateListing(params, context, i);

            std::cout << "Generating ratings" << std::endl;
            generateRatings(params, context);
        }

        if (context.listings.empty())
            return;

        for (std::size_t userIndex{}; userIndex < context.users.size();)
        {
            auto transaction{ context.session.createWriteTransaction() };
            std::cout << "Generating interactions for user #" << userIndex << " / " << context.users.size() << std::endl;

            for (std::size_t i{}; i < params.userCountPerBatch && userIndex < context.users.size(); ++i)
                generateInteractions(params, context, context.users[userIndex++]);
        }
    }
} // namespace grouprank

int main(int argc, char* argv[])
{
    try
    {
        using namespace grouprank;
        namespace program_options = boost::program_options;

        const GeneratorParameters defaultParams;

        program_options::options_description options{ "Options" };

        // clang-format off
        options.add_options()
        ("conf,c", program_options::value<std::string>()->default_value(core::sysconfDirectory / "grouprank.conf"), "grouprank config file")
        ("user-count", program_options::value<std::size_t>()->default_value(defaultParams.userCount), "Number of users to generate")
        ("listing-count", program_options::value<std::size_t>()->default_value(defaultParams.listingCount), "Number of listings to generate")
        ("interaction-count-per-user", program_options::value<std::size_t>()->default_value(defaultParams.interactionCountPerUser), "Number of favorites/participations to generate per user")
        ("rating-count-per-listing", program_options::value<std::size_t>()->default_value(defaultParams.ratingCountPerListing), "Number of host ratings to generate per listing")
        ("user-count-per-batch", program_options::value<std::size_t>()->default_value(defaultParams.userCountPerBatch), "Number of users to process before committing transaction")
        ("latitude", program_options::value<double>()->default_value(defaultParams.centerLatitude), "Latitude of the area center")
        ("longitude", program_options::value<double>()->default_value(defaultParams.centerLongitude), "Longitude of the area center")
        ("spread", program_options::value<double>()->default_value(defaultParams.spreadKm), "Half size of the area, in km")
        ("seed", program_options::value<unsigned>()->default_value(defaultParams.seed), "Random seed")
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

        GeneratorParameters genParams;
        genParams.userCount = vm["user-count"].as<std::size_t>();
        genParams.listingCount = vm["listing-count"].as<std::size_t>();
        genParams.interactionCountPerUser = vm["interaction-count-per-user"].as<std::size_t>();
        genParams.ratingCountPerListing = vm["rating-count-per-listing"].as<std::size_t>();
        genParams.userCountPerBatch = vm["user-count-per-batch"].as<std::size_t>();
        genParams.centerLatitude = vm["latitude"].as<double>();
        genParams.centerLongitude = vm["longitude"].as<double>();
        genParams.spreadKm = vm["spread"].as<double>();
        genParams.seed = vm["seed"].as<unsigned>();

        if (genParams.userCount == 0 || genParams.userCountPerBatch == 0)
            throw std::runtime_error{ "User count and batch size must be strictly positive!" };

        const std::unique_ptr<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };

        // log to stdout
        const std::unique_ptr<core::logging::ILogger> logger{ core::logging::createLogger(core::logging::Severity::WARNING) };

        const auto database{ db::createDb(config->getPath("working-dir", "/var/grouprank") / "grouprank.db", db::DbSettings{}, *logger) };
        db::Session session{ *database };
        session.prepareTablesIfNeeded();
        session.createIndexesIfNeeded();

        std::cout << "Starting generation..." << std::endl;

        GenerationContext genContext{ session, genParams.seed };
        generate(genParams, genContext);

        std::cout << "Analyzing database..." << std::endl;
        session.analyze();

        std::cout << "Generation complete!" << std::endl;
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
