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

#include <bitset>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "core/EnumSet.hpp"
#include "core/Exception.hpp"

namespace grouprank::db
{
    class Exception : public core::GroupRankException
    {
    public:
        using GroupRankException::GroupRankException;
    };

    struct Range
    {
        std::size_t offset{};
        std::size_t size{};

        bool operator==(const Range& rhs) const = default;
    };

    template<typename T>
    struct RangeResults
    {
        Range range;
        std::vector<T> results;
        bool moreResults{};
    };

    // Caution: values are persisted, do not change them
    enum class ListingCategory
    {
        Household = 0,
        FoodAndSnacks = 1,
        FashionAndAccessories = 2,
        BeautyAndHealthcare = 3,
    };
    static constexpr std::size_t listingCategoryCount{ 4 };
    using ListingCategorySet = core::EnumSet<ListingCategory>;

    // Caution: values are persisted, do not change them
    enum class Market
    {
        Costco = 0,
        EMart = 1,
        Traders = 2,
        NoBrand = 3,
        ConvenienceStore = 4,
        Homeplus = 5,
        LocalMarket = 6,
        TraditionalMarket = 7,
        ECommerce = 8,
        Other = 9,
    };
    static constexpr std::size_t marketCount{ 10 };
    using MarketSet = core::EnumSet<Market>;

    // Caution: values are persisted, do not change them
    enum class ListingStatus
    {
        Draft = 0,
        Recruiting = 1,
        Locked = 2,
        Purchasing = 3,
        Distributing = 4,
        Completed = 5,
        Canceled = 6,
    };

    // Caution: values are persisted, do not change them
    enum class ParticipationStatus
    {
        Applied = 0,
        Accepted = 1,
        Rejected = 2,
        Canceled = 3,
        NoShow = 4,
        Fulfilled = 5,
    };

    enum class InteractionSignal
    {
        Strong, // accepted or fulfilled participation
        Medium, // applied participation
        Weak,   // favorite
    };
    using InteractionSignalSet = core::EnumSet<InteractionSignal>;
    double getSignalWeight(InteractionSignal signal);

    // one bit per hour of the day
    static constexpr std::size_t hourCount{ 24 };
    using HourMask = std::bitset<hourCount>;

    struct GeoBoundingBox
    {
        double minLatitude{};
        double maxLatitude{};
        double minLongitude{};
        double maxLongitude{};
    };

    std::string_view toString(ListingCategory category);
    std::string_view toString(Market market);
    std::optional<ListingCategory> listingCategoryFromString(std::string_view str);
    std::optional<Market> marketFromString(std::string_view str);
} // namespace grouprank::db
