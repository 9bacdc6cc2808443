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

#include "database/Types.hpp"

#include <iterator>

#include "core/String.hpp"

namespace grouprank::db
{
    namespace
    {
        constexpr ListingCategory allCategories[]{
            ListingCategory::Household,
            ListingCategory::FoodAndSnacks,
            ListingCategory::FashionAndAccessories,
            ListingCategory::BeautyAndHealthcare,
        };
        static_assert(std::size(allCategories) == listingCategoryCount);

        constexpr Market allMarkets[]{
            Market::Costco,
            Market::EMart,
            Market::Traders,
            Market::NoBrand,
            Market::ConvenienceStore,
            Market::Homeplus,
            Market::LocalMarket,
            Market::TraditionalMarket,
            Market::ECommerce,
            Market::Other,
        };
        static_assert(std::size(allMarkets) == marketCount);
    } // namespace

    double getSignalWeight(InteractionSignal signal)
    {
        switch (signal)
        {
        case InteractionSignal::Strong:
            return 2.0;
        case InteractionSignal::Medium:
            return 0.5;
        case InteractionSignal::Weak:
            return 1.0;
        }

        return 0.0;
    }

    std::string_view toString(ListingCategory category)
    {
        switch (category)
        {
        case ListingCategory::Household:
            return "household";
        case ListingCategory::FoodAndSnacks:
            return "food_snacks";
        case ListingCategory::FashionAndAccessories:
            return "fashion_accessories";
        case ListingCategory::BeautyAndHealthcare:
            return "beauty_healthcare";
        }

        return "";
    }

    std::string_view toString(Market market)
    {
        switch (market)
        {
        case Market::Costco:
            return "costco";
        case Market::EMart:
            return "emart";
        case Market::Traders:
            return "traders";
        case Market::NoBrand:
            return "nobrand";
        case Market::ConvenienceStore:
            return "convenience_store";
        case Market::Homeplus:
            return "homeplus";
        case Market::LocalMarket:
            return "local_market";
        case Market::TraditionalMarket:
            return "traditional_market";
        case Market::ECommerce:
            return "ecommerce";
        case Market::Other:
            return "other";
        }

        return "";
    }

    std::optional<ListingCategory> listingCategoryFromString(std::string_view str)
    {
        for (ListingCategory category : allCategories)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, toString(category)))
                return category;
        }

        return std::nullopt;
    }

    std::optional<Market> marketFromString(std::string_view str)
    {
        for (Market market : allMarkets)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(str, toString(market)))
                return market;
        }

        return std::nullopt;
    }
} // namespace grouprank::db
