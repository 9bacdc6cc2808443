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

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unistd.h>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "services/similarity/SimilarityBuilderSettings.hpp"

namespace grouprank::similarity::tests
{
    namespace
    {
        // unique across concurrent test processes
        std::filesystem::path makeTmpConfigPath()
        {
            static unsigned counter{};
            const ::testing::TestInfo* testInfo{ ::testing::UnitTest::GetInstance()->current_test_info() };
            const std::string testName{ testInfo ? std::string{ testInfo->test_suite_name() } + "-" + testInfo->name() : std::string{ "global" } };

            return std::filesystem::temp_directory_path() / ("grouprank-" + testName + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".conf");
        }

        std::unique_ptr<core::IConfig> createConfigFromContent(std::string_view content)
        {
            const std::filesystem::path path{ makeTmpConfigPath() };
            std::ofstream{ path } << content;

            // the file is fully read on construction
            std::unique_ptr<core::IConfig> config{ core::createConfig(path) };
            std::filesystem::remove(path);

            return config;
        }
    } // namespace

    TEST(SimilarityBuilderSettings, defaults)
    {
        const auto config{ createConfigFromContent("") };
        const SimilarityBuilderSettings settings{ readSimilarityBuilderSettings(*config) };

        EXPECT_EQ(settings.topK, 100);
        EXPECT_EQ(settings.minCommon, 2);
        EXPECT_DOUBLE_EQ(settings.minSimilarity, 0.05);
        EXPECT_DOUBLE_EQ(settings.lambda, 5.0);
        EXPECT_EQ(settings.interactionLimit, 0);
    }

    TEST(SimilarityBuilderSettings, values)
    {
        const auto config{ createConfigFromContent(R"(
similarity-top-k = 10;
similarity-min-common = 3;
similarity-min-sim = 0.1;
similarity-lambda = 2.5;
similarity-interaction-limit = 100000;
)") };
        const SimilarityBuilderSettings settings{ readSimilarityBuilderSettings(*config) };

        EXPECT_EQ(settings.topK, 10);
        EXPECT_EQ(settings.minCommon, 3);
        EXPECT_DOUBLE_EQ(settings.minSimilarity, 0.1);
        EXPECT_DOUBLE_EQ(settings.lambda, 2.5);
        EXPECT_EQ(settings.interactionLimit, 100'000);
    }

    TEST(SimilarityBuilderSettings, invalidValues)
    {
        for (std::string_view content : { "similarity-top-k = 0;", "similarity-min-common = 0;", "similarity-min-sim = 1.5;", "similarity-min-sim = -0.1;", "similarity-lambda = -1.0;" })
        {
            const auto config{ createConfigFromContent(content) };
            EXPECT_THROW(readSimilarityBuilderSettings(*config), core::GroupRankException) << "content = '" << content << "'";
        }
    }
} // namespace grouprank::similarity::tests
