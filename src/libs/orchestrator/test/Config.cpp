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

#include <map>
#include <string>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "orchestrator/Config.hpp"

namespace mts::orchestrator::tests
{
    namespace
    {
        class MapConfig final : public core::IConfig
        {
        public:
            MapConfig(std::map<std::string, std::string, std::less<>> values)
                : _values{ std::move(values) } {}

        private:
            std::string_view getString(std::string_view setting, std::string_view def) override
            {
                auto itValue{ _values.find(setting) };
                return itValue == std::cend(_values) ? def : std::string_view{ itValue->second };
            }

            std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) override
            {
                auto itValue{ _values.find(setting) };
                return itValue == std::cend(_values) ? def : std::filesystem::path{ itValue->second };
            }

            unsigned long getULong(std::string_view setting, unsigned long def) override
            {
                auto itValue{ _values.find(setting) };
                return itValue == std::cend(_values) ? def : std::stoul(itValue->second);
            }

            long getLong(std::string_view setting, long def) override
            {
                auto itValue{ _values.find(setting) };
                return itValue == std::cend(_values) ? def : std::stol(itValue->second);
            }

            bool getBool(std::string_view setting, bool def) override
            {
                auto itValue{ _values.find(setting) };
                return itValue == std::cend(_values) ? def : itValue->second == "true";
            }

            const std::map<std::string, std::string, std::less<>> _values;
        };
    } // namespace

    TEST(Config, defaults)
    {
        MapConfig mapConfig{ {} };
        const Config config{ readConfig(mapConfig) };

        EXPECT_EQ(config.workingDirectory, "/var/mts");
        EXPECT_EQ(config.getDbPath(), "/var/mts/mts.db");
        EXPECT_EQ(config.getSourceDirectory(), "/var/mts/sources");
        EXPECT_EQ(config.encryptionSecretFile, "/var/mts/secret");
        EXPECT_EQ(config.maxConcurrentJobs, 4);
        EXPECT_EQ(config.transfer.chunkSize, transfer::defaultChunkSize);
        EXPECT_EQ(config.jobRetention, std::chrono::hours{ 30 * 24 });
    }

    TEST(Config, values)
    {
        MapConfig mapConfig{ {
            { "working-dir", "/tmp/mts" },
            { "max-concurrent-jobs", "8" },
            { "encoder-slots", "3" },
            { "transfer-max-attempts", "7" },
            { "transfer-backoff-base-ms", "100" },
            { "transfer-backoff-max-ms", "1000" },
            { "codec-timeout-base-seconds", "60" },
            { "ffmpeg-file", "/opt/ffmpeg/bin/ffmpeg" },
            { "gc-interval-seconds", "0" },
            { "job-retention-days", "2" },
        } };
        const Config config{ readConfig(mapConfig) };

        EXPECT_EQ(config.getOutputDirectory(), "/tmp/mts/outputs");
        EXPECT_EQ(config.maxConcurrentJobs, 8);
        EXPECT_EQ(config.encoderSlotCount, 3);
        EXPECT_EQ(config.transfer.retryPolicy.maxAttempts, 7);
        EXPECT_EQ(config.transfer.retryPolicy.baseDelay, std::chrono::milliseconds{ 100 });
        EXPECT_EQ(config.transfer.retryPolicy.maxDelay, std::chrono::milliseconds{ 1000 });
        EXPECT_EQ(config.ffmpeg.timeoutBase, std::chrono::seconds{ 60 });
        EXPECT_EQ(config.ffmpeg.ffmpegFile, "/opt/ffmpeg/bin/ffmpeg");
        EXPECT_EQ(config.gcInterval, std::chrono::seconds{ 0 });
        EXPECT_EQ(config.jobRetention, std::chrono::hours{ 48 });
    }

    TEST(Config, chunkSizeClamped)
    {
        {
            MapConfig mapConfig{ { { "transfer-chunk-size", "1" } } };
            EXPECT_EQ(readConfig(mapConfig).transfer.chunkSize, transfer::minChunkSize);
        }
        {
            MapConfig mapConfig{ { { "transfer-chunk-size", "1000000000000" } } };
            EXPECT_EQ(readConfig(mapConfig).transfer.chunkSize, transfer::maxChunkSize);
        }
    }

    TEST(Config, invalidValues)
    {
        for (const std::string_view setting : { "max-concurrent-jobs", "encoder-slots", "transfer-max-attempts", "http-timeout-seconds" })
        {
            MapConfig mapConfig{ { { std::string{ setting }, "0" } } };
            EXPECT_THROW(readConfig(mapConfig), core::MtsException) << setting;
        }

        {
            MapConfig mapConfig{ { { "transfer-backoff-base-ms", "1000" }, { "transfer-backoff-max-ms", "10" } } };
            EXPECT_THROW(readConfig(mapConfig), core::MtsException);
        }
        {
            MapConfig mapConfig{ { { "job-retention-days", "36501" } } };
            EXPECT_THROW(readConfig(mapConfig), core::MtsException);
        }
        {
            MapConfig mapConfig{ { { "job-retention-days", "36500" } } };
            EXPECT_EQ(readConfig(mapConfig).jobRetention, std::chrono::hours{ 36500 * 24 });
        }
    }
} // namespace mts::orchestrator::tests
