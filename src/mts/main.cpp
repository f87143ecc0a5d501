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

#include <algorithm>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include "codec/ICodecRunner.hpp"
#include "core/Exception.hpp"
#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "crypto/ICryptoPipeline.hpp"
#include "crypto/KeyDerivation.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "encoder/IEncoderSlotPool.hpp"
#include "orchestrator/Config.hpp"
#include "orchestrator/Exception.hpp"
#include "orchestrator/IJobOrchestrator.hpp"
#include "transfer/IHttpTransport.hpp"
#include "transfer/IResumableTransferClient.hpp"
#include "transfer/ITransferSessionStore.hpp"

namespace mts
{
    namespace
    {
        std::ostream& operator<<(std::ostream& os, const orchestrator::JobStatus& status)
        {
            os << status.jobId << ": " << db::toString(status.state);
            if (!db::isTerminal(status.state))
                os << " " << std::fixed << std::setprecision(0) << status.progress * 100 << "%";
            if (status.retryCount > 0)
                os << ", retries = " << status.retryCount;
            if (status.errorKind)
                os << ", error = " << db::toString(*status.errorKind);
            if (status.errorStage)
                os << " while " << db::toString(*status.errorStage);
            if (status.result)
                os << ", output = '" << status.result->outputLocation << "', hash = " << status.result->contentHash << ", size = " << status.result->encryptedSize;

            return os;
        }

        core::logging::Severity getLogMinSeverity(core::IConfig& config)
        {
            const std::string_view minSeverity{ config.getString("log-min-severity", "info") };
            if (const std::optional<core::logging::Severity> severity{ core::logging::parseSeverity(minSeverity) })
                return *severity;

            throw core::MtsException{ "Invalid config value for 'log-min-severity'" };
        }

        std::size_t getThreadCount(core::IConfig& config)
        {
            const unsigned long configThreadCount{ config.getULong("io-thread-count", 0) };
            return configThreadCount ? configThreadCount : std::max<unsigned long>(2, std::thread::hardware_concurrency());
        }

        orchestrator::JobDescriptor createDescriptor(const boost::program_options::variables_map& vm)
        {
            orchestrator::JobDescriptor descriptor;

            descriptor.sourceEndpoint = vm["source"].as<std::string>();
            descriptor.publishEndpoint = vm["publish"].as<std::string>();
            if (vm.count("checksum"))
                descriptor.sourceChecksum = vm["checksum"].as<std::string>();
            if (vm.count("sealed-by"))
            {
                const std::string& sealedBy{ vm["sealed-by"].as<std::string>() };
                descriptor.sourceSealedBy = core::UUID::fromString(sealedBy);
                if (!descriptor.sourceSealedBy)
                    throw orchestrator::InvalidJobDescriptorException{ "Invalid job id '" + sealedBy + "' for the sealed source" };
            }

            descriptor.profile.label = vm["label"].as<std::string>();
            descriptor.profile.videoCodec = vm["codec"].as<std::string>();
            descriptor.profile.container = vm["container"].as<std::string>();
            descriptor.profile.width = vm["width"].as<unsigned>();
            descriptor.profile.height = vm["height"].as<unsigned>();
            descriptor.profile.videoBitrate = vm["video-bitrate"].as<std::size_t>();
            descriptor.profile.audioCodec = vm["audio-codec"].as<std::string>();
            descriptor.profile.audioBitrate = vm["audio-bitrate"].as<std::size_t>();
            descriptor.profile.hardwareAcceleration = vm.count("gpu") > 0;

            return descriptor;
        }

        // Waits for the job to terminate, the first signal cancels it
        int processSubmit(orchestrator::IJobOrchestrator& orchestrator, const orchestrator::JobDescriptor& descriptor, boost::asio::signal_set& signals)
        {
            const core::UUID jobId{ orchestrator.submitJob(descriptor) };
            std::cout << "Submitted job " << jobId << std::endl;

            std::mutex mutex;
            std::condition_variable cv;
            std::optional<orchestrator::JobStatus> terminalStatus;

            std::optional<orchestrator::StatusSubscription> subscription{ orchestrator.streamStatus(jobId, [&](const orchestrator::JobStatus& status) {
                std::cout << status << std::endl;
                if (db::isTerminal(status.state))
                {
                    {
                        std::scoped_lock lock{ mutex };
                        terminalStatus = status;
                    }
                    cv.notify_all();
                }
            }) };
            if (!subscription)
                throw core::MtsException{ "Job " + std::string{ jobId.getAsString() } + " vanished" };

            signals.async_wait([&](const boost::system::error_code& ec, int signalNumber) {
                if (ec)
                    return;

                MTS_LOG(MAIN, INFO, "Received signal " << signalNumber << ", cancelling job " << jobId);
                orchestrator.cancelJob(jobId);
            });

            {
                std::unique_lock lock{ mutex };
                cv.wait(lock, [&] { return terminalStatus.has_value(); });
            }
            subscription->reset();
            signals.cancel();

            return terminalStatus->state == db::JobState::Completed ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        // Runs the recovered jobs, a signal interrupts them: they are resumed on next start
        int processRun(orchestrator::IJobOrchestrator& orchestrator, boost::asio::signal_set& signals)
        {
            std::stop_source stopSource;
            signals.async_wait([&](const boost::system::error_code& ec, int signalNumber) {
                if (ec)
                    return;

                MTS_LOG(MAIN, INFO, "Received signal " << signalNumber << ", stopping");
                stopSource.request_stop();
            });

            const std::size_t jobCount{ orchestrator.recoverJobs() };
            MTS_LOG(MAIN, INFO, "Recovered " << jobCount << " job(s)");

            const bool idle{ orchestrator.waitForIdle(stopSource.get_token()) };
            signals.cancel();

            if (idle)
                MTS_LOG(MAIN, INFO, "All jobs processed");

            return EXIT_SUCCESS;
        }

        int processStatus(orchestrator::IJobOrchestrator& orchestrator, std::string_view jobIdStr)
        {
            const std::optional<core::UUID> jobId{ core::UUID::fromString(jobIdStr) };
            if (!jobId)
            {
                std::cerr << "Invalid job id '" << jobIdStr << "'" << std::endl;
                return EXIT_FAILURE;
            }

            const std::optional<orchestrator::JobStatus> status{ orchestrator.getStatus(*jobId) };
            if (!status)
            {
                std::cerr << "Unknown job " << *jobId << std::endl;
                return EXIT_FAILURE;
            }

            std::cout << *status << std::endl;
            return EXIT_SUCCESS;
        }
    } // namespace

    int main(int argc, char* argv[])
    {
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("conf", program_options::value<std::string>()->default_value("/etc/mts.conf"), "Configuration file");
        // clang-format on

        program_options::options_description submitOptions{ "Submit options" };
        // clang-format off
        submitOptions.add_options()
            ("source", program_options::value<std::string>(), "Source media URL")
            ("publish", program_options::value<std::string>(), "Upload endpoint of the sealed output")
            ("checksum", program_options::value<std::string>(), "Expected SHA-256 of the source, hex encoded")
            ("sealed-by", program_options::value<std::string>(), "Source is the sealed output of this job")
            ("codec", program_options::value<std::string>()->default_value("h264"), "Video codec (h264, hevc, av1, vp9)")
            ("container", program_options::value<std::string>()->default_value("mp4"), "Container (mp4, mkv, webm, mov, ts)")
            ("width", program_options::value<unsigned>()->default_value(0), "Output width, 0 keeps the aspect ratio")
            ("height", program_options::value<unsigned>()->default_value(0), "Output height, 0 keeps the aspect ratio")
            ("video-bitrate", program_options::value<std::size_t>()->default_value(0), "Video bitrate in bits per second")
            ("audio-codec", program_options::value<std::string>()->default_value(""), "Audio codec, empty copies the source audio, 'none' drops it")
            ("audio-bitrate", program_options::value<std::size_t>()->default_value(0), "Audio bitrate in bits per second")
            ("label", program_options::value<std::string>()->default_value(""), "Profile label, names the cached output")
            ("gpu", "Use hardware acceleration");
        // clang-format on

        program_options::options_description statusOptions{ "Status options" };
        statusOptions.add_options()("job", program_options::value<std::string>(), "Job id");

        program_options::options_description hiddenOptions{ "Hidden options" };
        hiddenOptions.add_options()("command", program_options::value<std::string>(), "command");

        program_options::options_description allOptions;
        allOptions.add(options).add(submitOptions).add(statusOptions).add(hiddenOptions);

        program_options::positional_options_description positional;
        positional.add("command", 1);

        auto displayHelp = [&](std::ostream& os) {
            os << "Usage: " << argv[0] << " [options] run|submit|status" << std::endl;
            os << options << std::endl
               << submitOptions << std::endl
               << statusOptions << std::endl;
        };

        program_options::variables_map vm;
        try
        {
            program_options::store(program_options::command_line_parser(argc, argv)
                                       .options(allOptions)
                                       .positional(positional)
                                       .run(),
                vm);
            program_options::notify(vm);
        }
        catch (const program_options::error& e)
        {
            std::cerr << e.what() << std::endl;
            displayHelp(std::cerr);
            return EXIT_FAILURE;
        }

        if (vm.count("help"))
        {
            displayHelp(std::cout);
            return EXIT_SUCCESS;
        }

        const std::string command{ vm.count("command") ? vm["command"].as<std::string>() : "" };
        if (command != "run" && command != "submit" && command != "status")
        {
            displayHelp(std::cerr);
            return EXIT_FAILURE;
        }
        if (command == "submit" && (!vm.count("source") || !vm.count("publish")))
        {
            std::cerr << "'submit' requires --source and --publish" << std::endl;
            return EXIT_FAILURE;
        }
        if (command == "status" && !vm.count("job"))
        {
            std::cerr << "'status' requires --job" << std::endl;
            return EXIT_FAILURE;
        }

        try
        {
            core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(*config), config->getPath("log-file", "")) };

            const orchestrator::Config orchestratorConfig{ orchestrator::readConfig(*config) };
            std::filesystem::create_directories(orchestratorConfig.workingDirectory);

            auto database{ db::createDb(orchestratorConfig.getDbPath(), orchestratorConfig.maxConcurrentJobs + getThreadCount(*config) + 1) };
            {
                db::Session session{ *database };
                session.prepareTablesIfNeeded();
                session.createIndexesIfNeeded();
            }

            // HTTP requests, child process monitoring and signals
            boost::asio::io_context ioContext;
            core::IOContextRunner ioContextRunner{ ioContext, getThreadCount(*config), "Misc" };

            boost::asio::signal_set signals{ ioContext, SIGINT, SIGTERM };

            auto httpTransport{ transfer::http::createHttpTransport(ioContext, transfer::http::TransportConfig{ .timeout = orchestratorConfig.httpTimeout }) };
            auto transferSessionStore{ transfer::createTransferSessionStore(*database) };
            auto transferClient{ transfer::createResumableTransferClient(*httpTransport, *transferSessionStore, orchestratorConfig.transfer) };
            auto encoderSlotPool{ encoder::createEncoderSlotPool(orchestratorConfig.encoderSlotCount) };
            auto childProcessManager{ core::createChildProcessManager(ioContext) };
            auto codecRunner{ codec::createFfmpegCodecRunner(*childProcessManager, orchestratorConfig.ffmpeg) };
            auto cryptoPipeline{ crypto::createCryptoPipeline(crypto::readSecretFile(orchestratorConfig.encryptionSecretFile)) };

            const orchestrator::Dependencies dependencies{
                .db = *database,
                .transferClient = *transferClient,
                .transferSessionStore = *transferSessionStore,
                .encoderSlotPool = *encoderSlotPool,
                .codecRunner = *codecRunner,
                .cryptoPipeline = *cryptoPipeline,
            };
            auto jobOrchestrator{ orchestrator::createJobOrchestrator(orchestratorConfig, dependencies) };

            int res{ EXIT_FAILURE };
            if (command == "run")
                res = processRun(*jobOrchestrator, signals);
            else if (command == "submit")
                res = processSubmit(*jobOrchestrator, createDescriptor(vm), signals);
            else
                res = processStatus(*jobOrchestrator, vm["job"].as<std::string>());

            // stop jobs before the services they rely on
            jobOrchestrator.reset();
            ioContextRunner.stop();

            return res;
        }
        catch (const orchestrator::InvalidJobDescriptorException& e)
        {
            std::cerr << "Invalid job: " << e.what() << std::endl;
        }
        catch (const std::exception& e)
        {
            MTS_LOG(MAIN, FATAL, "Caught exception: " << e.what());
            std::cerr << "Caught exception: " << e.what() << std::endl;
        }

        return EXIT_FAILURE;
    }
} // namespace mts

int main(int argc, char* argv[])
{
    return mts::main(argc, argv);
}
