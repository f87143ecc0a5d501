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

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "transfer/IHttpTransport.hpp"

namespace mts::transfer::tests
{
    // In-memory remote: tus 1.0.0 upload server and range capable file server
    class FakeRemote final : public http::IHttpTransport
    {
    public:
        enum class FaultType
        {
            ConnectionFailure,
            Timeout,
            Status,                      // answers with the given HTTP status
            ConnectionFailureAfterApply, // request processed, answer lost
        };

        struct Fault
        {
            FaultType type{ FaultType::ConnectionFailure };
            int status{};
        };

        explicit FakeRemote(std::string_view baseUrl = "http://remote.test");
        ~FakeRemote() override = default;
        FakeRemote(const FakeRemote&) = delete;
        FakeRemote& operator=(const FakeRemote&) = delete;

        // Downloads, returns the resource url
        std::string addResource(std::string_view path, std::string content, bool advertiseChecksum = true);
        void setRangeSupport(bool enable);

        // Uploads
        std::string getUploadEndpoint() const;
        std::vector<std::string> getUploadUrls() const;
        std::optional<std::string> getUploadContent(std::string_view url) const;
        std::optional<std::string> getUploadMetadata(std::string_view url) const;
        void setUploadExpires(std::string_view httpDate);
        void expireUploads();
        void setMaxAcceptedBytesPerPatch(std::size_t maxBytes);

        // Applies the fault to 'count' requests of the given method, once 'skip' of them went through
        void injectFault(http::Method method, Fault fault, std::size_t count = 1, std::size_t skip = 0);
        // Called before each request is processed, outside of any lock
        void setRequestHook(std::function<void(const http::Request&)> hook);

        std::size_t getRequestCount(http::Method method) const;
        std::size_t getUploadedBytes() const;   // accepted PATCH payload bytes
        std::size_t getDownloadedBytes() const; // GET payload bytes sent

    private:
        http::TransportResult send(const http::Request& request) override;

        struct Resource
        {
            std::string content;
            bool advertiseChecksum{};
        };

        struct Upload
        {
            std::size_t length{};
            std::string metadata;
            std::string content;
            bool expired{};
        };

        struct FaultRule
        {
            http::Method method;
            Fault fault;
            std::size_t count{};
            std::size_t skip{};
        };

        std::optional<Fault> popFault(http::Method method);
        http::Response process(const http::Request& request, std::string_view path);
        http::Response processUploadCreation(const http::Request& request);
        http::Response processUploadQuery(Upload& upload);
        http::Response processUploadChunk(const http::Request& request, Upload& upload);
        http::Response processResourceQuery(const Resource& resource);
        http::Response processResourceGet(const http::Request& request, const Resource& resource);

        const std::string _baseUrl;

        mutable std::mutex _mutex;
        std::map<std::string, Resource, std::less<>> _resources;
        std::map<std::string, Upload, std::less<>> _uploads;
        std::size_t _nextUploadId{ 1 };
        std::string _uploadExpires;
        bool _rangeSupport{ true };
        std::size_t _maxAcceptedBytesPerPatch{};
        std::vector<FaultRule> _faultRules;
        std::map<http::Method, std::size_t> _requestCounts;
        std::size_t _uploadedBytes{};
        std::size_t _downloadedBytes{};
        std::function<void(const http::Request&)> _requestHook;
    };

    std::string computeChecksum(std::string_view content);
    std::string generatePayload(std::size_t size, unsigned seed = 0);
} // namespace mts::transfer::tests
