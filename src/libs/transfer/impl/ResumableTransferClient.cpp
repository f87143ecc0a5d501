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

#include "ResumableTransferClient.hpp"

#include <algorithm>
#include <condition_variable>
#include <fstream>
#include <mutex>

#include <Wt/Utils.h>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "crypto/Sha256Hasher.hpp"
#include "crypto/Types.hpp"

#include "UrlUtils.hpp"

#define LOG(sev, message) MTS_LOG(TRANSFER, sev, "[Transfer client] - " << message)

namespace mts::transfer
{
    namespace
    {
        constexpr std::string_view tusVersion{ "1.0.0" };
        constexpr std::string_view checksumHeader{ "X-Checksum-Sha256" };

        template<typename T>
        std::optional<T> headerReadAs(const Wt::Http::Message& msg, std::string_view headerName)
        {
            std::optional<T> res;

            if (const std::string * headerValue{ msg.getHeader(std::string{ headerName }) })
                res = core::stringUtils::readAs<T>(core::stringUtils::stringTrim(*headerValue));

            return res;
        }

        http::Request createRequest(http::Method method, std::string_view url)
        {
            http::Request request;
            request.method = method;
            request.url = url;
            return request;
        }

        http::Request createTusRequest(http::Method method, std::string_view url)
        {
            http::Request request{ createRequest(method, url) };
            request.message.addHeader("Tus-Resumable", std::string{ tusVersion });
            return request;
        }

        TransferError createStatusError(int status, std::string_view context)
        {
            TransferError error{ TransferErrorType::ProtocolError, std::string{ context } + ": unexpected HTTP status " + std::to_string(status) };

            if (status == 408 || status == 429)
                error.type = TransferErrorType::Throttled;
            else if (status == 409)
                error.type = TransferErrorType::OffsetConflict;
            else if (status == 404 || status == 410)
                error.type = TransferErrorType::SessionExpired;
            else if (status >= 500 && status < 600)
                error.type = TransferErrorType::ServerError;
            else if (status >= 400 && status < 500)
                error.type = TransferErrorType::ClientError;

            return error;
        }

        bool isChecksumEqual(std::string_view checksumA, std::string_view checksumB)
        {
            return core::stringUtils::stringCaseInsensitiveEqual(core::stringUtils::stringTrim(checksumA), core::stringUtils::stringTrim(checksumB));
        }

        std::optional<std::size_t> parseContentRangeStart(std::string_view contentRange)
        {
            // "bytes <start>-<end>/<total>"
            constexpr std::string_view prefix{ "bytes " };
            if (!core::stringUtils::stringStartsWith(contentRange, prefix))
                return std::nullopt;

            contentRange.remove_prefix(prefix.size());
            return core::stringUtils::readAs<std::size_t>(contentRange.substr(0, contentRange.find('-')));
        }

        std::optional<TransferError> readFileChunk(const std::filesystem::path& path, std::size_t offset, std::size_t size, std::vector<std::byte>& buffer)
        {
            std::ifstream ifs{ path, std::ios::binary };
            if (!ifs)
                return TransferError{ TransferErrorType::LocalFileUnavailable, "Cannot open '" + path.string() + "' for reading" };

            buffer.resize(size);
            ifs.seekg(static_cast<std::streamoff>(offset));
            ifs.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
            if (static_cast<std::size_t>(ifs.gcount()) != size)
                return TransferError{ TransferErrorType::LocalFileUnavailable, "Cannot read " + std::to_string(size) + " bytes at offset " + std::to_string(offset) + " from '" + path.string() + "'" };

            return std::nullopt;
        }
    } // namespace

    std::unique_ptr<IResumableTransferClient> createResumableTransferClient(http::IHttpTransport& transport, ITransferSessionStore& store, const TransferClientConfig& config)
    {
        return std::make_unique<ResumableTransferClient>(transport, store, config);
    }

    ResumableTransferClient::ResumableTransferClient(http::IHttpTransport& transport, ITransferSessionStore& store, const TransferClientConfig& config)
        : _transport{ transport }
        , _store{ store }
        , _config{ config }
    {
        if (_config.chunkSize == 0)
            throw core::MtsException{ "Transfer chunk size must not be null" };
        if (_config.retryPolicy.maxAttempts == 0)
            throw core::MtsException{ "Transfer max attempts must not be null" };
    }

    SessionResult ResumableTransferClient::open(const OpenParameters& parameters, std::stop_token stopToken)
    {
        std::optional<SessionResult> result{ retryTransient(stopToken, [&] {
            return parameters.direction == db::TransferDirection::Upload ? openUpload(parameters) : openDownload(parameters);
        }) };
        if (!result)
        {
            LOG(INFO, "Opening of " << db::toString(parameters.direction) << " session for '" << parameters.endpoint << "' cancelled");
            return TransferCancelled{};
        }

        return std::move(*result);
    }

    SessionResult ResumableTransferClient::resume(const core::UUID& token, std::stop_token stopToken)
    {
        std::optional<TransferSession> session{ _store.load(token) };
        if (!session)
            return TransferError{ TransferErrorType::SessionNotFound, "No persisted transfer session for token " + std::string{ token.getAsString() } };

        LOG(DEBUG, "Resuming " << db::toString(session->direction) << " session " << token << " at offset " << session->offset << "/" << session->totalLength);

        if (session->finalized)
            return *session;

        if (session->isExpired(Wt::WDateTime::currentDateTime()))
            return TransferError{ TransferErrorType::SessionExpired, "Transfer session expired" };

        const std::optional<std::optional<TransferError>> result{ retryTransient(stopToken, [&] { return reconcile(*session); }) };
        if (!result)
        {
            LOG(INFO, "Resuming of session " << token << " cancelled");
            return TransferCancelled{};
        }
        if (const std::optional<TransferError>& error{ *result })
            return *error;

        return *session;
    }

    SessionResult ResumableTransferClient::openUpload(const OpenParameters& parameters)
    {
        if (!parameters.payloadLength || parameters.checksum.empty())
            throw core::MtsException{ "Upload sessions require a payload length and a checksum" };

        http::Request request{ createTusRequest(http::Method::Post, parameters.endpoint) };
        request.message.addHeader("Upload-Length", std::to_string(*parameters.payloadLength));
        request.message.addHeader("Upload-Metadata", "checksum " + Wt::Utils::base64Encode("sha256 " + parameters.checksum, false));

        auto result{ sendRequest(request) };
        if (TransferError* error{ std::get_if<TransferError>(&result) })
            return std::move(*error);

        const http::Response& response{ std::get<http::Response>(result) };
        if (response.status() != 201)
            return createStatusError(response.status(), "Upload creation");

        const std::string* location{ response.getHeader("Location") };
        if (!location || location->empty())
            return TransferError{ TransferErrorType::ProtocolError, "Upload creation: missing Location header" };

        TransferSession session{
            .token = core::UUID::generate(),
            .direction = db::TransferDirection::Upload,
            .endpoint = parameters.endpoint,
            .remoteSessionId = urlUtils::resolveLocation(parameters.endpoint, core::stringUtils::stringTrim(*location)),
            .offset = 0,
            .totalLength = *parameters.payloadLength,
            .checksum = parameters.checksum,
            .expiresAt = {},
            .localPath = parameters.localPath,
        };

        if (const std::string * expires{ response.getHeader("Upload-Expires") })
            session.expiresAt = core::stringUtils::fromHttpDateString(*expires);

        persist(session);
        LOG(INFO, "Created upload session " << session.token << " at '" << session.remoteSessionId << "', length = " << session.totalLength);

        return session;
    }

    SessionResult ResumableTransferClient::openDownload(const OpenParameters& parameters)
    {
        auto result{ sendRequest(createRequest(http::Method::Head, parameters.endpoint)) };
        if (TransferError* error{ std::get_if<TransferError>(&result) })
            return std::move(*error);

        const http::Response& response{ std::get<http::Response>(result) };
        if (response.status() != 200)
            return createStatusError(response.status(), "Download query");

        const std::optional<std::size_t> contentLength{ headerReadAs<std::size_t>(response, "Content-Length") };
        if (!contentLength)
            return TransferError{ TransferErrorType::ProtocolError, "Download query: missing Content-Length header" };

        if (parameters.payloadLength && *parameters.payloadLength != *contentLength)
            return TransferError{ TransferErrorType::ProtocolError, "Download query: remote size " + std::to_string(*contentLength) + " does not match expected size " + std::to_string(*parameters.payloadLength) };

        std::string checksum{ parameters.checksum };
        if (const std::string * remoteChecksum{ response.getHeader(std::string{ checksumHeader }) })
        {
            if (checksum.empty())
                checksum = core::stringUtils::stringTrim(*remoteChecksum);
            else if (!isChecksumEqual(checksum, *remoteChecksum))
                return TransferError{ TransferErrorType::ChecksumMismatch, "Download query: remote checksum does not match expected checksum" };
        }
        if (checksum.empty())
            LOG(WARNING, "No checksum known for '" << parameters.endpoint << "', download will only be verified by length");

        {
            std::ofstream ofs{ parameters.localPath, std::ios::binary | std::ios::trunc };
            if (!ofs)
                return TransferError{ TransferErrorType::LocalIoError, "Cannot create '" + parameters.localPath.string() + "'" };
        }

        TransferSession session{
            .token = core::UUID::generate(),
            .direction = db::TransferDirection::Download,
            .endpoint = parameters.endpoint,
            .remoteSessionId = parameters.endpoint,
            .offset = 0,
            .totalLength = *contentLength,
            .checksum = checksum,
            .expiresAt = {},
            .localPath = parameters.localPath,
        };

        persist(session);
        LOG(INFO, "Created download session " << session.token << " for '" << session.endpoint << "', length = " << session.totalLength);

        return session;
    }

    std::optional<TransferError> ResumableTransferClient::reconcile(TransferSession& session)
    {
        return session.direction == db::TransferDirection::Upload ? reconcileUpload(session) : reconcileDownload(session);
    }

    std::optional<TransferError> ResumableTransferClient::reconcileUpload(TransferSession& session)
    {
        auto result{ sendRequest(createTusRequest(http::Method::Head, session.remoteSessionId)) };
        if (TransferError* error{ std::get_if<TransferError>(&result) })
            return std::move(*error);

        const http::Response& response{ std::get<http::Response>(result) };
        if (response.status() != 200 && response.status() != 204)
            return createStatusError(response.status(), "Upload offset query");

        const std::optional<std::size_t> remoteOffset{ headerReadAs<std::size_t>(response, "Upload-Offset") };
        if (!remoteOffset)
            return TransferError{ TransferErrorType::ProtocolError, "Upload offset query: missing Upload-Offset header" };

        if (*remoteOffset > session.totalLength)
            return TransferError{ TransferErrorType::ProtocolError, "Upload offset query: remote offset " + std::to_string(*remoteOffset) + " beyond total length " + std::to_string(session.totalLength) };

        if (const std::optional<std::size_t> remoteLength{ headerReadAs<std::size_t>(response, "Upload-Length") }; remoteLength && *remoteLength != session.totalLength)
            return TransferError{ TransferErrorType::ProtocolError, "Upload offset query: remote length does not match" };

        if (*remoteOffset != session.offset)
            LOG(INFO, "Upload session " << session.token << ": remote offset is " << *remoteOffset << ", local offset was " << session.offset);

        session.offset = *remoteOffset;
        persist(session);

        return std::nullopt;
    }

    std::optional<TransferError> ResumableTransferClient::reconcileDownload(TransferSession& session)
    {
        std::error_code ec;
        std::size_t localSize{};
        if (std::filesystem::exists(session.localPath, ec))
        {
            localSize = static_cast<std::size_t>(std::filesystem::file_size(session.localPath, ec));
            if (ec)
                return TransferError{ TransferErrorType::LocalFileUnavailable, "Cannot get size of '" + session.localPath.string() + "': " + ec.message() };
        }
        else
        {
            std::ofstream ofs{ session.localPath, std::ios::binary };
            if (!ofs)
                return TransferError{ TransferErrorType::LocalIoError, "Cannot create '" + session.localPath.string() + "'" };
        }

        // bytes past the persisted offset may come from a chunk that was not fully written
        const std::size_t offset{ std::min(localSize, session.offset) };
        if (localSize != offset)
        {
            std::filesystem::resize_file(session.localPath, offset, ec);
            if (ec)
                return TransferError{ TransferErrorType::LocalIoError, "Cannot truncate '" + session.localPath.string() + "': " + ec.message() };
        }

        auto result{ sendRequest(createRequest(http::Method::Head, session.remoteSessionId)) };
        if (TransferError* error{ std::get_if<TransferError>(&result) })
            return std::move(*error);

        const http::Response& response{ std::get<http::Response>(result) };
        if (response.status() != 200)
            return createStatusError(response.status(), "Download query");

        const std::optional<std::size_t> contentLength{ headerReadAs<std::size_t>(response, "Content-Length") };
        if (!contentLength || *contentLength != session.totalLength)
            return TransferError{ TransferErrorType::ProtocolError, "Download query: remote resource size changed" };

        if (offset != session.offset)
            LOG(INFO, "Download session " << session.token << ": local offset is " << offset << ", persisted offset was " << session.offset);

        session.offset = offset;
        persist(session);

        return std::nullopt;
    }

    OffsetResult ResumableTransferClient::uploadChunk(TransferSession& session, std::span<const std::byte> bytes)
    {
        if (session.direction != db::TransferDirection::Upload)
            throw core::MtsException{ "Cannot upload a chunk using a download session" };

        if (bytes.size() > session.totalLength - session.offset)
            throw core::MtsException{ "Chunk exceeds upload length" };

        if (session.isExpired(Wt::WDateTime::currentDateTime()))
            return TransferError{ TransferErrorType::SessionExpired, "Upload session expired" };

        http::Request request{ createTusRequest(http::Method::Patch, session.remoteSessionId) };
        request.message.addHeader("Upload-Offset", std::to_string(session.offset));
        request.message.addHeader("Content-Type", "application/offset+octet-stream");
        request.message.addBodyText(std::string{ reinterpret_cast<const char*>(bytes.data()), bytes.size() });

        auto result{ sendRequest(request) };
        if (TransferError* error{ std::get_if<TransferError>(&result) })
            return std::move(*error);

        const http::Response& response{ std::get<http::Response>(result) };
        if (response.status() != 204 && response.status() != 200)
            return createStatusError(response.status(), "Upload chunk");

        const std::optional<std::size_t> newOffset{ headerReadAs<std::size_t>(response, "Upload-Offset") };
        if (!newOffset)
            return TransferError{ TransferErrorType::ProtocolError, "Upload chunk: missing Upload-Offset header" };

        // the remote can never confirm more than what was sent
        if (*newOffset < session.offset || *newOffset > session.offset + bytes.size())
            return TransferError{ TransferErrorType::ProtocolError, "Upload chunk: remote offset " + std::to_string(*newOffset) + " inconsistent with sent range [" + std::to_string(session.offset) + ", " + std::to_string(session.offset + bytes.size()) + "]" };

        if (*newOffset == session.offset && !bytes.empty())
            return TransferError{ TransferErrorType::OffsetConflict, "Upload chunk: no byte acknowledged" };

        session.offset = *newOffset;
        persist(session);

        return session.offset;
    }

    ChunkResult ResumableTransferClient::downloadChunk(TransferSession& session, std::size_t maxBytes)
    {
        if (session.direction != db::TransferDirection::Download)
            throw core::MtsException{ "Cannot download a chunk using an upload session" };

        if (session.isComplete() || maxBytes == 0)
            return std::vector<std::byte>{};

        if (session.isExpired(Wt::WDateTime::currentDateTime()))
            return TransferError{ TransferErrorType::SessionExpired, "Download session expired" };

        const std::size_t end{ std::min(session.offset + maxBytes, session.totalLength) }; // exclusive
        http::Request request{ createRequest(http::Method::Get, session.remoteSessionId) };
        request.message.addHeader("Range", "bytes=" + std::to_string(session.offset) + "-" + std::to_string(end - 1));

        auto result{ sendRequest(request) };
        if (TransferError* error{ std::get_if<TransferError>(&result) })
            return std::move(*error);

        const http::Response& response{ std::get<http::Response>(result) };
        const std::string& body{ response.body() };
        if (response.status() == 206)
        {
            if (const std::string * contentRange{ response.getHeader("Content-Range") })
            {
                const std::optional<std::size_t> start{ parseContentRangeStart(*contentRange) };
                if (!start || *start != session.offset)
                    return TransferError{ TransferErrorType::ProtocolError, "Download chunk: unexpected Content-Range '" + *contentRange + "'" };
            }

            if (body.empty() || body.size() > end - session.offset)
                return TransferError{ TransferErrorType::ProtocolError, "Download chunk: unexpected body size " + std::to_string(body.size()) };
        }
        else if (response.status() == 200)
        {
            // whole payload sent, only acceptable from the very beginning
            if (session.offset != 0 || body.size() != session.totalLength)
                return TransferError{ TransferErrorType::ProtocolError, "Download chunk: remote does not support ranges" };
        }
        else
        {
            return createStatusError(response.status(), "Download chunk");
        }

        {
            std::ofstream ofs{ session.localPath, std::ios::binary | std::ios::app };
            ofs.write(body.data(), static_cast<std::streamsize>(body.size()));
            ofs.flush();
            if (!ofs)
                return TransferError{ TransferErrorType::LocalIoError, "Cannot write to '" + session.localPath.string() + "'" };
        }

        session.offset += body.size();
        persist(session);

        std::vector<std::byte> bytes(body.size());
        std::transform(std::cbegin(body), std::cend(body), std::begin(bytes), [](char c) { return static_cast<std::byte>(c); });
        return bytes;
    }

    FinalizeResult ResumableTransferClient::finalize(TransferSession& session)
    {
        if (session.finalized)
            return session.verified;

        if (!session.isComplete())
            return TransferError{ TransferErrorType::ProtocolError, "Cannot finalize an incomplete transfer (" + std::to_string(session.offset) + "/" + std::to_string(session.totalLength) + ")" };

        FinalizeResult result{ session.direction == db::TransferDirection::Upload ? verifyUpload(session) : verifyDownload(session) };
        if (const bool* verified{ std::get_if<bool>(&result) })
        {
            session.finalized = true;
            session.verified = *verified;
            persist(session);

            if (*verified)
                LOG(INFO, "Transfer session " << session.token << " finalized and verified, " << session.totalLength << " bytes");
            else
                LOG(ERROR, "Transfer session " << session.token << " failed checksum verification");
        }

        return result;
    }

    FinalizeResult ResumableTransferClient::verifyUpload(const TransferSession& session)
    {
        auto result{ sendRequest(createTusRequest(http::Method::Head, session.remoteSessionId)) };
        if (TransferError* error{ std::get_if<TransferError>(&result) })
            return std::move(*error);

        const http::Response& response{ std::get<http::Response>(result) };
        if (response.status() != 200 && response.status() != 204)
            return createStatusError(response.status(), "Upload final query");

        const std::optional<std::size_t> remoteOffset{ headerReadAs<std::size_t>(response, "Upload-Offset") };
        if (!remoteOffset || *remoteOffset != session.totalLength)
            return TransferError{ TransferErrorType::ProtocolError, "Upload final query: remote did not acknowledge the whole payload" };

        std::string localChecksum;
        try
        {
            localChecksum = crypto::Sha256Hasher::computeFileAsHex(session.localPath);
        }
        catch (const crypto::CryptoException& e)
        {
            return TransferError{ TransferErrorType::LocalFileUnavailable, e.what() };
        }

        bool verified{ isChecksumEqual(localChecksum, session.checksum) };
        if (const std::string * remoteChecksum{ response.getHeader(std::string{ checksumHeader }) })
            verified = verified && isChecksumEqual(*remoteChecksum, session.checksum);

        return verified;
    }

    FinalizeResult ResumableTransferClient::verifyDownload(const TransferSession& session)
    {
        std::error_code ec;
        const std::uintmax_t localSize{ std::filesystem::file_size(session.localPath, ec) };
        if (ec)
            return TransferError{ TransferErrorType::LocalFileUnavailable, "Cannot get size of '" + session.localPath.string() + "': " + ec.message() };

        if (localSize != session.totalLength)
            return false;

        if (session.checksum.empty())
            return true;

        try
        {
            return isChecksumEqual(crypto::Sha256Hasher::computeFileAsHex(session.localPath), session.checksum);
        }
        catch (const crypto::CryptoException& e)
        {
            return TransferError{ TransferErrorType::LocalFileUnavailable, e.what() };
        }
    }

    TransferOutcome ResumableTransferClient::upload(TransferSession& session, std::stop_token stopToken, ProgressCallback progressCallback)
    {
        if (session.direction != db::TransferDirection::Upload)
            throw core::MtsException{ "Cannot upload using a download session" };

        std::vector<std::byte> buffer;
        return runTransferLoop(session, stopToken, progressCallback, [&](TransferSession& s) -> std::optional<TransferError> {
            const std::size_t size{ std::min(_config.chunkSize, s.totalLength - s.offset) };
            if (std::optional<TransferError> error{ readFileChunk(s.localPath, s.offset, size, buffer) })
                return error;

            OffsetResult result{ uploadChunk(s, buffer) };
            if (TransferError* error{ std::get_if<TransferError>(&result) })
                return std::move(*error);

            return std::nullopt;
        });
    }

    TransferOutcome ResumableTransferClient::download(TransferSession& session, std::stop_token stopToken, ProgressCallback progressCallback)
    {
        if (session.direction != db::TransferDirection::Download)
            throw core::MtsException{ "Cannot download using an upload session" };

        return runTransferLoop(session, stopToken, progressCallback, [&](TransferSession& s) -> std::optional<TransferError> {
            ChunkResult result{ downloadChunk(s, _config.chunkSize) };
            if (TransferError* error{ std::get_if<TransferError>(&result) })
                return std::move(*error);

            return std::nullopt;
        });
    }

    TransferOutcome ResumableTransferClient::runTransferLoop(TransferSession& session, std::stop_token stopToken, const ProgressCallback& progressCallback, const ChunkFunc& transferNextChunk)
    {
        std::size_t failedAttempts{};
        bool mustReconcile{};

        while (true)
        {
            if (stopToken.stop_requested())
            {
                LOG(INFO, "Transfer session " << session.token << " cancelled at offset " << session.offset << "/" << session.totalLength);
                return TransferCancelled{};
            }

            std::optional<TransferError> error;
            if (mustReconcile)
            {
                error = reconcile(session);
                if (!error)
                    mustReconcile = false;
            }
            else if (!session.isComplete())
            {
                error = transferNextChunk(session);
                if (!error)
                {
                    failedAttempts = 0;
                    if (progressCallback)
                        progressCallback(session.offset, session.totalLength);
                }
            }
            else
            {
                FinalizeResult result{ finalize(session) };
                if (const bool* verified{ std::get_if<bool>(&result) })
                {
                    if (*verified)
                        return TransferCompleted{};

                    return TransferError{ TransferErrorType::ChecksumMismatch, "Checksum verification failed" };
                }
                error = std::move(std::get<TransferError>(result));
            }

            if (!error)
                continue;

            if (!isTransient(error->type))
            {
                LOG(ERROR, "Transfer session " << session.token << ": " << toString(error->type) << ", " << error->detail);
                return std::move(*error);
            }

            if (++failedAttempts >= _config.retryPolicy.maxAttempts)
            {
                LOG(ERROR, "Transfer session " << session.token << ": giving up after " << failedAttempts << " attempts, last error: " << error->detail);
                return std::move(*error);
            }

            LOG(WARNING, "Transfer session " << session.token << ": attempt " << failedAttempts << " failed (" << toString(error->type) << ", " << error->detail << "), resuming");
            if (!waitBeforeRetry(failedAttempts - 1, stopToken))
                return TransferCancelled{};

            // a failed attempt may have partially succeeded on the remote side
            mustReconcile = true;
        }
    }

    void ResumableTransferClient::discard(const TransferSession& session)
    {
        LOG(DEBUG, "Discarding transfer session " << session.token);
        _store.remove(session.token);
    }

    template<typename Func>
    auto ResumableTransferClient::retryTransient(std::stop_token stopToken, Func&& func) -> std::optional<decltype(func())>
    {
        using Result = decltype(func());

        std::size_t failedAttempts{};
        while (true)
        {
            if (stopToken.stop_requested())
                return std::nullopt;

            Result result{ func() };

            const TransferError* error{};
            if constexpr (std::is_same_v<Result, std::optional<TransferError>>)
                error = result ? &*result : nullptr;
            else
                error = std::get_if<TransferError>(&result);

            if (!error || !isTransient(error->type) || ++failedAttempts >= _config.retryPolicy.maxAttempts)
                return std::optional<Result>{ std::in_place, std::move(result) };

            LOG(WARNING, "Attempt " << failedAttempts << " failed (" << toString(error->type) << ", " << error->detail << "), retrying");
            if (!waitBeforeRetry(failedAttempts - 1, stopToken))
                return std::nullopt;
        }
    }

    bool ResumableTransferClient::waitBeforeRetry(std::size_t retryIndex, std::stop_token stopToken)
    {
        const std::chrono::milliseconds delay{ _config.retryPolicy.computeJitteredDelay(retryIndex) };
        LOG(DEBUG, "Waiting " << delay.count() << " ms before retrying");

        std::mutex mutex;
        std::condition_variable_any cv;
        std::unique_lock lock{ mutex };
        cv.wait_for(lock, stopToken, delay, [] { return false; });

        return !stopToken.stop_requested();
    }

    std::variant<http::Response, TransferError> ResumableTransferClient::sendRequest(const http::Request& request)
    {
        http::TransportResult result{ _transport.send(request) };
        if (http::Response * response{ std::get_if<http::Response>(&result) })
            return std::move(*response);

        const http::TransportError& error{ std::get<http::TransportError>(result) };
        switch (error.type)
        {
        case http::TransportErrorType::Timeout:
            return TransferError{ TransferErrorType::Timeout, error.message };
        case http::TransportErrorType::ConnectionFailure:
            return TransferError{ TransferErrorType::ConnectionFailure, error.message };
        case http::TransportErrorType::InvalidUrl:
            break;
        }

        return TransferError{ TransferErrorType::ClientError, "Invalid url '" + request.url + "'" };
    }

    void ResumableTransferClient::persist(const TransferSession& session)
    {
        _store.save(session);
    }
} // namespace mts::transfer
