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

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include <boost/asio/io_context.hpp>
#include <Wt/Http/Message.h>

namespace mts::transfer::http
{
    enum class Method
    {
        Get,
        Head,
        Post,
        Patch,
    };
    std::string_view toString(Method method);

    struct Request
    {
        Method method{ Method::Get };
        std::string url;
        Wt::Http::Message message; // headers and body
    };

    enum class TransportErrorType
    {
        ConnectionFailure,
        Timeout,
        InvalidUrl,
    };

    struct TransportError
    {
        TransportErrorType type;
        std::string message;
    };

    using Response = Wt::Http::Message;
    using TransportResult = std::variant<Response, TransportError>;

    // Synchronous request/response exchange, called from job threads
    class IHttpTransport
    {
    public:
        virtual ~IHttpTransport() = default;

        virtual TransportResult send(const Request& request) = 0;
    };

    struct TransportConfig
    {
        std::chrono::seconds timeout{ 60 };
        std::size_t maxResponseSize{ 80 * 1024 * 1024 };
    };

    // Requests are processed on the given io context, that must be run by someone else
    std::unique_ptr<IHttpTransport> createHttpTransport(boost::asio::io_context& ioContext, const TransportConfig& config);
} // namespace mts::transfer::http
