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

#include "HttpTransport.hpp"

#include <future>

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <Wt/Http/Client.h>

#include "core/ILogger.hpp"

#define LOG(sev, message) MTS_LOG(HTTP, sev, "[Http transport] - " << message)

namespace mts::transfer::http
{
    namespace
    {
        Wt::Http::Method toWtMethod(Method method)
        {
            switch (method)
            {
            case Method::Get:
                return Wt::Http::Method::Get;
            case Method::Head:
                return Wt::Http::Method::Head;
            case Method::Post:
                return Wt::Http::Method::Post;
            case Method::Patch:
                return Wt::Http::Method::Patch;
            }

            return Wt::Http::Method::Get;
        }
    } // namespace

    std::string_view toString(Method method)
    {
        switch (method)
        {
        case Method::Get:
            return "GET";
        case Method::Head:
            return "HEAD";
        case Method::Post:
            return "POST";
        case Method::Patch:
            return "PATCH";
        }

        return "";
    }

    std::unique_ptr<IHttpTransport> createHttpTransport(boost::asio::io_context& ioContext, const TransportConfig& config)
    {
        return std::make_unique<HttpTransport>(ioContext, config);
    }

    HttpTransport::HttpTransport(boost::asio::io_context& ioContext, const TransportConfig& config)
        : _ioContext{ ioContext }
        , _config{ config }
    {
    }

    TransportResult HttpTransport::send(const Request& request)
    {
        LOG(DEBUG, "Sending " << toString(request.method) << " request to url '" << request.url << "', body size = " << request.message.body().size());

        // one client per exchange: requests of different jobs never share a connection state
        Wt::Http::Client client{ _ioContext };
        client.setFollowRedirect(true);
        client.setTimeout(_config.timeout);
        client.setMaximumResponseSize(_config.maxResponseSize);

        std::promise<TransportResult> promise;
        std::future<TransportResult> future{ promise.get_future() };

        client.done().connect([&promise](Wt::AsioWrapper::error_code ec, const Wt::Http::Message& msg) {
            if (!ec || ec == boost::asio::ssl::error::stream_truncated)
                promise.set_value(msg);
            else if (ec == boost::asio::error::timed_out)
                promise.set_value(TransportError{ TransportErrorType::Timeout, ec.message() });
            else
                promise.set_value(TransportError{ TransportErrorType::ConnectionFailure, ec.message() });
        });

        if (!client.request(toWtMethod(request.method), request.url, request.message))
        {
            LOG(ERROR, "Send failed, bad url or unsupported scheme? url = '" << request.url << "'");
            return TransportError{ TransportErrorType::InvalidUrl, "Invalid url" };
        }

        // the client enforces its own timeout, this is a last resort guard
        if (future.wait_for(_config.timeout + std::chrono::seconds{ 5 }) != std::future_status::ready)
        {
            LOG(WARNING, "Request to '" << request.url << "' still pending, aborting");
            client.abort();
        }

        TransportResult result{ future.get() };
        if (const Response* response{ std::get_if<Response>(&result) })
            LOG(DEBUG, "Received response from '" << request.url << "', status = " << response->status());
        else
            LOG(DEBUG, "Request to '" << request.url << "' failed: " << std::get<TransportError>(result).message);

        return result;
    }
} // namespace mts::transfer::http
