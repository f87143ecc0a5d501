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

#include "transfer/IHttpTransport.hpp"

namespace mts::transfer::http
{
    class HttpTransport final : public IHttpTransport
    {
    public:
        HttpTransport(boost::asio::io_context& ioContext, const TransportConfig& config);
        ~HttpTransport() override = default;
        HttpTransport(const HttpTransport&) = delete;
        HttpTransport& operator=(const HttpTransport&) = delete;

    private:
        TransportResult send(const Request& request) override;

        boost::asio::io_context& _ioContext;
        const TransportConfig _config;
    };
} // namespace mts::transfer::http
