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

#include <compare>
#include <functional>
#include <string>

namespace mts::db
{
    class IdType
    {
    public:
        using ValueType = long long;

        IdType() = default;
        IdType(ValueType id)
            : _id{ id } {}

        bool isValid() const { return _id != invalidValue; }
        std::string toString() const { return std::to_string(_id); }

        ValueType getValue() const { return _id; }
        auto operator<=>(const IdType& other) const = default;

    private:
        static constexpr ValueType invalidValue{ -1 };
        ValueType _id{ invalidValue };
    };
} // namespace mts::db

#define MTS_DECLARE_IDTYPE(name)                                             \
    namespace mts::db                                                        \
    {                                                                        \
        class name : public IdType                                           \
        {                                                                    \
        public:                                                              \
            using IdType::IdType;                                            \
            auto operator<=>(const name& other) const = default;             \
        };                                                                   \
    }                                                                        \
    template<>                                                               \
    struct std::hash<mts::db::name>                                          \
    {                                                                        \
        std::size_t operator()(mts::db::name id) const                       \
        {                                                                    \
            return std::hash<mts::db::name::ValueType>()(id.getValue());     \
        }                                                                    \
    };
