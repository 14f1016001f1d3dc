// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <fmt/format.h>

#include <boost/describe/enum_to_string.hpp>
#include <boost/describe/enumerators.hpp>

#include <type_traits>

// shamelessly taken from the boost org (thanks!)
template <class T>
struct fmt::formatter<
    T, char,
    std::enable_if_t<boost::describe::has_describe_enumerators<T>::value>>
{
private:
    using U = std::underlying_type_t<T>;

    fmt::formatter<fmt::string_view, char> sf_;
    fmt::formatter<U, char> nf_;

public:
    constexpr auto parse(format_parse_context &ctx)
    {
        auto i1 = sf_.parse(ctx);
        auto i2 = nf_.parse(ctx);

        if (i1 != i2) {
            throw fmt::format_error("invalid format");
        }

        return i1;
    }

    auto format(T const &t, format_context &ctx) const
    {
        char const *s = boost::describe::enum_to_string(t, 0);

        if (s) {
            return sf_.format(s, ctx);
        }
        else {
            return nf_.format(static_cast<U>(t), ctx);
        }
    }
};
