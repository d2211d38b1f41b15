// Copyright (c) Giacomo Drago <giacomo@giacomodrago.com>
// All rights reserved.

// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. Neither the name of Giacomo Drago nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.

// THIS SOFTWARE IS PROVIDED BY GIACOMO DRAGO "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL GIACOMO DRAGO BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#ifndef NBJSON_TEST_COMMON_H
#define NBJSON_TEST_COMMON_H

#include "nbjson_parser.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace nbjson_test
{

struct recorded_event
{
    nbjson::event type;
    std::string payload;

    bool operator==(const recorded_event& other) const
    {
        return type == other.type && payload == other.payload;
    }
};

inline std::ostream& operator<<(std::ostream& out, const recorded_event& e)
{
    out << e.type;
    if (!e.payload.empty())
    {
        out << '(' << e.payload << ')';
    }
    return out;
}

inline bool has_payload(const nbjson::event e)
{
    switch (e)
    {
    case nbjson::event::FieldName:
    case nbjson::event::ValueString:
    case nbjson::event::ValueInt:
    case nbjson::event::ValueDouble:
        return true;
    default:
        return false;
    }
}

struct parse_result
{
    std::vector<recorded_event> events; // NeedMoreInput is not recorded
    std::optional<nbjson::parse_error> error;
    std::size_t suspensions = 0;
};

// Runs the feed/poll loop over json, handing at most chunk_size bytes to
// the feeder every time the parser asks for more input. Stops at the first
// Error or Eof.
inline parse_result parse(
    const std::string_view json,
    const std::size_t chunk_size = std::string_view::npos,
    const std::size_t max_depth = NBJ_DEFAULT_MAX_DEPTH,
    const std::size_t feeder_capacity = NBJ_DEFAULT_FEEDER_CAPACITY)
{
    nbjson::feeder feeder(feeder_capacity);
    nbjson::parser parser(feeder, max_depth);

    parse_result result;
    std::size_t offset = 0;

    while (true)
    {
        const nbjson::event e = parser.next_event();

        if (e == nbjson::event::NeedMoreInput)
        {
            ++result.suspensions;
            const std::size_t length =
                std::min(chunk_size, json.size() - offset);
            offset += feeder.feed(json.substr(offset, length));
            if (offset == json.size())
            {
                feeder.done();
            }
            continue;
        }

        recorded_event recorded {e, {}};
        if (has_payload(e))
        {
            recorded.payload = std::string(parser.value().raw());
        }
        result.events.push_back(recorded);

        if (e == nbjson::event::Error)
        {
            result.error = parser.error();
            break;
        }
        if (e == nbjson::event::Eof)
        {
            break;
        }
    }

    return result;
}

inline bool is_valid(
    const std::string_view json,
    const std::size_t max_depth = NBJ_DEFAULT_MAX_DEPTH)
{
    const parse_result result = parse(json, std::string_view::npos, max_depth);
    return !result.events.empty()
        && result.events.back().type == nbjson::event::Eof;
}

} // namespace nbjson_test

#endif // NBJSON_TEST_COMMON_H
