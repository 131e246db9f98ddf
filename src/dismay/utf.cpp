// Copyright 2016-2017 Henrik Steffen Gaßmann
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//		http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
////////////////////////////////////////////////////////////////////////////////
#include "utf.hpp"

using namespace dismay::utf::detail;

namespace dismay::utf
{
auto decode(std::string_view src) noexcept -> decode_result
{
    if (src.empty())
    {
        return {replacement_char, 0, false};
    }
    std::size_t const seqLength = sequence_length(src.front());
    if (seqLength == 0)
    {
        return {replacement_char, 1, false};
    }
    if (seqLength == 1)
    {
        return {static_cast<char32_t>(src.front()), 1, true};
    }

    auto cp = static_cast<char32_t>(static_cast<unsigned char>(src[0])
                                    & (0x7F >> seqLength));
    auto const firstTrail = first_trail_range(src.front());
    for (std::size_t i = 1; i < seqLength; ++i)
    {
        if (i >= src.size())
        {
            // truncated sequence
            return {replacement_char, i, false};
        }
        auto const unit = static_cast<unsigned char>(src[i]);
        bool const inRange = i == 1 ? firstTrail.min <= unit
                                              && unit <= firstTrail.max
                                    : is_trail(src[i]);
        if (!inRange)
        {
            return {replacement_char, i, false};
        }
        cp = (cp << 6) | static_cast<char32_t>(unit & 0x3F);
    }

    if (!is_code_point_valid(cp))
    {
        return {replacement_char, seqLength, false};
    }
    return {cp, seqLength, true};
}

auto find_invalid(std::string_view src) noexcept -> std::ptrdiff_t
{
    std::size_t offset = 0;
    while (offset < src.size())
    {
        auto const decoded = decode(src.substr(offset));
        if (!decoded.valid)
        {
            return static_cast<std::ptrdiff_t>(offset);
        }
        offset += decoded.length;
    }
    return -1;
}

auto to_string_lossy(std::string_view src) -> std::string
{
    std::string out;
    out.reserve(src.size());

    char replacement[4] = {};
    auto const replacementSize = encode_unsafe(replacement_char, replacement);

    std::size_t offset = 0;
    while (offset < src.size())
    {
        auto const rest = src.substr(offset);
        auto const decoded = decode(rest);
        if (decoded.valid)
        {
            out.append(rest.substr(0, decoded.length));
        }
        else
        {
            out.append(replacement, static_cast<std::size_t>(replacementSize));
        }
        offset += decoded.length;
    }
    return out;
}

} // namespace dismay::utf
