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
#pragma once

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>

namespace dismay::utf
{
namespace detail
{
// Unicode constants
constexpr char32_t code_point_max = 0x10FFFF;
constexpr char32_t replacement_char = 0xFFFD;

// high surrogates: 0xd800 - 0xdbff
// low surrogates:  0xdc00 - 0xdfff
constexpr char32_t surrogate_lead_min = 0xD800;
constexpr char32_t surrogate_trail_max = 0xDFFF;

// the number of code units of a sequence starting with the given lead unit
// clang-format off
constexpr std::uint8_t lead_char_class[] = {
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
    1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
    0, 0, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2,
    2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2,
    3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3, 3,
    4, 4, 4, 4, 4, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0
};
// clang-format on

constexpr auto sequence_length(char leadUnit) noexcept -> std::size_t
{
    return lead_char_class[static_cast<unsigned char>(leadUnit)];
}

constexpr auto is_trail(char codeUnit) noexcept -> bool
{
    return static_cast<unsigned char>(codeUnit) >> 6 == 0x2;
}

constexpr auto is_surrogate(char32_t cp) noexcept -> bool
{
    return surrogate_lead_min <= cp && cp <= surrogate_trail_max;
}

constexpr auto is_code_point_valid(char32_t cp) noexcept -> bool
{
    return cp <= code_point_max && !is_surrogate(cp);
}

/**
 * @brief The valid range of the first trail unit, the leads E0, ED, F0 and
 * F4 exclude overlong encodings, surrogates and code points beyond U+10FFFF.
 */
struct trail_range
{
    unsigned char min;
    unsigned char max;
};

constexpr auto first_trail_range(char leadUnit) noexcept -> trail_range
{
    switch (static_cast<unsigned char>(leadUnit))
    {
    case 0xE0:
        return {0xA0, 0xBF};
    case 0xED:
        return {0x80, 0x9F};
    case 0xF0:
        return {0x90, 0xBF};
    case 0xF4:
        return {0x80, 0x8F};
    default:
        return {0x80, 0xBF};
    }
}

constexpr auto encode_unsafe(char32_t cp, char *output) noexcept
        -> std::ptrdiff_t
{
    if (cp < 0x80)
    {
        output[0] = static_cast<char>(cp);
        return 1;
    }
    if (cp < 0x800)
    {
        output[0] = static_cast<char>(0xC0 | (cp >> 6));
        output[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000)
    {
        output[0] = static_cast<char>(0xE0 | (cp >> 12));
        output[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        output[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    }
    output[0] = static_cast<char>(0xF0 | (cp >> 18));
    output[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    output[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    output[3] = static_cast<char>(0x80 | (cp & 0x3F));
    return 4;
}
} // namespace detail

struct decode_result
{
    char32_t code_point;
    //! the number of code units consumed, never 0 for a non empty input
    std::size_t length;
    bool valid;
};

/**
 * @brief Decodes the first code point of src.
 *
 * An invalid sequence consumes the longest prefix which could have started
 * a valid sequence, but at least one code unit.
 */
auto decode(std::string_view src) noexcept -> decode_result;

auto find_invalid(std::string_view src) noexcept -> std::ptrdiff_t;

inline auto is_valid(std::string_view src) noexcept -> bool
{
    return find_invalid(src) == -1;
}

/**
 * @brief Copies src replacing every invalid sequence with U+FFFD.
 */
auto to_string_lossy(std::string_view src) -> std::string;

} // namespace dismay::utf
