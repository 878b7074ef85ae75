#ifndef INTERNAL_INCLUDE_PHC_CORE_CHARSET_HPP
#define INTERNAL_INCLUDE_PHC_CORE_CHARSET_HPP

#include <algorithm>
#include <string_view>

namespace phc::core::detail
{

[[nodiscard]] constexpr bool isLowerAlnum(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

[[nodiscard]] constexpr bool isUpper(char c) noexcept
{
    return c >= 'A' && c <= 'Z';
}

// [a-z0-9-]
[[nodiscard]] constexpr bool isNameChar(char c) noexcept
{
    return isLowerAlnum(c) || c == '-';
}

// [a-zA-Z0-9/+.-]
[[nodiscard]] constexpr bool isValueChar(char c) noexcept
{
    return isLowerAlnum(c) || isUpper(c) || c == '/' || c == '+' || c == '.' || c == '-';
}

// [a-zA-Z0-9/+]
[[nodiscard]] constexpr bool isBase64Char(char c) noexcept
{
    return isLowerAlnum(c) || isUpper(c) || c == '/' || c == '+';
}

[[nodiscard]] constexpr bool isName(std::string_view s) noexcept
{
    return !s.empty() && std::all_of(s.begin(), s.end(), isNameChar);
}

[[nodiscard]] constexpr bool isValue(std::string_view s) noexcept
{
    return !s.empty() && std::all_of(s.begin(), s.end(), isValueChar);
}

} // namespace phc::core::detail

#endif // INTERNAL_INCLUDE_PHC_CORE_CHARSET_HPP
