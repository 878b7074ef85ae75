#ifndef INCLUDE_PHC_CORE_PARSER_HPP
#define INCLUDE_PHC_CORE_PARSER_HPP

#include "phc/core/RawPhc.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace phc::core
{

enum class ParseError : std::uint8_t
{
    MissingIdMarker,
    InvalidId,
    InvalidHashEncoding,
    TrailingInput,
};

template <class T> using ParseResult = std::variant<T, ParseError>;

// Grammar:
//   phc           := '$' id params? salt_and_hash?
//   id            := [a-z0-9-]+
//   params        := '$' param (',' param)*
//   param         := [a-z0-9-]+ '=' [a-zA-Z0-9/+.-]+
//   salt_and_hash := '$' [a-zA-Z0-9/+.-]+ ('$' [a-zA-Z0-9/+]+)?
//
// A params segment is tried first and silently yields an empty list when it does not match, so a '$'-prefixed
// token without '=' is read as the salt. The whole input must be consumed.
[[nodiscard]] ParseResult<RawPhc> parsePhc(std::string_view text);

[[nodiscard]] std::optional<RawPhc> tryParsePhc(std::string_view text);

[[nodiscard]] std::string_view describe(ParseError error) noexcept;

} // namespace phc::core

#endif // INCLUDE_PHC_CORE_PARSER_HPP
