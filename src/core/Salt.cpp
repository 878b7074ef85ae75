#include "phc/core/Salt.hpp"

#include "phc/core/Charset.hpp"
#include "phc/encoding/Base64.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace phc::core
{

Salt Salt::fromAscii(std::string ascii)
{
    if (!detail::isValue(ascii))
    {
        throw std::invalid_argument("Salt::fromAscii: salt must be non-empty [a-zA-Z0-9/+.-]");
    }
    return Salt{ std::variant<std::string, Bytes>{ std::in_place_type<std::string>, std::move(ascii) } };
}

Salt Salt::fromBinary(Bytes binary)
{
    return Salt{ std::variant<std::string, Bytes>{ std::in_place_type<Bytes>, std::move(binary) } };
}

Salt Salt::fromBinary(std::span<const std::uint8_t> binary)
{
    return fromBinary(Bytes(binary.begin(), binary.end()));
}

std::optional<std::string_view> Salt::ascii() const noexcept
{
    if (const auto* text{ std::get_if<std::string>(&m_value) })
    {
        return std::string_view{ *text };
    }
    return std::nullopt;
}

std::optional<std::span<const std::uint8_t>> Salt::binary() const noexcept
{
    if (const auto* bytes{ std::get_if<Bytes>(&m_value) })
    {
        return std::span<const std::uint8_t>{ *bytes };
    }
    return std::nullopt;
}

std::string Salt::toString() const
{
    if (const auto* text{ std::get_if<std::string>(&m_value) })
    {
        return *text;
    }
    return phc::encoding::encodeBase64NoPad(std::get<Bytes>(m_value));
}

Salt Salt::asBinary() const
{
    const auto* text{ std::get_if<std::string>(&m_value) };
    if (text == nullptr)
    {
        return *this;
    }

    auto decoded{ phc::encoding::decodeBase64NoPad(*text) };
    if (!decoded)
    {
        spdlog::debug("Salt::asBinary: {}-char ascii salt is not base64, kept as ascii", text->size());
        return *this;
    }
    return fromBinary(std::move(*decoded));
}

} // namespace phc::core
