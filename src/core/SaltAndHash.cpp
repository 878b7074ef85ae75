#include "phc/core/SaltAndHash.hpp"

namespace phc::core
{

SaltAndHash SaltAndHash::fromOptional(Parts parts)
{
    if (!parts)
    {
        return SaltAndHash{};
    }

    auto& [salt, hash]{ *parts };
    if (!hash)
    {
        return SaltAndHash{ Variant{ SaltOnly{ .salt = std::move(salt) } } };
    }
    return SaltAndHash{ Variant{ Both{ .salt = std::move(salt), .hash = std::move(*hash) } } };
}

SaltAndHashKind SaltAndHash::kind() const noexcept
{
    if (std::holds_alternative<SaltOnly>(m_value))
    {
        return SaltAndHashKind::SaltOnly;
    }
    if (std::holds_alternative<Both>(m_value))
    {
        return SaltAndHashKind::Both;
    }
    return SaltAndHashKind::Neither;
}

const Salt* SaltAndHash::salt() const noexcept
{
    if (const auto* saltOnly{ std::get_if<SaltOnly>(&m_value) })
    {
        return &saltOnly->salt;
    }
    if (const auto* both{ std::get_if<Both>(&m_value) })
    {
        return &both->salt;
    }
    return nullptr;
}

std::optional<std::span<const std::uint8_t>> SaltAndHash::hash() const noexcept
{
    if (const auto* both{ std::get_if<Both>(&m_value) })
    {
        return std::span<const std::uint8_t>{ both->hash };
    }
    return std::nullopt;
}

} // namespace phc::core
