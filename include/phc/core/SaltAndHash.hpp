#ifndef INCLUDE_PHC_CORE_SALTANDHASH_HPP
#define INCLUDE_PHC_CORE_SALTANDHASH_HPP

#include "phc/core/Salt.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <variant>

namespace phc::core
{

enum class SaltAndHashKind : std::uint8_t
{
    Neither,
    SaltOnly,
    Both,
};

// Trailing salt/hash segments of a PHC string. A hash never appears without a salt: the only way in is
// fromOptional(), whose input can carry a hash only next to a salt.
class SaltAndHash final
{
public:
    struct Neither final
    {
        bool operator==(const Neither&) const = default;
    };

    struct SaltOnly final
    {
        Salt salt;

        bool operator==(const SaltOnly&) const = default;
    };

    struct Both final
    {
        Salt salt;
        Bytes hash;

        bool operator==(const Both&) const = default;
    };

    using Variant = std::variant<Neither, SaltOnly, Both>;
    using Parts = std::optional<std::pair<Salt, std::optional<Bytes>>>;

    SaltAndHash() = default;

    [[nodiscard]] static SaltAndHash fromOptional(Parts parts);

    [[nodiscard]] SaltAndHashKind kind() const noexcept;

    // nullptr for Neither.
    [[nodiscard]] const Salt* salt() const noexcept;

    [[nodiscard]] std::optional<std::span<const std::uint8_t>> hash() const noexcept;

    [[nodiscard]] const Variant& value() const noexcept
    {
        return m_value;
    }

    bool operator==(const SaltAndHash&) const = default;

private:
    explicit SaltAndHash(Variant value) noexcept : m_value(std::move(value))
    {
    }

    Variant m_value{ Neither{} };
};

} // namespace phc::core

#endif // INCLUDE_PHC_CORE_SALTANDHASH_HPP
