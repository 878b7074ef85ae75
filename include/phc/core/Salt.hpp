#ifndef INCLUDE_PHC_CORE_SALT_HPP
#define INCLUDE_PHC_CORE_SALT_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace phc::core
{

using Bytes = std::vector<std::uint8_t>;

// A salt is either an ASCII token in [a-zA-Z0-9/+.-] used literally, or opaque bytes rendered as unpadded base64.
// The alternative is chosen by the factory, never inferred from the content.
class Salt final
{
public:
    // Throws std::invalid_argument for an empty string or a character outside [a-zA-Z0-9/+.-].
    [[nodiscard]] static Salt fromAscii(std::string ascii);

    [[nodiscard]] static Salt fromBinary(Bytes binary);
    [[nodiscard]] static Salt fromBinary(std::span<const std::uint8_t> binary);

    [[nodiscard]] bool isAscii() const noexcept
    {
        return std::holds_alternative<std::string>(m_value);
    }

    [[nodiscard]] bool isBinary() const noexcept
    {
        return std::holds_alternative<Bytes>(m_value);
    }

    [[nodiscard]] std::optional<std::string_view> ascii() const noexcept;
    [[nodiscard]] std::optional<std::span<const std::uint8_t>> binary() const noexcept;

    [[nodiscard]] std::string toString() const;

    // Reinterprets an ASCII salt as base64-encoded bytes. Returns an unchanged copy if it does not decode.
    [[nodiscard]] Salt asBinary() const;

    bool operator==(const Salt&) const = default;

private:
    explicit Salt(std::variant<std::string, Bytes> value) noexcept : m_value(std::move(value))
    {
    }

    std::variant<std::string, Bytes> m_value;
};

} // namespace phc::core

#endif // INCLUDE_PHC_CORE_SALT_HPP
