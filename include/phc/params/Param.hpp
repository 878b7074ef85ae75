#ifndef INCLUDE_PHC_PARAMS_PARAM_HPP
#define INCLUDE_PHC_PARAMS_PARAM_HPP

#include <array>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace phc::params
{

// Text codec for a parameter value type. Specialize with
//   static std::optional<T> parse(std::string_view raw);
//   static std::string render(const T& value);
template <class T> struct ParamTraits;

namespace detail
{

// Accepts an explicit leading '+', but not a doubled sign such as "+-1".
template <class T> [[nodiscard]] std::optional<T> parseNumber(std::string_view raw) noexcept
{
    if (raw.size() > 1U && raw.front() == '+' && raw[1] != '-' && raw[1] != '+')
    {
        raw.remove_prefix(1U);
    }

    T value{};
    const char* first{ raw.data() };
    const char* last{ raw.data() + raw.size() };
    const auto [ptr, ec]{ std::from_chars(first, last, value) };
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

template <std::integral T> [[nodiscard]] std::string renderNumber(T value)
{
    // Large enough for any integer.
    constexpr std::size_t kBufferBytes{ 64U };
    std::array<char, kBufferBytes> buffer{};
    const auto [ptr, ec]{ std::to_chars(buffer.data(), buffer.data() + buffer.size(), value) };
    if (ec != std::errc{})
    {
        return {};
    }
    return std::string(buffer.data(), ptr);
}

// Shortest round-trip digits in plain decimal notation, never an exponent: 1e20 renders as
// "100000000000000000000".
template <std::floating_point T> [[nodiscard]] std::string renderNumber(T value)
{
    constexpr std::size_t kInitialBufferBytes{ 64U };
    constexpr std::size_t kMaxBufferBytes{ 8192U };

    std::string buffer(kInitialBufferBytes, '\0');
    while (true)
    {
        const auto [ptr, ec]{ std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                            std::chars_format::fixed) };
        if (ec == std::errc{})
        {
            buffer.resize(static_cast<std::size_t>(ptr - buffer.data()));
            return buffer;
        }
        if (ec != std::errc::value_too_large || buffer.size() >= kMaxBufferBytes)
        {
            return {};
        }
        buffer.resize(buffer.size() * 2U);
    }
}

} // namespace detail

template <class T>
    requires(std::integral<T> && !std::same_as<T, bool>)
struct ParamTraits<T>
{
    [[nodiscard]] static std::optional<T> parse(std::string_view raw) noexcept
    {
        return detail::parseNumber<T>(raw);
    }

    [[nodiscard]] static std::string render(T value)
    {
        return detail::renderNumber(value);
    }
};

template <std::floating_point T> struct ParamTraits<T>
{
    [[nodiscard]] static std::optional<T> parse(std::string_view raw) noexcept
    {
        return detail::parseNumber<T>(raw);
    }

    [[nodiscard]] static std::string render(T value)
    {
        return detail::renderNumber(value);
    }
};

template <> struct ParamTraits<bool>
{
    [[nodiscard]] static std::optional<bool> parse(std::string_view raw) noexcept
    {
        if (raw == "true")
        {
            return true;
        }
        if (raw == "false")
        {
            return false;
        }
        return std::nullopt;
    }

    [[nodiscard]] static std::string render(bool value)
    {
        return value ? "true" : "false";
    }
};

template <> struct ParamTraits<std::string>
{
    [[nodiscard]] static std::optional<std::string> parse(std::string_view raw)
    {
        return std::string{ raw };
    }

    [[nodiscard]] static std::string render(const std::string& value)
    {
        return value;
    }
};

// Equality is required so that a value equal to the default can be left out when serializing.
template <class T>
concept ParamValue = std::copy_constructible<T> && std::equality_comparable<T> &&
                     requires(std::string_view raw, const T& value) {
                         { ParamTraits<T>::parse(raw) } -> std::same_as<std::optional<T>>;
                         { ParamTraits<T>::render(value) } -> std::same_as<std::string>;
                     };

// Transforms one hash function parameter to and from its serialized text.
template <class P>
concept Param = requires(const P& p, std::string_view raw, const typename P::Output& value) {
    typename P::Output;
    { p.name() } -> std::convertible_to<std::string_view>;
    { p.defaultValue() } -> std::same_as<std::optional<typename P::Output>>;
    { p.extract(raw) } -> std::same_as<std::optional<typename P::Output>>;
    { p.serialize(value) } -> std::same_as<std::optional<std::string>>;
};

// Parameter for any ParamValue type; required when declared without a default.
template <ParamValue T> class GenParam final
{
public:
    using Output = T;

    explicit GenParam(std::string name) : m_name(std::move(name))
    {
    }

    GenParam(std::string name, T defaultValue) : m_name(std::move(name)), m_default(std::move(defaultValue))
    {
    }

    [[nodiscard]] std::string_view name() const noexcept
    {
        return m_name;
    }

    [[nodiscard]] std::optional<T> defaultValue() const
    {
        return m_default;
    }

    [[nodiscard]] std::optional<T> extract(std::string_view raw) const
    {
        return ParamTraits<T>::parse(raw);
    }

    // Nothing when the value equals the default.
    [[nodiscard]] std::optional<std::string> serialize(const T& value) const
    {
        if (m_default && value == *m_default)
        {
            return std::nullopt;
        }
        return ParamTraits<T>::render(value);
    }

private:
    std::string m_name;
    std::optional<T> m_default;
};

template <ParamValue T> [[nodiscard]] GenParam<T> param(std::string name)
{
    return GenParam<T>{ std::move(name) };
}

template <ParamValue T> [[nodiscard]] GenParam<T> param(std::string name, T defaultValue)
{
    return GenParam<T>{ std::move(name), std::move(defaultValue) };
}

[[nodiscard]] inline GenParam<std::string> param(std::string name, const char* defaultValue)
{
    return GenParam<std::string>{ std::move(name), std::string{ defaultValue } };
}

} // namespace phc::params

#endif // INCLUDE_PHC_PARAMS_PARAM_HPP
