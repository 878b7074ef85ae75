#ifndef INCLUDE_PHC_PARAMS_PARAMSET_HPP
#define INCLUDE_PHC_PARAMS_PARAMSET_HPP

#include "phc/core/RawPhc.hpp"
#include "phc/core/SaltAndHash.hpp"
#include "phc/params/Param.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace phc::params
{

enum class ExtractFailure : std::uint8_t
{
    MissingRequired,
    MalformedValue,
};

namespace detail
{

void logExtractFailure(std::string_view paramName, ExtractFailure failure);

} // namespace detail

// Forward-only cursor over a record's (name, value) pairs.
class RawParamCursor final
{
public:
    explicit RawParamCursor(std::span<const phc::core::ParamPair> raw) noexcept : m_raw(raw)
    {
    }

    // Consumes the pair at the cursor if its name is key.
    [[nodiscard]] std::optional<std::string_view> nextIfKey(std::string_view key) noexcept;

    // The value at the cursor when its name matches, otherwise the parameter's default.
    template <Param P> [[nodiscard]] std::optional<typename P::Output> extractSingle(const P& param)
    {
        const auto raw{ nextIfKey(param.name()) };
        if (!raw)
        {
            auto fallback{ param.defaultValue() };
            if (!fallback)
            {
                detail::logExtractFailure(param.name(), ExtractFailure::MissingRequired);
            }
            return fallback;
        }

        auto value{ param.extract(*raw) };
        if (!value)
        {
            detail::logExtractFailure(param.name(), ExtractFailure::MalformedValue);
        }
        return value;
    }

    [[nodiscard]] std::size_t consumed() const noexcept
    {
        return m_index;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_raw.size() - m_index;
    }

private:
    std::span<const phc::core::ParamPair> m_raw;
    std::size_t m_index{ 0 };
};

// An ordered list of parameter declarations for one hash function.
//
// Extraction walks the declarations in order against the raw pairs: a declaration consumes the next pair only
// when the names match, otherwise it takes its default. There is no search or backtracking, so parameters must
// appear in declaration order; the first missing required parameter or malformed value fails the whole set.
// Pairs left over after the last declaration are ignored.
template <Param... Ps>
    requires(sizeof...(Ps) > 0)
class ParamSet final
{
public:
    using Values = std::tuple<typename Ps::Output...>;

    explicit ParamSet(Ps... params) : m_params(std::move(params)...)
    {
    }

    [[nodiscard]] static constexpr std::size_t size() noexcept
    {
        return sizeof...(Ps);
    }

    [[nodiscard]] const std::tuple<Ps...>& declarations() const noexcept
    {
        return m_params;
    }

    [[nodiscard]] std::optional<Values> extract(std::span<const phc::core::ParamPair> raw) const
    {
        RawParamCursor cursor{ raw };
        return extractImpl(cursor, std::index_sequence_for<Ps...>{});
    }

    [[nodiscard]] std::optional<Values> extract(const phc::core::RawPhc& raw) const
    {
        return extract(std::span<const phc::core::ParamPair>{ raw.params() });
    }

    // Values equal to their declared default are left out.
    [[nodiscard]] phc::core::ParamList serialize(const Values& values) const
    {
        phc::core::ParamList out{};
        out.reserve(sizeof...(Ps));
        serializeImpl(values, out, std::index_sequence_for<Ps...>{});
        return out;
    }

private:
    template <std::size_t... I>
    [[nodiscard]] std::optional<Values> extractImpl(RawParamCursor& cursor, std::index_sequence<I...>) const
    {
        std::tuple<std::optional<typename Ps::Output>...> slots{};
        // && folds left to right and stops at the first failure.
        const bool complete{ (... && (std::get<I>(slots) = cursor.extractSingle(std::get<I>(m_params))).has_value()) };
        if (!complete)
        {
            return std::nullopt;
        }
        return Values{ std::move(*std::get<I>(slots))... };
    }

    template <std::size_t... I>
    void serializeImpl(const Values& values, phc::core::ParamList& out, std::index_sequence<I...>) const
    {
        (appendSerialized(std::get<I>(m_params), std::get<I>(values), out), ...);
    }

    template <Param P>
    static void appendSerialized(const P& param, const typename P::Output& value, phc::core::ParamList& out)
    {
        if (auto text{ param.serialize(value) })
        {
            out.emplace_back(std::string{ param.name() }, std::move(*text));
        }
    }

    std::tuple<Ps...> m_params;
};

template <Param... Ps> [[nodiscard]] ParamSet<Ps...> paramSet(Ps... params)
{
    return ParamSet<Ps...>{ std::move(params)... };
}

// Builds a record from typed values; throws std::invalid_argument if a rendered value is not PHC-safe.
template <Param... Ps>
[[nodiscard]] phc::core::RawPhc assemble(std::string id, const ParamSet<Ps...>& set,
                                         const typename ParamSet<Ps...>::Values& values,
                                         phc::core::SaltAndHash saltAndHash = {})
{
    return phc::core::RawPhc{ std::move(id), set.serialize(values), std::move(saltAndHash) };
}

} // namespace phc::params

#endif // INCLUDE_PHC_PARAMS_PARAMSET_HPP
