#include "phc/params/ParamSet.hpp"

#include <spdlog/spdlog.h>

namespace phc::params
{
namespace detail
{

void logExtractFailure(std::string_view paramName, ExtractFailure failure)
{
    switch (failure)
    {
    case ExtractFailure::MissingRequired:
        spdlog::debug("ParamSet::extract: required parameter '{}' is missing or out of order", paramName);
        break;
    case ExtractFailure::MalformedValue:
        spdlog::debug("ParamSet::extract: parameter '{}' has a malformed value", paramName);
        break;
    }
}

} // namespace detail

std::optional<std::string_view> RawParamCursor::nextIfKey(std::string_view key) noexcept
{
    if (m_index >= m_raw.size())
    {
        return std::nullopt;
    }

    const auto& [name, value]{ m_raw[m_index] };
    if (name != key)
    {
        return std::nullopt;
    }
    ++m_index;
    return std::string_view{ value };
}

} // namespace phc::params
