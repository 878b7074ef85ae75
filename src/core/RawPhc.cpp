#include "phc/core/RawPhc.hpp"

#include "phc/core/Charset.hpp"
#include "phc/encoding/Base64.hpp"
#include <stdexcept>
#include <variant>

namespace phc::core
{
namespace
{

constexpr char g_kSegmentSeparator{ '$' };
constexpr char g_kParamSeparator{ ',' };
constexpr char g_kKeyValueSeparator{ '=' };

void requireValidParams(const ParamList& params)
{
    for (const auto& [name, value] : params)
    {
        if (!detail::isName(name))
        {
            throw std::invalid_argument("RawPhc: parameter name must be [a-z0-9-]+");
        }
        if (!detail::isValue(value))
        {
            throw std::invalid_argument("RawPhc: parameter value must be [a-zA-Z0-9/+.-]+");
        }
    }
}

void requireRenderableTail(const SaltAndHash& saltAndHash)
{
    if (const auto* salt{ saltAndHash.salt() }; salt != nullptr)
    {
        if (const auto bytes{ salt->binary() }; bytes && bytes->empty())
        {
            throw std::invalid_argument("RawPhc: binary salt must be non-empty");
        }
    }
    if (const auto hash{ saltAndHash.hash() }; hash && hash->empty())
    {
        throw std::invalid_argument("RawPhc: hash must be non-empty");
    }
}

} // namespace

RawPhc::RawPhc(std::string id, ParamList params, SaltAndHash saltAndHash)
    : m_id(std::move(id)), m_params(std::move(params)), m_saltAndHash(std::move(saltAndHash))
{
    if (!detail::isName(m_id))
    {
        throw std::invalid_argument("RawPhc: id must be [a-z0-9-]+");
    }
    requireValidParams(m_params);
    requireRenderableTail(m_saltAndHash);
}

std::optional<std::string_view> RawPhc::param(std::string_view name) const noexcept
{
    for (const auto& [key, value] : m_params)
    {
        if (key == name)
        {
            return std::string_view{ value };
        }
    }
    return std::nullopt;
}

std::string RawPhc::toString() const
{
    std::string out{};
    out.push_back(g_kSegmentSeparator);
    out += m_id;

    if (!m_params.empty())
    {
        out.push_back(g_kSegmentSeparator);
        bool first{ true };
        for (const auto& [name, value] : m_params)
        {
            if (!first)
            {
                out.push_back(g_kParamSeparator);
            }
            first = false;
            out += name;
            out.push_back(g_kKeyValueSeparator);
            out += value;
        }
    }

    const auto& tail{ m_saltAndHash.value() };
    if (const auto* saltOnly{ std::get_if<SaltAndHash::SaltOnly>(&tail) })
    {
        out.push_back(g_kSegmentSeparator);
        out += saltOnly->salt.toString();
    }
    else if (const auto* both{ std::get_if<SaltAndHash::Both>(&tail) })
    {
        out.push_back(g_kSegmentSeparator);
        out += both->salt.toString();
        out.push_back(g_kSegmentSeparator);
        out += phc::encoding::encodeBase64NoPad(both->hash);
    }

    return out;
}

} // namespace phc::core
