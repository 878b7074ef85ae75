#ifndef INCLUDE_PHC_CORE_RAWPHC_HPP
#define INCLUDE_PHC_CORE_RAWPHC_HPP

#include "phc/core/Salt.hpp"
#include "phc/core/SaltAndHash.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace phc::core
{

using ParamPair = std::pair<std::string, std::string>;
using ParamList = std::vector<ParamPair>;

// A PHC string that has not been associated with a hash function: the id, the parameters as ordered text pairs
// and the trailing salt/hash segments.
class RawPhc final
{
public:
    // Throws std::invalid_argument unless the record renders to a string the parser accepts: id and parameter
    // names in [a-z0-9-]+, parameter values in [a-zA-Z0-9/+.-]+, no empty binary salt or hash.
    RawPhc(std::string id, ParamList params, SaltAndHash saltAndHash = {});

    [[nodiscard]] const std::string& id() const noexcept
    {
        return m_id;
    }

    [[nodiscard]] const ParamList& params() const noexcept
    {
        return m_params;
    }

    [[nodiscard]] const SaltAndHash& saltAndHash() const noexcept
    {
        return m_saltAndHash;
    }

    [[nodiscard]] const Salt* salt() const noexcept
    {
        return m_saltAndHash.salt();
    }

    [[nodiscard]] std::optional<std::span<const std::uint8_t>> hash() const noexcept
    {
        return m_saltAndHash.hash();
    }

    // First parameter with this name, if any.
    [[nodiscard]] std::optional<std::string_view> param(std::string_view name) const noexcept;

    // $id[$k=v(,k=v)*][$salt[$hash]]
    [[nodiscard]] std::string toString() const;

    bool operator==(const RawPhc&) const = default;

private:
    std::string m_id;
    ParamList m_params;
    SaltAndHash m_saltAndHash;
};

} // namespace phc::core

#endif // INCLUDE_PHC_CORE_RAWPHC_HPP
