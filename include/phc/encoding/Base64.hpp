#ifndef INCLUDE_PHC_ENCODING_BASE64_HPP
#define INCLUDE_PHC_ENCODING_BASE64_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phc::encoding
{

// Standard alphabet, no '=' padding (the PHC "B64" encoding).
[[nodiscard]] std::string encodeBase64NoPad(std::span<const std::uint8_t> bytes);

// Strict: rejects padding, characters outside [A-Za-z0-9+/], a length of 1 mod 4 and non-zero trailing bits,
// so any accepted text re-encodes to itself.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> decodeBase64NoPad(std::string_view text);

} // namespace phc::encoding

#endif // INCLUDE_PHC_ENCODING_BASE64_HPP
