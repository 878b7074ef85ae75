#include "phc/encoding/Base64.hpp"

#include "phc/core/Charset.hpp"
#include <cstddef>
#include <limits>
#include <openssl/evp.h>
#include <stdexcept>

namespace phc::encoding
{
namespace
{

constexpr std::size_t g_kQuadChars{ 4U };
constexpr std::size_t g_kTripletBytes{ 3U };

// EVP_*Block take int lengths.
constexpr std::size_t g_kMaxBlockInput{ static_cast<std::size_t>(std::numeric_limits<int>::max() / 2) };

} // namespace

std::string encodeBase64NoPad(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    if (bytes.size() > g_kMaxBlockInput)
    {
        throw std::length_error("encodeBase64NoPad: input too large");
    }

    const std::size_t quads{ (bytes.size() + g_kTripletBytes - 1U) / g_kTripletBytes };
    // EVP_EncodeBlock NUL-terminates.
    std::string out(quads * g_kQuadChars + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                       static_cast<int>(bytes.size())) };
    out.resize(static_cast<std::size_t>(written));

    while (!out.empty() && out.back() == '=')
    {
        out.pop_back();
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> decodeBase64NoPad(std::string_view text)
{
    if (text.size() > g_kMaxBlockInput)
    {
        return std::nullopt;
    }
    for (const char c : text)
    {
        if (!phc::core::detail::isBase64Char(c))
        {
            return std::nullopt;
        }
    }

    const std::size_t tail{ text.size() % g_kQuadChars };
    if (tail == 1U)
    {
        return std::nullopt;
    }
    if (text.empty())
    {
        return std::vector<std::uint8_t>{};
    }

    const std::size_t padding{ (tail == 0U) ? 0U : (g_kQuadChars - tail) };
    std::string padded{ text };
    padded.append(padding, '=');

    std::vector<std::uint8_t> out((padded.size() / g_kQuadChars) * g_kTripletBytes);
    const int decoded{ EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(padded.data()),
                                       static_cast<int>(padded.size())) };
    if (decoded < 0 || static_cast<std::size_t>(decoded) < padding)
    {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the zero bytes produced by '=' padding.
    out.resize(static_cast<std::size_t>(decoded) - padding);

    if (encodeBase64NoPad(out) != text)
    {
        return std::nullopt;
    }
    return out;
}

} // namespace phc::encoding
