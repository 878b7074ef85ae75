#include "phc/core/Parser.hpp"

#include "phc/core/Charset.hpp"
#include "phc/encoding/Base64.hpp"
#include <cstddef>
#include <spdlog/spdlog.h>
#include <utility>

namespace phc::core
{
namespace
{

constexpr char g_kSegmentSeparator{ '$' };
constexpr char g_kParamSeparator{ ',' };
constexpr char g_kKeyValueSeparator{ '=' };

class Cursor
{
public:
    explicit Cursor(std::string_view text) noexcept : m_text(text)
    {
    }

    [[nodiscard]] bool atEnd() const noexcept
    {
        return m_index >= m_text.size();
    }

    [[nodiscard]] std::size_t position() const noexcept
    {
        return m_index;
    }

    void rewind(std::size_t position) noexcept
    {
        m_index = position;
    }

    [[nodiscard]] bool consume(char expected) noexcept
    {
        if (atEnd() || m_text[m_index] != expected)
        {
            return false;
        }
        ++m_index;
        return true;
    }

    // Longest non-empty run of characters matching pred; nothing is consumed on an empty run.
    template <class Pred> [[nodiscard]] std::optional<std::string_view> takeWhile1(Pred pred) noexcept
    {
        const std::size_t start{ m_index };
        while (!atEnd() && pred(m_text[m_index]))
        {
            ++m_index;
        }
        if (m_index == start)
        {
            return std::nullopt;
        }
        return m_text.substr(start, m_index - start);
    }

private:
    std::string_view m_text;
    std::size_t m_index{ 0 };
};

[[nodiscard]] std::optional<ParamPair> parseParam(Cursor& cursor)
{
    const std::size_t start{ cursor.position() };

    const auto name{ cursor.takeWhile1(detail::isNameChar) };
    if (!name || !cursor.consume(g_kKeyValueSeparator))
    {
        cursor.rewind(start);
        return std::nullopt;
    }
    const auto value{ cursor.takeWhile1(detail::isValueChar) };
    if (!value)
    {
        cursor.rewind(start);
        return std::nullopt;
    }
    return ParamPair{ std::string{ *name }, std::string{ *value } };
}

// Optional segment: an unmatched segment rewinds and yields an empty list.
[[nodiscard]] ParamList parseParams(Cursor& cursor)
{
    const std::size_t start{ cursor.position() };
    if (!cursor.consume(g_kSegmentSeparator))
    {
        return {};
    }

    auto first{ parseParam(cursor) };
    if (!first)
    {
        cursor.rewind(start);
        return {};
    }

    ParamList params{};
    params.push_back(std::move(*first));
    while (true)
    {
        const std::size_t beforeSeparator{ cursor.position() };
        if (!cursor.consume(g_kParamSeparator))
        {
            break;
        }
        auto next{ parseParam(cursor) };
        if (!next)
        {
            cursor.rewind(beforeSeparator);
            break;
        }
        params.push_back(std::move(*next));
    }
    return params;
}

[[nodiscard]] ParseResult<SaltAndHash> parseSaltAndHash(Cursor& cursor)
{
    const std::size_t start{ cursor.position() };
    if (!cursor.consume(g_kSegmentSeparator))
    {
        return SaltAndHash{};
    }
    const auto salt{ cursor.takeWhile1(detail::isValueChar) };
    if (!salt)
    {
        cursor.rewind(start);
        return SaltAndHash{};
    }

    const std::size_t afterSalt{ cursor.position() };
    std::optional<Bytes> hash{};
    if (cursor.consume(g_kSegmentSeparator))
    {
        const auto encoded{ cursor.takeWhile1(detail::isBase64Char) };
        if (encoded)
        {
            // Committed: the token can only be the hash.
            hash = phc::encoding::decodeBase64NoPad(*encoded);
            if (!hash)
            {
                return ParseError::InvalidHashEncoding;
            }
        }
        else
        {
            cursor.rewind(afterSalt);
        }
    }

    return SaltAndHash::fromOptional(std::make_pair(Salt::fromAscii(std::string{ *salt }), std::move(hash)));
}

[[nodiscard]] ParseError reject(ParseError error, std::string_view text, std::size_t offset)
{
    spdlog::debug("parsePhc: rejected {}-char input at offset {}: {}", text.size(), offset, describe(error));
    return error;
}

} // namespace

ParseResult<RawPhc> parsePhc(std::string_view text)
{
    Cursor cursor{ text };

    if (!cursor.consume(g_kSegmentSeparator))
    {
        return reject(ParseError::MissingIdMarker, text, cursor.position());
    }
    const auto id{ cursor.takeWhile1(detail::isNameChar) };
    if (!id)
    {
        return reject(ParseError::InvalidId, text, cursor.position());
    }

    ParamList params{ parseParams(cursor) };

    auto tail{ parseSaltAndHash(cursor) };
    if (const auto* error{ std::get_if<ParseError>(&tail) })
    {
        return reject(*error, text, cursor.position());
    }

    if (!cursor.atEnd())
    {
        return reject(ParseError::TrailingInput, text, cursor.position());
    }

    return RawPhc{ std::string{ *id }, std::move(params), std::get<SaltAndHash>(std::move(tail)) };
}

std::optional<RawPhc> tryParsePhc(std::string_view text)
{
    auto result{ parsePhc(text) };
    if (auto* raw{ std::get_if<RawPhc>(&result) })
    {
        return std::move(*raw);
    }
    return std::nullopt;
}

std::string_view describe(ParseError error) noexcept
{
    switch (error)
    {
    case ParseError::MissingIdMarker:
        return "expected '$' before the id";
    case ParseError::InvalidId:
        return "id must be one or more of [a-z0-9-]";
    case ParseError::InvalidHashEncoding:
        return "hash is not valid unpadded base64";
    case ParseError::TrailingInput:
        return "unexpected characters after the last segment";
    }
    return "unknown parse error";
}

} // namespace phc::core
