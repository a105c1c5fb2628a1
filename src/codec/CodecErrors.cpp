/**
 * @file CodecErrors.cpp
 * @brief Message formatting for codec errors
 */

#include "CodecErrors.hpp"

#include <spdlog/fmt/fmt.h>

namespace arkfix::codec {

UnknownType::UnknownType(const std::string& typeTag, int64_t offset)
    : CodecError(fmt::format("Unknown property type '{}' at offset {}", typeTag, offset), offset)
    , m_typeTag(typeTag)
{
}

SizeMismatch::SizeMismatch(const std::string& propertyName, int64_t declaredSize,
                           int64_t actualSize, int64_t offset)
    : CodecError(fmt::format("Property '{}' at offset {}: declared size {}, actual size {}",
                             propertyName, offset, declaredSize, actualSize), offset)
    , m_propertyName(propertyName)
    , m_declaredSize(declaredSize)
    , m_actualSize(actualSize)
{
}

TruncatedInput::TruncatedInput(int64_t offset, int64_t requested, int64_t limit)
    : CodecError(fmt::format("Truncated input: {} bytes requested at offset {}, data ends at {}",
                             requested, offset, limit), offset)
    , m_requested(requested)
    , m_limit(limit)
{
}

TypeMismatch::TypeMismatch(const std::string& propertyName, const std::string& expected,
                           const std::string& actual)
    : CodecError(fmt::format("Property '{}': expected {} value, got {}",
                             propertyName, expected, actual), -1)
    , m_propertyName(propertyName)
    , m_expected(expected)
    , m_actual(actual)
{
}

EncodeOverflow::EncodeOverflow(const std::string& what, uint64_t value)
    : CodecError(fmt::format("{} {} does not fit in a 32-bit field", what, value), -1)
    , m_value(value)
{
}

} // namespace arkfix::codec
