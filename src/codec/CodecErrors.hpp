/**
 * @file CodecErrors.hpp
 * @brief Error conditions raised by the property codec
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace arkfix::codec {

/**
 * Base class for all codec errors
 *
 * offset() is the byte position in the input buffer the error refers to,
 * or -1 when the error does not come from a buffer position (encode time).
 */
class CodecError : public std::runtime_error {
public:
    CodecError(const std::string& message, int64_t offset)
        : std::runtime_error(message)
        , m_offset(offset) {}

    int64_t offset() const { return m_offset; }

private:
    int64_t m_offset;
};

/**
 * Type tag not present in the type registry
 */
class UnknownType : public CodecError {
public:
    UnknownType(const std::string& typeTag, int64_t offset);

    const std::string& typeTag() const { return m_typeTag; }

private:
    std::string m_typeTag;
};

/**
 * Bytes consumed by a payload differ from the size recorded in its tag
 */
class SizeMismatch : public CodecError {
public:
    SizeMismatch(const std::string& propertyName, int64_t declaredSize,
                 int64_t actualSize, int64_t offset);

    const std::string& propertyName() const { return m_propertyName; }
    int64_t declaredSize() const { return m_declaredSize; }
    int64_t actualSize() const { return m_actualSize; }

private:
    std::string m_propertyName;
    int64_t m_declaredSize;
    int64_t m_actualSize;
};

/**
 * Read past the end of the available bytes
 *
 * limit() is the end of the region that was being read, which is the
 * buffer end at top level or the declared end of an enclosing property.
 */
class TruncatedInput : public CodecError {
public:
    TruncatedInput(int64_t offset, int64_t requested, int64_t limit);

    int64_t requested() const { return m_requested; }
    int64_t limit() const { return m_limit; }

private:
    int64_t m_requested;
    int64_t m_limit;
};

/**
 * Structurally invalid bytes (bad string terminator, negative count, ...)
 */
class MalformedData : public CodecError {
public:
    MalformedData(const std::string& message, int64_t offset)
        : CodecError(message, offset) {}
};

/**
 * Encode-time mismatch between a node's value and its declared type
 */
class TypeMismatch : public CodecError {
public:
    TypeMismatch(const std::string& propertyName, const std::string& expected,
                 const std::string& actual);

    const std::string& propertyName() const { return m_propertyName; }
    const std::string& expected() const { return m_expected; }
    const std::string& actual() const { return m_actual; }

private:
    std::string m_propertyName;
    std::string m_expected;
    std::string m_actual;
};

/**
 * Size or count that does not fit the 32-bit field reserved for it
 */
class EncodeOverflow : public CodecError {
public:
    EncodeOverflow(const std::string& what, uint64_t value);

    uint64_t value() const { return m_value; }

private:
    uint64_t m_value;
};

} // namespace arkfix::codec
