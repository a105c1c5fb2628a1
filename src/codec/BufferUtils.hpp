/**
 * @file BufferUtils.hpp
 * @brief Little-endian cursor reader and writer for property streams
 *
 * The reader is bounded: every read checks against a limit, which is the
 * buffer end for a top-level stream or the declared end of the property
 * whose payload is being read. Reading past the limit raises TruncatedInput.
 */

#pragma once

#include "FString.hpp"

#include <QByteArray>
#include <cstdint>
#include <utility>

namespace arkfix::codec {

/**
 * @class BufferReader
 * @brief Bounded cursor over an immutable byte array
 */
class BufferReader {
public:
    explicit BufferReader(const QByteArray& data);

    /**
     * @brief Reader over [offset, limit) of data
     */
    BufferReader(const QByteArray& data, qsizetype offset, qsizetype limit);

    qsizetype offset() const { return m_offset; }
    qsizetype limit() const { return m_limit; }
    qsizetype remaining() const { return m_limit - m_offset; }
    bool atEnd() const { return m_offset >= m_limit; }

    /**
     * @brief True when the limit is tighter than the underlying buffer
     */
    bool isBounded() const { return m_limit < m_data.size(); }

    /**
     * @brief Reader over the next @p length bytes; the cursor does not move
     *
     * The sub-reader's limit is clamped to this reader's limit, so a length
     * reaching past it yields a reader that fails on the first overrun.
     */
    BufferReader subReader(qsizetype length) const;

    void seek(qsizetype offset);
    void skip(qsizetype count);

    uint8_t readUInt8();
    int8_t readInt8();
    uint16_t readUInt16();
    int16_t readInt16();
    uint32_t readUInt32();
    int32_t readInt32();
    uint64_t readUInt64();
    int64_t readInt64();
    float readFloat();
    double readDouble();

    /**
     * @brief Read an int32 without moving the cursor
     */
    int32_t peekInt32() const;

    QByteArray readBytes(qsizetype count);

    /**
     * @brief Read a length-prefixed string, keeping its on-disk form
     */
    FString readString();

    const QByteArray& data() const { return m_data; }

private:
    void require(qsizetype count) const;

    QByteArray m_data;
    qsizetype m_offset;
    qsizetype m_limit;
};

/**
 * @class BufferWriter
 * @brief Growable little-endian output buffer with size backpatching
 */
class BufferWriter {
public:
    BufferWriter() = default;

    void writeUInt8(uint8_t value);
    void writeInt8(int8_t value);
    void writeUInt16(uint16_t value);
    void writeInt16(int16_t value);
    void writeUInt32(uint32_t value);
    void writeInt32(int32_t value);
    void writeUInt64(uint64_t value);
    void writeInt64(int64_t value);
    void writeFloat(float value);
    void writeDouble(double value);
    void writeBytes(const QByteArray& bytes);
    void writeZeros(qsizetype count);
    void writeString(const FString& value);

    /**
     * @brief Write a zero int32 placeholder and return its position
     */
    qsizetype reserveInt32();

    /**
     * @brief Overwrite a previously reserved int32
     */
    void patchInt32(qsizetype position, int32_t value);

    qsizetype size() const { return m_data.size(); }
    const QByteArray& data() const { return m_data; }
    QByteArray take() { return std::move(m_data); }

    /**
     * @brief Narrow a size or count to the int32 wire field
     * @throws EncodeOverflow when the value does not fit
     */
    static int32_t checkedInt32(uint64_t value, const char* what);

private:
    QByteArray m_data;
};

} // namespace arkfix::codec
