/**
 * @file BufferUtils.cpp
 * @brief Implementation of the bounded reader and the writer
 */

#include "BufferUtils.hpp"
#include "CodecErrors.hpp"

#include <QString>
#include <QStringView>

#include <algorithm>
#include <cstring>
#include <limits>
#include <string>

namespace arkfix::codec {

BufferReader::BufferReader(const QByteArray& data)
    : m_data(data)
    , m_offset(0)
    , m_limit(data.size())
{
}

BufferReader::BufferReader(const QByteArray& data, qsizetype offset, qsizetype limit)
    : m_data(data)
    , m_offset(offset)
    , m_limit(std::min(limit, data.size()))
{
}

BufferReader BufferReader::subReader(qsizetype length) const {
    qsizetype end = m_offset + std::max<qsizetype>(length, 0);
    return BufferReader(m_data, m_offset, std::min(end, m_limit));
}

void BufferReader::require(qsizetype count) const {
    if (count < 0 || count > m_limit - m_offset) {
        throw TruncatedInput(m_offset, count, m_limit);
    }
}

void BufferReader::seek(qsizetype offset) {
    if (offset < 0 || offset > m_limit) {
        throw TruncatedInput(m_offset, offset - m_offset, m_limit);
    }
    m_offset = offset;
}

void BufferReader::skip(qsizetype count) {
    require(count);
    m_offset += count;
}

uint8_t BufferReader::readUInt8() {
    require(1);
    return static_cast<uint8_t>(m_data[m_offset++]);
}

int8_t BufferReader::readInt8() {
    return static_cast<int8_t>(readUInt8());
}

uint16_t BufferReader::readUInt16() {
    require(2);
    const char* ptr = m_data.constData() + m_offset;
    uint16_t low = static_cast<uint8_t>(ptr[0]);
    uint16_t high = static_cast<uint8_t>(ptr[1]);
    m_offset += 2;
    return static_cast<uint16_t>((high << 8) | low);
}

int16_t BufferReader::readInt16() {
    return static_cast<int16_t>(readUInt16());
}

uint32_t BufferReader::readUInt32() {
    require(4);
    const char* ptr = m_data.constData() + m_offset;
    uint32_t b0 = static_cast<uint8_t>(ptr[0]);
    uint32_t b1 = static_cast<uint8_t>(ptr[1]);
    uint32_t b2 = static_cast<uint8_t>(ptr[2]);
    uint32_t b3 = static_cast<uint8_t>(ptr[3]);
    m_offset += 4;
    return (b3 << 24) | (b2 << 16) | (b1 << 8) | b0;
}

int32_t BufferReader::readInt32() {
    return static_cast<int32_t>(readUInt32());
}

uint64_t BufferReader::readUInt64() {
    uint64_t low = readUInt32();
    uint64_t high = readUInt32();
    return (high << 32) | low;
}

int64_t BufferReader::readInt64() {
    return static_cast<int64_t>(readUInt64());
}

float BufferReader::readFloat() {
    uint32_t bits = readUInt32();
    float result;
    std::memcpy(&result, &bits, sizeof(float));
    return result;
}

double BufferReader::readDouble() {
    uint64_t bits = readUInt64();
    double result;
    std::memcpy(&result, &bits, sizeof(double));
    return result;
}

int32_t BufferReader::peekInt32() const {
    BufferReader copy(*this);
    return copy.readInt32();
}

QByteArray BufferReader::readBytes(qsizetype count) {
    require(count);
    QByteArray result = m_data.mid(m_offset, count);
    m_offset += count;
    return result;
}

FString BufferReader::readString() {
    const qsizetype start = m_offset;
    int32_t length = readInt32();

    if (length == 0) {
        return FString(std::string(), FString::Encoding::Null);
    }

    if (length > 0) {
        require(length);
        const char* ptr = m_data.constData() + m_offset;
        if (ptr[length - 1] != '\0') {
            throw MalformedData("String is not NUL-terminated", start);
        }
        QString decoded = QString::fromLatin1(ptr, length - 1);
        m_offset += length;
        return FString(decoded.toStdString(), FString::Encoding::Latin1);
    }

    if (length == std::numeric_limits<int32_t>::min()) {
        throw MalformedData("Invalid string length", start);
    }

    qsizetype units = -static_cast<qsizetype>(length);
    require(units * 2);
    std::u16string chars;
    chars.reserve(static_cast<size_t>(units));
    for (qsizetype i = 0; i < units; ++i) {
        chars.push_back(static_cast<char16_t>(readUInt16()));
    }
    if (chars.back() != u'\0') {
        throw MalformedData("Wide string is not NUL-terminated", start);
    }
    chars.pop_back();
    QString decoded = QString::fromUtf16(chars.data(), static_cast<qsizetype>(chars.size()));
    FString result(decoded.toStdString(), FString::Encoding::Utf16);
    if (!QStringView(chars.data(), static_cast<qsizetype>(chars.size())).isValidUtf16()) {
        result.units = std::move(chars);
    }
    return result;
}

void BufferWriter::writeUInt8(uint8_t value) {
    m_data.append(static_cast<char>(value));
}

void BufferWriter::writeInt8(int8_t value) {
    writeUInt8(static_cast<uint8_t>(value));
}

void BufferWriter::writeUInt16(uint16_t value) {
    writeUInt8(static_cast<uint8_t>(value & 0xFF));
    writeUInt8(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void BufferWriter::writeInt16(int16_t value) {
    writeUInt16(static_cast<uint16_t>(value));
}

void BufferWriter::writeUInt32(uint32_t value) {
    writeUInt8(static_cast<uint8_t>(value & 0xFF));
    writeUInt8(static_cast<uint8_t>((value >> 8) & 0xFF));
    writeUInt8(static_cast<uint8_t>((value >> 16) & 0xFF));
    writeUInt8(static_cast<uint8_t>((value >> 24) & 0xFF));
}

void BufferWriter::writeInt32(int32_t value) {
    writeUInt32(static_cast<uint32_t>(value));
}

void BufferWriter::writeUInt64(uint64_t value) {
    writeUInt32(static_cast<uint32_t>(value & 0xFFFFFFFFu));
    writeUInt32(static_cast<uint32_t>(value >> 32));
}

void BufferWriter::writeInt64(int64_t value) {
    writeUInt64(static_cast<uint64_t>(value));
}

void BufferWriter::writeFloat(float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(float));
    writeUInt32(bits);
}

void BufferWriter::writeDouble(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(double));
    writeUInt64(bits);
}

void BufferWriter::writeBytes(const QByteArray& bytes) {
    m_data.append(bytes);
}

void BufferWriter::writeZeros(qsizetype count) {
    if (count > 0) {
        m_data.append(count, '\0');
    }
}

void BufferWriter::writeString(const FString& value) {
    const QString decoded = QString::fromUtf8(value.text.data(), static_cast<qsizetype>(value.text.size()));

    switch (value.encoding) {
        case FString::Encoding::Null:
            if (!value.text.empty()) {
                throw TypeMismatch(value.text, "null string", "non-empty text");
            }
            writeInt32(0);
            return;

        case FString::Encoding::Latin1: {
            for (const QChar ch : decoded) {
                if (ch.unicode() > 0xFF) {
                    throw TypeMismatch(value.text, "latin1 string", "non-latin1 text");
                }
            }
            QByteArray bytes = decoded.toLatin1();
            writeInt32(checkedInt32(static_cast<uint64_t>(bytes.size()) + 1, "String length"));
            writeBytes(bytes);
            writeUInt8(0);
            return;
        }

        case FString::Encoding::Utf16: {
            if (value.usesUnits()) {
                writeInt32(-checkedInt32(static_cast<uint64_t>(value.units.size()) + 1, "String length"));
                for (char16_t unit : value.units) {
                    writeUInt16(static_cast<uint16_t>(unit));
                }
                writeUInt16(0);
                return;
            }
            int32_t units = checkedInt32(static_cast<uint64_t>(decoded.size()) + 1, "String length");
            writeInt32(-units);
            for (const QChar ch : decoded) {
                writeUInt16(ch.unicode());
            }
            writeUInt16(0);
            return;
        }
    }
}

qsizetype BufferWriter::reserveInt32() {
    qsizetype position = m_data.size();
    writeInt32(0);
    return position;
}

void BufferWriter::patchInt32(qsizetype position, int32_t value) {
    uint32_t bits = static_cast<uint32_t>(value);
    m_data[position] = static_cast<char>(bits & 0xFF);
    m_data[position + 1] = static_cast<char>((bits >> 8) & 0xFF);
    m_data[position + 2] = static_cast<char>((bits >> 16) & 0xFF);
    m_data[position + 3] = static_cast<char>((bits >> 24) & 0xFF);
}

int32_t BufferWriter::checkedInt32(uint64_t value, const char* what) {
    if (value > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
        throw EncodeOverflow(what, value);
    }
    return static_cast<int32_t>(value);
}

} // namespace arkfix::codec
