/**
 * ArkProfile Fixer - Byte Reader/Writer Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "codec/BufferUtils.hpp"
#include "codec/CodecErrors.hpp"

#include <limits>
#include <string>

using namespace arkfix::codec;

TEST(BufferReaderTest, ReadsLittleEndianIntegers) {
    const QByteArray data = QByteArray::fromHex("0102030405060708" "ff");
    BufferReader reader(data);

    EXPECT_EQ(reader.readUInt16(), 0x0201);
    EXPECT_EQ(reader.readUInt32(), 0x06050403u);
    EXPECT_EQ(reader.offset(), 6);
    EXPECT_EQ(reader.readInt16(), 0x0807);
    EXPECT_EQ(reader.readInt8(), -1);
    EXPECT_TRUE(reader.atEnd());
}

TEST(BufferReaderTest, ReadsFloatingPointBitPatterns) {
    BufferWriter writer;
    writer.writeFloat(1.5f);
    writer.writeDouble(-2.25);

    BufferReader reader(writer.data());
    EXPECT_EQ(reader.readFloat(), 1.5f);
    EXPECT_EQ(reader.readDouble(), -2.25);
}

TEST(BufferReaderTest, ReadPastLimitThrowsTruncatedInput) {
    const QByteArray data(6, '\0');
    BufferReader reader(data);
    reader.skip(4);

    try {
        reader.readInt32();
        FAIL() << "expected TruncatedInput";
    } catch (const TruncatedInput& e) {
        EXPECT_EQ(e.offset(), 4);
        EXPECT_EQ(e.requested(), 4);
        EXPECT_EQ(e.limit(), 6);
    }
    // failed read leaves the cursor in place
    EXPECT_EQ(reader.offset(), 4);
}

TEST(BufferReaderTest, SubReaderIsClampedToParentLimit) {
    const QByteArray data(16, '\x01');
    BufferReader reader(data, 2, 10);

    BufferReader sub = reader.subReader(100);
    EXPECT_EQ(sub.offset(), 2);
    EXPECT_EQ(sub.limit(), 10);
    EXPECT_TRUE(sub.isBounded());

    BufferReader narrow = reader.subReader(3);
    EXPECT_EQ(narrow.remaining(), 3);
    EXPECT_THROW(narrow.readInt32(), TruncatedInput);
}

TEST(BufferReaderTest, PeekDoesNotMoveCursor) {
    BufferWriter writer;
    writer.writeInt32(77);
    BufferReader reader(writer.data());

    EXPECT_EQ(reader.peekInt32(), 77);
    EXPECT_EQ(reader.offset(), 0);
}

TEST(BufferStringTest, ReadsAllThreeForms) {
    BufferWriter writer;
    writer.writeInt32(0);
    writer.writeInt32(4);
    writer.writeBytes(QByteArray("abc", 4));
    writer.writeInt32(-3);
    writer.writeUInt16(0x00e9);
    writer.writeUInt16(0x4e2d);
    writer.writeUInt16(0);

    BufferReader reader(writer.data());
    FString null = reader.readString();
    FString latin = reader.readString();
    FString wide = reader.readString();

    EXPECT_EQ(null.encoding, FString::Encoding::Null);
    EXPECT_TRUE(null.text.empty());
    EXPECT_EQ(latin.encoding, FString::Encoding::Latin1);
    EXPECT_EQ(latin.text, "abc");
    EXPECT_EQ(wide.encoding, FString::Encoding::Utf16);
    EXPECT_EQ(wide.text, "\xc3\xa9\xe4\xb8\xad");
    EXPECT_TRUE(reader.atEnd());
}

TEST(BufferStringTest, MissingTerminatorIsMalformed) {
    BufferWriter writer;
    writer.writeInt32(3);
    writer.writeBytes(QByteArray("abc"));

    BufferReader reader(writer.data());
    try {
        reader.readString();
        FAIL() << "expected MalformedData";
    } catch (const MalformedData& e) {
        EXPECT_EQ(e.offset(), 0);
    }
}

TEST(BufferStringTest, LengthBeyondBufferIsTruncated) {
    BufferWriter writer;
    writer.writeInt32(50);
    writer.writeBytes(QByteArray("short"));

    BufferReader reader(writer.data());
    EXPECT_THROW(reader.readString(), TruncatedInput);
}

TEST(BufferStringTest, EmptyButTerminatedStringKeepsItsForm) {
    const FString empty(std::string(), FString::Encoding::Latin1);
    EXPECT_FALSE(empty.isNatural());
    EXPECT_EQ(empty.byteSize(), 5);

    BufferWriter writer;
    writer.writeString(empty);
    EXPECT_EQ(writer.data(), QByteArray::fromHex("0100000000"));

    BufferReader reader(writer.data());
    EXPECT_EQ(reader.readString(), empty);
}

TEST(BufferStringTest, NaturalEncodingFollowsText) {
    EXPECT_EQ(FString("").encoding, FString::Encoding::Null);
    EXPECT_EQ(FString("None").encoding, FString::Encoding::Latin1);
    EXPECT_EQ(FString("caf\xc3\xa9").encoding, FString::Encoding::Latin1);
    EXPECT_EQ(FString("\xe4\xb8\xad").encoding, FString::Encoding::Utf16);
    EXPECT_EQ(FString("None").byteSize(), 9);
    EXPECT_EQ(FString("\xe4\xb8\xad").byteSize(), 8);
}

TEST(BufferStringTest, LoneSurrogateKeepsItsCodeUnits) {
    BufferWriter writer;
    writer.writeInt32(-3);
    writer.writeUInt16(0x0041);
    writer.writeUInt16(0xd800);
    writer.writeUInt16(0);
    const QByteArray original = writer.data();

    BufferReader reader(original);
    const FString lossy = reader.readString();
    EXPECT_EQ(lossy.encoding, FString::Encoding::Utf16);
    EXPECT_EQ(lossy.units, (std::u16string{u'A', static_cast<char16_t>(0xd800)}));
    EXPECT_TRUE(lossy.usesUnits());
    EXPECT_FALSE(lossy.isNatural());
    EXPECT_EQ(lossy.byteSize(), original.size());

    BufferWriter again;
    again.writeString(lossy);
    EXPECT_EQ(again.data(), original);
}

TEST(BufferStringTest, EditedTextReplacesStoredCodeUnits) {
    BufferWriter writer;
    writer.writeInt32(-2);
    writer.writeUInt16(0xdc00);
    writer.writeUInt16(0);

    BufferReader reader(writer.data());
    FString value = reader.readString();
    value.text = "\xe4\xb8\xad";
    EXPECT_FALSE(value.usesUnits());
    EXPECT_EQ(value.byteSize(), 8);

    BufferWriter edited;
    edited.writeString(value);
    EXPECT_EQ(edited.data(), QByteArray::fromHex("feffffff2d4e0000"));
}

TEST(BufferStringTest, SurrogatePairRoundTrips) {
    BufferWriter writer;
    writer.writeInt32(-3);
    writer.writeUInt16(0xd83d);
    writer.writeUInt16(0xde00);
    writer.writeUInt16(0);
    const QByteArray original = writer.data();

    BufferReader reader(original);
    const FString face = reader.readString();
    EXPECT_EQ(face.text, "\xf0\x9f\x98\x80");
    EXPECT_TRUE(face.units.empty());
    EXPECT_TRUE(face.isNatural());

    BufferWriter again;
    again.writeString(face);
    EXPECT_EQ(again.data(), original);
}

TEST(BufferWriterTest, NonLatinTextInLatinFormIsRejected) {
    BufferWriter writer;
    const FString wrongForm("\xe4\xb8\xad", FString::Encoding::Latin1);
    EXPECT_THROW(writer.writeString(wrongForm), TypeMismatch);
}

TEST(BufferWriterTest, PatchesReservedSize) {
    BufferWriter writer;
    writer.writeUInt8(0xaa);
    const qsizetype position = writer.reserveInt32();
    writer.writeZeros(3);
    writer.patchInt32(position, 0x01020304);

    EXPECT_EQ(writer.data(), QByteArray::fromHex("aa04030201000000"));
}

TEST(BufferWriterTest, CheckedInt32RejectsValuesAbove32Bits) {
    const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
    EXPECT_EQ(BufferWriter::checkedInt32(limit, "Size"), std::numeric_limits<int32_t>::max());

    try {
        BufferWriter::checkedInt32(limit + 1, "Size");
        FAIL() << "expected EncodeOverflow";
    } catch (const EncodeOverflow& e) {
        EXPECT_EQ(e.value(), limit + 1);
        EXPECT_EQ(e.offset(), -1);
    }
}
