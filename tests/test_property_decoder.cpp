/**
 * ArkProfile Fixer - Property Decoder Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "TestProfileBuilder.hpp"

#include "codec/CodecErrors.hpp"
#include "codec/PropertyDecoder.hpp"
#include "codec/PropertyEncoder.hpp"

using namespace arkfix::codec;
using namespace arkfix::test;

class PropertyDecoderTest : public ::testing::Test {
protected:
    DecodeResult decodeStrict(const QByteArray& data) const {
        return PropertyDecoder().decode(data);
    }

    DecodeResult decodeRecovering(const QByteArray& data) const {
        return PropertyDecoder(TypeRegistry::builtin(), DecodeOptions{true}).decode(data);
    }
};

TEST_F(PropertyDecoderTest, DecodesScalarProperty) {
    const QByteArray data = propertyList({intProperty("Level", 42)});
    DecodeResult result = decodeStrict(data);

    ASSERT_EQ(result.properties.size(), 1u);
    const Property& level = result.properties[0];
    EXPECT_EQ(level.name, "Level");
    EXPECT_EQ(level.typeTag(), "IntProperty");
    EXPECT_EQ(level.declaredSize, 4);
    EXPECT_EQ(level.offset, 0);
    ASSERT_TRUE(level.value.is<int32_t>());
    EXPECT_EQ(*level.value.as<int32_t>(), 42);
    EXPECT_EQ(result.endOffset, data.size());
    EXPECT_TRUE(result.findings.empty());
}

TEST_F(PropertyDecoderTest, DecodesFromOffset) {
    const QByteArray prefix(7, '\x5a');
    const QByteArray data = prefix + propertyList({intProperty("Level", 3)});
    DecodeResult result = PropertyDecoder().decode(data, prefix.size());

    ASSERT_EQ(result.properties.size(), 1u);
    EXPECT_EQ(result.properties[0].offset, 7);
    EXPECT_EQ(result.endOffset, data.size());
}

TEST_F(PropertyDecoderTest, BoolValueLivesInTagFlags) {
    DecodeResult result = decodeStrict(propertyList({boolProperty("bIsFemale", true),
                                                     boolProperty("bIsDead", false)}));

    ASSERT_EQ(result.properties.size(), 2u);
    EXPECT_EQ(result.properties[0].declaredSize, 0);
    EXPECT_TRUE(*result.properties[0].value.as<bool>());
    EXPECT_FALSE(*result.properties[1].value.as<bool>());
}

TEST_F(PropertyDecoderTest, ReadsOptionalTagFields) {
    const QByteArray guid = QByteArray::fromHex("0f0e0d0c0b0a09080706050403020100");
    const QByteArray indexed = taggedProperty("Slots", scalarType("IntProperty"),
                                              int32Bytes(2) + int32Bytes(9), 4, TagFlags::HasArrayIndex);
    const QByteArray guarded = taggedProperty("Tagged", scalarType("IntProperty"),
                                              guid + int32Bytes(5), 4, TagFlags::HasPropertyGuid);
    const QByteArray extended = taggedProperty("Extended", scalarType("IntProperty"),
                                               QByteArray::fromHex("020102030405") + int32Bytes(6), 4,
                                               TagFlags::HasPropertyExtensions);

    DecodeResult result = decodeStrict(propertyList({indexed, guarded, extended}));

    ASSERT_EQ(result.properties.size(), 3u);
    EXPECT_EQ(result.properties[0].arrayIndex, 2);
    EXPECT_EQ(*result.properties[0].value.as<int32_t>(), 9);
    EXPECT_EQ(result.properties[1].guid, guid);
    EXPECT_EQ(*result.properties[1].value.as<int32_t>(), 5);
    EXPECT_EQ(result.properties[2].extensions, QByteArray::fromHex("020102030405"));
    EXPECT_EQ(*result.properties[2].value.as<int32_t>(), 6);
}

TEST_F(PropertyDecoderTest, DecodesNestedStruct) {
    const QByteArray data = propertyList({structProperty(
        "MyData", "PlayerData", intProperty("Level", 12) + strProperty("Name", "Rex"))});
    DecodeResult result = decodeStrict(data);

    ASSERT_EQ(result.properties.size(), 1u);
    const Property& data0 = result.properties[0];
    EXPECT_EQ(data0.type.toString(), "StructProperty<PlayerData</Script/ShooterGame>>");

    const auto* value = data0.value.as<StructValue>();
    ASSERT_NE(value, nullptr);
    EXPECT_TRUE(value->terminated);
    EXPECT_TRUE(value->padding.isEmpty());
    ASSERT_EQ(value->properties.size(), 2u);
    EXPECT_EQ(*value->properties[1].value.as<FString>(), "Rex");
}

TEST_F(PropertyDecoderTest, StructMayEndAtItsBoundaryWithoutNone) {
    const QByteArray data = propertyList({taggedProperty("Partial", structType("PlayerData"),
                                                         intProperty("Level", 1))});
    DecodeResult result = decodeStrict(data);

    const auto* value = result.properties[0].value.as<StructValue>();
    ASSERT_NE(value, nullptr);
    EXPECT_FALSE(value->terminated);
    EXPECT_EQ(value->properties.size(), 1u);
}

TEST_F(PropertyDecoderTest, KeepsZeroPaddingAfterStruct) {
    const QByteArray payload = intProperty("Level", 1) + noneTerminator() + QByteArray(4, '\0');
    DecodeResult result = decodeStrict(propertyList({taggedProperty("Padded", structType("PlayerData"), payload)}));

    const auto* value = result.properties[0].value.as<StructValue>();
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(value->padding, QByteArray(4, '\0'));
}

TEST_F(PropertyDecoderTest, NonZeroBytesAfterStructAreSizeMismatch) {
    const QByteArray payload = intProperty("Level", 1) + noneTerminator() + QByteArray("\x01", 1);
    const QByteArray data = propertyList({taggedProperty("Dirty", structType("PlayerData"), payload)});

    try {
        decodeStrict(data);
        FAIL() << "expected SizeMismatch";
    } catch (const SizeMismatch& e) {
        EXPECT_EQ(e.propertyName(), "Dirty");
        EXPECT_EQ(e.offset(), 0);
        EXPECT_EQ(e.declaredSize(), payload.size());
        EXPECT_EQ(e.actualSize(), payload.size() - 1);
    }
}

TEST_F(PropertyDecoderTest, NativeStructIsKeptAsBytes) {
    const QByteArray location(24, '\x11');
    DecodeResult result = decodeStrict(propertyList({taggedProperty(
        "Location", structType("Vector", "/Script/CoreUObject"), location)}));

    const auto* value = result.properties[0].value.as<StructValue>();
    ASSERT_NE(value, nullptr);
    ASSERT_TRUE(value->native.has_value());
    EXPECT_EQ(*value->native, location);
}

TEST_F(PropertyDecoderTest, DecodesScalarArray) {
    DecodeResult result = decodeStrict(propertyList({intArrayProperty("Counts", {4, 5, 6})}));

    const auto* array = result.properties[0].value.as<ArrayValue>();
    ASSERT_NE(array, nullptr);
    ASSERT_EQ(array->items.size(), 3u);
    EXPECT_EQ(*array->items[2].as<int32_t>(), 6);
    EXPECT_FALSE(array->raw.has_value());
}

TEST_F(PropertyDecoderTest, DetectsSeparatedStructElements) {
    const std::vector<QByteArray> elements = {intProperty("Quantity", 1), intProperty("Quantity", 2),
                                              intProperty("Quantity", 3)};
    DecodeResult separated = decodeStrict(propertyList({structArrayProperty("Items", "ItemData", elements, true)}));
    DecodeResult packed = decodeStrict(propertyList({structArrayProperty("Items", "ItemData", elements, false)}));

    const auto* a = separated.properties[0].value.as<ArrayValue>();
    const auto* b = packed.properties[0].value.as<ArrayValue>();
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_TRUE(a->separated);
    EXPECT_FALSE(b->separated);
    ASSERT_EQ(a->items.size(), 3u);
    ASSERT_EQ(b->items.size(), 3u);
    EXPECT_EQ(a->items, b->items);

    const auto* third = a->items[2].as<StructValue>();
    ASSERT_NE(third, nullptr);
    EXPECT_EQ(*third->properties[0].value.as<int32_t>(), 3);
}

TEST_F(PropertyDecoderTest, DecodesMapAndSet) {
    BufferWriter mapPayload;
    mapPayload.writeInt32(0);
    mapPayload.writeInt32(2);
    mapPayload.writeString(FString("wood"));
    mapPayload.writeInt32(10);
    mapPayload.writeString(FString("stone"));
    mapPayload.writeInt32(20);

    BufferWriter setPayload;
    setPayload.writeInt32(1);
    setPayload.writeString(FString("Gone"));
    setPayload.writeInt32(1);
    setPayload.writeString(FString("Kept"));

    DecodeResult result = decodeStrict(propertyList({
        taggedProperty("Resources", mapOf(scalarType("StrProperty"), scalarType("IntProperty")), mapPayload.take()),
        taggedProperty("Tags", setOf(scalarType("NameProperty")), setPayload.take())}));

    const auto* map = result.properties[0].value.as<MapValue>();
    ASSERT_NE(map, nullptr);
    ASSERT_EQ(map->entries.size(), 2u);
    EXPECT_EQ(*map->entries[1].key.as<FString>(), "stone");
    EXPECT_EQ(*map->entries[1].value.as<int32_t>(), 20);

    const auto* set = result.properties[1].value.as<SetValue>();
    ASSERT_NE(set, nullptr);
    ASSERT_EQ(set->removed.size(), 1u);
    ASSERT_EQ(set->items.size(), 1u);
    EXPECT_EQ(*set->items[0].as<FString>(), "Kept");
}

TEST_F(PropertyDecoderTest, ByteStoresEnumNameWhenTyped) {
    const TypeName enumByte(FString("ByteProperty"), {scalarType("EPrimalItemQuality")});
    const TypeName plainByte(FString("ByteProperty"), {scalarType("None")});

    DecodeResult result = decodeStrict(propertyList({
        taggedProperty("Quality", enumByte, stringBytes(FString("EPrimalItemQuality::Rare"))),
        taggedProperty("Raw", plainByte, QByteArray("\x07", 1))}));

    EXPECT_EQ(*result.properties[0].value.as<FString>(), "EPrimalItemQuality::Rare");
    EXPECT_EQ(*result.properties[1].value.as<uint8_t>(), 7);
}

TEST_F(PropertyDecoderTest, ObjectAndTextPayloads) {
    BufferWriter text;
    text.writeUInt32(0);
    text.writeInt8(0);
    text.writeString(FString("Items"));
    text.writeString(FString("Key_01"));
    text.writeString(FString("Stone Hatchet"));

    BufferWriter objectPath;
    objectPath.writeInt32(1);
    objectPath.writeString(FString("/Game/Items/Hatchet.Hatchet_C"));

    DecodeResult result = decodeStrict(propertyList({
        taggedProperty("Owner", scalarType("ObjectProperty"), int32Bytes(-1)),
        taggedProperty("ItemClass", scalarType("ObjectProperty"), objectPath.take()),
        taggedProperty("Label", scalarType("TextProperty"), text.take())}));

    const auto* owner = result.properties[0].value.as<ObjectRef>();
    ASSERT_NE(owner, nullptr);
    EXPECT_EQ(owner->kind, -1);
    EXPECT_FALSE(owner->path.has_value());

    const auto* itemClass = result.properties[1].value.as<ObjectRef>();
    ASSERT_NE(itemClass, nullptr);
    ASSERT_TRUE(itemClass->path.has_value());
    EXPECT_EQ(*itemClass->path, "/Game/Items/Hatchet.Hatchet_C");

    const auto* label = result.properties[2].value.as<TextValue>();
    ASSERT_NE(label, nullptr);
    EXPECT_EQ(label->historyType, 0);
    ASSERT_EQ(label->strings.size(), 3u);
    EXPECT_EQ(label->strings[2], "Stone Hatchet");
}

TEST_F(PropertyDecoderTest, WideNoneEndsTheList) {
    const QByteArray data = intProperty("Level", 1)
                          + stringBytes(FString("None", FString::Encoding::Utf16));
    DecodeResult result = decodeStrict(data);

    EXPECT_EQ(result.properties.size(), 1u);
    EXPECT_EQ(result.endOffset, data.size());
}

TEST_F(PropertyDecoderTest, UnknownTypeIsKeptRawAndDecodingContinues) {
    const QByteArray data = propertyList({
        taggedProperty("Mystery", scalarType("FancyProperty"), QByteArray("abc")),
        intProperty("After", 8)});
    DecodeResult result = decodeStrict(data);

    ASSERT_EQ(result.properties.size(), 2u);
    const auto* raw = result.properties[0].value.as<QByteArray>();
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(*raw, QByteArray("abc"));
    EXPECT_EQ(*result.properties[1].value.as<int32_t>(), 8);

    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].kind, Finding::Kind::UnknownType);
    EXPECT_EQ(result.findings[0].severity, Finding::Severity::Warning);
    EXPECT_EQ(result.findings[0].path, "Mystery");
    EXPECT_FALSE(result.hasErrors());
}

TEST_F(PropertyDecoderTest, SizeMismatchReportsPropertyOffset) {
    const QByteArray first = intProperty("First", 1);
    const QByteArray data = propertyList({
        first,
        taggedProperty("Broken", scalarType("IntProperty"), QByteArray(8, '\x02'), 8),
        intProperty("Last", 3)});

    try {
        decodeStrict(data);
        FAIL() << "expected SizeMismatch";
    } catch (const SizeMismatch& e) {
        EXPECT_EQ(e.offset(), first.size());
        EXPECT_EQ(e.declaredSize(), 8);
        EXPECT_EQ(e.actualSize(), 4);
    }
}

TEST_F(PropertyDecoderTest, DeclaredSizeTooSmallIsSizeMismatch) {
    const QByteArray data = propertyList({
        taggedProperty("Short", scalarType("IntProperty"), int32Bytes(5).left(2) + QByteArray(2, '\0'), 2)});

    try {
        decodeStrict(data);
        FAIL() << "expected SizeMismatch";
    } catch (const SizeMismatch& e) {
        EXPECT_EQ(e.offset(), 0);
        EXPECT_EQ(e.declaredSize(), 2);
        EXPECT_EQ(e.actualSize(), 4);
    }
}

TEST_F(PropertyDecoderTest, RecoverModeRecordsFindingAndResumes) {
    const QByteArray inner = taggedProperty("Broken", scalarType("IntProperty"), QByteArray(8, '\x02'), 8);
    const QByteArray data = propertyList({structProperty("Outer", "PlayerData", inner), intProperty("Last", 3)});

    DecodeResult result = decodeRecovering(data);

    ASSERT_EQ(result.properties.size(), 2u);
    EXPECT_EQ(*result.properties[1].value.as<int32_t>(), 3);

    const auto* outer = result.properties[0].value.as<StructValue>();
    ASSERT_NE(outer, nullptr);
    ASSERT_EQ(outer->properties.size(), 1u);
    const auto* raw = outer->properties[0].value.as<QByteArray>();
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(*raw, QByteArray(8, '\x02'));

    ASSERT_EQ(result.findings.size(), 1u);
    const Finding& finding = result.findings[0];
    EXPECT_EQ(finding.kind, Finding::Kind::SizeMismatch);
    EXPECT_EQ(finding.path, "Outer.Broken");
    EXPECT_EQ(finding.declared, 8);
    EXPECT_EQ(finding.actual, 4);
    EXPECT_TRUE(result.hasErrors());
}

TEST_F(PropertyDecoderTest, SizeBeyondInputIsTruncatedEvenWhenRecovering) {
    const QByteArray data = propertyList({
        taggedProperty("Huge", scalarType("IntProperty"), int32Bytes(1), 100)});

    EXPECT_THROW(decodeStrict(data), TruncatedInput);
    EXPECT_THROW(decodeRecovering(data), TruncatedInput);
}

TEST_F(PropertyDecoderTest, MissingTerminatorIsTruncated) {
    const QByteArray data = intProperty("Level", 1);
    EXPECT_THROW(decodeStrict(data), TruncatedInput);
}

TEST_F(PropertyDecoderTest, NegativeElementCountIsMalformed) {
    const QByteArray data = propertyList({
        taggedProperty("Counts", arrayOf(scalarType("IntProperty")), int32Bytes(-1))});

    EXPECT_THROW(decodeStrict(data), MalformedData);

    DecodeResult result = decodeRecovering(data);
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].kind, Finding::Kind::MalformedData);
    EXPECT_TRUE(result.properties[0].value.is<QByteArray>());
}

TEST_F(PropertyDecoderTest, NullObjectReferenceIsKeptAsBytes) {
    const QByteArray reference = QByteArray::fromHex("00000000ffffffff");
    const QByteArray data = propertyList({
        taggedProperty("Owner", scalarType("ObjectProperty"), reference),
        intProperty("After", 2)});
    DecodeResult result = decodeStrict(data);

    ASSERT_EQ(result.properties.size(), 2u);
    const auto* raw = result.properties[0].value.as<QByteArray>();
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(*raw, reference);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_EQ(PropertyEncoder().encode(result.properties), data);
}

TEST_F(PropertyDecoderTest, ObjectPathLongerThanPayloadIsKeptAsBytes) {
    BufferWriter payload;
    payload.writeInt32(1);
    payload.writeInt32(40);
    payload.writeBytes(QByteArray("abc", 3));
    const QByteArray bytes = payload.take();
    const QByteArray data = propertyList({taggedProperty("ItemClass", scalarType("ObjectProperty"), bytes)});

    DecodeResult result = decodeStrict(data);
    ASSERT_TRUE(result.properties[0].value.is<QByteArray>());
    EXPECT_EQ(*result.properties[0].value.as<QByteArray>(), bytes);
    EXPECT_EQ(PropertyEncoder().encode(result.properties), data);
}

TEST_F(PropertyDecoderTest, TextArrayWithUnknownHistoryKeepsRawElements) {
    BufferWriter elements;
    elements.writeUInt32(0);
    elements.writeInt8(-1);
    elements.writeUInt32(1);
    elements.writeString(FString("Stone"));
    elements.writeUInt32(0);
    elements.writeInt8(3);
    elements.writeBytes(QByteArray::fromHex("0102030405"));
    const QByteArray elementBytes = elements.take();

    const QByteArray data = propertyList({
        taggedProperty("Labels", arrayOf(scalarType("TextProperty")), int32Bytes(2) + elementBytes),
        intProperty("After", 4)});
    DecodeResult result = decodeStrict(data);

    const auto* labels = result.properties[0].value.as<ArrayValue>();
    ASSERT_NE(labels, nullptr);
    ASSERT_TRUE(labels->raw.has_value());
    EXPECT_EQ(labels->raw->count, 2);
    EXPECT_EQ(labels->raw->bytes, elementBytes);
    EXPECT_TRUE(labels->items.empty());
    EXPECT_EQ(containerSize(result.properties[0]), 2u);
    EXPECT_EQ(*result.properties[1].value.as<int32_t>(), 4);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_EQ(PropertyEncoder().encode(result.properties), data);
}

TEST_F(PropertyDecoderTest, BoolElementOutsideZeroOneKeepsRawElements) {
    const QByteArray elementBytes = QByteArray::fromHex("010002");
    const QByteArray data = propertyList({
        taggedProperty("Flags", arrayOf(scalarType("BoolProperty")), int32Bytes(3) + elementBytes)});
    DecodeResult result = decodeStrict(data);

    const auto* flags = result.properties[0].value.as<ArrayValue>();
    ASSERT_NE(flags, nullptr);
    ASSERT_TRUE(flags->raw.has_value());
    EXPECT_EQ(flags->raw->count, 3);
    EXPECT_EQ(flags->raw->bytes, elementBytes);
    EXPECT_EQ(PropertyEncoder().encode(result.properties), data);
}

TEST_F(PropertyDecoderTest, UndelimitableSetAndMapKeepWholePayload) {
    const QByteArray setPayload = int32Bytes(0) + int32Bytes(1) + QByteArray(1, '\x05');
    const QByteArray mapPayload = int32Bytes(0) + int32Bytes(1) + int32Bytes(7) + QByteArray(1, '\x09');
    const QByteArray data = propertyList({
        taggedProperty("Seen", setOf(scalarType("BoolProperty")), setPayload),
        taggedProperty("Unlocked", mapOf(scalarType("IntProperty"), scalarType("BoolProperty")), mapPayload)});
    DecodeResult result = decodeStrict(data);

    const auto* seen = result.properties[0].value.as<SetValue>();
    ASSERT_NE(seen, nullptr);
    ASSERT_TRUE(seen->raw.has_value());
    EXPECT_EQ(*seen->raw, setPayload);

    const auto* unlocked = result.properties[1].value.as<MapValue>();
    ASSERT_NE(unlocked, nullptr);
    ASSERT_TRUE(unlocked->raw.has_value());
    EXPECT_EQ(*unlocked->raw, mapPayload);

    EXPECT_EQ(PropertyEncoder().encode(result.properties), data);
}

TEST_F(PropertyDecoderTest, FindingUnderUnnamedPropertyHasAPath) {
    const QByteArray inner = taggedProperty("", scalarType("FancyProperty"), QByteArray("xy", 2));
    const QByteArray data = propertyList({
        structProperty("Outer", "PlayerData", inner)});
    DecodeResult result = decodeStrict(data);

    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings[0].kind, Finding::Kind::UnknownType);
    EXPECT_EQ(result.findings[0].path, "Outer.");
}

TEST_F(PropertyDecoderTest, DottedLookupOnConstTree) {
    const PropertyList properties = decodeStrict(propertyList({arkDataProperty(2, 1), intProperty("Level", 5)})).properties;

    const Property* items = findProperty(properties, "MyArkData.ArkItems");
    ASSERT_NE(items, nullptr);
    EXPECT_EQ(containerSize(*items), 2u);
    EXPECT_EQ(findProperty(properties, "MyArkData.Nothing"), nullptr);
    EXPECT_EQ(findProperty(properties, "Level.Inner"), nullptr);
    EXPECT_EQ(findProperty(properties, ""), nullptr);
}
