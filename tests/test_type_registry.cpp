/**
 * ArkProfile Fixer - Type Registry Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "codec/CodecErrors.hpp"
#include "codec/TypeRegistry.hpp"

#include <algorithm>

using namespace arkfix::codec;

TEST(TypeRegistryTest, BuiltinKnowsScalarWidths) {
    const auto& registry = TypeRegistry::builtin();

    const TypeInfo* info = registry.find("IntProperty");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->kind, PropertyKind::Int);
    EXPECT_EQ(info->fixedSize, 4);
    EXPECT_FALSE(info->composite);

    EXPECT_EQ(registry.find("DoubleProperty")->fixedSize, 8);
    EXPECT_EQ(registry.find("BoolProperty")->fixedSize, 0);
    EXPECT_FALSE(registry.find("StrProperty")->isFixedSize());
}

TEST(TypeRegistryTest, SeveralTagsShareAKind) {
    const auto& registry = TypeRegistry::builtin();
    EXPECT_EQ(registry.kindOf("ObjectProperty"), PropertyKind::Object);
    EXPECT_EQ(registry.kindOf("ClassProperty"), PropertyKind::Object);
    EXPECT_EQ(registry.kindOf("SoftClassProperty"), PropertyKind::SoftObject);
    EXPECT_TRUE(registry.find("MapProperty")->composite);
}

TEST(TypeRegistryTest, UnknownTagLookupCarriesOffset) {
    const auto& registry = TypeRegistry::builtin();
    EXPECT_EQ(registry.find("FancyProperty"), nullptr);
    EXPECT_EQ(registry.kindOf("FancyProperty"), PropertyKind::Unknown);

    try {
        registry.lookup("FancyProperty", 123);
        FAIL() << "expected UnknownType";
    } catch (const UnknownType& e) {
        EXPECT_EQ(e.typeTag(), "FancyProperty");
        EXPECT_EQ(e.offset(), 123);
    }
}

TEST(TypeRegistryTest, NativeStructSizes) {
    const auto& registry = TypeRegistry::builtin();
    EXPECT_EQ(registry.nativeStructSize("Vector"), 24);
    EXPECT_EQ(registry.nativeStructSize("Guid"), 16);
    EXPECT_TRUE(registry.isNativeStruct("Color"));
    EXPECT_FALSE(registry.isNativeStruct("ItemNetInfo"));
}

TEST(TypeRegistryTest, CustomRegistryIsIndependent) {
    TypeRegistry registry;
    EXPECT_EQ(registry.count(), 0);

    registry.registerType({"FancyProperty", PropertyKind::Int, 4, false});
    registry.registerNativeStruct("Fancy", 6);

    EXPECT_EQ(registry.count(), 1);
    EXPECT_EQ(registry.kindOf("FancyProperty"), PropertyKind::Int);
    EXPECT_EQ(registry.nativeStructSize("Fancy"), 6);
    EXPECT_EQ(TypeRegistry::builtin().find("FancyProperty"), nullptr);
}

TEST(TypeRegistryTest, TypeTagsAreListed) {
    const auto tags = TypeRegistry::builtin().typeTags();
    EXPECT_EQ(static_cast<int>(tags.size()), TypeRegistry::builtin().count());
    EXPECT_NE(std::find(tags.begin(), tags.end(), "ArrayProperty"), tags.end());
}
