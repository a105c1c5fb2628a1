/**
 * @file TypeRegistry.cpp
 * @brief Built-in type table
 */

#include "TypeRegistry.hpp"
#include "CodecErrors.hpp"

namespace arkfix::codec {

namespace {

TypeRegistry buildBuiltinRegistry() {
    TypeRegistry registry;

    // Fixed-width scalars
    registry.registerType({"BoolProperty", PropertyKind::Bool, 0, false});
    registry.registerType({"Int8Property", PropertyKind::Int8, 1, false});
    registry.registerType({"Int16Property", PropertyKind::Int16, 2, false});
    registry.registerType({"UInt16Property", PropertyKind::UInt16, 2, false});
    registry.registerType({"IntProperty", PropertyKind::Int, 4, false});
    registry.registerType({"UInt32Property", PropertyKind::UInt32, 4, false});
    registry.registerType({"Int64Property", PropertyKind::Int64, 8, false});
    registry.registerType({"UInt64Property", PropertyKind::UInt64, 8, false});
    registry.registerType({"FloatProperty", PropertyKind::Float, 4, false});
    registry.registerType({"DoubleProperty", PropertyKind::Double, 8, false});

    // One byte, or an enum name when the type names an enum
    registry.registerType({"ByteProperty", PropertyKind::Byte, -1, false});

    // Strings
    registry.registerType({"StrProperty", PropertyKind::Str, -1, false});
    registry.registerType({"NameProperty", PropertyKind::Name, -1, false});
    registry.registerType({"EnumProperty", PropertyKind::Enum, -1, false});

    // References
    registry.registerType({"ObjectProperty", PropertyKind::Object, -1, false});
    registry.registerType({"ClassProperty", PropertyKind::Object, -1, false});
    registry.registerType({"WeakObjectProperty", PropertyKind::Object, -1, false});
    registry.registerType({"LazyObjectProperty", PropertyKind::Object, -1, false});
    registry.registerType({"SoftObjectProperty", PropertyKind::SoftObject, -1, false});
    registry.registerType({"SoftClassProperty", PropertyKind::SoftObject, -1, false});

    // Composites
    registry.registerType({"TextProperty", PropertyKind::Text, -1, true});
    registry.registerType({"StructProperty", PropertyKind::Struct, -1, true});
    registry.registerType({"ArrayProperty", PropertyKind::Array, -1, true});
    registry.registerType({"SetProperty", PropertyKind::Set, -1, true});
    registry.registerType({"MapProperty", PropertyKind::Map, -1, true});

    // Structs with a binary layout (double precision math types)
    registry.registerNativeStruct("Vector", 24);
    registry.registerNativeStruct("Vector2D", 16);
    registry.registerNativeStruct("Vector4", 32);
    registry.registerNativeStruct("Rotator", 24);
    registry.registerNativeStruct("Quat", 32);
    registry.registerNativeStruct("LinearColor", 16);
    registry.registerNativeStruct("Color", 4);
    registry.registerNativeStruct("Guid", 16);
    registry.registerNativeStruct("IntPoint", 8);
    registry.registerNativeStruct("IntVector", 12);
    registry.registerNativeStruct("DateTime", 8);
    registry.registerNativeStruct("Timespan", 8);

    return registry;
}

} // anonymous namespace

const TypeRegistry& TypeRegistry::builtin() {
    static const TypeRegistry registry = buildBuiltinRegistry();
    return registry;
}

void TypeRegistry::registerType(const TypeInfo& info) {
    m_types[info.typeTag] = info;
}

void TypeRegistry::registerNativeStruct(const std::string& structName, int size) {
    m_nativeStructs[structName] = size;
}

const TypeInfo* TypeRegistry::find(const std::string& typeTag) const {
    auto it = m_types.find(typeTag);
    if (it == m_types.end()) {
        return nullptr;
    }
    return &it->second;
}

const TypeInfo& TypeRegistry::lookup(const std::string& typeTag, int64_t offset) const {
    const TypeInfo* info = find(typeTag);
    if (!info) {
        throw UnknownType(typeTag, offset);
    }
    return *info;
}

PropertyKind TypeRegistry::kindOf(const std::string& typeTag) const {
    const TypeInfo* info = find(typeTag);
    return info ? info->kind : PropertyKind::Unknown;
}

std::optional<int> TypeRegistry::nativeStructSize(const std::string& structName) const {
    auto it = m_nativeStructs.find(structName);
    if (it == m_nativeStructs.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> TypeRegistry::typeTags() const {
    std::vector<std::string> tags;
    tags.reserve(m_types.size());
    for (const auto& [tag, info] : m_types) {
        tags.push_back(tag);
    }
    return tags;
}

} // namespace arkfix::codec
