/**
 * @file PropertyType.hpp
 * @brief Enumeration of property kinds understood by the codec
 */

#pragma once

#include <cstdint>

namespace arkfix::codec {

/**
 * @enum PropertyKind
 * @brief Wire shapes a property payload can take
 *
 * Several type tags can share one kind (ObjectProperty and ClassProperty
 * are both serialized as object references).
 */
enum class PropertyKind : int {
    Unknown = 0,
    Bool,
    Int8,
    Byte,
    Int16,
    UInt16,
    Int,
    UInt32,
    Int64,
    UInt64,
    Float,
    Double,
    Str,
    Name,
    Enum,
    Object,
    SoftObject,
    Text,
    Struct,
    Array,
    Set,
    Map
};

/**
 * @brief Human-readable kind name, used in diagnostics
 */
inline const char* kindName(PropertyKind kind) {
    switch (kind) {
        case PropertyKind::Unknown:    return "unknown";
        case PropertyKind::Bool:       return "bool";
        case PropertyKind::Int8:       return "int8";
        case PropertyKind::Byte:       return "byte";
        case PropertyKind::Int16:      return "int16";
        case PropertyKind::UInt16:     return "uint16";
        case PropertyKind::Int:        return "int32";
        case PropertyKind::UInt32:     return "uint32";
        case PropertyKind::Int64:      return "int64";
        case PropertyKind::UInt64:     return "uint64";
        case PropertyKind::Float:      return "float";
        case PropertyKind::Double:     return "double";
        case PropertyKind::Str:        return "string";
        case PropertyKind::Name:       return "name";
        case PropertyKind::Enum:       return "enum";
        case PropertyKind::Object:     return "object reference";
        case PropertyKind::SoftObject: return "soft object path";
        case PropertyKind::Text:       return "text";
        case PropertyKind::Struct:     return "struct";
        case PropertyKind::Array:      return "array";
        case PropertyKind::Set:        return "set";
        case PropertyKind::Map:        return "map";
    }
    return "unknown";
}

/**
 * Bits of the tag flag byte
 */
namespace TagFlags {
constexpr uint8_t HasArrayIndex = 0x01;
constexpr uint8_t HasPropertyGuid = 0x02;
constexpr uint8_t HasPropertyExtensions = 0x04;
constexpr uint8_t HasBinaryOrNativeSerialize = 0x08;
constexpr uint8_t BoolTrue = 0x10;
}

/**
 * Bits of the tag extension byte
 */
namespace TagExtensions {
constexpr uint8_t OverridableInformation = 0x02;
}

} // namespace arkfix::codec
