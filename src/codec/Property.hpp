/**
 * @file Property.hpp
 * @brief Property tree model shared by the decoder and the encoder
 */

#pragma once

#include "FString.hpp"
#include "PropertyType.hpp"

#include <QByteArray>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace arkfix::codec {

struct Property;
struct Value;
struct MapEntry;

using PropertyList = std::vector<Property>;

/**
 * @struct TypeName
 * @brief Complete, recursive name of a property type
 *
 * Parameters by root type:
 * - StructProperty: struct name (whose own parameter is its package)
 * - ArrayProperty / SetProperty: element type
 * - MapProperty: key type, value type
 * - EnumProperty: enum name, underlying type
 * - ByteProperty: enum name, when the byte stores an enum
 */
struct TypeName {
    FString name;
    std::vector<TypeName> params;

    TypeName() = default;
    TypeName(const FString& typeName, std::vector<TypeName> parameters = {})
        : name(typeName)
        , params(std::move(parameters))
    {}

    const std::string& tag() const { return name.text; }

    /**
     * @brief Parameter at index, or nullptr
     */
    const TypeName* param(size_t index) const {
        return index < params.size() ? &params[index] : nullptr;
    }

    /**
     * @brief Bytes the type name occupies in a stream
     */
    int64_t byteSize() const;

    /**
     * @brief Readable form, e.g. "ArrayProperty<StructProperty<ItemNetInfo</Script/ShooterGame>>>"
     */
    std::string toString() const;

    bool operator==(const TypeName& other) const {
        return name == other.name && params == other.params;
    }
    bool operator!=(const TypeName& other) const { return !(*this == other); }
};

/**
 * Object reference payload
 *
 * A 4-byte payload is a bare index (no path). Longer payloads are a kind
 * marker followed by the object path.
 */
struct ObjectRef {
    int32_t kind = 0;
    std::optional<FString> path;
};

/**
 * Soft object path: package and asset names plus a sub-object path
 */
struct SoftObjectPath {
    FString package;
    FString asset;
    FString subPath;
};

/**
 * Localized text
 *
 * History -1 (no history) stores an optional culture-invariant string;
 * history 0 (base) stores namespace, key and source string. Any other
 * history is kept as opaque bytes.
 */
struct TextValue {
    uint32_t flags = 0;
    int8_t historyType = -1;
    uint32_t invariantFlag = 0;
    std::vector<FString> strings;
    QByteArray opaque;
};

/**
 * Struct payload: a tagged property list, or a native binary layout
 */
struct StructValue {
    PropertyList properties;
    std::optional<QByteArray> native;
    bool terminated = true;     // list ended with None rather than at the size boundary
    QByteArray padding;         // zero bytes after the terminator
};

/**
 * Array elements kept as one block when their layout cannot be delimited
 */
struct RawElements {
    int32_t count = 0;
    QByteArray bytes;
};

struct ArrayValue {
    std::vector<Value> items;
    std::optional<RawElements> raw;
    bool separated = false;     // struct elements separated by 4 zero bytes
    QByteArray padding;         // zero bytes after the last element
};

struct SetValue {
    std::vector<Value> removed;
    std::vector<Value> items;
    std::optional<QByteArray> raw;  // whole payload, when elements cannot be delimited
};

struct MapValue {
    std::vector<Value> removed;
    std::vector<MapEntry> entries;
    std::optional<QByteArray> raw;  // whole payload, when entries cannot be delimited
};

/**
 * @struct Value
 * @brief Decoded payload of a property, array element or map key/value
 *
 * Opaque bytes (unknown types, undecodable payloads) are held as QByteArray.
 */
struct Value {
    using Storage = std::variant<
        std::monostate,
        bool,
        int8_t,
        uint8_t,
        int16_t,
        uint16_t,
        int32_t,
        uint32_t,
        int64_t,
        uint64_t,
        float,
        double,
        FString,
        ObjectRef,
        SoftObjectPath,
        TextValue,
        QByteArray,
        StructValue,
        ArrayValue,
        SetValue,
        MapValue>;

    Storage data;

    Value() = default;
    Value(const char* text) : data(FString(text)) {}

    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Value> &&
                                          !std::is_same_v<std::decay_t<T>, const char*> &&
                                          !std::is_same_v<std::decay_t<T>, char*>>>
    Value(T&& v) : data(std::forward<T>(v)) {}

    template <typename T> bool is() const { return std::holds_alternative<T>(data); }
    template <typename T> const T* as() const { return std::get_if<T>(&data); }
    template <typename T> T* as() { return std::get_if<T>(&data); }

    bool isEmpty() const { return std::holds_alternative<std::monostate>(data); }
};

struct MapEntry {
    Value key;
    Value value;
};

/**
 * @struct Property
 * @brief One named, typed entry of a property list
 *
 * Metadata fields (flags, array index, guid, extensions and the composite
 * layout fields inside the value) are never derived from the value; they are
 * written back exactly as stored.
 */
struct Property {
    FString name;
    TypeName type;
    int32_t declaredSize = 0;
    uint8_t flags = 0;
    int32_t arrayIndex = 0;     // meaningful when flags & HasArrayIndex
    QByteArray guid;            // 16 bytes when flags & HasPropertyGuid
    QByteArray extensions;      // raw block when flags & HasPropertyExtensions
    Value value;

    // Position of the tag in the decoded stream, -1 when built in memory.
    // Diagnostic only: not part of equality nor of the textual form.
    int64_t offset = -1;

    const std::string& typeTag() const { return type.tag(); }
    PropertyKind kind() const;

    bool hasArrayIndex() const { return (flags & TagFlags::HasArrayIndex) != 0; }
    bool hasGuid() const { return (flags & TagFlags::HasPropertyGuid) != 0; }
    bool hasExtensions() const { return (flags & TagFlags::HasPropertyExtensions) != 0; }
    bool hasNativeSerialize() const { return (flags & TagFlags::HasBinaryOrNativeSerialize) != 0; }
};

bool operator==(const ObjectRef& a, const ObjectRef& b);
bool operator==(const SoftObjectPath& a, const SoftObjectPath& b);
bool operator==(const TextValue& a, const TextValue& b);
bool operator==(const StructValue& a, const StructValue& b);
bool operator==(const RawElements& a, const RawElements& b);
bool operator==(const ArrayValue& a, const ArrayValue& b);
bool operator==(const SetValue& a, const SetValue& b);
bool operator==(const MapValue& a, const MapValue& b);
bool operator==(const MapEntry& a, const MapEntry& b);

/**
 * Floating point alternatives compare by bit pattern, so NaN payloads and
 * negative zero survive an equality check.
 */
bool operator==(const Value& a, const Value& b);
bool operator==(const Property& a, const Property& b);

inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }
inline bool operator!=(const Property& a, const Property& b) { return !(a == b); }

/**
 * @brief Name of the alternative a value holds, for diagnostics
 */
std::string describeShape(const Value& value);

/**
 * @brief Find a property by dotted path, descending into struct values
 *
 * "MyArkData.ArkItems" finds ArkItems inside the first MyArkData struct.
 * @return The property, or nullptr if any segment is missing
 */
Property* findProperty(PropertyList& properties, const std::string& path);
const Property* findProperty(const PropertyList& properties, const std::string& path);

/**
 * @brief Number of items of an array, set or map property (0 otherwise)
 */
size_t containerSize(const Property& property);

/**
 * @brief Empty an array, set or map property
 *
 * Drops items, removed-element lists, opaque element blocks and trailing
 * padding, and sets the declared size to that of an empty payload.
 * @throws TypeMismatch if the property is not a container
 */
void clearContainer(Property& property);

} // namespace arkfix::codec
