/**
 * @file PropertyEncoder.cpp
 * @brief Implementation of the property stream encoder
 */

#include "PropertyEncoder.hpp"
#include "CodecErrors.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace arkfix::codec {

namespace {

const FString kNoneTerminator("None");

template <typename T>
const T& expect(const Value& value, const std::string& name, const char* expected) {
    if (const T* typed = value.as<T>()) {
        return *typed;
    }
    throw TypeMismatch(name, expected, describeShape(value));
}

bool storesEnumName(const TypeName& type) {
    const TypeName* enumType = type.param(0);
    return enumType && enumType->tag() != "None";
}

std::string structNameOf(const TypeName& type) {
    const TypeName* structType = type.param(0);
    return structType ? structType->tag() : std::string();
}

void writeSoftObject(BufferWriter& writer, const SoftObjectPath& path) {
    writer.writeString(path.package);
    writer.writeString(path.asset);
    writer.writeString(path.subPath);
}

} // anonymous namespace

PropertyEncoder::PropertyEncoder(const TypeRegistry& registry)
    : m_registry(registry)
{
}

QByteArray PropertyEncoder::encode(const PropertyList& properties) const {
    BufferWriter writer;
    encodeList(writer, properties);
    writer.writeString(kNoneTerminator);
    return writer.take();
}

void PropertyEncoder::encodeList(BufferWriter& writer, const PropertyList& properties) const {
    for (const auto& property : properties) {
        writeProperty(writer, property);
    }
}

int32_t PropertyEncoder::payloadSize(const Property& property) const {
    BufferWriter writer;
    writePayload(writer, property);
    return BufferWriter::checkedInt32(static_cast<uint64_t>(writer.size()), "Property size");
}

void PropertyEncoder::writeTypeName(BufferWriter& writer, const TypeName& type) const {
    writer.writeString(type.name);
    writer.writeInt32(BufferWriter::checkedInt32(type.params.size(), "Type parameter count"));
    for (const auto& param : type.params) {
        writeTypeName(writer, param);
    }
}

void PropertyEncoder::writeProperty(BufferWriter& writer, const Property& property) const {
    const std::string& name = property.name.text;

    writer.writeString(property.name);
    writeTypeName(writer, property.type);
    const qsizetype sizePosition = writer.reserveInt32();

    uint8_t flags = property.flags;
    if (property.kind() == PropertyKind::Bool) {
        if (const bool* value = property.value.as<bool>()) {
            flags = *value ? (flags | TagFlags::BoolTrue)
                           : (flags & static_cast<uint8_t>(~TagFlags::BoolTrue));
        }
    }
    writer.writeUInt8(flags);

    if (flags & TagFlags::HasArrayIndex) {
        writer.writeInt32(property.arrayIndex);
    }
    if (flags & TagFlags::HasPropertyGuid) {
        if (property.guid.size() != 16) {
            throw TypeMismatch(name, "16-byte property guid",
                               fmt::format("{} bytes", property.guid.size()));
        }
        writer.writeBytes(property.guid);
    }
    if (flags & TagFlags::HasPropertyExtensions) {
        if (property.extensions.isEmpty()) {
            throw TypeMismatch(name, "extension block", "nothing");
        }
        writer.writeBytes(property.extensions);
    }

    const qsizetype payloadStart = writer.size();
    writePayload(writer, property);
    const int32_t size = BufferWriter::checkedInt32(
        static_cast<uint64_t>(writer.size() - payloadStart), "Property size");
    writer.patchInt32(sizePosition, size);

    if (size != property.declaredSize) {
        spdlog::debug("Property {} re-encoded with size {} (was {})", name, size, property.declaredSize);
    }
}

void PropertyEncoder::writePayload(BufferWriter& writer, const Property& property) const {
    const std::string& name = property.name.text;
    const Value& value = property.value;

    // Payloads the decoder could not interpret go back verbatim
    if (const QByteArray* raw = value.as<QByteArray>()) {
        writer.writeBytes(*raw);
        return;
    }

    const TypeInfo* info = m_registry.find(property.typeTag());
    if (!info) {
        throw TypeMismatch(name, "raw bytes for unknown type " + property.typeTag(), describeShape(value));
    }

    switch (info->kind) {
        case PropertyKind::Bool:
            expect<bool>(value, name, "bool");
            return;
        case PropertyKind::Int8:
            writer.writeInt8(expect<int8_t>(value, name, "int8"));
            return;
        case PropertyKind::Int16:
            writer.writeInt16(expect<int16_t>(value, name, "int16"));
            return;
        case PropertyKind::UInt16:
            writer.writeUInt16(expect<uint16_t>(value, name, "uint16"));
            return;
        case PropertyKind::Int:
            writer.writeInt32(expect<int32_t>(value, name, "int32"));
            return;
        case PropertyKind::UInt32:
            writer.writeUInt32(expect<uint32_t>(value, name, "uint32"));
            return;
        case PropertyKind::Int64:
            writer.writeInt64(expect<int64_t>(value, name, "int64"));
            return;
        case PropertyKind::UInt64:
            writer.writeUInt64(expect<uint64_t>(value, name, "uint64"));
            return;
        case PropertyKind::Float:
            writer.writeFloat(expect<float>(value, name, "float"));
            return;
        case PropertyKind::Double:
            writer.writeDouble(expect<double>(value, name, "double"));
            return;

        case PropertyKind::Byte:
            if (storesEnumName(property.type)) {
                writer.writeString(expect<FString>(value, name, "enum name"));
            } else {
                writer.writeUInt8(expect<uint8_t>(value, name, "byte"));
            }
            return;

        case PropertyKind::Str:
        case PropertyKind::Name:
        case PropertyKind::Enum:
            writer.writeString(expect<FString>(value, name, "string"));
            return;

        case PropertyKind::Object: {
            const auto& ref = expect<ObjectRef>(value, name, "object reference");
            writer.writeInt32(ref.kind);
            if (ref.path) {
                writer.writeString(*ref.path);
            }
            return;
        }

        case PropertyKind::SoftObject:
            writeSoftObject(writer, expect<SoftObjectPath>(value, name, "soft object path"));
            return;

        case PropertyKind::Text:
            writeText(writer, name, expect<TextValue>(value, name, "text"));
            return;

        case PropertyKind::Struct:
            writeStruct(writer, expect<StructValue>(value, name, "struct"));
            return;
        case PropertyKind::Array:
            writeArray(writer, property, expect<ArrayValue>(value, name, "array"));
            return;
        case PropertyKind::Set:
            writeSet(writer, property, expect<SetValue>(value, name, "set"));
            return;
        case PropertyKind::Map:
            writeMap(writer, property, expect<MapValue>(value, name, "map"));
            return;

        case PropertyKind::Unknown:
            break;
    }
    throw TypeMismatch(name, "raw bytes", describeShape(value));
}

void PropertyEncoder::writeText(BufferWriter& writer, const std::string& name, const TextValue& value) const {
    writer.writeUInt32(value.flags);
    writer.writeInt8(value.historyType);

    switch (value.historyType) {
        case -1:
            writer.writeUInt32(value.invariantFlag);
            if (value.invariantFlag != 0) {
                if (value.strings.size() != 1) {
                    throw TypeMismatch(name, "one invariant string",
                                       fmt::format("{} strings", value.strings.size()));
                }
                writer.writeString(value.strings.front());
            }
            return;
        case 0:
            if (value.strings.size() != 3) {
                throw TypeMismatch(name, "namespace, key and source strings",
                                   fmt::format("{} strings", value.strings.size()));
            }
            for (const auto& str : value.strings) {
                writer.writeString(str);
            }
            return;
        default:
            writer.writeBytes(value.opaque);
            return;
    }
}

void PropertyEncoder::writeStruct(BufferWriter& writer, const StructValue& value) const {
    if (value.native) {
        writer.writeBytes(*value.native);
        return;
    }
    encodeList(writer, value.properties);
    if (value.terminated) {
        writer.writeString(kNoneTerminator);
    }
    writer.writeBytes(value.padding);
}

void PropertyEncoder::writeArray(BufferWriter& writer, const Property& property,
                                 const ArrayValue& value) const {
    const std::string& name = property.name.text;

    if (value.raw) {
        writer.writeInt32(value.raw->count);
        writer.writeBytes(value.raw->bytes);
        return;
    }

    const TypeName* elementType = property.type.param(0);
    if (!elementType) {
        if (!value.items.empty()) {
            throw TypeMismatch(name, "array with an element type", "untyped elements");
        }
        writer.writeInt32(0);
        writer.writeBytes(value.padding);
        return;
    }

    writer.writeInt32(BufferWriter::checkedInt32(value.items.size(), "Array element count"));
    for (size_t i = 0; i < value.items.size(); ++i) {
        if (i > 0 && value.separated) {
            writer.writeInt32(0);
        }
        writeElement(writer, *elementType, value.items[i], name);
    }
    writer.writeBytes(value.padding);
}

void PropertyEncoder::writeSet(BufferWriter& writer, const Property& property,
                               const SetValue& value) const {
    const std::string& name = property.name.text;

    if (value.raw) {
        writer.writeBytes(*value.raw);
        return;
    }

    const TypeName* elementType = property.type.param(0);
    if (!elementType) {
        throw TypeMismatch(name, "set with an element type", "untyped set");
    }
    writer.writeInt32(BufferWriter::checkedInt32(value.removed.size(), "Set removed count"));
    writeElements(writer, *elementType, value.removed, name);
    writer.writeInt32(BufferWriter::checkedInt32(value.items.size(), "Set element count"));
    writeElements(writer, *elementType, value.items, name);
}

void PropertyEncoder::writeMap(BufferWriter& writer, const Property& property,
                               const MapValue& value) const {
    const std::string& name = property.name.text;

    if (value.raw) {
        writer.writeBytes(*value.raw);
        return;
    }

    const TypeName* keyType = property.type.param(0);
    const TypeName* valueType = property.type.param(1);
    if (!keyType || !valueType) {
        throw TypeMismatch(name, "map with key and value types", "untyped map");
    }
    writer.writeInt32(BufferWriter::checkedInt32(value.removed.size(), "Map removed count"));
    writeElements(writer, *keyType, value.removed, name);
    writer.writeInt32(BufferWriter::checkedInt32(value.entries.size(), "Map entry count"));
    for (const auto& entry : value.entries) {
        writeElement(writer, *keyType, entry.key, name);
        writeElement(writer, *valueType, entry.value, name);
    }
}

void PropertyEncoder::writeElements(BufferWriter& writer, const TypeName& elementType,
                                    const std::vector<Value>& values, const std::string& name) const {
    for (const auto& value : values) {
        writeElement(writer, elementType, value, name);
    }
}

void PropertyEncoder::writeElement(BufferWriter& writer, const TypeName& elementType,
                                   const Value& value, const std::string& name) const {
    switch (m_registry.kindOf(elementType.tag())) {
        case PropertyKind::Bool:
            writer.writeUInt8(expect<bool>(value, name, "bool") ? 1 : 0);
            return;
        case PropertyKind::Int8:
            writer.writeInt8(expect<int8_t>(value, name, "int8"));
            return;
        case PropertyKind::Int16:
            writer.writeInt16(expect<int16_t>(value, name, "int16"));
            return;
        case PropertyKind::UInt16:
            writer.writeUInt16(expect<uint16_t>(value, name, "uint16"));
            return;
        case PropertyKind::Int:
            writer.writeInt32(expect<int32_t>(value, name, "int32"));
            return;
        case PropertyKind::UInt32:
            writer.writeUInt32(expect<uint32_t>(value, name, "uint32"));
            return;
        case PropertyKind::Int64:
            writer.writeInt64(expect<int64_t>(value, name, "int64"));
            return;
        case PropertyKind::UInt64:
            writer.writeUInt64(expect<uint64_t>(value, name, "uint64"));
            return;
        case PropertyKind::Float:
            writer.writeFloat(expect<float>(value, name, "float"));
            return;
        case PropertyKind::Double:
            writer.writeDouble(expect<double>(value, name, "double"));
            return;

        case PropertyKind::Byte:
            if (storesEnumName(elementType)) {
                writer.writeString(expect<FString>(value, name, "enum name"));
            } else {
                writer.writeUInt8(expect<uint8_t>(value, name, "byte"));
            }
            return;

        case PropertyKind::Str:
        case PropertyKind::Name:
        case PropertyKind::Enum:
            writer.writeString(expect<FString>(value, name, "string"));
            return;

        case PropertyKind::Object: {
            const auto& ref = expect<ObjectRef>(value, name, "object reference");
            if (!ref.path) {
                throw TypeMismatch(name, "object reference with path", "bare object index");
            }
            writer.writeInt32(ref.kind);
            writer.writeString(*ref.path);
            return;
        }

        case PropertyKind::SoftObject:
            writeSoftObject(writer, expect<SoftObjectPath>(value, name, "soft object path"));
            return;

        case PropertyKind::Text: {
            const auto& text = expect<TextValue>(value, name, "text");
            if (text.historyType != -1 && text.historyType != 0) {
                throw TypeMismatch(name, "text element with history -1 or 0",
                                   fmt::format("history {}", text.historyType));
            }
            writeText(writer, name, text);
            return;
        }

        case PropertyKind::Struct: {
            const auto& structValue = expect<StructValue>(value, name, "struct");
            if (structValue.native) {
                auto nativeSize = m_registry.nativeStructSize(structNameOf(elementType));
                if (nativeSize && structValue.native->size() != *nativeSize) {
                    throw TypeMismatch(name, fmt::format("{}-byte native struct", *nativeSize),
                                       fmt::format("{} bytes", structValue.native->size()));
                }
            }
            writeStruct(writer, structValue);
            return;
        }

        case PropertyKind::Unknown:
        case PropertyKind::Array:
        case PropertyKind::Set:
        case PropertyKind::Map:
            break;
    }
    throw TypeMismatch(name, "raw element block for " + elementType.toString(), describeShape(value));
}

namespace {

void recalculateValue(const PropertyEncoder& encoder, Value& value);

void recalculateList(const PropertyEncoder& encoder, PropertyList& properties) {
    for (auto& property : properties) {
        recalculateValue(encoder, property.value);
        property.declaredSize = encoder.payloadSize(property);
    }
}

void recalculateValue(const PropertyEncoder& encoder, Value& value) {
    if (auto* structValue = value.as<StructValue>()) {
        recalculateList(encoder, structValue->properties);
    } else if (auto* array = value.as<ArrayValue>()) {
        for (auto& item : array->items) {
            recalculateValue(encoder, item);
        }
    } else if (auto* set = value.as<SetValue>()) {
        for (auto& item : set->removed) {
            recalculateValue(encoder, item);
        }
        for (auto& item : set->items) {
            recalculateValue(encoder, item);
        }
    } else if (auto* map = value.as<MapValue>()) {
        for (auto& key : map->removed) {
            recalculateValue(encoder, key);
        }
        for (auto& entry : map->entries) {
            recalculateValue(encoder, entry.key);
            recalculateValue(encoder, entry.value);
        }
    }
}

} // anonymous namespace

void PropertyEncoder::recalculateSizes(PropertyList& properties) {
    const PropertyEncoder encoder;
    recalculateList(encoder, properties);
}

} // namespace arkfix::codec
