/**
 * @file JsonConverter.cpp
 * @brief Property tree <-> JSON conversion
 */

#include "JsonConverter.hpp"
#include "CodecErrors.hpp"

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace arkfix::codec {

using json = nlohmann::json;

namespace {

bool storesEnumName(const TypeName& type) {
    const TypeName* enumType = type.param(0);
    return enumType && enumType->tag() != "None";
}

json typeNameToJson(const TypeName& type) {
    json node = {{"name", JsonConverter::stringToJson(type.name)}};
    if (!type.params.empty()) {
        json params = json::array();
        for (const auto& param : type.params) {
            params.push_back(typeNameToJson(param));
        }
        node["params"] = std::move(params);
    }
    return node;
}

TypeName typeNameFromJson(const json& node) {
    TypeName type;
    type.name = JsonConverter::stringFromJson(node.at("name"));
    if (node.contains("params")) {
        for (const auto& param : node.at("params")) {
            type.params.push_back(typeNameFromJson(param));
        }
    }
    return type;
}

json floatToJson(float value) {
    if (std::isfinite(value)) {
        return value;
    }
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return {{"_bits", fmt::format("{:08x}", bits)}};
}

json doubleToJson(double value) {
    if (std::isfinite(value)) {
        return value;
    }
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return {{"_bits", fmt::format("{:016x}", bits)}};
}

uint64_t bitsFromJson(const json& node) {
    const std::string hex = node.at("_bits").get<std::string>();
    try {
        size_t used = 0;
        uint64_t bits = std::stoull(hex, &used, 16);
        if (used == hex.size()) {
            return bits;
        }
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range, reported below
    }
    throw MalformedData(fmt::format("Invalid float bit pattern '{}'", hex), -1);
}

float floatFromJson(const json& node) {
    if (node.is_object()) {
        uint32_t bits = static_cast<uint32_t>(bitsFromJson(node));
        float value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }
    return node.get<float>();
}

double doubleFromJson(const json& node) {
    if (node.is_object()) {
        uint64_t bits = bitsFromJson(node);
        double value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }
    return node.get<double>();
}

template <typename T>
T integerFromJson(const json& node, const std::string& name, const char* typeName) {
    if (!node.is_number_integer()) {
        throw MalformedData(fmt::format("Property '{}' needs an integer {} value, got {}",
                                        name, typeName, node.type_name()), -1);
    }
    if (node.is_number_unsigned()) {
        const uint64_t value = node.get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw TypeMismatch(name, typeName, fmt::format("out of range value {}", value));
        }
        return static_cast<T>(value);
    }
    const int64_t value = node.get<int64_t>();
    bool fits = false;
    if constexpr (std::numeric_limits<T>::is_signed) {
        fits = value >= static_cast<int64_t>(std::numeric_limits<T>::min())
            && value <= static_cast<int64_t>(std::numeric_limits<T>::max());
    } else {
        fits = value >= 0 && static_cast<uint64_t>(value) <= std::numeric_limits<T>::max();
    }
    if (!fits) {
        throw TypeMismatch(name, typeName, fmt::format("out of range value {}", value));
    }
    return static_cast<T>(value);
}

bool isRawPayload(const json& node) {
    return node.is_object() && node.contains("_raw");
}

} // anonymous namespace

JsonConverter::JsonConverter(const TypeRegistry& registry)
    : m_registry(registry)
{
}

// ----------------------------------------------------------------------------
// Strings and bytes
// ----------------------------------------------------------------------------

json JsonConverter::stringToJson(const FString& value) {
    if (value.isNatural()) {
        return value.text;
    }
    json node = {{"_text", value.text}, {"_encoding", encodingName(value.encoding)}};
    if (value.usesUnits()) {
        // little-endian code units, the text above is only a lossy rendering
        QByteArray bytes;
        for (char16_t unit : value.units) {
            bytes.append(static_cast<char>(unit & 0xFF));
            bytes.append(static_cast<char>((unit >> 8) & 0xFF));
        }
        node["_units"] = bytesToHex(bytes);
    }
    return node;
}

FString JsonConverter::stringFromJson(const json& node) {
    if (node.is_null()) {
        return FString();
    }
    if (node.is_string()) {
        return FString(node.get<std::string>());
    }
    FString::Encoding encoding;
    const std::string encodingText = node.at("_encoding").get<std::string>();
    if (!encodingFromName(encodingText, encoding)) {
        throw MalformedData(fmt::format("Unknown string encoding '{}'", encodingText), -1);
    }
    FString result(node.at("_text").get<std::string>(), encoding);
    if (node.contains("_units")) {
        const QByteArray bytes = bytesFromHex(node.at("_units").get<std::string>());
        if (encoding != FString::Encoding::Utf16 || bytes.size() % 2 != 0) {
            throw MalformedData("String code units need utf16 encoding and an even byte count", -1);
        }
        for (qsizetype i = 0; i < bytes.size(); i += 2) {
            const auto low = static_cast<uint8_t>(bytes.at(i));
            const auto high = static_cast<uint8_t>(bytes.at(i + 1));
            result.units.push_back(static_cast<char16_t>(low | (high << 8)));
        }
    }
    return result;
}

std::string JsonConverter::bytesToHex(const QByteArray& bytes) {
    return bytes.toHex().toStdString();
}

QByteArray JsonConverter::bytesFromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw MalformedData(fmt::format("Hex string has odd length {}", hex.size()), -1);
    }
    for (char ch : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(ch))) {
            throw MalformedData(fmt::format("Invalid hex character '{}'", ch), -1);
        }
    }
    return QByteArray::fromHex(QByteArray::fromStdString(hex));
}

// ----------------------------------------------------------------------------
// Tree to JSON
// ----------------------------------------------------------------------------

json JsonConverter::toJson(const PropertyList& properties) const {
    json list = json::array();
    for (const auto& property : properties) {
        list.push_back(toJson(property));
    }
    return list;
}

json JsonConverter::toJson(const Property& property) const {
    json node = json::object();
    node["name"] = stringToJson(property.name);
    node["type"] = stringToJson(property.type.name);
    if (!property.type.params.empty()) {
        json params = json::array();
        for (const auto& param : property.type.params) {
            params.push_back(typeNameToJson(param));
        }
        node["_type_params"] = std::move(params);
    }
    node["_size"] = property.declaredSize;
    node["_flags"] = property.flags;
    if (property.hasArrayIndex()) {
        node["_array_index"] = property.arrayIndex;
    }
    if (property.hasGuid()) {
        node["_guid"] = bytesToHex(property.guid);
    }
    if (property.hasExtensions()) {
        node["_extensions"] = bytesToHex(property.extensions);
    }
    // Composite layout keys are added to the node while the value is built
    json value = valueToJson(property.value, &node);
    node["value"] = std::move(value);
    return node;
}

json JsonConverter::structToJson(const StructValue& value, json* node) const {
    if (value.native) {
        return {{"_native", bytesToHex(*value.native)}};
    }

    json properties = toJson(value.properties);
    if (node) {
        if (!value.terminated) {
            (*node)["_terminated"] = false;
        }
        if (!value.padding.isEmpty()) {
            (*node)["_padding"] = bytesToHex(value.padding);
        }
        return properties;
    }

    if (value.terminated && value.padding.isEmpty()) {
        return properties;
    }
    json wrapped = {{"properties", std::move(properties)}};
    if (!value.terminated) {
        wrapped["_terminated"] = false;
    }
    if (!value.padding.isEmpty()) {
        wrapped["_padding"] = bytesToHex(value.padding);
    }
    return wrapped;
}

json JsonConverter::valueToJson(const Value& value, json* node) const {
    struct ToJson {
        const JsonConverter& converter;
        json* node;

        json operator()(const std::monostate&) const { return nullptr; }
        json operator()(bool v) const { return v; }
        json operator()(int8_t v) const { return v; }
        json operator()(uint8_t v) const { return v; }
        json operator()(int16_t v) const { return v; }
        json operator()(uint16_t v) const { return v; }
        json operator()(int32_t v) const { return v; }
        json operator()(uint32_t v) const { return v; }
        json operator()(int64_t v) const { return v; }
        json operator()(uint64_t v) const { return v; }
        json operator()(float v) const { return floatToJson(v); }
        json operator()(double v) const { return doubleToJson(v); }
        json operator()(const FString& v) const { return stringToJson(v); }

        json operator()(const ObjectRef& v) const {
            if (!v.path) {
                return {{"index", v.kind}};
            }
            return {{"kind", v.kind}, {"path", stringToJson(*v.path)}};
        }

        json operator()(const SoftObjectPath& v) const {
            return {{"package", stringToJson(v.package)},
                    {"asset", stringToJson(v.asset)},
                    {"sub_path", stringToJson(v.subPath)}};
        }

        json operator()(const TextValue& v) const {
            json text = {{"flags", v.flags}, {"history", v.historyType}};
            if (v.historyType == -1) {
                text["invariant_flag"] = v.invariantFlag;
            }
            json strings = json::array();
            for (const auto& str : v.strings) {
                strings.push_back(stringToJson(str));
            }
            text["strings"] = std::move(strings);
            if (!v.opaque.isEmpty()) {
                text["_opaque"] = bytesToHex(v.opaque);
            }
            return text;
        }

        json operator()(const QByteArray& v) const { return {{"_raw", bytesToHex(v)}}; }

        json operator()(const StructValue& v) const { return converter.structToJson(v, node); }

        json operator()(const ArrayValue& v) const {
            if (v.raw) {
                return {{"_raw_elements", bytesToHex(v.raw->bytes)}, {"_count", v.raw->count}};
            }
            json items = json::array();
            for (const auto& item : v.items) {
                items.push_back(converter.valueToJson(item, nullptr));
            }
            if (node) {
                if (v.separated) {
                    (*node)["_separated"] = true;
                }
                if (!v.padding.isEmpty()) {
                    (*node)["_padding"] = bytesToHex(v.padding);
                }
            }
            return items;
        }

        json operator()(const SetValue& v) const {
            if (v.raw) {
                return {{"_raw_elements", bytesToHex(*v.raw)}};
            }
            json items = json::array();
            for (const auto& item : v.items) {
                items.push_back(converter.valueToJson(item, nullptr));
            }
            if (node && !v.removed.empty()) {
                json removed = json::array();
                for (const auto& item : v.removed) {
                    removed.push_back(converter.valueToJson(item, nullptr));
                }
                (*node)["_removed"] = std::move(removed);
            }
            return items;
        }

        json operator()(const MapValue& v) const {
            if (v.raw) {
                return {{"_raw_elements", bytesToHex(*v.raw)}};
            }
            json entries = json::array();
            for (const auto& entry : v.entries) {
                entries.push_back({{"key", converter.valueToJson(entry.key, nullptr)},
                                   {"value", converter.valueToJson(entry.value, nullptr)}});
            }
            if (node && !v.removed.empty()) {
                json removed = json::array();
                for (const auto& key : v.removed) {
                    removed.push_back(converter.valueToJson(key, nullptr));
                }
                (*node)["_removed"] = std::move(removed);
            }
            return entries;
        }
    };

    return std::visit(ToJson{*this, node}, value.data);
}

// ----------------------------------------------------------------------------
// JSON to tree
// ----------------------------------------------------------------------------

PropertyList JsonConverter::listFromJson(const json& node) const {
    try {
        return readList(node);
    } catch (const json::exception& e) {
        throw MalformedData(fmt::format("Invalid property document: {}", e.what()), -1);
    }
}

Property JsonConverter::propertyFromJson(const json& node) const {
    try {
        return readProperty(node);
    } catch (const json::exception& e) {
        throw MalformedData(fmt::format("Invalid property document: {}", e.what()), -1);
    }
}

PropertyList JsonConverter::readList(const json& node) const {
    if (!node.is_array()) {
        throw MalformedData("Property list must be a JSON array", -1);
    }
    PropertyList properties;
    properties.reserve(node.size());
    for (const auto& item : node) {
        properties.push_back(readProperty(item));
    }
    return properties;
}

Property JsonConverter::readProperty(const json& node) const {
    Property property;
    property.name = stringFromJson(node.at("name"));
    property.type.name = stringFromJson(node.at("type"));
    if (node.contains("_type_params")) {
        for (const auto& param : node.at("_type_params")) {
            property.type.params.push_back(typeNameFromJson(param));
        }
    }

    property.declaredSize = node.value("_size", 0);
    property.flags = static_cast<uint8_t>(node.value("_flags", 0));

    if (node.contains("_array_index")) {
        property.flags |= TagFlags::HasArrayIndex;
        property.arrayIndex = node.at("_array_index").get<int32_t>();
    }
    if (node.contains("_guid")) {
        property.flags |= TagFlags::HasPropertyGuid;
        property.guid = bytesFromHex(node.at("_guid").get<std::string>());
        if (property.guid.size() != 16) {
            throw MalformedData(fmt::format("Property '{}' guid must be 16 bytes", property.name.text), -1);
        }
    }
    if (node.contains("_extensions")) {
        property.flags |= TagFlags::HasPropertyExtensions;
        property.extensions = bytesFromHex(node.at("_extensions").get<std::string>());
    }

    property.value = valueFromJson(property.type, node.at("value"), &node, property.name.text);
    return property;
}

StructValue JsonConverter::structFromJson(const json& node, const json* holder) const {
    StructValue value;
    if (node.is_object() && node.contains("_native")) {
        value.native = bytesFromHex(node.at("_native").get<std::string>());
        return value;
    }

    const json* layout = holder;
    if (node.is_object()) {
        value.properties = readList(node.at("properties"));
        layout = &node;
    } else {
        value.properties = readList(node);
    }
    if (layout) {
        value.terminated = layout->value("_terminated", true);
        if (layout->contains("_padding")) {
            value.padding = bytesFromHex(layout->at("_padding").get<std::string>());
        }
    }
    return value;
}

TextValue JsonConverter::textFromJson(const json& node) const {
    TextValue text;
    text.flags = node.value("flags", 0u);
    text.historyType = static_cast<int8_t>(node.value("history", -1));
    text.invariantFlag = node.value("invariant_flag", 0u);
    if (node.contains("strings")) {
        for (const auto& str : node.at("strings")) {
            text.strings.push_back(stringFromJson(str));
        }
    }
    if (node.contains("_opaque")) {
        text.opaque = bytesFromHex(node.at("_opaque").get<std::string>());
    }
    return text;
}

std::vector<Value> JsonConverter::elementsFromJson(const TypeName* elementType, const json& node,
                                                   const std::string& name) const {
    if (!elementType) {
        throw MalformedData(fmt::format("Property '{}' has elements but no element type", name), -1);
    }
    if (!node.is_array()) {
        throw MalformedData(fmt::format("Elements of '{}' must be a JSON array", name), -1);
    }
    std::vector<Value> elements;
    elements.reserve(node.size());
    for (const auto& item : node) {
        elements.push_back(valueFromJson(*elementType, item, nullptr, name));
    }
    return elements;
}

Value JsonConverter::valueFromJson(const TypeName& type, const json& node,
                                   const json* holder, const std::string& name) const {
    // Payload the decoder kept opaque
    if (holder && isRawPayload(node)) {
        return bytesFromHex(node.at("_raw").get<std::string>());
    }

    switch (m_registry.kindOf(type.tag())) {
        case PropertyKind::Bool:
            return node.get<bool>();
        case PropertyKind::Int8:
            return integerFromJson<int8_t>(node, name, "int8");
        case PropertyKind::Int16:
            return integerFromJson<int16_t>(node, name, "int16");
        case PropertyKind::UInt16:
            return integerFromJson<uint16_t>(node, name, "uint16");
        case PropertyKind::Int:
            return integerFromJson<int32_t>(node, name, "int32");
        case PropertyKind::UInt32:
            return integerFromJson<uint32_t>(node, name, "uint32");
        case PropertyKind::Int64:
            return integerFromJson<int64_t>(node, name, "int64");
        case PropertyKind::UInt64:
            return integerFromJson<uint64_t>(node, name, "uint64");
        case PropertyKind::Float:
            return floatFromJson(node);
        case PropertyKind::Double:
            return doubleFromJson(node);

        case PropertyKind::Byte:
            if (storesEnumName(type)) {
                return stringFromJson(node);
            }
            return integerFromJson<uint8_t>(node, name, "byte");

        case PropertyKind::Str:
        case PropertyKind::Name:
        case PropertyKind::Enum:
            return stringFromJson(node);

        case PropertyKind::Object: {
            ObjectRef ref;
            if (node.contains("index")) {
                ref.kind = node.at("index").get<int32_t>();
            } else {
                ref.kind = node.at("kind").get<int32_t>();
                ref.path = stringFromJson(node.at("path"));
            }
            return ref;
        }

        case PropertyKind::SoftObject: {
            SoftObjectPath path;
            path.package = stringFromJson(node.at("package"));
            path.asset = stringFromJson(node.at("asset"));
            path.subPath = stringFromJson(node.at("sub_path"));
            return path;
        }

        case PropertyKind::Text:
            return textFromJson(node);

        case PropertyKind::Struct:
            return structFromJson(node, holder);

        case PropertyKind::Array: {
            ArrayValue array;
            if (node.is_object() && node.contains("_raw_elements")) {
                array.raw = RawElements{node.at("_count").get<int32_t>(),
                                        bytesFromHex(node.at("_raw_elements").get<std::string>())};
                return array;
            }
            array.items = elementsFromJson(type.param(0), node, name);
            if (holder) {
                array.separated = holder->value("_separated", false);
                if (holder->contains("_padding")) {
                    array.padding = bytesFromHex(holder->at("_padding").get<std::string>());
                }
            }
            return array;
        }

        case PropertyKind::Set: {
            SetValue set;
            if (node.is_object() && node.contains("_raw_elements")) {
                set.raw = bytesFromHex(node.at("_raw_elements").get<std::string>());
                return set;
            }
            set.items = elementsFromJson(type.param(0), node, name);
            if (holder && holder->contains("_removed")) {
                set.removed = elementsFromJson(type.param(0), holder->at("_removed"), name);
            }
            return set;
        }

        case PropertyKind::Map: {
            MapValue map;
            if (node.is_object() && node.contains("_raw_elements")) {
                map.raw = bytesFromHex(node.at("_raw_elements").get<std::string>());
                return map;
            }
            const TypeName* keyType = type.param(0);
            const TypeName* valueType = type.param(1);
            if (!keyType || !valueType) {
                throw MalformedData(fmt::format("Map '{}' needs key and value types", name), -1);
            }
            for (const auto& entry : node) {
                MapEntry mapEntry;
                mapEntry.key = valueFromJson(*keyType, entry.at("key"), nullptr, name);
                mapEntry.value = valueFromJson(*valueType, entry.at("value"), nullptr, name);
                map.entries.push_back(std::move(mapEntry));
            }
            if (holder && holder->contains("_removed")) {
                map.removed = elementsFromJson(keyType, holder->at("_removed"), name);
            }
            return map;
        }

        case PropertyKind::Unknown:
            break;
    }
    throw MalformedData(fmt::format("Property '{}' of unknown type {} needs a _raw value",
                                    name, type.toString()), -1);
}

} // namespace arkfix::codec
