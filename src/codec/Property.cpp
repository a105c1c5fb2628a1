/**
 * @file Property.cpp
 * @brief Property tree helpers: equality, lookup and container editing
 */

#include "Property.hpp"
#include "CodecErrors.hpp"
#include "TypeRegistry.hpp"

#include <cstring>

namespace arkfix::codec {

int64_t TypeName::byteSize() const {
    int64_t size = name.byteSize() + 4;
    for (const auto& param : params) {
        size += param.byteSize();
    }
    return size;
}

std::string TypeName::toString() const {
    std::string result = name.text;
    if (params.empty()) {
        return result;
    }
    result += '<';
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += params[i].toString();
    }
    result += '>';
    return result;
}

PropertyKind Property::kind() const {
    return TypeRegistry::builtin().kindOf(type.tag());
}

bool operator==(const ObjectRef& a, const ObjectRef& b) {
    return a.kind == b.kind && a.path == b.path;
}

bool operator==(const SoftObjectPath& a, const SoftObjectPath& b) {
    return a.package == b.package && a.asset == b.asset && a.subPath == b.subPath;
}

bool operator==(const TextValue& a, const TextValue& b) {
    return a.flags == b.flags
        && a.historyType == b.historyType
        && a.invariantFlag == b.invariantFlag
        && a.strings == b.strings
        && a.opaque == b.opaque;
}

bool operator==(const StructValue& a, const StructValue& b) {
    return a.properties == b.properties
        && a.native == b.native
        && a.terminated == b.terminated
        && a.padding == b.padding;
}

bool operator==(const RawElements& a, const RawElements& b) {
    return a.count == b.count && a.bytes == b.bytes;
}

bool operator==(const ArrayValue& a, const ArrayValue& b) {
    return a.items == b.items
        && a.raw == b.raw
        && a.separated == b.separated
        && a.padding == b.padding;
}

bool operator==(const SetValue& a, const SetValue& b) {
    return a.removed == b.removed && a.items == b.items && a.raw == b.raw;
}

bool operator==(const MapValue& a, const MapValue& b) {
    return a.removed == b.removed && a.entries == b.entries && a.raw == b.raw;
}

bool operator==(const MapEntry& a, const MapEntry& b) {
    return a.key == b.key && a.value == b.value;
}

namespace {

template <typename T>
bool sameBits(T a, T b) {
    return std::memcmp(&a, &b, sizeof(T)) == 0;
}

} // anonymous namespace

bool operator==(const Value& a, const Value& b) {
    if (a.data.index() != b.data.index()) {
        return false;
    }
    if (const float* fa = a.as<float>()) {
        return sameBits(*fa, *b.as<float>());
    }
    if (const double* da = a.as<double>()) {
        return sameBits(*da, *b.as<double>());
    }
    return std::visit([&b](const auto& lhs) {
        using T = std::decay_t<decltype(lhs)>;
        return lhs == std::get<T>(b.data);
    }, a.data);
}

bool operator==(const Property& a, const Property& b) {
    return a.name == b.name
        && a.type == b.type
        && a.declaredSize == b.declaredSize
        && a.flags == b.flags
        && a.arrayIndex == b.arrayIndex
        && a.guid == b.guid
        && a.extensions == b.extensions
        && a.value == b.value;
}

std::string describeShape(const Value& value) {
    struct Describe {
        std::string operator()(const std::monostate&) const { return "nothing"; }
        std::string operator()(bool) const { return "bool"; }
        std::string operator()(int8_t) const { return "int8"; }
        std::string operator()(uint8_t) const { return "byte"; }
        std::string operator()(int16_t) const { return "int16"; }
        std::string operator()(uint16_t) const { return "uint16"; }
        std::string operator()(int32_t) const { return "int32"; }
        std::string operator()(uint32_t) const { return "uint32"; }
        std::string operator()(int64_t) const { return "int64"; }
        std::string operator()(uint64_t) const { return "uint64"; }
        std::string operator()(float) const { return "float"; }
        std::string operator()(double) const { return "double"; }
        std::string operator()(const FString&) const { return "string"; }
        std::string operator()(const ObjectRef&) const { return "object reference"; }
        std::string operator()(const SoftObjectPath&) const { return "soft object path"; }
        std::string operator()(const TextValue&) const { return "text"; }
        std::string operator()(const QByteArray&) const { return "raw bytes"; }
        std::string operator()(const StructValue&) const { return "struct"; }
        std::string operator()(const ArrayValue&) const { return "array"; }
        std::string operator()(const SetValue&) const { return "set"; }
        std::string operator()(const MapValue&) const { return "map"; }
    };
    return std::visit(Describe{}, value.data);
}

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        if (dot == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

// Shared walk for the const and non-const overloads
template <typename List, typename Prop>
Prop* findIn(List& properties, const std::string& path) {
    const auto segments = splitPath(path);
    List* current = &properties;
    Prop* found = nullptr;

    for (size_t i = 0; i < segments.size(); ++i) {
        found = nullptr;
        for (auto& property : *current) {
            if (property.name.text == segments[i]) {
                found = &property;
                break;
            }
        }
        if (!found) {
            return nullptr;
        }
        if (i + 1 < segments.size()) {
            auto* structValue = found->value.template as<StructValue>();
            if (!structValue) {
                return nullptr;
            }
            current = &structValue->properties;
        }
    }
    return found;
}

} // anonymous namespace

Property* findProperty(PropertyList& properties, const std::string& path) {
    return findIn<PropertyList, Property>(properties, path);
}

const Property* findProperty(const PropertyList& properties, const std::string& path) {
    return findIn<const PropertyList, const Property>(properties, path);
}

size_t containerSize(const Property& property) {
    if (const auto* array = property.value.as<ArrayValue>()) {
        if (array->raw) {
            return static_cast<size_t>(array->raw->count);
        }
        return array->items.size();
    }
    if (const auto* set = property.value.as<SetValue>()) {
        return set->items.size();
    }
    if (const auto* map = property.value.as<MapValue>()) {
        return map->entries.size();
    }
    return 0;
}

void clearContainer(Property& property) {
    if (auto* array = property.value.as<ArrayValue>()) {
        array->items.clear();
        array->raw.reset();
        array->padding.clear();
        property.declaredSize = 4;
        return;
    }
    if (auto* set = property.value.as<SetValue>()) {
        set->removed.clear();
        set->items.clear();
        set->raw.reset();
        property.declaredSize = 8;
        return;
    }
    if (auto* map = property.value.as<MapValue>()) {
        map->removed.clear();
        map->entries.clear();
        map->raw.reset();
        property.declaredSize = 8;
        return;
    }
    throw TypeMismatch(property.name.text, "container", describeShape(property.value));
}

} // namespace arkfix::codec
