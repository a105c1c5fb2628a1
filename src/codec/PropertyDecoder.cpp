/**
 * @file PropertyDecoder.cpp
 * @brief Implementation of the property stream decoder
 */

#include "PropertyDecoder.hpp"
#include "CodecErrors.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>

namespace arkfix::codec {

namespace {

const char* kNoneName = "None";

/**
 * Pushes one path segment for the lifetime of the scope
 */
class PathScope {
public:
    PathScope(std::vector<std::string>& path, std::string segment)
        : m_path(path)
    {
        m_path.push_back(std::move(segment));
    }
    ~PathScope() { m_path.pop_back(); }

    PathScope(const PathScope&) = delete;
    PathScope& operator=(const PathScope&) = delete;

private:
    std::vector<std::string>& m_path;
};

std::string joinPath(const std::vector<std::string>& segments) {
    std::string result;
    for (const auto& segment : segments) {
        if (!result.empty() && (segment.empty() || segment.front() != '[')) {
            result += '.';
        }
        result += segment;
    }
    return result;
}

bool storesEnumName(const TypeName& type) {
    const TypeName* enumType = type.param(0);
    return enumType && enumType->tag() != kNoneName;
}

std::string structNameOf(const TypeName& type) {
    const TypeName* structType = type.param(0);
    return structType ? structType->tag() : std::string();
}

} // anonymous namespace

const char* findingKindName(Finding::Kind kind) {
    switch (kind) {
        case Finding::Kind::UnknownType:    return "UnknownType";
        case Finding::Kind::SizeMismatch:   return "SizeMismatch";
        case Finding::Kind::TruncatedInput: return "TruncatedInput";
        case Finding::Kind::MalformedData:  return "MalformedData";
        case Finding::Kind::TrailingData:   return "TrailingData";
    }
    return "Unknown";
}

bool DecodeResult::hasErrors() const {
    return std::any_of(findings.begin(), findings.end(), [](const Finding& f) {
        return f.severity == Finding::Severity::Error;
    });
}

struct PropertyDecoder::Context {
    std::vector<Finding> findings;
    std::vector<std::string> path;

    void report(Finding::Kind kind, Finding::Severity severity, int64_t offset,
                int64_t declared, int64_t actual, const std::string& message) {
        Finding finding;
        finding.kind = kind;
        finding.severity = severity;
        finding.path = joinPath(path);
        finding.offset = offset;
        finding.declared = declared;
        finding.actual = actual;
        finding.message = message;
        spdlog::warn("{} at {} (offset {}): {}", findingKindName(kind), finding.path, offset, message);
        findings.push_back(std::move(finding));
    }
};

void PropertyDecoder::dropFindingsSince(Context& ctx, size_t count) {
    ctx.findings.erase(ctx.findings.begin() + static_cast<std::ptrdiff_t>(count), ctx.findings.end());
}

PropertyDecoder::PropertyDecoder(const TypeRegistry& registry, DecodeOptions options)
    : m_registry(registry)
    , m_options(options)
{
}

DecodeResult PropertyDecoder::decode(const QByteArray& data, qsizetype offset) const {
    Context ctx;
    BufferReader reader(data, offset, data.size());

    DecodeResult result;
    result.properties = readList(reader, ctx, nullptr);
    result.findings = std::move(ctx.findings);
    result.endOffset = reader.offset();

    spdlog::debug("Decoded {} top-level properties ({} findings), list ends at {}",
                  result.properties.size(), result.findings.size(), result.endOffset);
    return result;
}

PropertyList PropertyDecoder::readList(BufferReader& reader, Context& ctx, bool* terminated) const {
    PropertyList properties;

    while (true) {
        // A struct payload may end exactly at its boundary without a terminator
        if (terminated && reader.atEnd()) {
            *terminated = false;
            return properties;
        }

        const qsizetype tagOffset = reader.offset();
        FString name = reader.readString();
        if (name.text == kNoneName) {
            if (terminated) {
                *terminated = true;
            }
            return properties;
        }

        properties.push_back(readProperty(reader, name, tagOffset, ctx));
    }
}

TypeName PropertyDecoder::readTypeName(BufferReader& reader) const {
    TypeName type;
    type.name = reader.readString();

    const qsizetype countOffset = reader.offset();
    int32_t paramCount = reader.readInt32();
    if (paramCount < 0) {
        throw MalformedData(fmt::format("Negative parameter count {} in type {}",
                                        paramCount, type.name.text), countOffset);
    }
    for (int32_t i = 0; i < paramCount; ++i) {
        type.params.push_back(readTypeName(reader));
    }
    return type;
}

Property PropertyDecoder::readProperty(BufferReader& reader, const FString& name,
                                       qsizetype tagOffset, Context& ctx) const {
    Property property;
    property.name = name;
    property.offset = tagOffset;
    property.type = readTypeName(reader);

    const int32_t size = reader.readInt32();
    property.flags = reader.readUInt8();

    if (property.hasArrayIndex()) {
        property.arrayIndex = reader.readInt32();
    }
    if (property.hasGuid()) {
        property.guid = reader.readBytes(16);
    }
    if (property.hasExtensions()) {
        const uint8_t extensions = reader.readUInt8();
        property.extensions.append(static_cast<char>(extensions));
        if (extensions & TagExtensions::OverridableInformation) {
            // operation byte + experimental overridable flag
            property.extensions.append(reader.readBytes(5));
        }
    }

    if (size < 0) {
        throw MalformedData(fmt::format("Negative size {} for property {}", size, name.text), tagOffset);
    }
    property.declaredSize = size;

    PathScope scope(ctx.path, name.text);

    if (size > reader.remaining()) {
        throw TruncatedInput(reader.offset(), size, reader.limit());
    }

    const qsizetype payloadStart = reader.offset();
    BufferReader payload = reader.subReader(size);

    try {
        try {
            property.value = readPayload(payload, property, ctx);
            const qsizetype consumed = payload.offset() - payloadStart;
            if (consumed != size) {
                throw SizeMismatch(name.text, size, consumed, tagOffset);
            }
        } catch (const TruncatedInput& e) {
            if (e.limit() != payload.limit()) {
                throw;
            }
            // Payload reads ran past the declared size of this property
            throw SizeMismatch(name.text, size, e.offset() + e.requested() - payloadStart, tagOffset);
        }
    } catch (const SizeMismatch& e) {
        if (!m_options.recover) {
            throw;
        }
        ctx.report(Finding::Kind::SizeMismatch, Finding::Severity::Error, e.offset(),
                   e.declaredSize(), e.actualSize(), e.what());
        property.value = reader.subReader(size).readBytes(size);
    } catch (const MalformedData& e) {
        if (!m_options.recover) {
            throw;
        }
        ctx.report(Finding::Kind::MalformedData, Finding::Severity::Error, e.offset(),
                   size, -1, e.what());
        property.value = reader.subReader(size).readBytes(size);
    }

    reader.skip(size);

    spdlog::trace("{} {} at {}: {} bytes", property.type.toString(), name.text, tagOffset, size);
    return property;
}

Value PropertyDecoder::readPayload(BufferReader& payload, Property& property, Context& ctx) const {
    const TypeInfo* info = m_registry.find(property.typeTag());
    if (!info) {
        ctx.report(Finding::Kind::UnknownType, Finding::Severity::Warning, property.offset,
                   property.declaredSize, -1,
                   fmt::format("Unknown type {}, payload kept as raw bytes", property.typeTag()));
        return payload.readBytes(payload.remaining());
    }

    switch (info->kind) {
        case PropertyKind::Bool:
            return (property.flags & TagFlags::BoolTrue) != 0;
        case PropertyKind::Int8:
            return payload.readInt8();
        case PropertyKind::Int16:
            return payload.readInt16();
        case PropertyKind::UInt16:
            return payload.readUInt16();
        case PropertyKind::Int:
            return payload.readInt32();
        case PropertyKind::UInt32:
            return payload.readUInt32();
        case PropertyKind::Int64:
            return payload.readInt64();
        case PropertyKind::UInt64:
            return payload.readUInt64();
        case PropertyKind::Float:
            return payload.readFloat();
        case PropertyKind::Double:
            return payload.readDouble();

        case PropertyKind::Byte:
            if (storesEnumName(property.type)) {
                return payload.readString();
            }
            return payload.readUInt8();

        case PropertyKind::Str:
        case PropertyKind::Name:
        case PropertyKind::Enum:
            return payload.readString();

        case PropertyKind::Object:
            return readObject(payload);

        case PropertyKind::SoftObject: {
            SoftObjectPath path;
            path.package = payload.readString();
            path.asset = payload.readString();
            path.subPath = payload.readString();
            return path;
        }

        case PropertyKind::Text:
            return readText(payload, true);
        case PropertyKind::Struct:
            return readStruct(payload, property, ctx);
        case PropertyKind::Array:
            return readArray(payload, property, ctx);
        case PropertyKind::Set:
            return readSet(payload, property, ctx);
        case PropertyKind::Map:
            return readMap(payload, property, ctx);

        case PropertyKind::Unknown:
            break;
    }
    return payload.readBytes(payload.remaining());
}

Value PropertyDecoder::readObject(BufferReader& payload) const {
    const qsizetype start = payload.offset();

    if (payload.remaining() == 4) {
        ObjectRef ref;
        ref.kind = payload.readInt32();
        return ref;
    }

    if (payload.remaining() >= 8) {
        try {
            ObjectRef ref;
            ref.kind = payload.readInt32();
            ref.path = payload.readString();
            if (payload.atEnd()) {
                return ref;
            }
        } catch (const CodecError& e) {
            // e.g. a null reference (kind 0, length -1) or a length running past the payload
            spdlog::debug("Object payload at {} is not a path reference: {}", start, e.what());
        }
    }

    payload.seek(start);
    return payload.readBytes(payload.remaining());
}

TextValue PropertyDecoder::readText(BufferReader& payload, bool bounded) const {
    const qsizetype start = payload.offset();

    TextValue text;
    text.flags = payload.readUInt32();
    text.historyType = payload.readInt8();

    switch (text.historyType) {
        case -1:
            text.invariantFlag = payload.readUInt32();
            if (text.invariantFlag != 0) {
                text.strings.push_back(payload.readString());
            }
            break;
        case 0:
            // namespace, key, source string
            for (int i = 0; i < 3; ++i) {
                text.strings.push_back(payload.readString());
            }
            break;
        default:
            if (!bounded) {
                throw MalformedData(fmt::format("Cannot delimit text with history type {}",
                                                text.historyType), start);
            }
            text.opaque = payload.readBytes(payload.remaining());
            break;
    }
    return text;
}

StructValue PropertyDecoder::readStruct(BufferReader& payload, const Property& property, Context& ctx) const {
    const qsizetype start = payload.offset();

    StructValue value;
    if (property.hasNativeSerialize() || m_registry.isNativeStruct(structNameOf(property.type))) {
        value.native = payload.readBytes(payload.remaining());
        return value;
    }

    bool terminated = false;
    value.properties = readList(payload, ctx, &terminated);
    value.terminated = terminated;
    value.padding = readPadding(payload, property, start);
    return value;
}

ArrayValue PropertyDecoder::readArray(BufferReader& payload, const Property& property, Context& ctx) const {
    const qsizetype start = payload.offset();
    const TypeName* elementType = property.type.param(0);

    ArrayValue value;
    const int32_t count = readCount(payload);

    if (!elementType || !canDelimit(*elementType)) {
        if (elementType && !m_registry.find(elementType->tag())) {
            ctx.report(Finding::Kind::UnknownType, Finding::Severity::Warning, property.offset,
                       property.declaredSize, -1,
                       fmt::format("Unknown element type {}, elements kept as raw bytes",
                                   elementType->tag()));
        }
        value.raw = RawElements{count, payload.readBytes(payload.remaining())};
        return value;
    }

    const bool taggedStructs = m_registry.kindOf(elementType->tag()) == PropertyKind::Struct
                            && !m_registry.isNativeStruct(structNameOf(*elementType));

    const qsizetype elementsStart = payload.offset();
    const size_t findingCount = ctx.findings.size();
    try {
        if (taggedStructs) {
            readStructElements(payload, property, *elementType, count, value, ctx);
        } else {
            value.items = readElements(payload, *elementType, count, ctx);
        }
    } catch (const MalformedData& e) {
        spdlog::debug("Elements of {} kept as raw bytes: {}", property.name.text, e.what());
        dropFindingsSince(ctx, findingCount);
        payload.seek(elementsStart);
        ArrayValue raw;
        raw.raw = RawElements{count, payload.readBytes(payload.remaining())};
        return raw;
    }

    value.padding = readPadding(payload, property, start);
    return value;
}

void PropertyDecoder::readStructElements(BufferReader& payload, const Property& property,
                                         const TypeName& elementType, int32_t count,
                                         ArrayValue& value, Context& ctx) const {
    for (int32_t i = 0; i < count; ++i) {
        if (i == 1) {
            // The first gap decides whether elements are separated by a zero int32.
            // A property name never has length 0, so the peek is unambiguous.
            if (payload.remaining() >= 4 && payload.peekInt32() == 0) {
                value.separated = true;
                payload.skip(4);
            }
        } else if (i > 1 && value.separated) {
            const qsizetype separatorOffset = payload.offset();
            if (payload.readInt32() != 0) {
                throw MalformedData(fmt::format("Missing separator before element {} of {}",
                                                i, property.name.text), separatorOffset);
            }
        }
        PathScope scope(ctx.path, fmt::format("[{}]", i));
        value.items.push_back(readElement(payload, elementType, ctx));
    }
}

SetValue PropertyDecoder::readSet(BufferReader& payload, const Property& property, Context& ctx) const {
    const TypeName* elementType = property.type.param(0);

    SetValue value;
    if (!elementType || !canDelimit(*elementType)) {
        value.raw = payload.readBytes(payload.remaining());
        return value;
    }

    const qsizetype start = payload.offset();
    const size_t findingCount = ctx.findings.size();
    try {
        const int32_t removedCount = readCount(payload);
        value.removed = readElements(payload, *elementType, removedCount, ctx);
        const int32_t count = readCount(payload);
        value.items = readElements(payload, *elementType, count, ctx);
    } catch (const MalformedData& e) {
        spdlog::debug("Elements of {} kept as raw bytes: {}", property.name.text, e.what());
        dropFindingsSince(ctx, findingCount);
        payload.seek(start);
        SetValue raw;
        raw.raw = payload.readBytes(payload.remaining());
        return raw;
    }
    return value;
}

MapValue PropertyDecoder::readMap(BufferReader& payload, const Property& property, Context& ctx) const {
    const TypeName* keyType = property.type.param(0);
    const TypeName* valueType = property.type.param(1);

    MapValue value;
    if (!keyType || !valueType || !canDelimit(*keyType) || !canDelimit(*valueType)) {
        value.raw = payload.readBytes(payload.remaining());
        return value;
    }

    const qsizetype start = payload.offset();
    const size_t findingCount = ctx.findings.size();
    try {
        const int32_t removedCount = readCount(payload);
        value.removed = readElements(payload, *keyType, removedCount, ctx);

        const int32_t count = readCount(payload);
        for (int32_t i = 0; i < count; ++i) {
            PathScope scope(ctx.path, fmt::format("[{}]", i));
            MapEntry entry;
            entry.key = readElement(payload, *keyType, ctx);
            entry.value = readElement(payload, *valueType, ctx);
            value.entries.push_back(std::move(entry));
        }
    } catch (const MalformedData& e) {
        spdlog::debug("Entries of {} kept as raw bytes: {}", property.name.text, e.what());
        dropFindingsSince(ctx, findingCount);
        payload.seek(start);
        MapValue raw;
        raw.raw = payload.readBytes(payload.remaining());
        return raw;
    }
    return value;
}

bool PropertyDecoder::canDelimit(const TypeName& elementType) const {
    const TypeInfo* info = m_registry.find(elementType.tag());
    if (!info) {
        return false;
    }
    switch (info->kind) {
        case PropertyKind::Unknown:
        case PropertyKind::Array:
        case PropertyKind::Set:
        case PropertyKind::Map:
            return false;
        default:
            return true;
    }
}

std::vector<Value> PropertyDecoder::readElements(BufferReader& reader, const TypeName& elementType,
                                                 int32_t count, Context& ctx) const {
    std::vector<Value> elements;
    for (int32_t i = 0; i < count; ++i) {
        PathScope scope(ctx.path, fmt::format("[{}]", i));
        elements.push_back(readElement(reader, elementType, ctx));
    }
    return elements;
}

Value PropertyDecoder::readElement(BufferReader& reader, const TypeName& elementType, Context& ctx) const {
    const qsizetype start = reader.offset();

    switch (m_registry.kindOf(elementType.tag())) {
        case PropertyKind::Bool: {
            const uint8_t raw = reader.readUInt8();
            if (raw > 1) {
                throw MalformedData(fmt::format("Invalid bool element value {}", raw), start);
            }
            return raw != 0;
        }
        case PropertyKind::Int8:
            return reader.readInt8();
        case PropertyKind::Int16:
            return reader.readInt16();
        case PropertyKind::UInt16:
            return reader.readUInt16();
        case PropertyKind::Int:
            return reader.readInt32();
        case PropertyKind::UInt32:
            return reader.readUInt32();
        case PropertyKind::Int64:
            return reader.readInt64();
        case PropertyKind::UInt64:
            return reader.readUInt64();
        case PropertyKind::Float:
            return reader.readFloat();
        case PropertyKind::Double:
            return reader.readDouble();

        case PropertyKind::Byte:
            if (storesEnumName(elementType)) {
                return reader.readString();
            }
            return reader.readUInt8();

        case PropertyKind::Str:
        case PropertyKind::Name:
        case PropertyKind::Enum:
            return reader.readString();

        case PropertyKind::Object: {
            ObjectRef ref;
            ref.kind = reader.readInt32();
            ref.path = reader.readString();
            return ref;
        }

        case PropertyKind::SoftObject: {
            SoftObjectPath path;
            path.package = reader.readString();
            path.asset = reader.readString();
            path.subPath = reader.readString();
            return path;
        }

        case PropertyKind::Text:
            return readText(reader, false);

        case PropertyKind::Struct: {
            StructValue value;
            if (auto nativeSize = m_registry.nativeStructSize(structNameOf(elementType))) {
                value.native = reader.readBytes(*nativeSize);
                return value;
            }
            bool terminated = false;
            value.properties = readList(reader, ctx, &terminated);
            value.terminated = terminated;
            return value;
        }

        case PropertyKind::Unknown:
        case PropertyKind::Array:
        case PropertyKind::Set:
        case PropertyKind::Map:
            break;
    }
    throw MalformedData(fmt::format("Cannot delimit elements of type {}", elementType.toString()), start);
}

int32_t PropertyDecoder::readCount(BufferReader& reader) const {
    const qsizetype start = reader.offset();
    const int32_t count = reader.readInt32();
    if (count < 0) {
        throw MalformedData(fmt::format("Negative element count {}", count), start);
    }
    return count;
}

QByteArray PropertyDecoder::readPadding(BufferReader& payload, const Property& property,
                                        qsizetype payloadStart) const {
    const qsizetype consumed = payload.offset() - payloadStart;
    QByteArray padding = payload.readBytes(payload.remaining());
    for (char byte : padding) {
        if (byte != '\0') {
            throw SizeMismatch(property.name.text, property.declaredSize, consumed, property.offset);
        }
    }
    return padding;
}

} // namespace arkfix::codec
