/**
 * @file PropertyDecoder.hpp
 * @brief Decoder for tagged property streams
 *
 * Turns a binary property list into a Property tree. Bytes the decoder
 * cannot interpret are kept verbatim in the tree and reported as findings,
 * so an unchanged tree always re-encodes to the input.
 */

#pragma once

#include "BufferUtils.hpp"
#include "Property.hpp"
#include "TypeRegistry.hpp"

#include <QByteArray>

#include <cstdint>
#include <string>
#include <vector>

namespace arkfix::codec {

/**
 * @struct Finding
 * @brief One diagnostic about bytes the decoder could not interpret
 */
struct Finding {
    enum class Kind {
        UnknownType,
        SizeMismatch,
        TruncatedInput,
        MalformedData,
        TrailingData
    };

    enum class Severity {
        Warning,    // bytes preserved, output still round-trips
        Error       // structure is broken at this point
    };

    Kind kind = Kind::MalformedData;
    Severity severity = Severity::Error;
    std::string path;           // dotted property path, "[i]" for elements
    int64_t offset = -1;
    int64_t declared = -1;
    int64_t actual = -1;
    std::string message;
};

const char* findingKindName(Finding::Kind kind);

struct DecodeOptions {
    /**
     * Record SizeMismatch and MalformedData as findings instead of throwing.
     * The offending payload is kept as raw bytes and decoding resumes at its
     * declared end. TruncatedInput is always fatal.
     */
    bool recover = false;
};

struct DecodeResult {
    PropertyList properties;
    std::vector<Finding> findings;
    qsizetype endOffset = 0;    // first byte after the None terminator

    bool hasErrors() const;
};

/**
 * @class PropertyDecoder
 * @brief Reads a None-terminated property list
 *
 * The decoder holds no mutable state; one instance may be used from
 * several threads at once.
 */
class PropertyDecoder {
public:
    explicit PropertyDecoder(const TypeRegistry& registry = TypeRegistry::builtin(),
                             DecodeOptions options = {});

    /**
     * @brief Decode the property list starting at @p offset
     *
     * @throws TruncatedInput if the buffer ends before the None terminator
     * @throws SizeMismatch, MalformedData unless recovering
     */
    DecodeResult decode(const QByteArray& data, qsizetype offset = 0) const;

    const DecodeOptions& options() const { return m_options; }

private:
    struct Context;

    PropertyList readList(BufferReader& reader, Context& ctx, bool* terminated) const;
    Property readProperty(BufferReader& reader, const FString& name, qsizetype tagOffset,
                          Context& ctx) const;
    TypeName readTypeName(BufferReader& reader) const;

    Value readPayload(BufferReader& payload, Property& property, Context& ctx) const;
    Value readObject(BufferReader& payload) const;
    TextValue readText(BufferReader& payload, bool bounded) const;
    StructValue readStruct(BufferReader& payload, const Property& property, Context& ctx) const;
    ArrayValue readArray(BufferReader& payload, const Property& property, Context& ctx) const;
    void readStructElements(BufferReader& payload, const Property& property, const TypeName& elementType,
                            int32_t count, ArrayValue& value, Context& ctx) const;
    SetValue readSet(BufferReader& payload, const Property& property, Context& ctx) const;
    MapValue readMap(BufferReader& payload, const Property& property, Context& ctx) const;

    bool canDelimit(const TypeName& elementType) const;
    Value readElement(BufferReader& reader, const TypeName& elementType, Context& ctx) const;
    std::vector<Value> readElements(BufferReader& reader, const TypeName& elementType,
                                    int32_t count, Context& ctx) const;
    int32_t readCount(BufferReader& reader) const;
    static void dropFindingsSince(Context& ctx, size_t count);
    QByteArray readPadding(BufferReader& payload, const Property& property,
                           qsizetype payloadStart) const;

    const TypeRegistry& m_registry;
    DecodeOptions m_options;
};

} // namespace arkfix::codec
