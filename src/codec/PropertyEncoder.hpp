/**
 * @file PropertyEncoder.hpp
 * @brief Encoder for tagged property streams
 */

#pragma once

#include "BufferUtils.hpp"
#include "Property.hpp"
#include "TypeRegistry.hpp"

#include <QByteArray>

namespace arkfix::codec {

/**
 * @class PropertyEncoder
 * @brief Writes a Property tree back to its binary form
 *
 * Tag metadata is written exactly as stored on each node. Payload sizes
 * and element counts are computed from the values, so an edited tree
 * needs no manual bookkeeping. An unchanged decoded tree encodes to the
 * bytes it was decoded from.
 */
class PropertyEncoder {
public:
    explicit PropertyEncoder(const TypeRegistry& registry = TypeRegistry::builtin());

    /**
     * @brief Encode a property list followed by the None terminator
     *
     * @throws TypeMismatch if a value does not fit its declared type
     * @throws EncodeOverflow if a size or count exceeds its 32-bit field
     */
    QByteArray encode(const PropertyList& properties) const;

    /**
     * @brief Append a property list (without terminator) to a writer
     */
    void encodeList(BufferWriter& writer, const PropertyList& properties) const;

    /**
     * @brief Number of payload bytes the encoder writes for a property
     */
    int32_t payloadSize(const Property& property) const;

    /**
     * @brief Set every declared size in the tree to the encoded payload size
     */
    static void recalculateSizes(PropertyList& properties);

private:
    void writeProperty(BufferWriter& writer, const Property& property) const;
    void writeTypeName(BufferWriter& writer, const TypeName& type) const;
    void writePayload(BufferWriter& writer, const Property& property) const;
    void writeStruct(BufferWriter& writer, const StructValue& value) const;
    void writeArray(BufferWriter& writer, const Property& property, const ArrayValue& value) const;
    void writeSet(BufferWriter& writer, const Property& property, const SetValue& value) const;
    void writeMap(BufferWriter& writer, const Property& property, const MapValue& value) const;
    void writeText(BufferWriter& writer, const std::string& name, const TextValue& value) const;
    void writeElement(BufferWriter& writer, const TypeName& elementType, const Value& value,
                      const std::string& name) const;
    void writeElements(BufferWriter& writer, const TypeName& elementType,
                       const std::vector<Value>& values, const std::string& name) const;

    const TypeRegistry& m_registry;
};

} // namespace arkfix::codec
