/**
 * @file JsonConverter.hpp
 * @brief Lossless conversion between Property trees and JSON
 *
 * Layout of one property:
 *
 *   {
 *     "name": "ArkItems",
 *     "type": "ArrayProperty",
 *     "_type_params": [{"name": "StructProperty", "params": [...]}],
 *     "_size": 1234,
 *     "_flags": 0,
 *     "value": [...]
 *   }
 *
 * Keys starting with '_' carry layout metadata that the binary form needs
 * but an editor usually does not care about. Strings stored in a form other
 * than their natural one are written as {"_text", "_encoding"}; payloads
 * the decoder kept opaque are written as {"_raw": "<hex>"}.
 */

#pragma once

#include "Property.hpp"
#include "TypeRegistry.hpp"

#include <QByteArray>
#include <nlohmann/json.hpp>

#include <string>

namespace arkfix::codec {

class JsonConverter {
public:
    explicit JsonConverter(const TypeRegistry& registry = TypeRegistry::builtin());

    nlohmann::json toJson(const PropertyList& properties) const;
    nlohmann::json toJson(const Property& property) const;

    /**
     * @brief Rebuild a property list; values are interpreted by the
     *        declared type of each property
     * @throws MalformedData if the document does not describe a valid tree
     */
    PropertyList listFromJson(const nlohmann::json& json) const;
    Property propertyFromJson(const nlohmann::json& json) const;

    static nlohmann::json stringToJson(const FString& value);
    static FString stringFromJson(const nlohmann::json& json);

    static std::string bytesToHex(const QByteArray& bytes);

    /**
     * @throws MalformedData on odd length or non-hex characters
     */
    static QByteArray bytesFromHex(const std::string& hex);

private:
    nlohmann::json valueToJson(const Value& value, nlohmann::json* node) const;
    nlohmann::json structToJson(const StructValue& value, nlohmann::json* node) const;

    Value valueFromJson(const TypeName& type, const nlohmann::json& json,
                        const nlohmann::json* node, const std::string& name) const;
    StructValue structFromJson(const nlohmann::json& json, const nlohmann::json* node) const;
    TextValue textFromJson(const nlohmann::json& json) const;
    std::vector<Value> elementsFromJson(const TypeName* elementType, const nlohmann::json& json,
                                        const std::string& name) const;

    PropertyList readList(const nlohmann::json& json) const;
    Property readProperty(const nlohmann::json& json) const;

    const TypeRegistry& m_registry;
};

} // namespace arkfix::codec
