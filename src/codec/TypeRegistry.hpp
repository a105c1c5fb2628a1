/**
 * @file TypeRegistry.hpp
 * @brief Registry mapping type tags to wire shapes
 */

#pragma once

#include "PropertyType.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arkfix::codec {

/**
 * @struct TypeInfo
 * @brief Wire shape of one type tag
 */
struct TypeInfo {
    std::string typeTag;
    PropertyKind kind = PropertyKind::Unknown;
    int fixedSize = -1;         // payload width in bytes, -1 if variable
    bool composite = false;     // struct/array/set/map/text recurse or self-delimit

    bool isFixedSize() const { return fixedSize >= 0; }
};

/**
 * @class TypeRegistry
 * @brief Provides lookup from type tag to TypeInfo
 *
 * The built-in registry is populated once and never modified afterwards,
 * so it can be shared by concurrent decoders.
 *
 * Also knows the natively serialized struct types, whose payload is a
 * fixed binary layout rather than a tagged property list.
 */
class TypeRegistry {
public:
    TypeRegistry() = default;

    /**
     * @brief The registry of all type tags the codec understands
     */
    static const TypeRegistry& builtin();

    void registerType(const TypeInfo& info);
    void registerNativeStruct(const std::string& structName, int size);

    /**
     * @brief Find a type by tag
     * @return The type info, or nullptr if the tag is not registered
     */
    const TypeInfo* find(const std::string& typeTag) const;

    /**
     * @brief Find a type by tag
     * @param offset Byte offset of the tag, carried by the error
     * @throws UnknownType if the tag is not registered
     */
    const TypeInfo& lookup(const std::string& typeTag, int64_t offset) const;

    /**
     * @brief Kind for a tag, or PropertyKind::Unknown
     */
    PropertyKind kindOf(const std::string& typeTag) const;

    /**
     * @brief Element size of a natively serialized struct
     * @return The size, or nullopt for tagged structs
     */
    std::optional<int> nativeStructSize(const std::string& structName) const;

    bool isNativeStruct(const std::string& structName) const {
        return nativeStructSize(structName).has_value();
    }

    std::vector<std::string> typeTags() const;

    int count() const { return static_cast<int>(m_types.size()); }

private:
    std::map<std::string, TypeInfo> m_types;
    std::map<std::string, int> m_nativeStructs;
};

} // namespace arkfix::codec
