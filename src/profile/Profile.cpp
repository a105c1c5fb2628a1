/**
 * ArkProfile Fixer - Profile envelope implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Profile.hpp"

#include "codec/BufferUtils.hpp"
#include "codec/CodecErrors.hpp"
#include "codec/JsonConverter.hpp"
#include "codec/PropertyEncoder.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace arkfix {

using codec::BufferReader;
using codec::BufferWriter;
using codec::JsonConverter;
using json = nlohmann::json;

// Property paths used by the summary
constexpr const char* PATH_ARK_ITEMS = "MyArkData.ArkItems";
constexpr const char* PATH_TAMED_DINOS = "MyArkData.ArkTamedDinosData";
constexpr const char* PATH_ACHIEVEMENTS = "UnlockedAchievements";

namespace {

ProfileHeader readHeader(BufferReader& reader) {
    ProfileHeader header;
    header.headerV1 = reader.readInt32();
    header.headerV2 = reader.readInt32();
    header.headerV3 = reader.readInt32();

    const qsizetype versionOffset = reader.offset();
    header.version = reader.readInt32();
    if (header.version != PROFILE_FORMAT_VERSION) {
        throw codec::MalformedData(
            fmt::format("Unexpected profile version {} (expected {})", header.version, PROFILE_FORMAT_VERSION),
            versionOffset);
    }

    header.guid = reader.readBytes(16);
    header.fileType = reader.readString();
    header.reserved0 = reader.readInt32();
    header.reserved1 = reader.readInt32();
    header.name = reader.readString();
    header.controller = reader.readString();
    header.gameMode = reader.readString();
    header.mapName = reader.readString();
    header.mapPath = reader.readString();
    header.reservedBytes = reader.readBytes(12);
    header.headerSize = reader.readInt32();
    header.reserved2 = reader.readInt32();
    header.separator = reader.readUInt8();
    return header;
}

void writeHeader(BufferWriter& writer, const ProfileHeader& header) {
    if (header.guid.size() != 16) {
        throw codec::TypeMismatch("header.guid", "16 bytes", fmt::format("{} bytes", header.guid.size()));
    }
    if (header.reservedBytes.size() != 12) {
        throw codec::TypeMismatch("header.reserved_bytes", "12 bytes",
                                  fmt::format("{} bytes", header.reservedBytes.size()));
    }

    writer.writeInt32(header.headerV1);
    writer.writeInt32(header.headerV2);
    writer.writeInt32(header.headerV3);
    writer.writeInt32(header.version);
    writer.writeBytes(header.guid);
    writer.writeString(header.fileType);
    writer.writeInt32(header.reserved0);
    writer.writeInt32(header.reserved1);
    writer.writeString(header.name);
    writer.writeString(header.controller);
    writer.writeString(header.gameMode);
    writer.writeString(header.mapName);
    writer.writeString(header.mapPath);
    writer.writeBytes(header.reservedBytes);
    writer.writeInt32(header.headerSize);
    writer.writeInt32(header.reserved2);
    writer.writeUInt8(header.separator);
}

json headerToJson(const ProfileHeader& header) {
    return {
        {"header_v1", header.headerV1},
        {"header_v2", header.headerV2},
        {"header_v3", header.headerV3},
        {"version", header.version},
        {"guid", JsonConverter::bytesToHex(header.guid)},
        {"file_type", JsonConverter::stringToJson(header.fileType)},
        {"_reserved0", header.reserved0},
        {"_reserved1", header.reserved1},
        {"name", JsonConverter::stringToJson(header.name)},
        {"controller", JsonConverter::stringToJson(header.controller)},
        {"game_mode", JsonConverter::stringToJson(header.gameMode)},
        {"map_name", JsonConverter::stringToJson(header.mapName)},
        {"map_path", JsonConverter::stringToJson(header.mapPath)},
        {"_reserved_bytes", JsonConverter::bytesToHex(header.reservedBytes)},
        {"header_size", header.headerSize},
        {"_reserved2", header.reserved2},
        {"_separator", header.separator},
    };
}

ProfileHeader headerFromJson(const json& j) {
    ProfileHeader header;
    header.headerV1 = j.value("header_v1", header.headerV1);
    header.headerV2 = j.value("header_v2", header.headerV2);
    header.headerV3 = j.value("header_v3", header.headerV3);
    header.version = j.value("version", header.version);
    if (j.contains("guid")) {
        header.guid = JsonConverter::bytesFromHex(j.at("guid").get<std::string>());
    }
    if (j.contains("file_type")) {
        header.fileType = JsonConverter::stringFromJson(j.at("file_type"));
    }
    header.reserved0 = j.value("_reserved0", header.reserved0);
    header.reserved1 = j.value("_reserved1", header.reserved1);
    if (j.contains("name")) {
        header.name = JsonConverter::stringFromJson(j.at("name"));
    }
    if (j.contains("controller")) {
        header.controller = JsonConverter::stringFromJson(j.at("controller"));
    }
    if (j.contains("game_mode")) {
        header.gameMode = JsonConverter::stringFromJson(j.at("game_mode"));
    }
    if (j.contains("map_name")) {
        header.mapName = JsonConverter::stringFromJson(j.at("map_name"));
    }
    if (j.contains("map_path")) {
        header.mapPath = JsonConverter::stringFromJson(j.at("map_path"));
    }
    if (j.contains("_reserved_bytes")) {
        header.reservedBytes = JsonConverter::bytesFromHex(j.at("_reserved_bytes").get<std::string>());
    }
    header.headerSize = j.value("header_size", header.headerSize);
    header.reserved2 = j.value("_reserved2", header.reserved2);
    header.separator = static_cast<uint8_t>(j.value("_separator", 0));

    if (header.guid.size() != 16) {
        throw codec::MalformedData("Profile guid must be 16 bytes", -1);
    }
    return header;
}

} // anonymous namespace

bool operator==(const ProfileHeader& a, const ProfileHeader& b) {
    return a.headerV1 == b.headerV1
        && a.headerV2 == b.headerV2
        && a.headerV3 == b.headerV3
        && a.version == b.version
        && a.guid == b.guid
        && a.fileType == b.fileType
        && a.reserved0 == b.reserved0
        && a.reserved1 == b.reserved1
        && a.name == b.name
        && a.controller == b.controller
        && a.gameMode == b.gameMode
        && a.mapName == b.mapName
        && a.mapPath == b.mapPath
        && a.reservedBytes == b.reservedBytes
        && a.headerSize == b.headerSize
        && a.reserved2 == b.reserved2
        && a.separator == b.separator;
}

bool operator==(const Profile& a, const Profile& b) {
    return a.header == b.header && a.properties == b.properties && a.trailer == b.trailer;
}

codec::Property* Profile::find(const std::string& path) {
    return codec::findProperty(properties, path);
}

const codec::Property* Profile::find(const std::string& path) const {
    return codec::findProperty(properties, path);
}

ProfileDecodeResult decodeProfile(const QByteArray& data, codec::DecodeOptions options) {
    BufferReader reader(data);

    ProfileDecodeResult result;
    result.profile.header = readHeader(reader);
    spdlog::debug("Profile header: type '{}', player '{}', map '{}', properties at {}",
                  result.profile.header.fileType.text, result.profile.header.name.text,
                  result.profile.header.mapName.text, reader.offset());

    codec::PropertyDecoder decoder(codec::TypeRegistry::builtin(), options);
    codec::DecodeResult decoded = decoder.decode(data, reader.offset());

    result.profile.properties = std::move(decoded.properties);
    result.findings = std::move(decoded.findings);
    result.profile.trailer = data.mid(decoded.endOffset);

    if (result.profile.trailer.size() != PROFILE_TRAILER_SIZE) {
        spdlog::warn("Profile has {} trailing bytes (expected {})",
                     result.profile.trailer.size(), PROFILE_TRAILER_SIZE);
    }
    return result;
}

QByteArray encodeProfile(const Profile& profile) {
    BufferWriter writer;
    writeHeader(writer, profile.header);
    writer.writeBytes(codec::PropertyEncoder().encode(profile.properties));
    writer.writeBytes(profile.trailer);
    return writer.take();
}

QByteArray defaultTrailer(const ProfileHeader& header) {
    BufferWriter writer;
    writer.writeInt32(0);
    writer.writeBytes(header.guid);
    return writer.take();
}

json profileToJson(const Profile& profile) {
    JsonConverter converter;
    return {
        {"header", headerToJson(profile.header)},
        {"properties", converter.toJson(profile.properties)},
        {"trailer", JsonConverter::bytesToHex(profile.trailer)},
    };
}

Profile profileFromJson(const json& j) {
    try {
        if (!j.is_object() || !j.contains("properties")) {
            throw codec::MalformedData("Profile document needs a 'properties' list", -1);
        }

        Profile profile;
        if (j.contains("header")) {
            profile.header = headerFromJson(j.at("header"));
        }
        profile.properties = JsonConverter().listFromJson(j.at("properties"));
        if (j.contains("trailer")) {
            profile.trailer = JsonConverter::bytesFromHex(j.at("trailer").get<std::string>());
        } else {
            profile.trailer = defaultTrailer(profile.header);
        }
        return profile;
    } catch (const json::exception& e) {
        throw codec::MalformedData(fmt::format("Invalid profile document: {}", e.what()), -1);
    }
}

ProfileSummary summarize(const Profile& profile) {
    ProfileSummary summary;
    summary.playerName = profile.header.name.text;
    summary.mapName = profile.header.mapName.text;
    summary.fileType = profile.header.fileType.text;
    summary.propertyCount = profile.properties.size();
    summary.trailerSize = profile.trailer.size();

    if (const auto* items = profile.find(PATH_ARK_ITEMS)) {
        summary.arkItemCount = codec::containerSize(*items);
    }
    if (const auto* dinos = profile.find(PATH_TAMED_DINOS)) {
        summary.tamedDinoCount = codec::containerSize(*dinos);
    }
    if (const auto* achievements = profile.find(PATH_ACHIEVEMENTS)) {
        summary.achievementCount = codec::containerSize(*achievements);
    }
    return summary;
}

std::vector<ClearedContainer> clearContainers(Profile& profile, const std::vector<std::string>& paths) {
    std::vector<codec::Property*> targets;
    for (const auto& path : paths) {
        codec::Property* property = profile.find(path);
        if (!property) {
            throw ProfileEditError(path, fmt::format("No property at {}", path));
        }
        const codec::Value& value = property->value;
        if (!value.is<codec::ArrayValue>() && !value.is<codec::SetValue>() && !value.is<codec::MapValue>()) {
            throw ProfileEditError(path, fmt::format("{} is a {}, not a container",
                                                     path, codec::describeShape(value)));
        }
        targets.push_back(property);
    }

    std::vector<ClearedContainer> cleared;
    for (size_t i = 0; i < targets.size(); ++i) {
        ClearedContainer entry;
        entry.path = paths[i];
        entry.removed = codec::containerSize(*targets[i]);
        codec::clearContainer(*targets[i]);
        cleared.push_back(std::move(entry));
    }
    return cleared;
}

} // namespace arkfix
