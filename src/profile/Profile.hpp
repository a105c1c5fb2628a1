/**
 * ArkProfile Fixer - Profile envelope
 *
 * A .arkprofile file is a fixed header, one None-terminated property
 * list and a few trailing bytes. Every header field is kept, including
 * the ones that are always zero, so the envelope re-encodes exactly.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "codec/FString.hpp"
#include "codec/Property.hpp"
#include "codec/PropertyDecoder.hpp"

#include <QByteArray>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace arkfix {

constexpr int32_t PROFILE_FORMAT_VERSION = 1;
constexpr qsizetype PROFILE_TRAILER_SIZE = 20;     // int32 + guid

/**
 * Header preceding the property list
 */
struct ProfileHeader {
    int32_t headerV1 = 0;
    int32_t headerV2 = 0;
    int32_t headerV3 = 0;
    int32_t version = PROFILE_FORMAT_VERSION;
    QByteArray guid = QByteArray(16, '\0');
    codec::FString fileType;
    int32_t reserved0 = 0;      // observed 0
    int32_t reserved1 = 5;      // observed 5
    codec::FString name;
    codec::FString controller;
    codec::FString gameMode = codec::FString("PersistentLevel");
    codec::FString mapName;
    codec::FString mapPath;
    QByteArray reservedBytes = QByteArray(12, '\0');
    int32_t headerSize = 0;
    int32_t reserved2 = 0;      // observed 0
    uint8_t separator = 0;
};

bool operator==(const ProfileHeader& a, const ProfileHeader& b);

/**
 * Decoded profile: header, top-level properties, trailing bytes
 */
struct Profile {
    ProfileHeader header;
    codec::PropertyList properties;
    QByteArray trailer;

    /**
     * Find a property by dotted path ("MyArkData.ArkItems")
     */
    codec::Property* find(const std::string& path);
    const codec::Property* find(const std::string& path) const;
};

bool operator==(const Profile& a, const Profile& b);

struct ProfileDecodeResult {
    Profile profile;
    std::vector<codec::Finding> findings;
};

/**
 * Decode a complete profile file
 * @throws MalformedData if the envelope version is not 1
 * @throws TruncatedInput, SizeMismatch as for PropertyDecoder::decode
 */
ProfileDecodeResult decodeProfile(const QByteArray& data, codec::DecodeOptions options = {});

/**
 * Encode a profile; property sizes are computed from the values
 */
QByteArray encodeProfile(const Profile& profile);

/**
 * Trailer written when none is known: int32 zero followed by the header guid
 */
QByteArray defaultTrailer(const ProfileHeader& header);

nlohmann::json profileToJson(const Profile& profile);

/**
 * @throws MalformedData if the document is not a profile
 */
Profile profileFromJson(const nlohmann::json& json);

/**
 * Counts and names shown by the info command
 */
struct ProfileSummary {
    std::string playerName;
    std::string mapName;
    std::string fileType;
    size_t propertyCount = 0;
    size_t arkItemCount = 0;
    size_t tamedDinoCount = 0;
    size_t achievementCount = 0;
    qsizetype trailerSize = 0;
};

ProfileSummary summarize(const Profile& profile);

/**
 * Error for an edit that names a missing or unsuitable property
 */
class ProfileEditError : public std::runtime_error {
public:
    ProfileEditError(const std::string& path, const std::string& message)
        : std::runtime_error(message)
        , m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

struct ClearedContainer {
    std::string path;
    size_t removed = 0;
};

/**
 * Empty the array, set or map properties at the given dotted paths
 *
 * Every path is resolved before the first one is cleared, so a failed
 * call leaves the profile untouched.
 * @throws ProfileEditError if a path is missing or not a container
 */
std::vector<ClearedContainer> clearContainers(Profile& profile, const std::vector<std::string>& paths);

} // namespace arkfix
