/**
 * @file FString.hpp
 * @brief Length-prefixed engine string as stored in property streams
 */

#pragma once

#include <cstdint>
#include <string>

namespace arkfix::codec {

/**
 * @struct FString
 * @brief A stream string together with the on-disk form it was read in
 *
 * Wire layout: int32 length, then the characters including a terminator.
 * - length == 0: null string, no characters follow
 * - length > 0: Latin-1 bytes, last one is NUL
 * - length < 0: UTF-16LE code units, last one is NUL
 *
 * The text is always held as UTF-8. The encoding is kept so that an
 * empty-but-terminated string or a wide string re-encodes exactly.
 * A wide string that is not valid UTF-16 (lone surrogates) also keeps its
 * code units, since its UTF-8 text is lossy.
 */
struct FString {
    enum class Encoding : uint8_t {
        Null,
        Latin1,
        Utf16
    };

    std::string text;
    Encoding encoding = Encoding::Null;
    std::u16string units;   // verbatim code units, empty unless text is lossy

    FString() = default;

    /**
     * @brief Build a string in its natural form (null if empty, Latin-1 if
     *        representable, UTF-16 otherwise)
     */
    FString(const std::string& utf8);
    FString(const char* utf8);

    FString(const std::string& utf8, Encoding enc)
        : text(utf8)
        , encoding(enc)
    {}

    /**
     * @brief The form a freshly typed string of this text would take
     */
    static Encoding naturalEncoding(const std::string& utf8);

    bool isNatural() const { return encoding == naturalEncoding(text) && units.empty(); }
    bool isNull() const { return encoding == Encoding::Null; }

    /**
     * @brief Number of bytes this string occupies in a stream
     */
    int64_t byteSize() const;

    /**
     * @brief True while the stored code units still decode to text
     *
     * Editing text drops the verbatim units from the encoded form.
     */
    bool usesUnits() const;

    bool operator==(const FString& other) const {
        return text == other.text && encoding == other.encoding && units == other.units;
    }
    bool operator!=(const FString& other) const { return !(*this == other); }
    bool operator==(const char* other) const { return text == other; }
    bool operator==(const std::string& other) const { return text == other; }
};

const char* encodingName(FString::Encoding encoding);
bool encodingFromName(const std::string& name, FString::Encoding& out);

} // namespace arkfix::codec
