/**
 * @file FString.cpp
 * @brief Stream string form selection and sizing
 */

#include "FString.hpp"

#include <QString>

namespace arkfix::codec {

FString::FString(const std::string& utf8)
    : text(utf8)
    , encoding(naturalEncoding(utf8))
{
}

FString::FString(const char* utf8)
    : FString(std::string(utf8 ? utf8 : ""))
{
}

FString::Encoding FString::naturalEncoding(const std::string& utf8) {
    if (utf8.empty()) {
        return Encoding::Null;
    }
    const QString decoded = QString::fromUtf8(utf8.data(), static_cast<qsizetype>(utf8.size()));
    for (const QChar ch : decoded) {
        if (ch.unicode() > 0xFF) {
            return Encoding::Utf16;
        }
    }
    return Encoding::Latin1;
}

int64_t FString::byteSize() const {
    switch (encoding) {
        case Encoding::Null:
            return 4;
        case Encoding::Latin1: {
            const QString decoded = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
            return 4 + decoded.size() + 1;
        }
        case Encoding::Utf16: {
            if (usesUnits()) {
                return 4 + (static_cast<int64_t>(units.size()) + 1) * 2;
            }
            const QString decoded = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
            return 4 + (decoded.size() + 1) * 2;
        }
    }
    return 4;
}

bool FString::usesUnits() const {
    if (encoding != Encoding::Utf16 || units.empty()) {
        return false;
    }
    const QString decoded = QString::fromUtf16(units.data(), static_cast<qsizetype>(units.size()));
    return decoded.toStdString() == text;
}

const char* encodingName(FString::Encoding encoding) {
    switch (encoding) {
        case FString::Encoding::Null:   return "null";
        case FString::Encoding::Latin1: return "latin1";
        case FString::Encoding::Utf16:  return "utf16";
    }
    return "null";
}

bool encodingFromName(const std::string& name, FString::Encoding& out) {
    if (name == "null") {
        out = FString::Encoding::Null;
    } else if (name == "latin1") {
        out = FString::Encoding::Latin1;
    } else if (name == "utf16") {
        out = FString::Encoding::Utf16;
    } else {
        return false;
    }
    return true;
}

} // namespace arkfix::codec
