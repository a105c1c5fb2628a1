/**
 * Round-trip check for .arkprofile files
 *
 * Decodes each file strictly, re-encodes it and reports the first byte
 * where the output differs from the input.
 */

#include "codec/CodecErrors.hpp"
#include "profile/Profile.hpp"
#include "profile/ProfileFile.hpp"

#include <QCoreApplication>
#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>

namespace {

bool checkFile(const std::filesystem::path& path) {
    arkfix::ProfileFile file(path);
    const QByteArray original = file.readAll();

    arkfix::ProfileDecodeResult decoded = arkfix::decodeProfile(original);
    const QByteArray encoded = arkfix::encodeProfile(decoded.profile);

    const qsizetype diff = arkfix::firstDifference(original, encoded);
    std::cout << std::left << std::setw(40) << path.filename().string()
              << std::setw(12) << original.size();
    if (diff < 0) {
        std::cout << "identical (" << decoded.profile.properties.size() << " properties)\n";
        return true;
    }

    std::cout << "differs at offset " << diff << " (0x" << std::hex << diff << std::dec
              << "), re-encoded " << encoded.size() << " bytes\n";
    return false;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    spdlog::set_level(spdlog::level::warn);

    if (argc < 2) {
        std::cout << "Usage: roundtrip_check <profile>...\n";
        std::cout << "Example: roundtrip_check LocalPlayer.arkprofile 12345.arkprofile\n";
        return 1;
    }

    std::cout << std::left << std::setw(40) << "File" << std::setw(12) << "Bytes" << "Result\n";
    std::cout << std::string(80, '-') << "\n";

    int failures = 0;
    for (int i = 1; i < argc; ++i) {
        const std::filesystem::path path = argv[i];
        try {
            if (!checkFile(path)) {
                ++failures;
            }
        } catch (const arkfix::codec::CodecError& e) {
            std::cout << std::left << std::setw(52) << path.filename().string()
                      << "error at offset " << e.offset() << ": " << e.what() << "\n";
            ++failures;
        } catch (const std::exception& e) {
            std::cout << std::left << std::setw(52) << path.filename().string()
                      << "error: " << e.what() << "\n";
            ++failures;
        }
    }

    std::cout << std::string(80, '-') << "\n";
    std::cout << (argc - 1 - failures) << " of " << (argc - 1) << " files round-trip\n";
    return failures == 0 ? 0 : 1;
}
