/**
 * ArkProfile Fixer - Profile file access
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include "Profile.hpp"

#include <QByteArray>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace arkfix {

/**
 * Failure to read or write a profile file
 */
class ProfileIoError : public std::runtime_error {
public:
    ProfileIoError(const std::string& message, const std::filesystem::path& path)
        : std::runtime_error(message)
        , m_path(path) {}

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

/**
 * Result of verifying one profile file
 */
struct VerifyReport {
    std::filesystem::path path;
    qsizetype fileSize = 0;
    bool decoded = false;       // property list read up to its terminator
    bool roundTrips = false;    // re-encoding reproduces the file
    qsizetype trailerSize = 0;
    std::vector<codec::Finding> findings;

    bool hasErrors() const;
};

/**
 * Reads, writes and verifies .arkprofile files
 *
 * File handles are opened per call and closed before it returns.
 */
/**
 * First offset at which two buffers differ, or -1 if identical
 */
qsizetype firstDifference(const QByteArray& a, const QByteArray& b);

class ProfileFile {
public:
    explicit ProfileFile(const std::filesystem::path& path);

    const std::filesystem::path& path() const { return m_path; }

    /**
     * Read and decode the file
     * @throws ProfileIoError if the file cannot be read
     * @throws codec::CodecError if the contents are not a valid profile
     */
    Profile open() const;

    /**
     * Encode and write a profile
     * @param createBackup Copy an existing file to <path>.bak first
     * @throws ProfileIoError if the file cannot be written
     */
    void save(const Profile& profile, bool createBackup = false) const;

    /**
     * Decode in recovering mode and report every problem found
     *
     * Format problems end up in the report; only I/O failures throw.
     */
    VerifyReport verify() const;

    /**
     * Path of the backup written by save()
     */
    std::filesystem::path backupPath() const;

    QByteArray readAll() const;
    void writeAll(const QByteArray& data) const;

private:
    std::filesystem::path m_path;
};

} // namespace arkfix
