/**
 * ArkProfile Fixer - Profile file access implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ProfileFile.hpp"

#include "codec/CodecErrors.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <QFile>
#include <QSaveFile>

#include <algorithm>

namespace arkfix {

using codec::Finding;

namespace {

Finding makeFinding(Finding::Kind kind, Finding::Severity severity, int64_t offset,
                    const std::string& message) {
    Finding finding;
    finding.kind = kind;
    finding.severity = severity;
    finding.offset = offset;
    finding.message = message;
    return finding;
}

} // anonymous namespace

qsizetype firstDifference(const QByteArray& a, const QByteArray& b) {
    const qsizetype common = std::min(a.size(), b.size());
    for (qsizetype i = 0; i < common; ++i) {
        if (a[i] != b[i]) {
            return i;
        }
    }
    return a.size() == b.size() ? -1 : common;
}

bool VerifyReport::hasErrors() const {
    if (!decoded) {
        return true;
    }
    return std::any_of(findings.begin(), findings.end(), [](const Finding& f) {
        return f.severity == Finding::Severity::Error;
    });
}

ProfileFile::ProfileFile(const std::filesystem::path& path)
    : m_path(path)
{
}

std::filesystem::path ProfileFile::backupPath() const {
    std::filesystem::path backup = m_path;
    backup += ".bak";
    return backup;
}

QByteArray ProfileFile::readAll() const {
    QFile file(QString::fromStdString(m_path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        throw ProfileIoError(fmt::format("Failed to open {}: {}", m_path.string(),
                                         file.errorString().toStdString()), m_path);
    }
    QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        throw ProfileIoError(fmt::format("Failed to read {}: {}", m_path.string(),
                                         file.errorString().toStdString()), m_path);
    }
    return data;
}

void ProfileFile::writeAll(const QByteArray& data) const {
    // QSaveFile replaces the target only once everything is written
    QSaveFile file(QString::fromStdString(m_path.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        throw ProfileIoError(fmt::format("Failed to open {} for writing: {}", m_path.string(),
                                         file.errorString().toStdString()), m_path);
    }
    if (file.write(data) != data.size() || !file.commit()) {
        throw ProfileIoError(fmt::format("Failed to write {}: {}", m_path.string(),
                                         file.errorString().toStdString()), m_path);
    }
}

Profile ProfileFile::open() const {
    const QByteArray data = readAll();
    ProfileDecodeResult result = decodeProfile(data);

    spdlog::info("Opened {} ({} bytes, {} top-level properties)",
                 m_path.filename().string(), data.size(), result.profile.properties.size());
    return std::move(result.profile);
}

void ProfileFile::save(const Profile& profile, bool createBackup) const {
    const QByteArray data = encodeProfile(profile);

    if (createBackup && std::filesystem::exists(m_path)) {
        std::error_code ec;
        std::filesystem::copy_file(m_path, backupPath(),
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            throw ProfileIoError(fmt::format("Failed to create backup {}: {}",
                                             backupPath().string(), ec.message()), m_path);
        }
        spdlog::info("Backup written to {}", backupPath().string());
    }

    writeAll(data);
    spdlog::info("Saved {} ({} bytes)", m_path.filename().string(), data.size());
}

VerifyReport ProfileFile::verify() const {
    VerifyReport report;
    report.path = m_path;

    const QByteArray data = readAll();
    report.fileSize = data.size();

    ProfileDecodeResult result;
    try {
        result = decodeProfile(data, codec::DecodeOptions{true});
    } catch (const codec::TruncatedInput& e) {
        report.findings.push_back(makeFinding(Finding::Kind::TruncatedInput, Finding::Severity::Error,
                                              e.offset(), e.what()));
        return report;
    } catch (const codec::CodecError& e) {
        report.findings.push_back(makeFinding(Finding::Kind::MalformedData, Finding::Severity::Error,
                                              e.offset(), e.what()));
        return report;
    }

    report.decoded = true;
    report.findings = std::move(result.findings);
    report.trailerSize = result.profile.trailer.size();

    if (report.trailerSize != PROFILE_TRAILER_SIZE) {
        Finding finding = makeFinding(
            Finding::Kind::TrailingData, Finding::Severity::Warning, data.size() - report.trailerSize,
            fmt::format("{} trailing bytes after the property list (expected {})",
                        report.trailerSize, PROFILE_TRAILER_SIZE));
        finding.declared = PROFILE_TRAILER_SIZE;
        finding.actual = report.trailerSize;
        report.findings.push_back(std::move(finding));
    }

    try {
        const QByteArray encoded = encodeProfile(result.profile);
        const qsizetype diff = firstDifference(data, encoded);
        report.roundTrips = diff < 0;
        if (!report.roundTrips) {
            report.findings.push_back(makeFinding(
                Finding::Kind::MalformedData, Finding::Severity::Error, diff,
                fmt::format("Re-encoded profile differs from the file at offset {}", diff)));
        }
    } catch (const codec::CodecError& e) {
        report.findings.push_back(makeFinding(Finding::Kind::MalformedData, Finding::Severity::Error,
                                              e.offset(), fmt::format("Re-encoding failed: {}", e.what())));
    }

    spdlog::info("Verified {}: {} findings, round trip {}", m_path.filename().string(),
                 report.findings.size(), report.roundTrips ? "ok" : "failed");
    return report;
}

} // namespace arkfix
