/**
 * ArkProfile Fixer - Inspect, edit and repair .arkprofile files
 *
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "codec/CodecErrors.hpp"
#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"
#include "profile/Profile.hpp"
#include "profile/ProfileFile.hpp"

namespace {

constexpr const char* DEFAULT_CLEAR_PATH = "MyArkData.ArkItems";
constexpr const char* TAMED_DINOS_PATH = "MyArkData.ArkTamedDinosData";

enum ExitCode {
    ExitSuccess = 0,
    ExitFailure = 1,    // command ran but found errors, or failed on the input
    ExitUsage = 2
};

spdlog::level::level_enum parseLevel(const std::string& name) {
    if (name == "debug") return spdlog::level::debug;
    if (name == "warning" || name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    return spdlog::level::info;
}

void setupLogging(const std::filesystem::path& configDir, spdlog::level::level_enum consoleLevel,
                  bool toFile) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(consoleLevel);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if (toFile) {
        auto logPath = arkfix::Platform::getLogPath(configDir) / "arkprofile-fixer.log";
        try {
            // Ensure log directory exists
            std::filesystem::create_directories(logPath.parent_path());
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(), 1024 * 1024 * 5, 3);
            file_sink->set_level(spdlog::level::debug);
            sinks.push_back(file_sink);
        } catch (const std::exception& e) {
            std::cerr << "Logging to file disabled: " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("arkfix", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
}

std::filesystem::path toPath(const QString& value) {
    return std::filesystem::path(value.toStdString());
}

void printFinding(const arkfix::codec::Finding& finding) {
    using arkfix::codec::Finding;
    std::cout << "  " << (finding.severity == Finding::Severity::Error ? "error" : "warning")
              << " [" << arkfix::codec::findingKindName(finding.kind) << "]";
    if (finding.offset >= 0) {
        std::cout << " @" << finding.offset;
    }
    if (!finding.path.empty()) {
        std::cout << " " << finding.path;
    }
    std::cout << ": " << finding.message << "\n";
}

int printReport(const arkfix::VerifyReport& report, bool verbose) {
    std::cout << report.path.string() << ": " << report.fileSize << " bytes, "
              << (report.decoded ? "decoded" : "not decoded") << ", round trip "
              << (report.roundTrips ? "ok" : "FAILED") << "\n";

    for (const auto& finding : report.findings) {
        if (verbose || finding.severity == arkfix::codec::Finding::Severity::Error) {
            printFinding(finding);
        }
    }
    if (!verbose && !report.findings.empty()) {
        std::cout << "  " << report.findings.size() << " finding(s), use --verbose for all\n";
    }
    return report.hasErrors() ? ExitFailure : ExitSuccess;
}

/**
 * Output path for build: "x.arkprofile.json" -> "x.arkprofile"
 */
std::filesystem::path defaultBuildOutput(const std::filesystem::path& input) {
    std::filesystem::path output = input;
    if (output.extension() == ".json") {
        output.replace_extension();
        if (output.has_extension()) {
            return output;
        }
    }
    return output.replace_extension(".arkprofile");
}

void writeJson(const nlohmann::json& document, const std::filesystem::path& path, int indent) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw arkfix::ProfileIoError("Failed to open " + path.string() + " for writing", path);
    }
    file << document.dump(indent) << "\n";
    if (!file) {
        throw arkfix::ProfileIoError("Failed to write " + path.string(), path);
    }
}

nlohmann::json readJson(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw arkfix::ProfileIoError("Failed to open " + path.string(), path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw arkfix::codec::MalformedData(
            "Invalid JSON in " + path.string() + ": " + e.what(), static_cast<int64_t>(e.byte));
    }
}

int runExtract(const QStringList& args, const QString& output, const QString& indentValue,
               const arkfix::ToolConfig& config) {
    if (args.size() != 1) {
        std::cerr << "extract expects exactly one profile\n";
        return ExitUsage;
    }

    int indent = config.jsonIndent;
    if (!indentValue.isEmpty()) {
        bool ok = false;
        indent = indentValue.toInt(&ok);
        if (!ok) {
            std::cerr << "Invalid --indent value: " << indentValue.toStdString() << "\n";
            return ExitUsage;
        }
    }

    arkfix::ProfileFile input(toPath(args.front()));
    std::filesystem::path outPath = output.isEmpty()
        ? std::filesystem::path(input.path().string() + ".json")
        : toPath(output);

    arkfix::Profile profile = input.open();
    writeJson(arkfix::profileToJson(profile), outPath, indent);

    spdlog::info("Extracted {} properties to {}", profile.properties.size(), outPath.string());
    return ExitSuccess;
}

int runBuild(const QStringList& args, const QString& output, const arkfix::ToolConfig& config) {
    if (args.size() != 1) {
        std::cerr << "build expects exactly one JSON document\n";
        return ExitUsage;
    }

    const std::filesystem::path inPath = toPath(args.front());
    arkfix::ProfileFile target(output.isEmpty() ? defaultBuildOutput(inPath) : toPath(output));

    arkfix::Profile profile = arkfix::profileFromJson(readJson(inPath));
    target.save(profile, config.createBackups);

    if (config.verifyAfterBuild) {
        return printReport(target.verify(), false);
    }
    return ExitSuccess;
}

int runVerify(const QStringList& args, bool verbose) {
    if (args.isEmpty()) {
        std::cerr << "verify expects at least one profile\n";
        return ExitUsage;
    }

    int result = ExitSuccess;
    for (const QString& arg : args) {
        if (printReport(arkfix::ProfileFile(toPath(arg)).verify(), verbose) != ExitSuccess) {
            result = ExitFailure;
        }
    }
    return result;
}

int runClear(const QStringList& args, QStringList paths, bool dinos, const QString& output,
             const arkfix::ToolConfig& config) {
    if (args.size() != 1) {
        std::cerr << "clear expects exactly one profile\n";
        return ExitUsage;
    }

    if (paths.isEmpty()) {
        paths << QString::fromLatin1(DEFAULT_CLEAR_PATH);
    }
    if (dinos && !paths.contains(QString::fromLatin1(TAMED_DINOS_PATH))) {
        paths << QString::fromLatin1(TAMED_DINOS_PATH);
    }

    arkfix::ProfileFile input(toPath(args.front()));
    arkfix::Profile profile = input.open();

    std::vector<std::string> targets;
    for (const QString& path : paths) {
        targets.push_back(path.toStdString());
    }
    try {
        for (const auto& cleared : arkfix::clearContainers(profile, targets)) {
            spdlog::info("Cleared {} ({} entries removed)", cleared.path, cleared.removed);
        }
    } catch (const arkfix::ProfileEditError& e) {
        spdlog::error("{}, nothing written", e.what());
        return ExitFailure;
    }

    arkfix::ProfileFile target(output.isEmpty() ? input.path() : toPath(output));
    target.save(profile, config.createBackups);

    if (config.verifyAfterBuild) {
        return printReport(target.verify(), false);
    }
    return ExitSuccess;
}

int runInfo(const QStringList& args) {
    if (args.size() != 1) {
        std::cerr << "info expects exactly one profile\n";
        return ExitUsage;
    }

    arkfix::ProfileFile input(toPath(args.front()));
    const arkfix::ProfileSummary summary = arkfix::summarize(input.open());

    std::cout << "File:          " << input.path().string() << "\n"
              << "Type:          " << summary.fileType << "\n"
              << "Player:        " << summary.playerName << "\n"
              << "Map:           " << summary.mapName << "\n"
              << "Properties:    " << summary.propertyCount << "\n"
              << "Ark items:     " << summary.arkItemCount << "\n"
              << "Tamed dinos:   " << summary.tamedDinoCount << "\n"
              << "Achievements:  " << summary.achievementCount << "\n"
              << "Trailer bytes: " << summary.trailerSize << "\n";
    return ExitSuccess;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("arkprofile-fixer");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("arkprofile-fixer");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Inspect, edit and repair ARK .arkprofile files\n\n"
        "Commands:\n"
        "  extract <profile>        Write the profile as JSON\n"
        "  build <json>             Write a profile from JSON\n"
        "  verify <profile>...      Check that profiles decode and re-encode exactly\n"
        "  clear <profile>          Empty container properties (default MyArkData.ArkItems)\n"
        "  info <profile>           Show a short summary");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "extract, build, verify, clear or info");
    parser.addPositionalArgument("files", "Input files", "<file>...");

    QCommandLineOption configDirOption(
        QStringList() << "c" << "config-directory",
        "Configuration directory path",
        "path"
    );
    parser.addOption(configDirOption);

    QCommandLineOption outputOption(
        QStringList() << "o" << "output",
        "Output file",
        "file"
    );
    parser.addOption(outputOption);

    QCommandLineOption indentOption(
        "indent",
        "JSON indentation for extract (-1 for compact)",
        "spaces"
    );
    parser.addOption(indentOption);

    QCommandLineOption pathOption(
        "path",
        "Dotted property path to clear (repeatable)",
        "path"
    );
    parser.addOption(pathOption);

    QCommandLineOption dinosOption(
        "dinos",
        "Also clear MyArkData.ArkTamedDinosData"
    );
    parser.addOption(dinosOption);

    QCommandLineOption verboseOption(
        QStringList() << "v" << "verbose",
        "Debug logging and all findings"
    );
    parser.addOption(verboseOption);

    parser.process(app);

    // Initialize configuration
    std::filesystem::path configPath;
    if (parser.isSet(configDirOption)) {
        configPath = parser.value(configDirOption).toStdString();
    } else {
        configPath = arkfix::Platform::getConfigPath();
    }

    auto& configManager = arkfix::ConfigManager::instance();
    const bool configReady = configManager.initialize(configPath);
    const arkfix::ToolConfig config = configManager.toolConfig();

    const bool verbose = parser.isSet(verboseOption);
    setupLogging(configPath, verbose ? spdlog::level::debug : parseLevel(config.logVerbosity),
                 configReady && config.logToFile);

    if (!configReady) {
        spdlog::warn("Configuration directory unavailable, using defaults");
    } else if (configManager.isFirstRun()) {
        spdlog::info("First run, writing default configuration to {}",
                     configManager.configFile().string());
        configManager.save();
    }

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(ExitUsage);
    }
    const QString command = args.takeFirst();

    try {
        if (command == "extract") {
            return runExtract(args, parser.value(outputOption), parser.value(indentOption), config);
        }
        if (command == "build") {
            return runBuild(args, parser.value(outputOption), config);
        }
        if (command == "verify") {
            return runVerify(args, verbose);
        }
        if (command == "clear") {
            return runClear(args, parser.values(pathOption), parser.isSet(dinosOption),
                            parser.value(outputOption), config);
        }
        if (command == "info") {
            return runInfo(args);
        }
    } catch (const arkfix::codec::CodecError& e) {
        spdlog::error("{} (offset {})", e.what(), e.offset());
        return ExitFailure;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return ExitFailure;
    }

    std::cerr << "Unknown command: " << command.toStdString() << "\n";
    return ExitUsage;
}
