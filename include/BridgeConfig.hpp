// BridgeConfig.hpp - JSON configuration for mounts and logging
#pragma once
#include "FileSystem.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <plog/Severity.h>
#include <string>
#include <vector>

struct MountConfig
{
    std::string point;
    std::string type = "directory"; // memory, directory, archive, sqlite
    std::string source;

    static std::optional<MountConfig> fromJSON(const nlohmann::json &j, std::string *outError = nullptr);
    nlohmann::json toJSON() const;
};

struct LoggingConfig
{
    plog::Severity level = plog::info;
    std::string file; // empty: console only
};

struct BridgeConfig
{
    LoggingConfig logging;
    std::optional<MountConfig> library;
    std::vector<MountConfig> mounts;

    static std::optional<BridgeConfig> parse(const std::string &text, std::string *outError = nullptr);
    static std::optional<BridgeConfig> load(const std::string &path, std::string *outError = nullptr);

    // Reads the file named by TCLBRIDGE_CONFIG. Unset means defaults.
    static std::optional<BridgeConfig> fromEnvironment(std::string *outError = nullptr);
};

// "none", "fatal", "error", "warning", "info", "debug", "verbose"
bool parseSeverity(const std::string &name, plog::Severity &out);

// Builds the provider a mount entry describes; nullptr with outError set when
// the type is unknown or the provider cannot be opened.
std::shared_ptr<FileSystem> createFileSystem(const MountConfig &cfg, std::string *outError = nullptr);

// Mounts the library entry (exporting TCL_LIBRARY unless already set) and then
// every mount entry in order. Stops at the first failure.
bool applyMounts(const BridgeConfig &cfg, std::string *outError = nullptr);
