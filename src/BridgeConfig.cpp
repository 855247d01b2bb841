#include "BridgeConfig.hpp"
#include "MountTable.hpp"
#include "TclFilesystem.hpp"
#include <cstdlib>
#include <fstream>
#include <plog/Log.h>
#include <sstream>

static bool knownType(const std::string &type)
{
    return type == "memory" || type == "directory" || type == "archive" || type == "sqlite";
}

std::optional<MountConfig> MountConfig::fromJSON(const nlohmann::json &j, std::string *outError)
{
    if (!j.is_object())
    {
        if (outError) *outError = "mount entry must be an object";
        return std::nullopt;
    }
    MountConfig m;
    m.point = j.value("point", "");
    m.type = j.value("type", "directory");
    m.source = j.value("source", "");
    if (m.point.empty())
    {
        if (outError) *outError = "mount entry without \"point\"";
        return std::nullopt;
    }
    if (!knownType(m.type))
    {
        if (outError) *outError = "unknown provider type \"" + m.type + "\" for " + m.point;
        return std::nullopt;
    }
    if (m.type != "memory" && m.source.empty())
    {
        if (outError) *outError = "mount entry " + m.point + " needs a \"source\"";
        return std::nullopt;
    }
    return m;
}

nlohmann::json MountConfig::toJSON() const
{
    return nlohmann::json{{"point", point}, {"type", type}, {"source", source}};
}

bool parseSeverity(const std::string &name, plog::Severity &out)
{
    static const std::pair<const char *, plog::Severity> names[] = {
        {"none", plog::none}, {"fatal", plog::fatal}, {"error", plog::error}, {"warning", plog::warning},
        {"info", plog::info}, {"debug", plog::debug}, {"verbose", plog::verbose},
    };
    for (const auto &n : names)
    {
        if (name == n.first)
        {
            out = n.second;
            return true;
        }
    }
    return false;
}

std::optional<BridgeConfig> BridgeConfig::parse(const std::string &text, std::string *outError)
{
    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error &ex)
    {
        if (outError) *outError = ex.what();
        return std::nullopt;
    }
    if (!j.is_object())
    {
        if (outError) *outError = "configuration must be a JSON object";
        return std::nullopt;
    }

    BridgeConfig cfg;
    try
    {
        if (j.contains("logging"))
        {
            const auto &l = j["logging"];
            std::string level = l.value("level", "info");
            if (!parseSeverity(level, cfg.logging.level))
            {
                if (outError) *outError = "unknown log level \"" + level + "\"";
                return std::nullopt;
            }
            cfg.logging.file = l.value("file", "");
        }
        if (j.contains("library"))
        {
            auto lib = MountConfig::fromJSON(j["library"], outError);
            if (!lib)
                return std::nullopt;
            cfg.library = std::move(*lib);
        }
        if (j.contains("mounts"))
        {
            if (!j["mounts"].is_array())
            {
                if (outError) *outError = "\"mounts\" must be an array";
                return std::nullopt;
            }
            for (const auto &entry : j["mounts"])
            {
                auto m = MountConfig::fromJSON(entry, outError);
                if (!m)
                    return std::nullopt;
                cfg.mounts.push_back(std::move(*m));
            }
        }
    }
    catch (const nlohmann::json::type_error &ex)
    {
        if (outError) *outError = ex.what();
        return std::nullopt;
    }
    return cfg;
}

std::optional<BridgeConfig> BridgeConfig::load(const std::string &path, std::string *outError)
{
    std::ifstream ifs(path);
    if (!ifs)
    {
        if (outError) *outError = "cannot read configuration " + path;
        return std::nullopt;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    auto cfg = parse(ss.str(), outError);
    if (!cfg && outError)
        *outError = path + ": " + *outError;
    return cfg;
}

std::optional<BridgeConfig> BridgeConfig::fromEnvironment(std::string *outError)
{
    const char *path = std::getenv("TCLBRIDGE_CONFIG");
    if (!path || !*path)
        return BridgeConfig{};
    return load(path, outError);
}

static bool mountEntry(const MountConfig &m, std::string *outError)
{
    std::string err;
    auto fs = createFileSystem(m, &err);
    if (!fs)
    {
        if (outError) *outError = m.point + ": " + err;
        return false;
    }
    BridgeResult r = mountFileSystem(m.point, std::move(fs));
    if (!r.ok)
    {
        if (outError) *outError = m.point + ": " + r.error;
        return false;
    }
    return true;
}

bool applyMounts(const BridgeConfig &cfg, std::string *outError)
{
    if (cfg.library)
    {
        if (!mountEntry(*cfg.library, outError))
            return false;
        if (!std::getenv("TCL_LIBRARY"))
        {
            std::string point = cleanPath(cfg.library->point);
            setenv("TCL_LIBRARY", point.c_str(), 1);
            PLOGI << "TCL_LIBRARY=" << point;
        }
    }
    for (const MountConfig &m : cfg.mounts)
    {
        if (!mountEntry(m, outError))
            return false;
    }
    return true;
}
