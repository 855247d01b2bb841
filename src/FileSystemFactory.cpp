#include "BridgeConfig.hpp"
#include "FileSystems/ArchiveFileSystem.hpp"
#include "FileSystems/LocalFileSystem.hpp"
#include "FileSystems/MemoryFileSystem.hpp"
#include "FileSystems/SQLiteFileSystem.hpp"
#include <ctime>
#include <plog/Log.h>

std::shared_ptr<FileSystem> createFileSystem(const MountConfig &cfg, std::string *outError)
{
    if (cfg.type == "memory")
        return std::make_shared<MemoryFileSystem>(std::time(nullptr));

    if (cfg.type == "directory")
    {
        auto fs = std::make_shared<LocalFileSystem>(cfg.source);
        if (!fs->isOpen())
        {
            if (outError) *outError = "not a directory: " + cfg.source;
            return nullptr;
        }
        return fs;
    }

    if (cfg.type == "archive")
    {
        auto fs = std::make_shared<ArchiveFileSystem>(cfg.source);
        if (!fs->isOpen())
        {
            if (outError) *outError = fs->lastError();
            return nullptr;
        }
        return fs;
    }

    if (cfg.type == "sqlite")
    {
        auto fs = std::make_shared<TclBridge::SQLiteFileSystem>(cfg.source, true);
        if (!fs->isOpen())
        {
            if (outError) *outError = fs->lastError();
            return nullptr;
        }
        return fs;
    }

    PLOGW << "createFileSystem: unknown provider type " << cfg.type;
    if (outError) *outError = "unknown provider type \"" + cfg.type + "\"";
    return nullptr;
}
