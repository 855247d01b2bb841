// tclbridgesh - tclsh with configurable virtual mounts
#include "BridgeConfig.hpp"
#include "BridgeState.hpp"
#include "FileSystems/LocalFileSystem.hpp"
#include "TclFilesystem.hpp"
#include "TclInterp.hpp"
#include <cstdio>
#include <cstring>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <string>
#include <vector>

static void usage(const char *argv0)
{
    std::fprintf(stderr,
                 "usage: %s [--config FILE] [--mount POINT=DIR]... [--log-level LEVEL] [script [arg ...]]\n"
                 "  --config FILE       JSON configuration (default: $TCLBRIDGE_CONFIG)\n"
                 "  --mount POINT=DIR   expose host directory DIR read-only at POINT\n"
                 "  --log-level LEVEL   none, fatal, error, warning, info, debug or verbose\n"
                 "  --help              show this text\n",
                 argv0);
}

static int mountsCommand(const std::any &, TclInterp &interp, const std::vector<std::string> &args)
{
    if (args.size() != 1)
    {
        interp.setResult("wrong # args: should be \"" + args[0] + "\"");
        return TCL_ERROR;
    }
    Tcl_Obj *list = Tcl_NewListObj(0, nullptr);
    for (const std::string &point : BridgeState::get().mountPoints())
        Tcl_ListObjAppendElement(interp.get(), list, Tcl_NewStringObj(point.data(), static_cast<int>(point.size())));
    Tcl_SetObjResult(interp.get(), list);
    return TCL_OK;
}

static int appInit(Tcl_Interp *ip)
{
    TclInterp interp(ip);
    if (Tcl_Init(ip) != TCL_OK)
    {
        PLOGW << "Tcl_Init failed: " << Tcl_GetStringResult(ip);
        return TCL_ERROR;
    }
    if (!interp.newCommand("::tclbridge::mounts", mountsCommand))
    {
        PLOGE << interp.lastError();
        return TCL_ERROR;
    }
    Tcl_SetVar2(ip, "tcl_rcFileName", nullptr, "~/.tclshrc", TCL_GLOBAL_ONLY);
    return TCL_OK;
}

int main(int argc, char **argv)
{
    std::string configPath;
    std::vector<std::pair<std::string, std::string>> cliMounts;
    std::string levelName;

    int i = 1;
    for (; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            usage(argv[0]);
            return 0;
        }
        if (arg == "--")
        {
            ++i;
            break;
        }
        if ((arg == "--config" || arg == "--mount" || arg == "--log-level") && i + 1 >= argc)
        {
            std::fprintf(stderr, "%s: %s needs a value\n", argv[0], arg.c_str());
            return 2;
        }
        if (arg == "--config")
            configPath = argv[++i];
        else if (arg == "--log-level")
            levelName = argv[++i];
        else if (arg == "--mount")
        {
            std::string mountArg = argv[++i];
            size_t eq = mountArg.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == mountArg.size())
            {
                std::fprintf(stderr, "%s: --mount expects POINT=DIR, got \"%s\"\n", argv[0], mountArg.c_str());
                return 2;
            }
            cliMounts.emplace_back(mountArg.substr(0, eq), mountArg.substr(eq + 1));
        }
        else
            break;
    }

    std::string err;
    std::optional<BridgeConfig> cfg = configPath.empty() ? BridgeConfig::fromEnvironment(&err) : BridgeConfig::load(configPath, &err);
    if (!cfg)
    {
        std::fprintf(stderr, "%s: %s\n", argv[0], err.c_str());
        return 1;
    }
    if (!levelName.empty() && !parseSeverity(levelName, cfg->logging.level))
    {
        std::fprintf(stderr, "%s: unknown log level \"%s\"\n", argv[0], levelName.c_str());
        return 2;
    }

    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender(plog::streamStdErr);
    plog::init(cfg->logging.level, &consoleAppender);
    if (!cfg->logging.file.empty())
    {
        static plog::RollingFileAppender<plog::TxtFormatter> fileAppender(cfg->logging.file.c_str(), 1024 * 1024, 3);
        plog::get()->addAppender(&fileAppender);
    }
    PLOGI << "tclbridgesh starting";

    initializeTcl(argv[0]);
    if (!applyMounts(*cfg, &err))
    {
        PLOGE << "mount failed: " << err;
        return 1;
    }
    for (const auto &m : cliMounts)
    {
        auto fs = std::make_shared<LocalFileSystem>(m.second);
        if (!fs->isOpen())
        {
            PLOGE << "--mount " << m.first << ": not a directory: " << m.second;
            return 1;
        }
        BridgeResult r = mountFileSystem(m.first, fs);
        if (!r.ok)
        {
            PLOGE << "--mount " << m.first << ": " << r.error;
            return 1;
        }
    }

    // Tcl_Main sees argv[0] followed by the script and its arguments.
    std::vector<char *> tclArgs;
    tclArgs.push_back(argv[0]);
    for (; i < argc; ++i)
        tclArgs.push_back(argv[i]);
    Tcl_Main(static_cast<int>(tclArgs.size()), tclArgs.data(), appInit);
    return 0;
}
