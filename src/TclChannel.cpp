#include "TclChannel.hpp"
#include "BridgeState.hpp"
#include <cerrno>
#include <cstdio>
#include <plog/Log.h>

static int channelClose(ClientData instanceData, Tcl_Interp *)
{
    Handle h = HandleRegistry::fromClientData(instanceData);
    PLOGD << "channel " << h << " closed";
    BridgeState::get().releaseObject(h);
    return 0;
}

static int channelInput(ClientData instanceData, char *buf, int toRead, int *errorCodePtr)
{
    if (!buf || toRead <= 0)
        return 0;

    Handle h = HandleRegistry::fromClientData(instanceData);
    auto stream = BridgeState::get().loadAs<FileStream>(h);
    if (!stream)
    {
        PLOGE << "channelInput: stale stream handle " << h;
        *errorCodePtr = EBADF;
        return -1;
    }

    ReadResult r = stream->read(buf, static_cast<size_t>(toRead));
    if (!r.ok)
    {
        PLOGW << "channelInput: read failed: " << r.error;
        *errorCodePtr = EIO;
        return -1;
    }
    return static_cast<int>(r.count);
}

static int channelOutput(ClientData, const char *, int, int *errorCodePtr)
{
    *errorCodePtr = EBADF;
    return -1;
}

static int channelSeek(ClientData instanceData, long offset, int mode, int *errorCodePtr)
{
    PLOGW << "channelSeek: seeking is not supported (handle " << HandleRegistry::fromClientData(instanceData)
          << ", offset " << offset << ", mode " << mode << ")";
    *errorCodePtr = toPosixErrno(BridgeError::Unsupported);
    return -1;
}

static void channelWatch(ClientData instanceData, int mask)
{
    if (mask == 0)
        return;
    PLOGF << "channelWatch: event notification requested (mask " << mask << ") on handle "
          << HandleRegistry::fromClientData(instanceData) << "; only synchronous reads are supported";
    Tcl_Panic("tclbridge channel: watch mask %d is not supported", mask);
}

static int channelGetHandle(ClientData, int, ClientData *)
{
    return TCL_ERROR;
}

static const Tcl_ChannelType kChannelType = {
    "tclbridge",          // typeName
    TCL_CHANNEL_VERSION_5,
    channelClose,
    channelInput,
    channelOutput,
    channelSeek,
    nullptr,              // setOptionProc
    nullptr,              // getOptionProc
    channelWatch,
    channelGetHandle,
    nullptr,              // close2Proc
    nullptr,              // blockModeProc
    nullptr,              // flushProc
    nullptr,              // handlerProc
    nullptr,              // wideSeekProc
    nullptr,              // threadActionProc
    nullptr,              // truncateProc
};

const Tcl_ChannelType *bridgeChannelType()
{
    return &kChannelType;
}

Tcl_Channel createStreamChannel(std::shared_ptr<FileStream> stream, const std::string &path)
{
    Handle h = BridgeState::get().storeObject(std::move(stream));
    if (h == kInvalidHandle)
    {
        PLOGE << "createStreamChannel: no free handle for " << path;
        return nullptr;
    }
    char name[32];
    std::snprintf(name, sizeof(name), "vfs%llx", static_cast<unsigned long long>(h));
    Tcl_Channel chan = Tcl_CreateChannel(&kChannelType, name, HandleRegistry::toClientData(h), TCL_READABLE);
    if (!chan)
    {
        PLOGE << "createStreamChannel: Tcl_CreateChannel failed for " << path;
        BridgeState::get().releaseObject(h);
        return nullptr;
    }
    PLOGD << "channel " << name << " opened on " << path;
    return chan;
}
