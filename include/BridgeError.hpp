// BridgeError.hpp - error taxonomy shared by the bridge and its Tcl hooks
#pragma once
#include <cerrno>
#include <string>
#include <utility>

enum class BridgeError
{
    None,
    NotMine,          // path or operation not owned by any mount
    NotFound,         // resolved to a mount, provider has no such entry
    PermissionDenied, // write/execute on a read-only provider
    Unsupported,      // seek or asynchronous watch
    InvalidArgument,  // malformed mount point
    Io                // provider failure
};

struct BridgeResult
{
    bool ok = false;
    BridgeError code = BridgeError::None;
    std::string error;

    static BridgeResult success()
    {
        BridgeResult r;
        r.ok = true;
        return r;
    }

    static BridgeResult failure(BridgeError code, std::string message)
    {
        BridgeResult r;
        r.code = code;
        r.error = std::move(message);
        return r;
    }
};

// errno reported to Tcl for each error kind
inline int toPosixErrno(BridgeError code)
{
    switch (code)
    {
    case BridgeError::None: return 0;
    case BridgeError::NotMine: return ENOENT;
    case BridgeError::NotFound: return ENOENT;
    case BridgeError::PermissionDenied: return EACCES;
    case BridgeError::Unsupported: return ESPIPE;
    case BridgeError::InvalidArgument: return EINVAL;
    case BridgeError::Io: return EIO;
    }
    return EIO;
}

inline const char *bridgeErrorName(BridgeError code)
{
    switch (code)
    {
    case BridgeError::None: return "none";
    case BridgeError::NotMine: return "not-mine";
    case BridgeError::NotFound: return "not-found";
    case BridgeError::PermissionDenied: return "permission-denied";
    case BridgeError::Unsupported: return "unsupported";
    case BridgeError::InvalidArgument: return "invalid-argument";
    case BridgeError::Io: return "io";
    }
    return "unknown";
}
