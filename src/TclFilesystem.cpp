#include "TclFilesystem.hpp"
#include "BridgeState.hpp"
#include "TclChannel.hpp"
#include "TclInterp.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <plog/Log.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utime.h>

static std::string pathString(Tcl_Obj *pathPtr)
{
    Tcl_Obj *norm = Tcl_FSGetNormalizedPath(nullptr, pathPtr);
    int len = 0;
    const char *s = Tcl_GetStringFromObj(norm ? norm : pathPtr, &len);
    return std::string(s, static_cast<size_t>(len));
}

static void setErrno(BridgeError code)
{
    Tcl_SetErrno(toPosixErrno(code));
}

static BridgeError toBridgeError(FileError e)
{
    switch (e)
    {
    case FileError::None: return BridgeError::None;
    case FileError::NotFound:
    case FileError::NotDirectory: return BridgeError::NotFound;
    case FileError::PermissionDenied: return BridgeError::PermissionDenied;
    case FileError::IsDirectory:
    case FileError::Io: return BridgeError::Io;
    }
    return BridgeError::Io;
}

// Opens path through its provider, retrying with a trailing slash so
// directory-keyed providers find directories.
static OpenResult openResolved(const std::string &path, BridgeError &code)
{
    auto resolved = BridgeState::get().resolve(path);
    if (!resolved)
    {
        code = BridgeError::NotMine;
        return OpenResult::failure(FileError::NotFound, "not part of any virtual filesystem: " + path);
    }

    OpenResult r = resolved->fs->open(resolved->relative);
    if (!r.ok && r.code == FileError::NotFound && resolved->relative.back() != '/')
        r = resolved->fs->open(resolved->relative + "/");
    if (!r.ok)
    {
        PLOGD << "open " << path << " via " << resolved->fs->describe() << ": " << r.error;
        code = toBridgeError(r.code);
    }
    return r;
}

static bool statResolved(const std::string &path, FileInfo &info, BridgeError &code)
{
    auto resolved = BridgeState::get().resolve(path);
    if (!resolved)
    {
        code = BridgeError::NotMine;
        return false;
    }

    StatResult st = resolved->fs->stat(resolved->relative);
    if (!st.ok && st.code == FileError::NotFound && resolved->relative.back() != '/')
        st = resolved->fs->stat(resolved->relative + "/");
    if (!st.ok)
    {
        if (st.code == FileError::Io)
            PLOGW << "stat " << path << ": " << st.error;
        else
            PLOGD << "stat " << path << " via " << resolved->fs->describe() << ": " << st.error;
        code = toBridgeError(st.code);
        return false;
    }
    info = st.info;
    return true;
}

static int fsPathInFilesystem(Tcl_Obj *pathPtr, ClientData *clientDataPtr)
{
    if (!BridgeState::get().resolve(pathString(pathPtr)))
        return -1;
    *clientDataPtr = nullptr;
    return TCL_OK;
}

static int fsNormalizePath(Tcl_Interp *, Tcl_Obj *pathPtr, int nextCheckpoint)
{
    int len = 0;
    const char *s = Tcl_GetStringFromObj(pathPtr, &len);
    if (!BridgeState::get().resolve(std::string(s, static_cast<size_t>(len))))
        return nextCheckpoint;
    return len;
}

static Tcl_Obj *fsSeparator(Tcl_Obj *)
{
    return Tcl_NewStringObj("/", 1);
}

static int fsStat(Tcl_Obj *pathPtr, Tcl_StatBuf *buf)
{
    std::string path = pathString(pathPtr);
    FileInfo info;
    BridgeError code = BridgeError::None;
    if (!statResolved(path, info, code))
    {
        setErrno(code);
        return -1;
    }

    unsigned perms = info.isDir ? 0555 : 0444;
    if (info.mode)
        perms &= info.mode;
    std::memset(buf, 0, sizeof(*buf));
    buf->st_mode = (info.isDir ? S_IFDIR : S_IFREG) | perms;
    buf->st_size = static_cast<decltype(buf->st_size)>(info.size);
    buf->st_nlink = 1;
    buf->st_mtime = info.modTime;
    buf->st_atime = info.modTime;
    buf->st_ctime = info.modTime;
    return 0;
}

static int fsAccess(Tcl_Obj *pathPtr, int mode)
{
    std::string path = pathString(pathPtr);
    FileInfo info;
    BridgeError code = BridgeError::None;
    if (!statResolved(path, info, code))
    {
        setErrno(code);
        return -1;
    }

    int denied = info.isDir ? W_OK : (W_OK | X_OK);
    if (mode & denied)
    {
        PLOGD << "access " << path << " mode " << mode << " denied";
        setErrno(BridgeError::PermissionDenied);
        return -1;
    }
    return 0;
}

static Tcl_Channel openFailed(Tcl_Interp *interp, Tcl_Obj *pathPtr, int err)
{
    Tcl_SetErrno(err);
    if (interp)
    {
        Tcl_SetObjResult(interp, Tcl_ObjPrintf("couldn't open \"%s\": %s", Tcl_GetString(pathPtr), Tcl_PosixError(interp)));
    }
    return nullptr;
}

static Tcl_Channel fsOpenFileChannel(Tcl_Interp *interp, Tcl_Obj *pathPtr, int mode, int)
{
    std::string path = pathString(pathPtr);
    if (mode & (O_WRONLY | O_RDWR | O_CREAT | O_TRUNC | O_APPEND))
    {
        PLOGW << "open " << path << " for writing rejected";
        return openFailed(interp, pathPtr, toPosixErrno(BridgeError::PermissionDenied));
    }

    BridgeError code = BridgeError::None;
    OpenResult r = openResolved(path, code);
    if (!r.ok)
        return openFailed(interp, pathPtr, toPosixErrno(code));

    StatResult st = r.stream->stat();
    if (st.ok && st.info.isDir)
    {
        r.stream->close();
        return openFailed(interp, pathPtr, EISDIR);
    }

    Tcl_Channel chan = createStreamChannel(std::move(r.stream), path);
    if (!chan)
        return openFailed(interp, pathPtr, EIO);
    return chan;
}

static bool globHidden(const std::string &name)
{
    return !name.empty() && name[0] == '.';
}

static bool globTypeMatches(bool isDir, bool hidden, const Tcl_GlobTypeData *types)
{
    if (!types)
        return true;
    if (types->perm)
    {
        if (types->perm & TCL_GLOB_PERM_W)
            return false;
        if ((types->perm & TCL_GLOB_PERM_X) && !isDir)
            return false;
        if ((types->perm & TCL_GLOB_PERM_HIDDEN) && !hidden)
            return false;
    }
    if (types->type)
    {
        bool ok = ((types->type & TCL_GLOB_TYPE_DIR) && isDir) || ((types->type & TCL_GLOB_TYPE_FILE) && !isDir);
        if (!ok)
            return false;
    }
    return true;
}

static void appendJoined(Tcl_Interp *interp, Tcl_Obj *resultPtr, Tcl_Obj *dirPtr, const std::string &name)
{
    Tcl_Obj *tail = Tcl_NewStringObj(name.data(), static_cast<int>(name.size()));
    Tcl_IncrRefCount(tail);
    Tcl_Obj *joined = Tcl_FSJoinToPath(dirPtr, 1, &tail);
    Tcl_DecrRefCount(tail);
    Tcl_ListObjAppendElement(interp, resultPtr, joined);
}

// Mount points sitting directly inside the directory dir.
static int matchMounts(Tcl_Interp *interp, Tcl_Obj *resultPtr, Tcl_Obj *pathPtr, const char *pattern)
{
    std::string dir = pathString(pathPtr);
    if (dir.empty() || dir.back() != '/')
        dir += '/';
    for (const std::string &point : BridgeState::get().mountPoints())
    {
        if (point == "/" || point.compare(0, dir.size(), dir) != 0)
            continue;
        std::string tail = point.substr(dir.size(), point.size() - dir.size() - 1);
        if (tail.empty() || tail.find('/') != std::string::npos)
            continue;
        if (pattern && !Tcl_StringCaseMatch(tail.c_str(), pattern, 0))
            continue;
        appendJoined(interp, resultPtr, pathPtr, tail);
    }
    return TCL_OK;
}

static int fsMatchInDirectory(Tcl_Interp *interp, Tcl_Obj *resultPtr, Tcl_Obj *pathPtr, const char *pattern, Tcl_GlobTypeData *types)
{
    if (types && (types->type & TCL_GLOB_TYPE_MOUNT))
        return matchMounts(interp, resultPtr, pathPtr, pattern);

    std::string path = pathString(pathPtr);
    if (!pattern)
    {
        // pathPtr names a single entry: report it if it exists and fits types
        FileInfo info;
        BridgeError code = BridgeError::None;
        size_t slash = path.find_last_of('/');
        std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
        if (statResolved(path, info, code) && globTypeMatches(info.isDir, globHidden(name), types))
            Tcl_ListObjAppendElement(interp, resultPtr, pathPtr);
        return TCL_OK;
    }

    auto resolved = BridgeState::get().resolve(path);
    if (!resolved)
        return TCL_OK;
    ListResult list = resolved->fs->list(resolved->relative);
    if (!list.ok)
    {
        PLOGD << "glob " << path << ": " << list.error;
        return TCL_OK;
    }

    bool wantHidden = pattern[0] == '.' || (types && (types->perm & TCL_GLOB_PERM_HIDDEN));
    for (const DirEntry &e : list.entries)
    {
        bool hidden = globHidden(e.name);
        if (hidden && !wantHidden)
            continue;
        if (!Tcl_StringCaseMatch(e.name.c_str(), pattern, 0))
            continue;
        if (!globTypeMatches(e.isDir, hidden, types))
            continue;
        appendJoined(interp, resultPtr, pathPtr, e.name);
    }
    return TCL_OK;
}

static int denyWrite(const char *what, Tcl_Obj *pathPtr)
{
    PLOGW << what << " " << Tcl_GetString(pathPtr) << " rejected: read-only filesystem";
    setErrno(BridgeError::PermissionDenied);
    return -1;
}

static int fsUtime(Tcl_Obj *pathPtr, struct utimbuf *)
{
    return denyWrite("utime", pathPtr);
}

static int fsCreateDirectory(Tcl_Obj *pathPtr)
{
    return denyWrite("mkdir", pathPtr);
}

static int fsRemoveDirectory(Tcl_Obj *pathPtr, int, Tcl_Obj **errorPtr)
{
    if (errorPtr)
    {
        *errorPtr = pathPtr;
        Tcl_IncrRefCount(pathPtr);
    }
    return denyWrite("rmdir", pathPtr);
}

static int fsDeleteFile(Tcl_Obj *pathPtr)
{
    return denyWrite("delete", pathPtr);
}

static int fsCopyFile(Tcl_Obj *, Tcl_Obj *destPtr)
{
    return denyWrite("copy to", destPtr);
}

static int fsRenameFile(Tcl_Obj *srcPtr, Tcl_Obj *)
{
    return denyWrite("rename", srcPtr);
}

static int fsCopyDirectory(Tcl_Obj *, Tcl_Obj *destPtr, Tcl_Obj **errorPtr)
{
    if (errorPtr)
    {
        *errorPtr = destPtr;
        Tcl_IncrRefCount(destPtr);
    }
    return denyWrite("copy directory to", destPtr);
}

static const Tcl_Filesystem kFilesystem = {
    "tclbridge",
    sizeof(Tcl_Filesystem),
    TCL_FILESYSTEM_VERSION_1,
    fsPathInFilesystem,
    nullptr,            // dupInternalRepProc
    nullptr,            // freeInternalRepProc
    nullptr,            // internalToNormalizedProc
    nullptr,            // createInternalRepProc
    fsNormalizePath,
    nullptr,            // filesystemPathTypeProc
    fsSeparator,
    fsStat,
    fsAccess,
    fsOpenFileChannel,
    fsMatchInDirectory,
    fsUtime,
    nullptr,            // linkProc
    nullptr,            // listVolumesProc
    nullptr,            // fileAttrStringsProc
    nullptr,            // fileAttrsGetProc
    nullptr,            // fileAttrsSetProc
    fsCreateDirectory,
    fsRemoveDirectory,
    fsDeleteFile,
    fsCopyFile,
    fsRenameFile,
    fsCopyDirectory,
    fsStat,             // lstatProc
    nullptr,            // loadFileProc
    nullptr,            // getCwdProc
    nullptr,            // chdirProc
};

const Tcl_Filesystem *bridgeFilesystem()
{
    return &kFilesystem;
}

static BridgeResult registerFilesystem()
{
    static std::once_flag once;
    static int rc = TCL_ERROR;
    std::call_once(once, []() {
        initializeTcl();
        rc = Tcl_FSRegister(nullptr, const_cast<Tcl_Filesystem *>(&kFilesystem));
        if (rc == TCL_OK)
            PLOGI << "tclbridge filesystem registered";
        else
            PLOGE << "Tcl_FSRegister failed: " << rc;
    });
    if (rc != TCL_OK)
        return BridgeResult::failure(BridgeError::Io, "virtual file system initialization failed: " + std::to_string(rc));
    return BridgeResult::success();
}

BridgeResult mountFileSystem(const std::string &point, std::shared_ptr<FileSystem> fs)
{
    BridgeResult r = registerFilesystem();
    if (!r.ok)
        return r;

    std::string desc = fs ? fs->describe() : "(none)";
    r = BridgeState::get().mount(point, std::move(fs));
    if (!r.ok)
    {
        PLOGW << "mount " << point << " failed: " << r.error;
        return r;
    }
    PLOGI << "mounted " << desc << " at " << point;
    Tcl_FSMountsChanged(const_cast<Tcl_Filesystem *>(&kFilesystem));
    return r;
}

BridgeResult unmountFileSystem(const std::string &point)
{
    BridgeResult r = BridgeState::get().unmount(point);
    if (!r.ok)
    {
        PLOGW << "unmount " << point << " failed: " << r.error;
        return r;
    }
    PLOGI << "unmounted " << point;
    Tcl_FSMountsChanged(const_cast<Tcl_Filesystem *>(&kFilesystem));
    return r;
}
