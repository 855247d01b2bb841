#include "FileSystems/SQLiteFileSystem.hpp"
#include "MountTable.hpp"
#include <plog/Log.h>

namespace TclBridge {

static const char* kCreateFiles =
    "CREATE TABLE IF NOT EXISTS Files ("
    "Path TEXT PRIMARY KEY, Content BLOB, ModTime INTEGER, IsDirectory INTEGER NOT NULL DEFAULT 0);";

static std::string keyFor(const std::string &path){ return cleanPath("/" + path); }

SQLiteFileSystem::SQLiteFileSystem(const std::string &dbPath, bool readOnly) : m_path(dbPath) {
    int flags = (readOnly ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE) | SQLITE_OPEN_FULLMUTEX;
    if(sqlite3_open_v2(dbPath.c_str(), &db, flags, nullptr) != SQLITE_OK){
        m_error = db ? sqlite3_errmsg(db) : "out of memory";
        if(db){ sqlite3_close(db); db = nullptr; }
        PLOGW << "SQLiteFileSystem: cannot open " << dbPath << ": " << m_error;
        return;
    }
    sqlite3_busy_timeout(db, 5000);
    if(readOnly){
        // an existing database must already carry the table
        sqlite3_stmt* stmt = nullptr;
        if(sqlite3_prepare_v2(db, "SELECT Path, Content, ModTime, IsDirectory FROM Files LIMIT 0;", -1, &stmt, nullptr) != SQLITE_OK){
            m_error = std::string("no usable Files table: ") + sqlite3_errmsg(db);
            if(stmt) sqlite3_finalize(stmt);
            sqlite3_close(db); db = nullptr;
            PLOGW << "SQLiteFileSystem: " << dbPath << ": " << m_error;
            return;
        }
        sqlite3_finalize(stmt);
        PLOGI << "SQLiteFileSystem: opened " << dbPath << " read-only";
        return;
    }
    char* err = nullptr;
    if(sqlite3_exec(db, kCreateFiles, nullptr, nullptr, &err) != SQLITE_OK){
        m_error = err ? err : sqlite3_errmsg(db);
        if(err) sqlite3_free(err);
        sqlite3_close(db); db = nullptr;
        PLOGW << "SQLiteFileSystem: cannot create Files table in " << dbPath << ": " << m_error;
        return;
    }
    PLOGI << "SQLiteFileSystem: opened " << dbPath;
}

SQLiteFileSystem::~SQLiteFileSystem(){ if(db){ sqlite3_close(db); db = nullptr; } }

bool SQLiteFileSystem::putRow(const std::string &key, const std::vector<uint8_t> *content, std::time_t modTime, std::string *outError){
    const char* sql = "INSERT OR REPLACE INTO Files(Path, Content, ModTime, IsDirectory) VALUES(?,?,?,?);";
    sqlite3_stmt* stmt = nullptr;
    if(sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK){ if(outError) *outError = sqlite3_errmsg(db); if(stmt) sqlite3_finalize(stmt); return false; }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if(content) sqlite3_bind_blob(stmt, 2, content->data(), static_cast<int>(content->size()), SQLITE_TRANSIENT);
    else sqlite3_bind_null(stmt, 2);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(modTime));
    sqlite3_bind_int(stmt, 4, content ? 0 : 1);
    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if(!ok && outError) *outError = sqlite3_errmsg(db);
    sqlite3_finalize(stmt);
    return ok;
}

bool SQLiteFileSystem::putParents(const std::string &key, std::time_t modTime, std::string *outError){
    for(size_t pos = key.find('/', 1); pos != std::string::npos; pos = key.find('/', pos + 1)){
        std::string dir = key.substr(0, pos);
        const char* sql = "INSERT OR IGNORE INTO Files(Path, Content, ModTime, IsDirectory) VALUES(?,NULL,?,1);";
        sqlite3_stmt* stmt = nullptr;
        if(sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK){ if(outError) *outError = sqlite3_errmsg(db); if(stmt) sqlite3_finalize(stmt); return false; }
        sqlite3_bind_text(stmt, 1, dir.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(modTime));
        bool ok = sqlite3_step(stmt) == SQLITE_DONE;
        if(!ok && outError) *outError = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        if(!ok) return false;
    }
    return true;
}

bool SQLiteFileSystem::putFile(const std::string &path, const std::vector<uint8_t> &content, std::time_t modTime, std::string *outError){
    if(!db){ if(outError) *outError = "DB not open"; return false; }
    std::string key = keyFor(path);
    if(key == "/"){ if(outError) *outError = "cannot store a file at /"; return false; }
    return putParents(key, modTime, outError) && putRow(key, &content, modTime, outError);
}

bool SQLiteFileSystem::putFile(const std::string &path, const std::string &content, std::time_t modTime, std::string *outError){
    return putFile(path, std::vector<uint8_t>(content.begin(), content.end()), modTime, outError);
}

bool SQLiteFileSystem::putDirectory(const std::string &path, std::time_t modTime, std::string *outError){
    if(!db){ if(outError) *outError = "DB not open"; return false; }
    std::string key = keyFor(path);
    if(key == "/") return true;
    return putParents(key, modTime, outError) && putRow(key, nullptr, modTime, outError);
}

StatResult SQLiteFileSystem::stat(const std::string &path){
    StatResult res;
    if(!db){ res.code = FileError::Io; res.error = "DB not open"; return res; }
    bool wantDir = !path.empty() && path.back() == '/';
    std::string key = keyFor(path);
    if(key == "/"){
        res.ok = true; res.info.isDir = true; res.info.mode = 0555;
        return res;
    }

    sqlite3_stmt* stmt = nullptr;
    if(sqlite3_prepare_v2(db, "SELECT length(Content), ModTime, IsDirectory FROM Files WHERE Path = ?;", -1, &stmt, nullptr) != SQLITE_OK){
        res.code = FileError::Io; res.error = sqlite3_errmsg(db);
        if(stmt) sqlite3_finalize(stmt);
        return res;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int r = sqlite3_step(stmt);
    if(r != SQLITE_ROW){
        res.code = r == SQLITE_DONE ? FileError::NotFound : FileError::Io;
        res.error = r == SQLITE_DONE ? "no such file: " + path : sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return res;
    }
    res.info.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    res.info.modTime = static_cast<std::time_t>(sqlite3_column_int64(stmt, 1));
    res.info.isDir = sqlite3_column_int(stmt, 2) != 0;
    sqlite3_finalize(stmt);

    if(res.info.isDir){ res.info.size = 0; res.info.mode = 0555; }
    else if(wantDir){
        res.code = FileError::NotDirectory; res.error = "not a directory: " + path;
        return res;
    }
    else res.info.mode = 0444;
    res.ok = true;
    return res;
}

OpenResult SQLiteFileSystem::open(const std::string &path){
    StatResult st = stat(path);
    if(!st.ok) return OpenResult::failure(st.code, st.error);

    OpenResult res;
    if(st.info.isDir){
        res.ok = true;
        res.stream = std::make_shared<DirectoryStream>(st.info);
        return res;
    }

    std::string key = keyFor(path);
    sqlite3_stmt* stmt = nullptr;
    if(sqlite3_prepare_v2(db, "SELECT Content FROM Files WHERE Path = ?;", -1, &stmt, nullptr) != SQLITE_OK){
        std::string err = sqlite3_errmsg(db);
        if(stmt) sqlite3_finalize(stmt);
        return OpenResult::failure(FileError::Io, err);
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int r = sqlite3_step(stmt);
    if(r != SQLITE_ROW){
        std::string err = r == SQLITE_DONE ? "no such file: " + path : sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return OpenResult::failure(r == SQLITE_DONE ? FileError::NotFound : FileError::Io, err);
    }

    auto data = std::make_shared<std::vector<uint8_t>>();
    const void* b = sqlite3_column_blob(stmt, 0);
    int sz = sqlite3_column_bytes(stmt, 0);
    if(b && sz > 0) data->assign(static_cast<const uint8_t*>(b), static_cast<const uint8_t*>(b) + sz);
    sqlite3_finalize(stmt);

    res.ok = true;
    res.stream = std::make_shared<MemoryStream>(std::move(data), st.info);
    PLOGD << "SQLiteFileSystem: opened " << key;
    return res;
}

ListResult SQLiteFileSystem::list(const std::string &path){
    ListResult res;
    if(!db){ res.code = FileError::Io; res.error = "DB not open"; return res; }
    std::string key = keyFor(path);

    if(key != "/"){
        StatResult self = stat(key + "/");
        if(!self.ok){ res.code = self.code; res.error = self.error; return res; }
    }

    std::string prefix = key == "/" ? "/" : key + "/";
    sqlite3_stmt* stmt = nullptr;
    // byte-wise range over every key starting with prefix; '0' follows '/'
    std::string upper = prefix.substr(0, prefix.size() - 1) + '0';
    if(sqlite3_prepare_v2(db, "SELECT Path, IsDirectory FROM Files WHERE Path > ? AND Path < ? ORDER BY Path;", -1, &stmt, nullptr) != SQLITE_OK){
        res.code = FileError::Io; res.error = sqlite3_errmsg(db);
        if(stmt) sqlite3_finalize(stmt);
        return res;
    }
    sqlite3_bind_text(stmt, 1, prefix.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, upper.c_str(), -1, SQLITE_TRANSIENT);
    int r;
    while((r = sqlite3_step(stmt)) == SQLITE_ROW){
        const unsigned char* t = sqlite3_column_text(stmt, 0);
        if(!t) continue;
        std::string full(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(stmt, 0)));
        if(full.compare(0, prefix.size(), prefix) != 0) continue;
        std::string rest = full.substr(prefix.size());
        if(rest.empty() || rest.find('/') != std::string::npos) continue;
        DirEntry d;
        d.name = rest;
        d.isDir = sqlite3_column_int(stmt, 1) != 0;
        res.entries.push_back(std::move(d));
    }
    if(r != SQLITE_DONE){
        res.entries.clear();
        res.code = FileError::Io; res.error = sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return res;
    }
    sqlite3_finalize(stmt);
    res.ok = true;
    return res;
}

} // namespace TclBridge
