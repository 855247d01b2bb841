#pragma once
#include <FileSystem.hpp>
#include <sqlite3.h>
#include <ctime>
#include <string>
#include <vector>

namespace TclBridge {

// Files(Path TEXT PRIMARY KEY, Content BLOB, ModTime INTEGER, IsDirectory INTEGER)
// Paths are stored cleaned and absolute ("/a/b.txt"); "/" is implicit.
class SQLiteFileSystem : public FileSystem {
public:
    // readOnly opens an existing database without creating it or its table;
    // the put* calls then fail.
    explicit SQLiteFileSystem(const std::string &dbPath, bool readOnly = false);
    ~SQLiteFileSystem() override;

    bool isOpen() const { return db != nullptr; }
    const std::string &lastError() const { return m_error; }

    // Host-side population. Parent directories are added as needed.
    bool putFile(const std::string &path, const std::vector<uint8_t> &content, std::time_t modTime, std::string *outError = nullptr);
    bool putFile(const std::string &path, const std::string &content, std::time_t modTime, std::string *outError = nullptr);
    bool putDirectory(const std::string &path, std::time_t modTime, std::string *outError = nullptr);

    OpenResult open(const std::string &path) override;
    ListResult list(const std::string &path) override;
    StatResult stat(const std::string &path) override;
    std::string describe() const override { return "sqlite " + m_path; }

private:
    bool putRow(const std::string &key, const std::vector<uint8_t> *content, std::time_t modTime, std::string *outError);
    bool putParents(const std::string &key, std::time_t modTime, std::string *outError);

    sqlite3* db = nullptr;
    std::string m_path;
    std::string m_error;
};

} // namespace TclBridge
