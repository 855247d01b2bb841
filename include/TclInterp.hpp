// TclInterp.hpp - owning wrapper around a Tcl interpreter
#pragma once
#include "TclCommand.hpp"
#include <any>
#include <string>
#include <tcl.h>

// Tcl_FindExecutable, once per process. Later calls are ignored.
void initializeTcl(const char *argv0 = nullptr);

class TclInterp
{
public:
    // Creates an interpreter. With initLibrary, also runs Tcl_Init; a missing
    // script library is logged and left in lastError().
    explicit TclInterp(bool initLibrary = false);

    // Wraps an interpreter created elsewhere (Tcl_Main, a command callback)
    // without taking ownership.
    explicit TclInterp(Tcl_Interp *interp);

    ~TclInterp();

    TclInterp(const TclInterp &) = delete;
    TclInterp &operator=(const TclInterp &) = delete;

    bool eval(const std::string &script);
    std::string result() const;
    const std::string &lastError() const { return m_lastError; }

    // Length based; value may hold NUL bytes.
    void setResult(const std::string &value);

    bool newCommand(const std::string &name, CommandProc proc, std::any clientData = {},
                    CommandDeleteProc onDelete = nullptr, TclCommand *out = nullptr);

    // false when the registration is no longer live in this interpreter
    bool deleteCommand(const TclCommand &cmd);

    // Deletes an owned interpreter: every live command's onDelete fires and
    // every channel still registered is closed. Returns false if already
    // closed; an adopted interpreter is only detached.
    bool close();

    bool isOpen() const { return m_interp != nullptr; }
    Tcl_Interp *get() const { return m_interp; }

private:
    Tcl_Interp *m_interp = nullptr;
    bool m_owned = false;
    std::string m_lastError;
};
