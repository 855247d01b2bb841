// TclCommand.hpp - host callables registered as Tcl commands
#pragma once
#include "HandleRegistry.hpp"
#include <any>
#include <atomic>
#include <functional>
#include <string>
#include <tcl.h>
#include <vector>

class TclInterp;

// args[0] is the command name as invoked. Returns a Tcl completion code.
using CommandProc = std::function<int(const std::any &clientData, TclInterp &interp, const std::vector<std::string> &args)>;
using CommandDeleteProc = std::function<void(const std::any &clientData)>;

// Describes one live registration. handle is the registry token Tcl holds as
// the command's ClientData.
struct TclCommand
{
    std::string name;
    Handle handle = kInvalidHandle;
    Tcl_Command token = nullptr;
};

// Registry object behind a command. release() runs when Tcl deletes the
// command (explicit delete, rename to "", replacement or interpreter teardown)
// and fires onDelete exactly once.
class CommandRegistration : public HostObject
{
public:
    CommandRegistration(Tcl_Interp *interp, std::string name, CommandProc proc, std::any clientData, CommandDeleteProc onDelete);

    int invoke(Tcl_Interp *interp, int objc, Tcl_Obj *const objv[]);
    void release() override;

    // Tcl never accepted the command; release() will not fire onDelete.
    void disarm() { m_fired.store(true); }

    Tcl_Interp *interp() const { return m_interp; }
    const std::string &name() const { return m_name; }

private:
    Tcl_Interp *m_interp;
    std::string m_name;
    CommandProc m_proc;
    std::any m_clientData;
    CommandDeleteProc m_onDelete;
    std::atomic<bool> m_fired{false};
};

// Tcl_ObjCmdProc / Tcl_CmdDeleteProc pair used for every bridged command.
int dispatchCommand(ClientData clientData, Tcl_Interp *interp, int objc, Tcl_Obj *const objv[]);
void deleteCommandProc(ClientData clientData);
