#include "TclCommand.hpp"
#include "BridgeState.hpp"
#include "TclInterp.hpp"
#include <plog/Log.h>

CommandRegistration::CommandRegistration(Tcl_Interp *interp, std::string name, CommandProc proc, std::any clientData, CommandDeleteProc onDelete)
    : m_interp(interp), m_name(std::move(name)), m_proc(std::move(proc)), m_clientData(std::move(clientData)), m_onDelete(std::move(onDelete))
{
}

int CommandRegistration::invoke(Tcl_Interp *interp, int objc, Tcl_Obj *const objv[])
{
    std::vector<std::string> args;
    args.reserve(static_cast<size_t>(objc));
    for (int i = 0; i < objc; ++i)
    {
        int len = 0;
        const char *s = Tcl_GetStringFromObj(objv[i], &len);
        args.emplace_back(s, static_cast<size_t>(len));
    }

    // A non-owning view; the interpreter belongs to whoever created it.
    TclInterp view(interp);
    try
    {
        return m_proc(m_clientData, view, args);
    }
    catch (const std::exception &ex)
    {
        PLOGW << "Command " << m_name << " threw: " << ex.what();
        view.setResult(ex.what());
    }
    catch (...)
    {
        PLOGW << "Command " << m_name << " threw a non-standard exception";
        view.setResult("unknown C++ exception in command " + m_name);
    }
    return TCL_ERROR;
}

void CommandRegistration::release()
{
    if (m_fired.exchange(true))
        return;
    PLOGD << "Command " << m_name << " deleted";
    if (!m_onDelete)
        return;
    // runs inside Tcl's command deletion, nothing may unwind past here
    try
    {
        m_onDelete(m_clientData);
    }
    catch (const std::exception &ex)
    {
        PLOGW << "Delete callback of command " << m_name << " threw: " << ex.what();
    }
    catch (...)
    {
        PLOGW << "Delete callback of command " << m_name << " threw a non-standard exception";
    }
}

int dispatchCommand(ClientData clientData, Tcl_Interp *interp, int objc, Tcl_Obj *const objv[])
{
    Handle h = HandleRegistry::fromClientData(clientData);
    auto reg = BridgeState::get().loadAs<CommandRegistration>(h);
    if (!reg)
    {
        PLOGE << "dispatchCommand: stale command handle " << h;
        Tcl_SetObjResult(interp, Tcl_NewStringObj("invalid command handle", -1));
        return TCL_ERROR;
    }
    return reg->invoke(interp, objc, objv);
}

void deleteCommandProc(ClientData clientData)
{
    BridgeState::get().releaseObject(HandleRegistry::fromClientData(clientData));
}
