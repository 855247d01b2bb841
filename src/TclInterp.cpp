#include "TclInterp.hpp"
#include "BridgeState.hpp"
#include <mutex>
#include <plog/Log.h>

void initializeTcl(const char *argv0)
{
    static std::once_flag once;
    std::call_once(once, [argv0]() { Tcl_FindExecutable(argv0); });
}

TclInterp::TclInterp(bool initLibrary)
{
    initializeTcl();
    m_interp = Tcl_CreateInterp();
    m_owned = true;
    if (!m_interp)
    {
        m_lastError = "Tcl_CreateInterp failed";
        PLOGE << m_lastError;
        return;
    }
    PLOGI << "TclInterp: created interpreter " << static_cast<void *>(m_interp);

    if (initLibrary && Tcl_Init(m_interp) != TCL_OK)
    {
        m_lastError = Tcl_GetStringResult(m_interp);
        PLOGW << "TclInterp: Tcl_Init failed: " << m_lastError;
    }
}

TclInterp::TclInterp(Tcl_Interp *interp) : m_interp(interp), m_owned(false) {}

TclInterp::~TclInterp()
{
    close();
}

bool TclInterp::eval(const std::string &script)
{
    if (!m_interp)
    {
        m_lastError = "interpreter is closed";
        return false;
    }
    int rc = Tcl_EvalEx(m_interp, script.data(), static_cast<int>(script.size()), 0);
    if (rc == TCL_OK)
        return true;

    const char *info = Tcl_GetVar2(m_interp, "errorInfo", nullptr, TCL_GLOBAL_ONLY);
    m_lastError = info && *info ? info : Tcl_GetStringResult(m_interp);
    PLOGD << "TclInterp: eval failed: " << Tcl_GetStringResult(m_interp);
    return false;
}

std::string TclInterp::result() const
{
    if (!m_interp)
        return std::string();
    int len = 0;
    const char *s = Tcl_GetStringFromObj(Tcl_GetObjResult(m_interp), &len);
    return std::string(s, static_cast<size_t>(len));
}

void TclInterp::setResult(const std::string &value)
{
    if (m_interp)
        Tcl_SetObjResult(m_interp, Tcl_NewStringObj(value.data(), static_cast<int>(value.size())));
}

bool TclInterp::newCommand(const std::string &name, CommandProc proc, std::any clientData,
                           CommandDeleteProc onDelete, TclCommand *out)
{
    if (!m_interp)
    {
        m_lastError = "interpreter is closed";
        return false;
    }
    if (!proc)
    {
        m_lastError = "no callable given for command " + name;
        return false;
    }

    auto reg = std::make_shared<CommandRegistration>(m_interp, name, std::move(proc), std::move(clientData), std::move(onDelete));
    BridgeState &state = BridgeState::get();
    Handle h = state.storeObject(reg);
    if (h == kInvalidHandle)
    {
        m_lastError = "no free handle for command " + name;
        PLOGE << "TclInterp: " << m_lastError;
        return false;
    }

    // An existing command of the same name is deleted by Tcl first, which
    // fires its deletion callback before this one becomes visible.
    Tcl_Command token = Tcl_CreateObjCommand(m_interp, name.c_str(), dispatchCommand,
                                             HandleRegistry::toClientData(h), deleteCommandProc);
    if (!token)
    {
        reg->disarm();
        state.releaseObject(h);
        m_lastError = "cannot create command " + name;
        PLOGW << "TclInterp: " << m_lastError;
        return false;
    }

    PLOGD << "TclInterp: registered command " << name << " as handle " << h;
    if (out)
    {
        out->name = name;
        out->handle = h;
        out->token = token;
    }
    return true;
}

bool TclInterp::deleteCommand(const TclCommand &cmd)
{
    if (!m_interp)
        return false;
    auto reg = BridgeState::get().loadAs<CommandRegistration>(cmd.handle);
    if (!reg || reg->interp() != m_interp)
        return false;
    return Tcl_DeleteCommandFromToken(m_interp, cmd.token) == 0;
}

bool TclInterp::close()
{
    if (!m_interp)
        return false;
    if (m_owned)
    {
        PLOGI << "TclInterp: deleting interpreter " << static_cast<void *>(m_interp);
        Tcl_DeleteInterp(m_interp);
    }
    m_interp = nullptr;
    return true;
}
