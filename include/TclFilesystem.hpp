// TclFilesystem.hpp - Tcl_Filesystem driver backed by the mount table
#pragma once
#include "BridgeError.hpp"
#include "FileSystem.hpp"
#include <memory>
#include <string>
#include <tcl.h>

// Registers the driver with Tcl on first use, then mounts fs at point.
// Mounting an occupied point replaces its provider.
BridgeResult mountFileSystem(const std::string &point, std::shared_ptr<FileSystem> fs);
BridgeResult unmountFileSystem(const std::string &point);

// The registered driver; exposed for tests and for Tcl_FSMountsChanged.
const Tcl_Filesystem *bridgeFilesystem();
