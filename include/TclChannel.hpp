// TclChannel.hpp - Tcl channel type over registry-held FileStreams
#pragma once
#include "FileSystem.hpp"
#include <memory>
#include <string>
#include <tcl.h>

// Read-only, blocking channel type. instanceData is the stream's registry
// handle. Seeking fails with ESPIPE; watching for any event panics.
const Tcl_ChannelType *bridgeChannelType();

// Stores stream in the registry and wraps it in a readable channel. The
// channel's close hook releases the handle, which closes the stream.
Tcl_Channel createStreamChannel(std::shared_ptr<FileStream> stream, const std::string &path);
