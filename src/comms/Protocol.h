#pragma once

#include <string>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the host <-> I/O board wire protocol.

  Wire format:
    - Newline-delimited JSON (one object per line)
===============================================================================
*/

namespace protocol {

// Wire name of an action ("start_chug", "servo", ...)
const char* actionName(BoardAction action);

/*=============================================================================
  ENCODE (Host -> Board)
=============================================================================*/

// Appends one command JSON line (including trailing '\n') to out
void encodeActionLine(const ActionFrame& a, std::string& out);


/*=============================================================================
  DECODE (Board -> Host)
=============================================================================*/

/*
  Attempts to parse one telemetry JSON line.

  Returns:
    - true if decoded into out (and out.valid will be true)
    - false if not a telemetry frame or parse failed
*/
bool decodeTelemetryLine(const char* line, TelemetryFrame& out);

}  // namespace protocol
