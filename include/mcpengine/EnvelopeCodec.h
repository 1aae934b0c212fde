//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeCodec.h
// Purpose: Validating decoder from frame payloads to typed JSON-RPC envelopes.
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

using Envelope = std::variant<JSONRPCRequest, JSONRPCNotification, JSONRPCResponse>;

//==========================================================================================================
// DecodeResult
// Purpose: Outcome of decoding one payload.
// Fields:
//   envelope: present on success.
//   error: present on failure (ParseError or InvalidRequest).
//   recoveredId: id salvaged from a rejected message so the error response can be correlated.
//==========================================================================================================
struct DecodeResult {
    std::optional<Envelope> envelope;
    std::optional<JSONRPCError> error;
    std::optional<RequestId> recoveredId;

    bool ok() const { return envelope.has_value(); }
};

//==========================================================================================================
// DecodeEnvelope
// Purpose: Parses and validates a payload.
// Rules:
//   - malformed JSON                       -> ParseError
//   - top level not an object              -> InvalidRequest
//   - jsonrpc absent or not "2.0"          -> InvalidRequest
//   - id neither string, integer nor null  -> InvalidRequest
//   - method missing / not a string        -> InvalidRequest (unless the object is a response)
//   - method ""                            -> InvalidRequest "Method cannot be empty"
//   - method with id -> request; method without id (or null id) -> notification
//   - no method but result/error           -> response
// Notes:
//   Never throws.
//==========================================================================================================
DecodeResult DecodeEnvelope(const std::string& payload);

// Method name of a request or notification envelope; empty for responses.
std::string EnvelopeMethod(const Envelope& envelope);

} // namespace mcpengine
