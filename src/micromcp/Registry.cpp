//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/micromcp/Registry.cpp
// Purpose: Wire shapes of registry descriptors
//==========================================================================================================

#include "micromcp/Registry.h"

namespace micromcp {

JSONValue Tool::ToSchema() const {
    JSONValue::Object obj;
    SetMember(obj, "name", JSONValue(name));
    SetMember(obj, "description", JSONValue(description));
    SetMember(obj, "inputSchema", inputSchema);
    return JSONValue{obj};
}

JSONValue Resource::ToSchema() const {
    JSONValue::Object obj;
    SetMember(obj, "uri", JSONValue(uri));
    SetMember(obj, "name", JSONValue(name));
    SetMember(obj, "description", JSONValue(description));
    SetMember(obj, "mimeType", JSONValue(mimeType));
    return JSONValue{obj};
}

} // namespace micromcp
