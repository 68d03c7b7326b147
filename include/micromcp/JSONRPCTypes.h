//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON document model and JSON-RPC 2.0 message types
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace micromcp {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
};

// Structural equality (object member order is irrelevant; int64 and double never compare equal)
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// ParseJSON
// Purpose: Strict parse of a complete JSON document (trailing non-whitespace is an error).
// Args:
//   text: Input document.
//   out: Receives the parsed value on success.
//   error: Receives a human-readable description on failure.
// Returns:
//   true on success; false otherwise (out is left untouched).
//==========================================================================================================
bool ParseJSON(const std::string& text, JSONValue& out, std::string& error);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON text for a value (no insignificant whitespace).
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// Object helpers
// Purpose: Small accessors over JSONValue::Object used by the dispatcher and tests.
//==========================================================================================================
// Returns the member value or nullptr when v is not an object or the key is absent.
const JSONValue* FindMember(const JSONValue& v, const std::string& key);
// Returns the member as string when present and of string type.
std::optional<std::string> GetStringMember(const JSONValue& v, const std::string& key);
// Inserts or replaces a member on an object map.
void SetMember(JSONValue::Object& obj, const std::string& key, JSONValue value);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, number, or null.
//   Non-integral numbers (and integers beyond int64 range) are kept as double.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, double, std::nullptr_t>;

// Converts a raw id member to JSONRPCId; objects, arrays, booleans (and a missing id) map to null.
JSONRPCId IdFromValue(const JSONValue* raw);
JSONValue IdToValue(const JSONRPCId& id);
std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCRequest
// Purpose: Incoming JSON-RPC 2.0 request as seen by the dispatcher.
// Methods:
//   FromValue(v): Populates from a parsed object; false when v is not an object.
//                 A missing or null params member becomes an empty object.
//==========================================================================================================
class JSONRPCRequest {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id{nullptr};
    std::string method;
    JSONValue params{JSONValue::Object{}};

    bool FromValue(const JSONValue& v);
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response carrying either result or error.
// Methods:
//   ToValue(): JSON object form (used when collecting batch replies).
//   Serialize(): Compact JSON text of ToValue().
//   IsError(): True when error is present.
//==========================================================================================================
class JSONRPCResponse {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id{nullptr};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    JSONValue ToValue() const;
    std::string Serialize() const;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace micromcp
