//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, Result<T> return type, and the JSON-RPC error response helper
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "micromcp/JSONRPCTypes.h"

namespace micromcp {
namespace errors {

// Categorization of JSON-RPC error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Typed error representation.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: return ErrorCategory::Unknown;
    }
}

// Build an McpError with its category derived from the code.
inline McpError makeError(int code, std::string message) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors

//==========================================================================================================
// Result
// Purpose: Explicit success-or-error return value for handler and configuration paths.
// Notes:
//   Holds exactly one of T or errors::McpError. value() on an error result throws std::logic_error.
//==========================================================================================================
template <typename T>
class Result {
public:
    Result(T value) : state(std::in_place_index<0>, std::move(value)) {}
    Result(errors::McpError error) : state(std::in_place_index<1>, std::move(error)) {}

    static Result Failure(int code, std::string message) {
        return Result(errors::makeError(code, std::move(message)));
    }

    bool ok() const { return state.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) {
            throw std::logic_error("Result::value() called on error: " + std::get<1>(state).message);
        }
        return std::get<0>(state);
    }
    T& value() {
        if (!ok()) {
            throw std::logic_error("Result::value() called on error: " + std::get<1>(state).message);
        }
        return std::get<0>(state);
    }

    const errors::McpError& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() called on success");
        }
        return std::get<1>(state);
    }

private:
    std::variant<T, errors::McpError> state;
};

} // namespace micromcp
