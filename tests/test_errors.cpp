//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures, Result<T> and error responses
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "micromcp/JSONRPCTypes.h"
#include "micromcp/errors/Errors.h"

using namespace micromcp;

TEST(Errors, CategoryMapping) {
    using micromcp::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ErrorResponseCarriesCodeMessageAndData) {
    errors::McpError e = errors::makeError(JSONRPCErrorCodes::InvalidParams, "Resource not found: x://y");
    e.data = JSONValue(std::string("detail"));
    auto resp = errors::makeErrorResponse(static_cast<int64_t>(9), e);
    ASSERT_TRUE(resp->IsError());
    EXPECT_FALSE(resp->result.has_value());
    EXPECT_EQ(std::get<int64_t>(resp->id), 9);

    const JSONValue& err = *resp->error;
    ASSERT_NE(FindMember(err, "code"), nullptr);
    EXPECT_EQ(std::get<int64_t>(FindMember(err, "code")->value), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(GetStringMember(err, "message").value_or(""), "Resource not found: x://y");
    EXPECT_EQ(GetStringMember(err, "data").value_or(""), "detail");
}

TEST(Result, HoldsValue) {
    Result<std::string> r(std::string("text"));
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), "text");
    EXPECT_THROW((void)r.error(), std::logic_error);
}

TEST(Result, HoldsErrorAndValueAccessThrows) {
    auto r = Result<JSONValue>::Failure(JSONRPCErrorCodes::InternalError, "boom");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(r.error().message, "boom");
    EXPECT_EQ(r.error().category, errors::ErrorCategory::JsonRpcInternal);
    EXPECT_THROW((void)r.value(), std::logic_error);
}
