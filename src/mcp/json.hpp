#pragma once

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// JSON-RPC 2.0 error codes
constexpr int RPC_PARSE_ERROR      = -32700;
constexpr int RPC_INVALID_REQUEST  = -32600;
constexpr int RPC_METHOD_NOT_FOUND = -32601;
constexpr int RPC_INVALID_PARAMS   = -32602;
constexpr int RPC_INTERNAL_ERROR   = -32603;
