//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ApiKeyAuth.hpp
// Purpose: Server-side API key check for the HTTP endpoint (Bearer token or Basic password)
//==========================================================================================================

#pragma once

#include <string>

namespace vaultmcp::auth {

//==========================================================================================================
// AuthCheckResult
// Purpose: Result of checking an Authorization header against the configured API key.
// Fields:
//   ok: True if authorization passed (or no key is configured).
//   httpStatus: HTTP status to use on failure (401).
//   errorMessage: Value for the {"error": ...} payload.
//==========================================================================================================
struct AuthCheckResult {
    bool ok{false};
    int httpStatus{401};
    std::string errorMessage;
};

//==========================================================================================================
// CheckApiKeyAuth
// Purpose: Accepts "Bearer <key>" or "Basic base64(user:key)" (any user name). Scheme names are matched
//          case-insensitively; the key itself is compared in constant time.
// Args:
//   authHeader: Value of the Authorization header (may be empty).
//   apiKey: Configured key; an empty key disables the check.
// Returns:
//   AuthCheckResult with "Authentication required" when the header is missing or malformed,
//   "Invalid API key" when the credentials do not match.
//==========================================================================================================
AuthCheckResult CheckApiKeyAuth(const std::string& authHeader, const std::string& apiKey);

// Decodes standard base64; returns false on malformed input.
bool DecodeBase64(const std::string& in, std::string& out);

} // namespace vaultmcp::auth
