//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/vaultmcp/auth/ApiKeyAuth.cpp
// Purpose: API key authentication helpers implementation
//==========================================================================================================

#include <cctype>
#include <string>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include "vaultmcp/auth/ApiKeyAuth.hpp"

namespace vaultmcp::auth {

namespace {
    static bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    // Returns the credentials following "<scheme> " when the header starts with that scheme.
    static bool stripScheme(const std::string& header, const std::string& scheme, std::string& rest) {
        const std::string pfx = scheme + " ";
        if (header.size() < pfx.size()) {
            return false;
        }
        for (size_t i = 0; i < pfx.size(); ++i) {
            if (!icaseEqual(header[i], pfx[i])) {
                return false;
            }
        }
        rest = header.substr(pfx.size());
        while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front())) != 0) {
            rest.erase(rest.begin());
        }
        while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back())) != 0) {
            rest.pop_back();
        }
        return true;
    }

    static bool constantTimeEquals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    static AuthCheckResult fail(const char* message) {
        AuthCheckResult r;
        r.ok = false;
        r.httpStatus = 401;
        r.errorMessage = message;
        return r;
    }
}

bool DecodeBase64(const std::string& in, std::string& out) {
    if (in.empty() || in.size() % 4 != 0) {
        return false;
    }
    std::vector<unsigned char> buf(in.size() / 4 * 3 + 1);
    const int n = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(in.data()),
                                  static_cast<int>(in.size()));
    if (n < 0) {
        return false;
    }
    size_t padding = 0;
    if (in[in.size() - 1] == '=') {
        ++padding;
        if (in[in.size() - 2] == '=') {
            ++padding;
        }
    }
    out.assign(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n) - padding);
    return true;
}

AuthCheckResult CheckApiKeyAuth(const std::string& authHeader, const std::string& apiKey) {
    if (apiKey.empty()) {
        AuthCheckResult r;
        r.ok = true;
        r.httpStatus = 200;
        return r;
    }
    if (authHeader.empty()) {
        return fail("Authentication required");
    }

    std::string credential;
    if (stripScheme(authHeader, "Bearer", credential)) {
        if (credential.empty()) {
            return fail("Authentication required");
        }
        if (!constantTimeEquals(credential, apiKey)) {
            return fail("Invalid API key");
        }
    } else if (stripScheme(authHeader, "Basic", credential)) {
        std::string decoded;
        if (!DecodeBase64(credential, decoded)) {
            return fail("Authentication required");
        }
        const auto colon = decoded.find(':');
        if (colon == std::string::npos) {
            return fail("Authentication required");
        }
        if (!constantTimeEquals(decoded.substr(colon + 1), apiKey)) {
            return fail("Invalid API key");
        }
    } else {
        return fail("Authentication required");
    }

    AuthCheckResult r;
    r.ok = true;
    r.httpStatus = 200;
    return r;
}

} // namespace vaultmcp::auth
