#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "Policy.h"

namespace auth {

struct Claims {
    int64_t sub = 0;
    Role role = Role::patient;
    int64_t iat = 0;
    int64_t exp = 0;
};

// HS256. Issuance belongs to the identity service; this exists for tests and tooling.
std::string create_jwt(const Claims& c, const std::string& secret);

// nullopt on a bad signature, an expired token, an iat more than a minute ahead,
// a non-numeric subject or an unknown role.
std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret, int64_t now_unix);
std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret);

inline Caller caller_from_claims(const Claims& c) { return Caller{c.sub, c.role}; }

// "Bearer <token>" header value to a caller.
std::optional<Caller> authenticate_bearer(const std::string& authorization, const std::string& secret);

}
