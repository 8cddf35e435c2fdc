#pragma once

#include <cstdint>

namespace decoy::http {

using StatusCode = int16_t;

// Codes decoy produces by itself, any code in [100, 599] can be declared by a responder.
inline constexpr StatusCode StatusCodeSwitchingProtocols = 101;
inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeAccepted = 202;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeNotAcceptable = 406;
inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeNotImplemented = 501;

constexpr bool IsValidStatusCode(int status) noexcept { return status >= 100 && status <= 599; }

}  // namespace decoy::http
