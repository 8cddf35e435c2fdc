#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace decoy::http {

enum class Method : uint8_t { GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH };

inline constexpr Method kAllMethods[] = {Method::GET,     Method::HEAD,    Method::POST,
                                         Method::PUT,     Method::DELETE,  Method::CONNECT,
                                         Method::OPTIONS, Method::TRACE,   Method::PATCH};

[[nodiscard]] std::string_view MethodToStr(Method method) noexcept;

// Method tokens are case-sensitive (RFC 9110 §9.1).
[[nodiscard]] std::optional<Method> MethodFromStr(std::string_view str) noexcept;

}  // namespace decoy::http
