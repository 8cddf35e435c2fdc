#pragma once

#include <string_view>

namespace decoy::http {

inline constexpr std::string_view GET = "GET";

// Header names in canonical case, headers are always looked up case-insensitively.
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentDisposition = "Content-Disposition";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Cookie = "Cookie";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view KeepAlive = "Keep-Alive";
inline constexpr std::string_view ProxyConnection = "Proxy-Connection";
inline constexpr std::string_view TE = "TE";
inline constexpr std::string_view Trailer = "Trailer";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view Upgrade = "Upgrade";
inline constexpr std::string_view Vary = "Vary";

// Content codings (RFC 9110 section 8.4.1, RFC 8878 for zstd, RFC 7932 for br)
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view deflate = "deflate";
inline constexpr std::string_view zstd = "zstd";
inline constexpr std::string_view br = "br";

inline constexpr std::string_view chunked = "chunked";

inline constexpr std::string_view ContentTypeAny = "*/*";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";
inline constexpr std::string_view ContentTypeApplicationXml = "application/xml";
inline constexpr std::string_view ContentTypeFormUrlEncoded = "application/x-www-form-urlencoded";
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";

inline constexpr std::string_view CharsetIso88591 = "iso-8859-1";
inline constexpr std::string_view CharsetUsAscii = "us-ascii";
inline constexpr std::string_view CharsetUtf8 = "utf-8";

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

}  // namespace decoy::http
