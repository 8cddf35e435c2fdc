#pragma once

#include <string>
#include <string_view>

#include "decoy/codec-registry.hpp"
#include "decoy/multipart.hpp"

namespace decoy {

// Decoders always available at the end of every decoder chain:
//  - */* and application/octet-stream           -> Bytes
//  - text/*, application/json, application/xml -> std::string (transcoded to UTF-8 from its charset)
//  - application/x-www-form-urlencoded         -> FormParams
//  - multipart/*                               -> MultipartBody, parts decoded through the chain
[[nodiscard]] const DecoderRegistry& BuiltinDecoders();

// Encoders always available at the end of every encoder chain, for any media type:
//  - std::string   (converted from UTF-8 to the charset parameter, if any)
//  - Bytes         (as is)
//  - Base64Bytes   (base64 text)
//  - FileSource, StreamSource, UrlSource (bytes read from the source)
//  - MultipartBody (multipart/* only, parts encoded through the chain)
[[nodiscard]] const EncoderRegistry& BuiltinEncoders();

// Serializes 'body' with its boundary (generating one if empty), encoding the parts holding an object through
// 'chain'. Returns the body bytes; 'body.boundary' is updated when generated.
[[nodiscard]] std::string AssembleMultipart(MultipartBody& body, const EncoderChain& chain);

// Reads the whole content of a file, throwing std::invalid_argument if it cannot be read.
[[nodiscard]] std::string ReadFileContent(const std::string& path);

// Resolves a file:// URL to its local path. Throws std::invalid_argument for other schemes.
[[nodiscard]] std::string FileUrlToPath(std::string_view url);

}  // namespace decoy
