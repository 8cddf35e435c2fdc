#pragma once

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/named-value.hpp"
#include "decoy/vector.hpp"

namespace decoy {

struct MultipartPart {
  // Name from the Content-Disposition header. Mandatory for multipart/form-data, may be empty otherwise.
  std::string name;
  std::optional<std::string> filename;
  // Content-Type of the part, empty if not specified.
  std::string contentType;
  // When parsing: all headers of the part. When assembling: extra headers to write, besides Content-Disposition and
  // Content-Type that are generated from the fields above.
  NamedValues headers;
  // Raw bytes of the part.
  std::string data;
  // When parsing: the part decoded through the decoder chain, if a decoder exists for its content type.
  // When assembling: if set, the object encoded through the part encoders instead of 'data'.
  std::any value;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return FindFirstValue(headers, key, true).value_or(std::string_view{});
  }
};

struct MultipartBody {
  // Media subtype of the body ("form-data", "mixed", ...).
  std::string subtype{"form-data"};
  // Boundary delimiter. Generated at assembly time if empty.
  std::string boundary;
  vector<MultipartPart> parts;

  // Adds a text/plain field.
  MultipartBody& field(std::string_view name, std::string_view value);

  // Adds a raw part.
  MultipartBody& file(std::string_view name, std::string_view filename, std::string_view contentType,
                      std::string_view data);

  // Adds a part whose bytes are produced by encoding 'object' as 'contentType'.
  template <class T>
  MultipartBody& object(std::string_view name, T object, std::string_view contentType) {
    auto& part = parts.emplace_back();
    part.name = name;
    part.contentType = contentType;
    part.value = std::any(std::move(object));
    return *this;
  }

  // First part named 'name', or nullptr.
  [[nodiscard]] const MultipartPart* part(std::string_view name) const noexcept;

  // Content-Type header value: multipart/<subtype>; boundary=<boundary>.
  [[nodiscard]] std::string contentTypeHeader() const;
};

struct MultipartParseOptions {
  std::size_t maxParts{128};
  std::size_t maxHeadersPerPart{32};
  std::size_t maxPartSizeBytes{32ULL * 1024ULL * 1024ULL};
};

// Parses a multipart/* body whose Content-Type header is 'contentTypeHeader'.
// Throws std::invalid_argument with the reason if the body is malformed. 'value' of the parts is left empty.
[[nodiscard]] MultipartBody ParseMultipart(std::string_view contentTypeHeader, std::string_view body,
                                           MultipartParseOptions options = {});

// Generates a random boundary delimiter (RFC 2046 §5.1.1).
[[nodiscard]] std::string GenerateBoundary();

// Serializes headers and bytes of a single part into 'out', followed by CRLF (without delimiter).
// 'data' is the part payload, already encoded.
void AppendMultipartPart(const MultipartPart& part, bool formData, std::string_view data, std::string& out);

}  // namespace decoy
