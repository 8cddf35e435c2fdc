#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "decoy/named-value.hpp"

namespace decoy {

// Parsed media type (RFC 9110 §8.3.1): type "/" subtype *( OWS ";" OWS parameter ).
// Type, subtype and parameter names are lower-cased, parameter values are unquoted and kept as is.
struct MediaType {
  std::string type;
  std::string subtype;
  NamedValues params;

  // Parses 'str'. Returns std::nullopt if it is not a syntactically valid media type.
  [[nodiscard]] static std::optional<MediaType> Parse(std::string_view str);

  // Same as Parse, but throws std::invalid_argument on invalid input.
  [[nodiscard]] static MediaType ParseOrThrow(std::string_view str);

  // "type/subtype" without parameters.
  [[nodiscard]] std::string essence() const;

  [[nodiscard]] std::optional<std::string_view> param(std::string_view name) const noexcept;

  // Lower-cased charset parameter, or empty if absent.
  [[nodiscard]] std::string charset() const;

  [[nodiscard]] bool isMultipart() const noexcept { return type == "multipart"; }

  bool operator==(const MediaType&) const noexcept = default;
};

// Specificity of a media range ("*/*", "text/*", "text/plain") against a concrete media type.
enum class MediaRangeMatch : int8_t { none, any, typeWildcard, exact };

// Matches the media range 'range' (parameters are ignored) against 'mediaType'. Comparison is case-insensitive.
[[nodiscard]] MediaRangeMatch MatchMediaRange(std::string_view range, const MediaType& mediaType);

// Returns true if 'range' is a syntactically valid media range usable for codec registration.
[[nodiscard]] bool IsValidMediaRange(std::string_view range);

}  // namespace decoy
