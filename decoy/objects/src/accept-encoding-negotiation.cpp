#include "decoy/accept-encoding-negotiation.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>

#include "decoy/ascii.hpp"
#include "decoy/compression-config.hpp"
#include "decoy/encoding.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/string-trim.hpp"
#include "decoy/vector.hpp"

namespace decoy {

namespace {

struct AcceptedCoding {
  std::string_view name;
  double quality;
};

double ParseQuality(std::string_view params) {
  while (!params.empty()) {
    const auto semicolon = params.find(';');
    const std::string_view param = TrimOws(params.substr(0, semicolon));
    params = semicolon == std::string_view::npos ? std::string_view{} : params.substr(semicolon + 1);
    if (param.size() < 2 || AsciiLower(param[0]) != 'q' || param[1] != '=') {
      continue;
    }
    const std::string_view value = TrimOws(param.substr(2));
    double quality = 0.0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), quality);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
      return 0.0;
    }
    return std::clamp(quality, 0.0, 1.0);
  }
  return 1.0;
}

vector<AcceptedCoding> ParseAcceptEncoding(std::string_view header) {
  vector<AcceptedCoding> codings;
  while (!header.empty()) {
    const auto comma = header.find(',');
    const std::string_view element = header.substr(0, comma);
    header = comma == std::string_view::npos ? std::string_view{} : header.substr(comma + 1);
    const auto semicolon = element.find(';');
    const std::string_view name = TrimOws(element.substr(0, semicolon));
    if (name.empty()) {
      continue;
    }
    const double quality =
        semicolon == std::string_view::npos ? 1.0 : ParseQuality(element.substr(semicolon + 1));
    codings.push_back(AcceptedCoding{name, quality});
  }
  return codings;
}

// Quality of the first element naming 'name'.
std::optional<double> ListedQuality(const vector<AcceptedCoding>& codings, std::string_view name) {
  auto it = std::ranges::find_if(codings, [name](const AcceptedCoding& coding) {
    return CaseInsensitiveEqual(coding.name, name);
  });
  return it == codings.end() ? std::nullopt : std::optional<double>(it->quality);
}

}  // namespace

EncodingSelector::EncodingSelector(const CompressionConfig& compressionConfig) {
  auto consider = [this](Encoding encoding) {
    if (encoding == Encoding::none || !IsEncodingEnabled(encoding)) {
      return;
    }
    if (std::ranges::find(_preference, encoding) == _preference.end()) {
      _preference.push_back(encoding);
    }
  };
  if (compressionConfig.preferredFormats.empty()) {
    for (std::size_t pos = 0; pos < kNbEncodings; ++pos) {
      consider(static_cast<Encoding>(pos));
    }
  } else {
    std::ranges::for_each(compressionConfig.preferredFormats, consider);
  }
}

EncodingSelector::NegotiatedResult EncodingSelector::negotiateAcceptEncoding(std::string_view acceptEncoding) const {
  NegotiatedResult ret;
  const auto codings = ParseAcceptEncoding(acceptEncoding);
  if (codings.empty()) {
    return ret;
  }
  const auto wildcard = ListedQuality(codings, "*");

  double bestQuality = 0.0;
  for (Encoding encoding : _preference) {
    const double quality = ListedQuality(codings, EncodingToken(encoding)).value_or(wildcard.value_or(0.0));
    if (quality > bestQuality) {
      bestQuality = quality;
      ret.encoding = encoding;
    }
  }
  if (ret.encoding == Encoding::none) {
    const auto identity = ListedQuality(codings, http::identity);
    ret.reject = identity ? *identity <= 0.0 : (wildcard && *wildcard <= 0.0);
  }
  return ret;
}

}  // namespace decoy
