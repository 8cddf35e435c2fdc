#include "decoy/multipart.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

#include "decoy/ascii.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/media-type.hpp"
#include "decoy/named-value.hpp"
#include "decoy/string-trim.hpp"

namespace decoy {
namespace {

constexpr std::string_view kDoubleDash{"--"};
constexpr std::string_view kMiddleBoundaryPrefix{"\r\n--"};

struct ContentDispositionInfo {
  std::string type;
  std::string name;
  std::optional<std::string> filename;
};

[[noreturn]] void Invalid(std::string_view reason) { throw std::invalid_argument(std::string(reason)); }

ContentDispositionInfo ParseContentDisposition(std::string_view headerValue) {
  std::string_view trimmed = TrimOws(headerValue);
  if (trimmed.empty()) {
    Invalid("multipart part missing Content-Disposition value");
  }

  ContentDispositionInfo ret;
  bool firstToken = true;
  while (!trimmed.empty()) {
    const auto semicolon = trimmed.find(';');
    const std::string_view token = TrimOws(trimmed.substr(0, semicolon));
    if (token.empty()) {
      Invalid("multipart part invalid Content-Disposition parameter");
    }

    if (firstToken) {
      ret.type = token;
    } else {
      const auto eq = token.find('=');
      if (eq == std::string_view::npos) {
        Invalid("multipart part invalid Content-Disposition parameter");
      }
      const std::string_view key = TrimOws(token.substr(0, eq));
      const std::string_view value = StripQuotes(TrimOws(token.substr(eq + 1)));
      if (CaseInsensitiveEqual(key, "name")) {
        ret.name = value;
      } else if (CaseInsensitiveEqual(key, "filename")) {
        ret.filename = std::string(value);
      } else if (CaseInsensitiveEqual(key, "filename*")) {
        // RFC 5987 style: charset'lang'value. Only the simplest utf-8''value case is supported.
        const auto firstTick = value.find('\'');
        const auto secondTick = firstTick == std::string_view::npos ? firstTick : value.find('\'', firstTick + 1);
        if (secondTick == std::string_view::npos) {
          Invalid("multipart part invalid Content-Disposition filename* parameter");
        }
        ret.filename = std::string(value.substr(secondTick + 1));
      }
    }

    if (semicolon == std::string_view::npos) {
      break;
    }
    trimmed.remove_prefix(semicolon + 1);
    firstToken = false;
  }
  return ret;
}

void AppendHeader(std::string_view line, const MultipartParseOptions& options, MultipartPart& part) {
  const auto colon = line.find(':');
  if (colon == std::string_view::npos) {
    Invalid("multipart part header missing colon");
  }
  const auto name = TrimOws(line.substr(0, colon));
  if (name.empty()) {
    Invalid("multipart part header missing name");
  }
  if (options.maxHeadersPerPart != 0 && part.headers.size() >= options.maxHeadersPerPart) {
    Invalid("multipart part exceeds header limit");
  }
  part.headers.emplace_back(std::string(name), std::string(TrimOws(line.substr(colon + 1))));
}

// Consumes "--<boundary>" at the beginning of 'body'.
void MatchBoundary(std::string_view& body, std::string_view boundary) {
  if (!body.starts_with(kDoubleDash) || !body.substr(kDoubleDash.size()).starts_with(boundary)) {
    Invalid("multipart body missing boundary");
  }
  body.remove_prefix(kDoubleDash.size() + boundary.size());
}

}  // namespace

MultipartBody& MultipartBody::field(std::string_view name, std::string_view value) {
  auto& part = parts.emplace_back();
  part.name = name;
  part.contentType = http::ContentTypeTextPlain;
  part.data = value;
  return *this;
}

MultipartBody& MultipartBody::file(std::string_view name, std::string_view filename, std::string_view contentType,
                                   std::string_view data) {
  auto& part = parts.emplace_back();
  part.name = name;
  part.filename = std::string(filename);
  part.contentType = contentType;
  part.data = data;
  return *this;
}

const MultipartPart* MultipartBody::part(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(parts, [name](const MultipartPart& part) { return part.name == name; });
  return it == parts.end() ? nullptr : &*it;
}

std::string MultipartBody::contentTypeHeader() const {
  return fmt::format("multipart/{}; boundary=\"{}\"", subtype, boundary);
}

MultipartBody ParseMultipart(std::string_view contentTypeHeader, std::string_view body,
                             MultipartParseOptions options) {
  const auto mediaType = MediaType::Parse(contentTypeHeader);
  if (!mediaType || !mediaType->isMultipart()) {
    Invalid("content type is not multipart");
  }
  const auto boundaryParam = mediaType->param("boundary");
  if (!boundaryParam || boundaryParam->empty()) {
    Invalid("multipart boundary missing");
  }
  const std::string_view boundary = *boundaryParam;
  const bool formData = mediaType->subtype == "form-data";

  MultipartBody ret;
  ret.subtype = mediaType->subtype;
  ret.boundary = boundary;

  // A preamble may precede the first delimiter
  if (!body.starts_with(kDoubleDash)) {
    const auto firstDelimiter = body.find(kMiddleBoundaryPrefix);
    if (firstDelimiter == std::string_view::npos) {
      Invalid("multipart body missing starting boundary");
    }
    body.remove_prefix(firstDelimiter + http::CRLF.size());
  }
  MatchBoundary(body, boundary);

  if (body.starts_with(kDoubleDash)) {
    // no parts at all
    return ret;
  }
  if (!body.starts_with(http::CRLF)) {
    Invalid("multipart boundary not followed by CRLF");
  }
  body.remove_prefix(http::CRLF.size());

  while (true) {
    if (options.maxParts != 0 && ret.parts.size() >= options.maxParts) {
      Invalid("multipart exceeds part limit");
    }

    auto& part = ret.parts.emplace_back();

    // An empty header block is allowed: the part starts directly with CRLF
    std::string_view headerBlock;
    if (body.starts_with(http::CRLF)) {
      body.remove_prefix(http::CRLF.size());
    } else {
      const auto headerEnd = body.find(http::DoubleCRLF);
      if (headerEnd == std::string_view::npos) {
        Invalid("multipart part missing header terminator");
      }
      headerBlock = body.substr(0, headerEnd);
      body.remove_prefix(headerEnd + http::DoubleCRLF.size());
    }

    while (!headerBlock.empty()) {
      const auto lineEnd = headerBlock.find(http::CRLF);
      const std::string_view line = headerBlock.substr(0, lineEnd);
      headerBlock = lineEnd == std::string_view::npos ? std::string_view{}
                                                      : headerBlock.substr(lineEnd + http::CRLF.size());
      if (!line.empty()) {
        AppendHeader(line, options, part);
      }
    }

    const auto contentDisposition = FindFirstValue(part.headers, http::ContentDisposition, true);
    if (contentDisposition) {
      auto cdInfo = ParseContentDisposition(*contentDisposition);
      if (formData && !CaseInsensitiveEqual(cdInfo.type, "form-data")) {
        Invalid("multipart part must have Content-Disposition: form-data");
      }
      part.name = std::move(cdInfo.name);
      part.filename = std::move(cdInfo.filename);
    } else if (formData) {
      Invalid("multipart part missing Content-Disposition header");
    }
    if (formData && part.name.empty()) {
      Invalid("multipart part missing name parameter");
    }
    part.contentType = part.headerValueOrEmpty(http::ContentType);

    std::size_t boundaryPos = 0;
    while (true) {
      boundaryPos = body.find(kMiddleBoundaryPrefix, boundaryPos);
      if (boundaryPos == std::string_view::npos) {
        Invalid("multipart part missing closing boundary");
      }
      if (body.substr(boundaryPos + kMiddleBoundaryPrefix.size()).starts_with(boundary)) {
        break;
      }
      boundaryPos += kMiddleBoundaryPrefix.size();
    }

    if (options.maxPartSizeBytes != 0 && boundaryPos > options.maxPartSizeBytes) {
      Invalid("multipart part exceeds size limit");
    }
    part.data = body.substr(0, boundaryPos);
    body.remove_prefix(boundaryPos + http::CRLF.size());  // drop CRLF preceding boundary marker

    MatchBoundary(body, boundary);

    if (body.starts_with(kDoubleDash)) {
      // final delimiter, anything after it is an epilogue and is ignored
      break;
    }
    // transport padding is allowed after the delimiter
    body = body.substr(std::min(body.find_first_not_of(" \t"), body.size()));
    if (!body.starts_with(http::CRLF)) {
      Invalid("multipart boundary missing CRLF");
    }
    body.remove_prefix(http::CRLF.size());
  }
  return ret;
}

std::string GenerateBoundary() {
  static constexpr std::string_view kAlphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
  static constexpr std::size_t kRandomLen = 24;

  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> dist(0, kAlphabet.size() - 1U);

  std::string ret("decoy-");
  for (std::size_t pos = 0; pos < kRandomLen; ++pos) {
    ret.push_back(kAlphabet[dist(rng)]);
  }
  return ret;
}

void AppendMultipartPart(const MultipartPart& part, bool formData, std::string_view data, std::string& out) {
  if (formData || !part.name.empty()) {
    out.append(http::ContentDisposition)
        .append(formData ? ": form-data; name=\"" : ": attachment; name=\"")
        .append(part.name)
        .append("\"");
    if (part.filename) {
      out.append("; filename=\"").append(*part.filename).append("\"");
    }
    out.append(http::CRLF);
  }
  if (!part.contentType.empty()) {
    out.append(http::ContentType).append(": ").append(part.contentType).append(http::CRLF);
  }
  for (const auto& header : part.headers) {
    if (CaseInsensitiveEqual(header.name, http::ContentDisposition) ||
        CaseInsensitiveEqual(header.name, http::ContentType)) {
      continue;
    }
    out.append(header.name).append(": ").append(header.value).append(http::CRLF);
  }
  out.append(http::CRLF);
  out.append(data);
  out.append(http::CRLF);
}

}  // namespace decoy
