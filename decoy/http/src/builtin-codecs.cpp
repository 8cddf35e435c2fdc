#include "decoy/builtin-codecs.hpp"

#include <spdlog/fmt/fmt.h>

#include <any>
#include <fstream>
#include <ios>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "decoy/ascii.hpp"
#include "decoy/base64.hpp"
#include "decoy/body-types.hpp"
#include "decoy/charset.hpp"
#include "decoy/codec-registry.hpp"
#include "decoy/http-constants.hpp"
#include "decoy/multipart.hpp"
#include "decoy/url-decode.hpp"

namespace decoy {

namespace {

std::string ReadStream(std::istream& stream) {
  std::ostringstream oss;
  oss << stream.rdbuf();
  if (stream.bad()) {
    throw std::invalid_argument("Unable to read response body stream");
  }
  return std::move(oss).str();
}

MultipartBody DecodeMultipart(std::string_view bytes, const DecodingContext& ctx) {
  std::string contentTypeHeader = ctx.contentType.essence();
  for (const auto& param : ctx.contentType.params) {
    contentTypeHeader.append("; ").append(param.name).append("=\"").append(param.value).append("\"");
  }
  MultipartBody body = ParseMultipart(contentTypeHeader, bytes);
  for (auto& part : body.parts) {
    // RFC 7578: parts without Content-Type are text/plain
    const std::string_view partContentType =
        part.contentType.empty() ? http::ContentTypeTextPlain : std::string_view(part.contentType);
    part.value = ctx.decodeNested(part.data, partContentType);
  }
  return body;
}

DecoderRegistry MakeBuiltinDecoders() {
  DecoderRegistry registry;
  auto decodeBytes = [](std::string_view bytes, const DecodingContext&) { return Bytes{std::string(bytes)}; };
  auto decodeText = [](std::string_view bytes, const DecodingContext& ctx) { return ToUtf8(bytes, ctx.charset); };
  registry.add<Bytes>(http::ContentTypeAny, decodeBytes)
      .add<Bytes>(http::ContentTypeApplicationOctetStream, decodeBytes)
      .add<std::string>("text/*", decodeText)
      .add<std::string>(http::ContentTypeApplicationJson, decodeText)
      .add<std::string>(http::ContentTypeApplicationXml, decodeText)
      .add<FormParams>(http::ContentTypeFormUrlEncoded,
                       [](std::string_view bytes, const DecodingContext& ctx) {
                         FormParams form;
                         url::ForEachFormPair(ToUtf8(bytes, ctx.charset), [&form](std::string key, std::string value) {
                           form.params.emplace_back(std::move(key), std::move(value));
                         });
                         return form;
                       })
      .add<MultipartBody>("multipart/*", DecodeMultipart);
  return registry;
}

EncoderRegistry MakeBuiltinEncoders() {
  EncoderRegistry registry;
  registry
      .add<std::string>(http::ContentTypeAny,
                        [](const std::string& text, EncodingContext& ctx) { return FromUtf8(text, ctx.charset); })
      .add<Bytes>(http::ContentTypeAny, [](const Bytes& bytes, EncodingContext&) { return bytes.data; })
      .add<Base64Bytes>(http::ContentTypeAny,
                        [](const Base64Bytes& bytes, EncodingContext&) { return B64Encode(bytes.data); })
      .add<FileSource>(http::ContentTypeAny,
                       [](const FileSource& source, EncodingContext&) { return ReadFileContent(source.path.string()); })
      .add<StreamSource>(http::ContentTypeAny,
                         [](const StreamSource& source, EncodingContext&) {
                           if (!source.open) {
                             throw std::invalid_argument("StreamSource without stream factory");
                           }
                           const auto stream = source.open();
                           if (!stream) {
                             throw std::invalid_argument("StreamSource factory returned no stream");
                           }
                           return ReadStream(*stream);
                         })
      .add<UrlSource>(http::ContentTypeAny,
                      [](const UrlSource& source, EncodingContext&) {
                        return ReadFileContent(FileUrlToPath(source.url));
                      })
      .add<MultipartBody>("multipart/*", [](const MultipartBody& body, EncodingContext& ctx) {
        MultipartBody copy = body;
        copy.subtype = ctx.contentType.subtype;
        if (copy.boundary.empty()) {
          if (auto boundary = ctx.contentType.param("boundary")) {
            copy.boundary = *boundary;
          }
        }
        std::string ret = AssembleMultipart(copy, *ctx.chain);
        ctx.contentTypeHeader = copy.contentTypeHeader();
        return ret;
      });
  return registry;
}

}  // namespace

const DecoderRegistry& BuiltinDecoders() {
  static const DecoderRegistry kRegistry = MakeBuiltinDecoders();
  return kRegistry;
}

const EncoderRegistry& BuiltinEncoders() {
  static const EncoderRegistry kRegistry = MakeBuiltinEncoders();
  return kRegistry;
}

std::string AssembleMultipart(MultipartBody& body, const EncoderChain& chain) {
  if (body.boundary.empty()) {
    body.boundary = GenerateBoundary();
  }
  const bool formData = body.subtype == "form-data";
  std::string out;
  for (const auto& part : body.parts) {
    out.append("--").append(body.boundary).append(http::CRLF);
    if (part.value.has_value()) {
      const auto encoded = chain.encode(part.value, part.contentType);
      AppendMultipartPart(part, formData, encoded.body, out);
    } else {
      AppendMultipartPart(part, formData, part.data, out);
    }
  }
  out.append("--").append(body.boundary).append("--").append(http::CRLF);
  return out;
}

std::string ReadFileContent(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::invalid_argument(fmt::format("Unable to open file '{}'", path));
  }
  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw std::invalid_argument(fmt::format("Error while reading file '{}'", path));
  }
  return content;
}

std::string FileUrlToPath(std::string_view url) {
  static constexpr std::string_view kFileScheme = "file://";
  if (!StartsWithCaseInsensitive(url, kFileScheme)) {
    throw std::invalid_argument(fmt::format("Unsupported URL '{}', only file:// URLs can be read", url));
  }
  url.remove_prefix(kFileScheme.size());
  // file://localhost/path and file:///path
  if (StartsWithCaseInsensitive(url, "localhost/")) {
    url.remove_prefix(std::string_view("localhost").size());
  }
  if (!url.starts_with('/')) {
    throw std::invalid_argument("file:// URL with a remote host is not supported");
  }
  return url::DecodeComponent(url, false);
}

}  // namespace decoy
