#include "decoy/mock-server-config.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "decoy/compression-config.hpp"
#include "decoy/http-status-code.hpp"

namespace decoy {

MockServerConfig& MockServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

MockServerConfig& MockServerConfig::withNbThreads(uint32_t nbThreads) {
  this->nbThreads = nbThreads;
  return *this;
}

MockServerConfig& MockServerConfig::withSecure(bool secure) {
  this->secure = secure;
  return *this;
}

MockServerConfig& MockServerConfig::withNoMatchStatus(http::StatusCode status) {
  noMatchStatus = status;
  return *this;
}

MockServerConfig& MockServerConfig::withNoMatchBody(std::string_view body, std::string_view contentType) {
  noMatchBody = body;
  noMatchContentType = contentType;
  return *this;
}

MockServerConfig& MockServerConfig::withVerifyPollInterval(std::chrono::milliseconds interval) {
  verifyPollInterval = interval;
  return *this;
}

MockServerConfig& MockServerConfig::withLogMismatchReports(bool on) {
  logMismatchReports = on;
  return *this;
}

MockServerConfig& MockServerConfig::withMaxDecompressedBodyBytes(std::size_t maxBytes) {
  maxDecompressedBodyBytes = maxBytes;
  return *this;
}

MockServerConfig& MockServerConfig::withCompression(CompressionConfig compressionConfig) {
  compression = std::move(compressionConfig);
  return *this;
}

void MockServerConfig::validate() const {
  compression.validate();

  if (nbThreads == 0) {
    throw std::invalid_argument("nbThreads should be at least 1");
  }
  if (verifyPollInterval.count() <= 0) {
    throw std::invalid_argument(
        fmt::format("verifyPollInterval should be strictly positive, got {} ms", verifyPollInterval.count()));
  }
  if (!http::IsValidStatusCode(noMatchStatus)) {
    throw std::invalid_argument(fmt::format("Invalid no-match status code {}", noMatchStatus));
  }
}

}  // namespace decoy
