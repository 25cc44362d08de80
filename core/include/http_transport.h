#ifndef KSM_HTTP_TRANSPORT_H
#define KSM_HTTP_TRANSPORT_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "error.h"
#include "payload_codec.h"
#include "transmission_key.h"

namespace ksm::core {

// Network failures report ErrorCode::kNetwork; any HTTP status, including
// errors, is a successful exchange.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  // An implementation may replace key.key when it answers from a cache;
  // the caller must decrypt with whatever key holds on return.
  virtual bool Post(const HttpRequest& request, TransmissionKey& key,
                    HttpResponse& out, Error& error) = 0;

  // Plain download, used for file content.
  virtual bool Get(const std::string& url, HttpResponse& out,
                   Error& error) = 0;

  // multipart/form-data POST of fields followed by a "file" part.
  virtual bool Upload(const std::string& url, const HttpHeaders& fields,
                      const std::vector<std::uint8_t>& file,
                      HttpResponse& out, Error& error) = 0;
};

struct HttpsOptions {
  bool verify_ssl{true};
  std::string ca_bundle;
  std::uint32_t timeout_ms{30000};
  std::size_t max_response_bytes{64u * 1024u * 1024u};
};

class HttpsTransport final : public HttpTransport {
 public:
  explicit HttpsTransport(HttpsOptions options);

  bool Post(const HttpRequest& request, TransmissionKey& key,
            HttpResponse& out, Error& error) override;
  bool Get(const std::string& url, HttpResponse& out, Error& error) override;
  bool Upload(const std::string& url, const HttpHeaders& fields,
              const std::vector<std::uint8_t>& file, HttpResponse& out,
              Error& error) override;

 private:
  bool Exchange(const std::string& method, const std::string& url,
                const HttpHeaders& headers,
                const std::vector<std::uint8_t>& body, HttpResponse& out,
                Error& error);

  HttpsOptions options_;
};

// Saves raw transmission key || response body of every successful
// get_secret and replays it when the wrapped transport cannot reach the
// server.
class CachingTransport final : public HttpTransport {
 public:
  CachingTransport(std::shared_ptr<HttpTransport> inner,
                   std::filesystem::path cache_path);

  bool Post(const HttpRequest& request, TransmissionKey& key,
            HttpResponse& out, Error& error) override;
  bool Get(const std::string& url, HttpResponse& out, Error& error) override;
  bool Upload(const std::string& url, const HttpHeaders& fields,
              const std::vector<std::uint8_t>& file, HttpResponse& out,
              Error& error) override;

 private:
  bool Save(const TransmissionKey& key, const HttpResponse& response) const;
  bool Replay(TransmissionKey& key, HttpResponse& out) const;

  std::shared_ptr<HttpTransport> inner_;
  std::filesystem::path cache_path_;
};

struct ParsedUrl {
  std::string host;
  std::uint16_t port{443};
  std::string target{"/"};
};

bool ParseHttpsUrl(const std::string& url, ParsedUrl& out, Error& error);

// Form fields in order, then the file part as application/octet-stream.
std::vector<std::uint8_t> BuildMultipartBody(
    const std::string& boundary, const HttpHeaders& fields,
    const std::vector<std::uint8_t>& file);

// Parses a complete HTTP/1.1 response read until connection close.
// Handles Content-Length, chunked and close-delimited bodies.
bool ParseHttpResponse(const std::vector<std::uint8_t>& raw,
                       HttpResponse& out, Error& error);

}  // namespace ksm::core

#endif  // KSM_HTTP_TRANSPORT_H
