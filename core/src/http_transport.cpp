#include "http_transport.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

#include "crypto.h"
#include "encoding_utils.h"
#include "platform_fs.h"
#include "platform_log.h"
#include "platform_net.h"
#include "platform_random.h"
#include "platform_time.h"
#include "platform_tls.h"
#include "secure_buffer.h"

namespace ksm::core {

namespace {

constexpr char kTag[] = "http";
constexpr char kCrlf[] = "\r\n";

std::string ToLower(std::string s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return s;
}

std::string Trim(const std::string& s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Socket and TLS session released together.
class Connection {
 public:
  Connection() = default;
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  ~Connection() {
    platform::tls::Close(tls_);
    platform::net::CloseSocket(sock_);
  }

  bool Open(const ParsedUrl& url, const HttpsOptions& options,
            Error& error) {
    std::string net_error;
    if (!platform::net::ConnectTcp(url.host, url.port, options.timeout_ms,
                                   sock_, net_error)) {
      return Fail(error, ErrorCode::kNetwork, net_error);
    }
    platform::tls::ClientVerifyConfig verify;
    verify.verify_peer = options.verify_ssl;
    verify.verify_hostname = options.verify_ssl;
    verify.ca_bundle_path = options.ca_bundle;
    if (!platform::tls::ClientHandshake(sock_, url.host, verify, tls_,
                                        net_error)) {
      return Fail(error, ErrorCode::kNetwork,
                  "tls handshake failed: " + net_error);
    }
    return true;
  }

  platform::tls::ClientContext& tls() { return tls_; }

 private:
  platform::net::Socket sock_{platform::net::kInvalidSocket};
  platform::tls::ClientContext tls_;
};

bool ParseChunked(const std::uint8_t* data, std::size_t len,
                  std::vector<std::uint8_t>& out, Error& error) {
  std::size_t pos = 0;
  while (true) {
    const auto* begin = data + pos;
    const auto* end = data + len;
    const auto* line_end = std::search(begin, end, kCrlf, kCrlf + 2);
    if (line_end == end) {
      return Fail(error, ErrorCode::kNetwork, "truncated chunk header");
    }
    std::string size_line(begin, line_end);
    const auto semi = size_line.find(';');
    if (semi != std::string::npos) size_line.resize(semi);
    size_line = Trim(size_line);
    if (size_line.empty()) {
      return Fail(error, ErrorCode::kNetwork, "bad chunk header");
    }
    char* parse_end = nullptr;
    const unsigned long long chunk =
        std::strtoull(size_line.c_str(), &parse_end, 16);
    if (*parse_end != '\0') {
      return Fail(error, ErrorCode::kNetwork, "bad chunk header");
    }
    pos = static_cast<std::size_t>(line_end - data) + 2;
    if (chunk == 0) {
      return true;
    }
    if (chunk > len - pos || len - pos - chunk < 2) {
      return Fail(error, ErrorCode::kNetwork, "truncated chunk");
    }
    out.insert(out.end(), data + pos, data + pos + chunk);
    pos += static_cast<std::size_t>(chunk) + 2;
  }
}

std::string MakeBoundary() {
  std::vector<std::uint8_t> raw;
  if (!platform::RandomBytes(12, raw)) {
    return "ksm-form-boundary";
  }
  return "ksm-" + common::BytesToHex(raw.data(), raw.size());
}

}  // namespace

std::vector<std::uint8_t> BuildMultipartBody(
    const std::string& boundary, const HttpHeaders& fields,
    const std::vector<std::uint8_t>& file) {
  std::string head;
  for (const auto& field : fields) {
    head += "--" + boundary + kCrlf;
    head += "Content-Disposition: form-data; name=\"" + field.first + "\"";
    head += kCrlf;
    head += kCrlf;
    head += field.second + kCrlf;
  }
  head += "--" + boundary + kCrlf;
  head += "Content-Disposition: form-data; name=\"file\"; filename=\"file\"";
  head += kCrlf;
  head += "Content-Type: application/octet-stream\r\n\r\n";
  const std::string tail = kCrlf + ("--" + boundary + "--") + kCrlf;

  std::vector<std::uint8_t> body(head.begin(), head.end());
  body.insert(body.end(), file.begin(), file.end());
  body.insert(body.end(), tail.begin(), tail.end());
  return body;
}

bool ParseHttpsUrl(const std::string& url, ParsedUrl& out, Error& error) {
  out = ParsedUrl{};
  constexpr char kScheme[] = "https://";
  constexpr std::size_t kSchemeLen = sizeof(kScheme) - 1;
  if (url.size() <= kSchemeLen || ToLower(url.substr(0, kSchemeLen)) != kScheme) {
    return Fail(error, ErrorCode::kInvalidArgument, "url is not https");
  }
  const std::size_t authority_end = url.find_first_of("/?", kSchemeLen);
  std::string authority = url.substr(kSchemeLen, authority_end - kSchemeLen);
  if (authority_end != std::string::npos) {
    out.target = url.substr(authority_end);
    if (out.target.front() == '?') out.target.insert(0, "/");
  }

  std::string port_text;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      return Fail(error, ErrorCode::kInvalidArgument, "bad ipv6 host");
    }
    out.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        return Fail(error, ErrorCode::kInvalidArgument, "bad url authority");
      }
      port_text = authority.substr(close + 2);
    }
  } else {
    const auto colon = authority.rfind(':');
    out.host = authority.substr(0, colon);
    if (colon != std::string::npos) port_text = authority.substr(colon + 1);
  }
  if (out.host.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "url host empty");
  }
  if (!port_text.empty()) {
    char* end = nullptr;
    const unsigned long v = std::strtoul(port_text.c_str(), &end, 10);
    if (*end != '\0' || v == 0 || v > 65535) {
      return Fail(error, ErrorCode::kInvalidArgument, "bad url port");
    }
    out.port = static_cast<std::uint16_t>(v);
  }
  return true;
}

bool ParseHttpResponse(const std::vector<std::uint8_t>& raw,
                       HttpResponse& out, Error& error) {
  out = HttpResponse{};
  constexpr char kHeaderEnd[] = "\r\n\r\n";
  const auto header_end =
      std::search(raw.begin(), raw.end(), kHeaderEnd, kHeaderEnd + 4);
  if (header_end == raw.end()) {
    return Fail(error, ErrorCode::kNetwork, "truncated http response");
  }
  const std::string head(raw.begin(), header_end);
  const std::size_t body_offset =
      static_cast<std::size_t>(header_end - raw.begin()) + 4;

  std::size_t line_end = head.find(kCrlf);
  const std::string status_line = head.substr(0, line_end);
  if (status_line.compare(0, 5, "HTTP/") != 0) {
    return Fail(error, ErrorCode::kNetwork, "bad http status line");
  }
  const auto sp = status_line.find(' ');
  if (sp == std::string::npos || sp + 4 > status_line.size()) {
    return Fail(error, ErrorCode::kNetwork, "bad http status line");
  }
  const std::string code = status_line.substr(sp + 1, 3);
  if (!std::all_of(code.begin(), code.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return Fail(error, ErrorCode::kNetwork, "bad http status code");
  }
  out.status = std::atoi(code.c_str());

  bool chunked = false;
  bool has_length = false;
  std::size_t content_length = 0;
  while (line_end != std::string::npos) {
    const std::size_t start = line_end + 2;
    line_end = head.find(kCrlf, start);
    const std::string line = head.substr(
        start, line_end == std::string::npos ? std::string::npos
                                             : line_end - start);
    const auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    const std::string name = ToLower(Trim(line.substr(0, colon)));
    const std::string value = Trim(line.substr(colon + 1));
    if (name == "transfer-encoding" &&
        ToLower(value).find("chunked") != std::string::npos) {
      chunked = true;
    } else if (name == "content-length") {
      char* end = nullptr;
      const unsigned long long v = std::strtoull(value.c_str(), &end, 10);
      if (value.empty() || *end != '\0') {
        return Fail(error, ErrorCode::kNetwork, "bad content-length");
      }
      has_length = true;
      content_length = static_cast<std::size_t>(v);
    }
  }

  const std::size_t available = raw.size() - body_offset;
  if (chunked) {
    return ParseChunked(raw.data() + body_offset, available, out.body, error);
  }
  if (has_length) {
    if (available < content_length) {
      return Fail(error, ErrorCode::kNetwork, "truncated http body");
    }
    out.body.assign(raw.begin() + static_cast<std::ptrdiff_t>(body_offset),
                    raw.begin() + static_cast<std::ptrdiff_t>(body_offset +
                                                              content_length));
    return true;
  }
  out.body.assign(raw.begin() + static_cast<std::ptrdiff_t>(body_offset),
                  raw.end());
  return true;
}

HttpsTransport::HttpsTransport(HttpsOptions options)
    : options_(std::move(options)) {}

bool HttpsTransport::Post(const HttpRequest& request, TransmissionKey& key,
                          HttpResponse& out, Error& error) {
  (void)key;
  return Exchange("POST", request.url, request.headers, request.body, out,
                  error);
}

bool HttpsTransport::Get(const std::string& url, HttpResponse& out,
                         Error& error) {
  return Exchange("GET", url, {}, {}, out, error);
}

bool HttpsTransport::Upload(const std::string& url,
                            const HttpHeaders& fields,
                            const std::vector<std::uint8_t>& file,
                            HttpResponse& out, Error& error) {
  const std::string boundary = MakeBoundary();
  const HttpHeaders headers = {
      {"Content-Type", "multipart/form-data; boundary=" + boundary}};
  return Exchange("POST", url, headers,
                  BuildMultipartBody(boundary, fields, file), out, error);
}

bool HttpsTransport::Exchange(const std::string& method,
                              const std::string& url,
                              const HttpHeaders& headers,
                              const std::vector<std::uint8_t>& body,
                              HttpResponse& out, Error& error) {
  ParsedUrl target;
  if (!ParseHttpsUrl(url, target, error)) {
    return false;
  }
  Connection conn;
  if (!conn.Open(target, options_, error)) {
    platform::log::Log(platform::log::Level::kWarn, kTag, "connect failed",
                       {{"host", target.host}, {"reason", error.message}});
    return false;
  }

  std::string head = method + " " + target.target + " HTTP/1.1\r\n";
  head += "Host: " + target.host + kCrlf;
  for (const auto& header : headers) {
    head += header.first + ": " + header.second + kCrlf;
  }
  if (method == "POST") {
    head += "Content-Length: " + std::to_string(body.size()) + kCrlf;
  }
  head += "Accept-Encoding: identity\r\nConnection: close\r\n\r\n";

  std::vector<std::uint8_t> wire(head.begin(), head.end());
  wire.insert(wire.end(), body.begin(), body.end());
  if (!platform::tls::EncryptAndSend(conn.tls(), wire)) {
    return Fail(error, ErrorCode::kNetwork, "send failed");
  }

  const std::uint64_t deadline =
      platform::NowSteadyMs() + options_.timeout_ms;
  std::vector<std::uint8_t> raw;
  bool eof = false;
  while (!eof) {
    if (!platform::tls::DecryptToPlain(conn.tls(), raw, eof)) {
      return Fail(error, ErrorCode::kNetwork, "receive failed or timed out");
    }
    if (raw.size() > options_.max_response_bytes) {
      return Fail(error, ErrorCode::kNetwork, "response too large");
    }
    if (!eof && platform::NowSteadyMs() > deadline) {
      return Fail(error, ErrorCode::kNetwork, "response timed out");
    }
  }
  if (!ParseHttpResponse(raw, out, error)) {
    return false;
  }
  platform::log::Log(platform::log::Level::kDebug, kTag, "exchange done",
                     {{"method", method},
                      {"target", target.target},
                      {"status", std::to_string(out.status)}});
  return true;
}

CachingTransport::CachingTransport(std::shared_ptr<HttpTransport> inner,
                                   std::filesystem::path cache_path)
    : inner_(std::move(inner)), cache_path_(std::move(cache_path)) {}

bool CachingTransport::Post(const HttpRequest& request, TransmissionKey& key,
                            HttpResponse& out, Error& error) {
  const bool cacheable =
      EndsWith(request.url, std::string("/") +
                                EndpointName(Endpoint::kGetSecret));
  if (inner_->Post(request, key, out, error)) {
    if (cacheable && out.status == 200 && !Save(key, out)) {
      platform::log::Log(platform::log::Level::kWarn, kTag,
                         "could not write response cache");
    }
    return true;
  }
  if (!cacheable || error.code != ErrorCode::kNetwork) {
    return false;
  }
  if (!Replay(key, out)) {
    return false;
  }
  platform::log::Log(platform::log::Level::kWarn, kTag,
                     "network failure, replaying cached response",
                     {{"reason", error.message}});
  error.Clear();
  return true;
}

bool CachingTransport::Get(const std::string& url, HttpResponse& out,
                           Error& error) {
  return inner_->Get(url, out, error);
}

bool CachingTransport::Upload(const std::string& url,
                              const HttpHeaders& fields,
                              const std::vector<std::uint8_t>& file,
                              HttpResponse& out, Error& error) {
  return inner_->Upload(url, fields, file, out, error);
}

bool CachingTransport::Save(const TransmissionKey& key,
                            const HttpResponse& response) const {
  std::vector<std::uint8_t> blob(key.key.data(),
                                 key.key.data() + key.key.size());
  common::ScopedWipe wipe_blob(blob);
  blob.insert(blob.end(), response.body.begin(), response.body.end());
  std::error_code ec;
  return platform::fs::AtomicWrite(cache_path_, blob.data(), blob.size(), ec);
}

bool CachingTransport::Replay(TransmissionKey& key, HttpResponse& out) const {
  std::error_code ec;
  if (!platform::fs::Exists(cache_path_, ec)) {
    return false;
  }
  std::vector<std::uint8_t> blob;
  common::ScopedWipe wipe_blob(blob);
  if (!platform::fs::ReadFileBytes(cache_path_, blob, ec) ||
      blob.size() <= crypto::kAesKeyBytes) {
    return false;
  }
  key.key.assign(blob.data(), crypto::kAesKeyBytes);
  out.status = 200;
  const auto offset = static_cast<std::ptrdiff_t>(crypto::kAesKeyBytes);
  out.body.assign(blob.begin() + offset, blob.end());
  return true;
}

}  // namespace ksm::core
