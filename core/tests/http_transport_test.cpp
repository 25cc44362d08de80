#include <cassert>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "encoding_utils.h"
#include "http_transport.h"
#include "test_support.h"

using namespace ksm::core;
namespace common = ksm::common;

namespace {

HttpResponse Parse(const std::string& raw) {
  HttpResponse out;
  Error error;
  const bool ok = ParseHttpResponse(common::StringToBytes(raw), out, error);
  assert(ok);
  (void)ok;
  return out;
}

void TestParseResponse() {
  HttpResponse r = Parse(
      "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n"
      "Content-Length: 5\r\n\r\nhello trailing");
  assert(r.status == 200);
  assert(common::BytesToString(r.body) == "hello");

  r = Parse(
      "HTTP/1.1 200 OK\r\nTransfer-Encoding: Chunked\r\n\r\n"
      "4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n");
  assert(common::BytesToString(r.body) == "Wikipedia");

  r = Parse("HTTP/1.0 403 Forbidden\r\nServer: test\r\n\r\n{\"a\":1}");
  assert(r.status == 403);
  assert(common::BytesToString(r.body) == "{\"a\":1}");

  HttpResponse out;
  Error error;
  assert(!ParseHttpResponse(common::StringToBytes("HTTP/1.1 200 OK\r\n"), out,
                            error));
  assert(error.code == ErrorCode::kNetwork);
  error.Clear();
  assert(!ParseHttpResponse(
      common::StringToBytes("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nab"),
      out, error));
  assert(error.code == ErrorCode::kNetwork);
  error.Clear();
  assert(!ParseHttpResponse(
      common::StringToBytes("SMTP ready\r\n\r\n"), out, error));
  error.Clear();
  assert(!ParseHttpResponse(
      common::StringToBytes("HTTP/1.1 200 OK\r\nContent-Length: x\r\n\r\n"),
      out, error));
}

void TestParseUrl() {
  ParsedUrl url;
  Error error;
  assert(ParseHttpsUrl("https://keepersecurity.com/api/rest/sm/v1/get_secret",
                       url, error));
  assert(url.host == "keepersecurity.com");
  assert(url.port == 443);
  assert(url.target == "/api/rest/sm/v1/get_secret");

  assert(ParseHttpsUrl("HTTPS://files.example:8443", url, error));
  assert(url.host == "files.example");
  assert(url.port == 8443);
  assert(url.target == "/");

  assert(ParseHttpsUrl("https://[::1]:9000/x?y=1", url, error));
  assert(url.host == "::1");
  assert(url.port == 9000);
  assert(url.target == "/x?y=1");

  assert(ParseHttpsUrl("https://host?sig=abc", url, error));
  assert(url.target == "/?sig=abc");

  assert(!ParseHttpsUrl("http://insecure.example/", url, error));
  assert(error.code == ErrorCode::kInvalidArgument);
  assert(!ParseHttpsUrl("https://host:0/", url, error));
  assert(!ParseHttpsUrl("https://host:70000/", url, error));
  assert(!ParseHttpsUrl("https://:443/", url, error));
  assert(!ParseHttpsUrl("https://[::1/", url, error));
}

// Answers get_secret once, then behaves like an unreachable server.
class FlakyTransport final : public HttpTransport {
 public:
  bool Post(const HttpRequest& request, TransmissionKey& key,
            HttpResponse& out, Error& error) override {
    (void)request;
    (void)key;
    ++posts;
    if (offline) {
      return Fail(error, ErrorCode::kNetwork, "connection refused");
    }
    if (reject) {
      return Fail(error, ErrorCode::kServer, "bad gateway");
    }
    out.status = 200;
    out.body = common::StringToBytes("sealed-body");
    return true;
  }

  bool Get(const std::string& url, HttpResponse& out, Error& error) override {
    (void)error;
    last_get = url;
    out.status = 200;
    out.body = common::StringToBytes("file");
    return true;
  }

  bool Upload(const std::string& url, const HttpHeaders& fields,
              const std::vector<std::uint8_t>& file, HttpResponse& out,
              Error& error) override {
    if (offline) {
      return Fail(error, ErrorCode::kNetwork, "connection refused");
    }
    last_upload = url;
    upload_fields = fields;
    upload_size = file.size();
    out.status = 204;
    out.body.clear();
    return true;
  }

  bool offline{false};
  bool reject{false};
  int posts{0};
  std::string last_get;
  std::string last_upload;
  HttpHeaders upload_fields;
  std::size_t upload_size{0};
};

TransmissionKey KeyOf(std::uint8_t fill) {
  TransmissionKey key;
  std::vector<std::uint8_t> raw(32, fill);
  key.key.assign(raw.data(), raw.size());
  return key;
}

void TestCachingTransport() {
  const auto dir = ksm::test::MakeTempDir("ksm_http_cache_test");
  const auto cache = dir / "ksm_cache.bin";
  auto inner = std::make_shared<FlakyTransport>();
  CachingTransport transport(inner, cache);

  HttpRequest get_secret;
  get_secret.url = EndpointUrl("h", Endpoint::kGetSecret);
  HttpRequest get_folders;
  get_folders.url = EndpointUrl("h", Endpoint::kGetFolders);

  HttpResponse out;
  Error error;
  TransmissionKey first = KeyOf(0x11);

  // Nothing cached yet.
  inner->offline = true;
  assert(!transport.Post(get_secret, first, out, error));
  assert(error.code == ErrorCode::kNetwork);

  inner->offline = false;
  error.Clear();
  assert(transport.Post(get_secret, first, out, error));
  assert(std::filesystem::exists(cache));

  inner->offline = true;
  TransmissionKey replay = KeyOf(0x22);
  out = HttpResponse{};
  assert(transport.Post(get_secret, replay, out, error));
  assert(error.ok());
  assert(out.status == 200);
  assert(common::BytesToString(out.body) == "sealed-body");
  assert(replay.key.bytes() == first.key.bytes());

  // Only get_secret is served from the cache.
  assert(!transport.Post(get_folders, replay, out, error));
  assert(error.code == ErrorCode::kNetwork);

  // Non-network failures propagate.
  inner->offline = false;
  inner->reject = true;
  error.Clear();
  assert(!transport.Post(get_secret, replay, out, error));
  assert(error.code == ErrorCode::kServer);

  assert(transport.Get("https://files.example/f", out, error));
  assert(inner->last_get == "https://files.example/f");

  // Uploads pass through and are never cached or replayed.
  const std::vector<std::uint8_t> content(3, 0x42);
  assert(transport.Upload("https://files.example/up", {{"key", "k1"}},
                          content, out, error));
  assert(out.status == 204);
  assert(inner->last_upload == "https://files.example/up");
  assert(inner->upload_fields.size() == 1);
  assert(inner->upload_size == 3);
  inner->offline = true;
  assert(!transport.Upload("https://files.example/up", {}, content, out,
                           error));
  assert(error.code == ErrorCode::kNetwork);
}

void TestMultipartBody() {
  const std::vector<std::uint8_t> file = {'a', 0x00, 'b'};
  const std::vector<std::uint8_t> body =
      BuildMultipartBody("BND", {{"key", "v1"}, {"policy", "p"}}, file);
  const std::string text(body.begin(), body.end());
  const std::string expected =
      std::string("--BND\r\n"
                  "Content-Disposition: form-data; name=\"key\"\r\n\r\n"
                  "v1\r\n"
                  "--BND\r\n"
                  "Content-Disposition: form-data; name=\"policy\"\r\n\r\n"
                  "p\r\n"
                  "--BND\r\n"
                  "Content-Disposition: form-data; name=\"file\"; "
                  "filename=\"file\"\r\n"
                  "Content-Type: application/octet-stream\r\n\r\n"
                  "a") +
      std::string(1, '\0') + "b\r\n--BND--\r\n";
  assert(text == expected);

  const std::vector<std::uint8_t> bare = BuildMultipartBody("X", {}, {});
  assert(std::string(bare.begin(), bare.end()).find("--X--\r\n") !=
         std::string::npos);
}

}  // namespace

int main() {
  TestParseResponse();
  TestParseUrl();
  TestCachingTransport();
  TestMultipartBody();
  return 0;
}
