#include "platform_tls.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <climits>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>

namespace ksm::platform::tls {

namespace {

struct SslCtxFree {
  void operator()(SSL_CTX* p) const { SSL_CTX_free(p); }
};
struct SslFree {
  void operator()(SSL* p) const {
    SSL_shutdown(p);
    SSL_free(p);
  }
};

struct Session {
  std::unique_ptr<SSL_CTX, SslCtxFree> ctx;
  std::unique_ptr<SSL, SslFree> ssl;
};

Session* SessionOf(ClientContext& ctx) {
  return static_cast<Session*>(ctx.impl);
}

// Pops the oldest queued OpenSSL error and drops the rest.
std::string TakeOpenSslError(const char* fallback) {
  const unsigned long code = ERR_get_error();
  ERR_clear_error();
  if (code == 0) {
    return fallback;
  }
  char buf[256] = {};
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

bool InitOpenSsl() {
  static std::once_flag once;
  static bool ok = false;
  std::call_once(once, [] { ok = OPENSSL_init_ssl(0, nullptr) == 1; });
  return ok;
}

bool LoadTrustLocation(SSL_CTX* ctx, const std::filesystem::path& where) {
  std::error_code ec;
  if (std::filesystem::is_directory(where, ec)) {
    return SSL_CTX_load_verify_locations(ctx, nullptr, where.c_str()) == 1;
  }
  return SSL_CTX_load_verify_locations(ctx, where.c_str(), nullptr) == 1;
}

bool LoadSystemTrust(SSL_CTX* ctx) {
  static const char* const kBundles[] = {
      "/etc/ssl/certs/ca-certificates.crt",
      "/etc/pki/tls/certs/ca-bundle.crt",
      "/etc/ssl/cert.pem",
  };
  bool loaded = SSL_CTX_set_default_verify_paths(ctx) == 1;
  for (const char* bundle : kBundles) {
    std::error_code ec;
    if (std::filesystem::exists(bundle, ec) && LoadTrustLocation(ctx, bundle)) {
      loaded = true;
      break;
    }
  }
  ERR_clear_error();
  return loaded;
}

bool ConfigureContext(SSL_CTX* ctx, const ClientVerifyConfig& verify,
                      std::string& error) {
  SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
  SSL_CTX_set_options(ctx, SSL_OP_NO_COMPRESSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
  // Servers that answer with Connection: close often skip close_notify.
  SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
  if (!verify.verify_peer) {
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    return true;
  }
  if (!verify.ca_bundle_path.empty()) {
    if (!LoadTrustLocation(ctx, verify.ca_bundle_path)) {
      error = "tls: cannot load ca bundle " + verify.ca_bundle_path;
      ERR_clear_error();
      return false;
    }
  } else if (!LoadSystemTrust(ctx)) {
    error = "tls: no system ca bundle";
    return false;
  }
  SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
  return true;
}

}  // namespace

bool ClientHandshake(net::Socket sock, const std::string& host,
                     const ClientVerifyConfig& verify,
                     ClientContext& ctx,
                     std::string& error) {
  error.clear();
  if (!InitOpenSsl()) {
    error = "tls: openssl init failed";
    return false;
  }

  auto session = std::make_unique<Session>();
  session->ctx.reset(SSL_CTX_new(TLS_client_method()));
  if (!session->ctx) {
    error = TakeOpenSslError("tls: SSL_CTX_new failed");
    return false;
  }
  if (!ConfigureContext(session->ctx.get(), verify, error)) {
    return false;
  }

  session->ssl.reset(SSL_new(session->ctx.get()));
  SSL* ssl = session->ssl.get();
  if (ssl == nullptr) {
    error = TakeOpenSslError("tls: SSL_new failed");
    return false;
  }
  SSL_set_mode(ssl, SSL_MODE_AUTO_RETRY);
  if (!host.empty()) {
    SSL_set_tlsext_host_name(ssl, host.c_str());
    if (verify.verify_peer && verify.verify_hostname &&
        SSL_set1_host(ssl, host.c_str()) != 1) {
      error = TakeOpenSslError("tls: hostname check setup failed");
      return false;
    }
  }
  if (SSL_set_fd(ssl, sock) != 1) {
    error = TakeOpenSslError("tls: SSL_set_fd failed");
    return false;
  }

  const int rc = SSL_connect(ssl);
  if (rc != 1) {
    const int reason = SSL_get_error(ssl, rc);
    error = (reason == SSL_ERROR_WANT_READ || reason == SSL_ERROR_WANT_WRITE)
                ? "tls: handshake timed out"
                : TakeOpenSslError("tls: handshake failed");
    ERR_clear_error();
    return false;
  }
  if (verify.verify_peer) {
    const long result = SSL_get_verify_result(ssl);
    if (result != X509_V_OK) {
      error = std::string("tls: ") + X509_verify_cert_error_string(result);
      return false;
    }
  }

  ctx.impl = session.release();
  return true;
}

bool EncryptAndSend(ClientContext& ctx,
                    const std::vector<std::uint8_t>& plain) {
  Session* session = SessionOf(ctx);
  if (session == nullptr) {
    return false;
  }
  const std::uint8_t* cursor = plain.data();
  std::size_t left = plain.size();
  while (left > 0) {
    const int want = left > static_cast<std::size_t>(INT_MAX)
                         ? INT_MAX
                         : static_cast<int>(left);
    const int wrote = SSL_write(session->ssl.get(), cursor, want);
    if (wrote <= 0) {
      ERR_clear_error();
      return false;
    }
    cursor += wrote;
    left -= static_cast<std::size_t>(wrote);
  }
  return true;
}

bool DecryptToPlain(ClientContext& ctx,
                    std::vector<std::uint8_t>& plain_out,
                    bool& out_eof) {
  out_eof = false;
  Session* session = SessionOf(ctx);
  if (session == nullptr) {
    return false;
  }
  std::uint8_t chunk[8192];
  const int got =
      SSL_read(session->ssl.get(), chunk, static_cast<int>(sizeof(chunk)));
  if (got > 0) {
    plain_out.insert(plain_out.end(), chunk, chunk + got);
    return true;
  }
  switch (SSL_get_error(session->ssl.get(), got)) {
    case SSL_ERROR_ZERO_RETURN:
      out_eof = true;
      return true;
    case SSL_ERROR_SYSCALL:
      // A bare TCP FIN with nothing queued counts as end of stream.
      if (got == 0 && ERR_peek_error() == 0) {
        out_eof = true;
        return true;
      }
      break;
    default:
      // WANT_READ on a blocking socket means SO_RCVTIMEO expired.
      break;
  }
  ERR_clear_error();
  return false;
}

void Close(ClientContext& ctx) {
  delete SessionOf(ctx);
  ctx.impl = nullptr;
}

}  // namespace ksm::platform::tls
