#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "client_config.h"
#include "test_support.h"

using ksm::core::ClientConfig;
using ksm::core::LoadClientConfig;
using ksm::platform::log::Level;

namespace {

void WriteFile(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path);
  out << text;
  out.close();
}

}  // namespace

int main() {
  const auto dir = ksm::test::MakeTempDir("ksm_client_config_test");
  const auto path = dir / "ksm.ini";

  {
    WriteFile(path,
              "# device settings\n"
              "[other]\n"
              "ignored=1\n"
              "[KSM]\n"
              "hostname = keepersecurity.eu\n"
              "config_file=/var/lib/ksm/config.json ; credentials\n"
              "log_level=debug\n"
              "verify_ssl=off\n"
              "ca_bundle=/etc/ssl/ca.pem\n"
              "timeout_ms=2500\n"
              "cache_enabled=yes\n"
              "cache_path=/tmp/ksm.cache\n"
              "server_public_key_id=10\n");
    ClientConfig cfg;
    std::string err;
    assert(LoadClientConfig(path.string(), cfg, err));
    assert(err.empty());
    assert(cfg.hostname == "keepersecurity.eu");
    assert(cfg.config_file == "/var/lib/ksm/config.json");
    assert(cfg.log_level == Level::kDebug);
    assert(!cfg.verify_ssl);
    assert(cfg.ca_bundle == "/etc/ssl/ca.pem");
    assert(cfg.timeout_ms == 2500);
    assert(cfg.cache_enabled);
    assert(cfg.cache_path == "/tmp/ksm.cache");
    assert(cfg.server_public_key_id == 10);
  }

  {
    WriteFile(path, "[ksm]\n");
    ClientConfig cfg;
    std::string err;
    assert(LoadClientConfig(path.string(), cfg, err));
    assert(cfg.config_file == "ksm-config.json");
    assert(cfg.verify_ssl);
    assert(cfg.timeout_ms == 30000);
    assert(!cfg.cache_enabled);
  }

  {
    WriteFile(path, "[ksm]\nhostname=x\ntimeout_ms=-5\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "invalid timeout_ms at line 3");
  }

  {
    WriteFile(path, "[ksm]\nlog_level=loud\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "invalid log_level at line 2");
  }

  {
    WriteFile(path, "[ksm]\njust some words\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "invalid line 2");
  }

  {
    WriteFile(path, "[client]\nserver_ip=127.0.0.1\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "ksm section missing");
  }

  {
    WriteFile(path, "[ksm]\ncache_enabled=1\ncache_path=\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path.string(), cfg, err));
    assert(err == "cache_enabled=1 but cache_path empty");
  }

  {
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig((dir / "missing.ini").string(), cfg, err));
    assert(err.find("client_config not found") == 0);
  }

  return 0;
}
