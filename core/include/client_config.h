#ifndef KSM_CLIENT_CONFIG_H
#define KSM_CLIENT_CONFIG_H

#include <cstdint>
#include <string>

#include "platform_log.h"

namespace ksm::core {

// Host-side options. The device credentials themselves live in the
// ConfigStore file named by config_file.
struct ClientConfig {
  std::string hostname;
  std::string config_file{"ksm-config.json"};
  platform::log::Level log_level{platform::log::Level::kInfo};
  bool verify_ssl{true};
  std::string ca_bundle;
  std::uint32_t timeout_ms{30000};
  bool cache_enabled{false};
  std::string cache_path{"ksm_cache.bin"};
  // 0 keeps whatever the store (or the key table default) says.
  std::uint32_t server_public_key_id{0};
};

bool LoadClientConfig(const std::string& path, ClientConfig& out_cfg,
                      std::string& error);

}  // namespace ksm::core

#endif  // KSM_CLIENT_CONFIG_H
