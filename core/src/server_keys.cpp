#include "server_keys.h"

#include <utility>

#include "encoding_utils.h"
#include "platform_log.h"

namespace ksm::core {

namespace {

constexpr std::uint32_t kProductionTableVersion = 3;

struct PinnedKey {
  std::uint32_t id;
  const char* point;
};

// Uncompressed P-256 points, url-safe base64.
constexpr PinnedKey kPinnedKeys[] = {
    {7, "BK9w6TZFxE6nFNbMfIpULCup2a8xc6w2tUTABjxny7yFmxW0dAEojwC6j6zb5nTlmb1dAx8nwo3qF7RPYGmloRM"},
    {8, "BKnhy0obglZJK-igwthNLdknoSXRrGB-mvFRzyb_L-DKKefWjYdFD2888qN1ROczz4n3keYSfKz9Koj90Z6w_tQ"},
    {9, "BAsPQdCpLIGXdWNLdAwx-3J5lNqUtKbaOMV56hUj8VzxE2USLHuHHuKDeno0ymJt-acxWV1xPlBfNUShhRTR77g"},
    {10, "BNYIh_Sv03nRZUUJveE8d2mxKLIDXv654UbshaItHrCJhd6cT7pdZ_XwbdyxAOCWMkBb9AZ4t1XRCsM8-wkEBRg"},
    {11, "BA6uNfeYSvqagwu4TOY6wFK4JyU5C200vJna0lH4PJ-SzGVXej8l9dElyQ58_ljfPs5Rq6zVVXpdDe8A7Y3WRhk"},
    {12, "BMjTIlXfohI8TDymsHxo0DqYysCy7yZGJ80WhgOBR4QUd6LBDA6-_318a-jCGW96zxXKMm8clDTKpE8w75KG-FY"},
    {13, "BJBDU1P1H21IwIdT2brKkPqbQR0Zl0TIHf7Bz_OO9jaNgIwydMkxt4GpBmkYoprZ_DHUGOrno2faB7pmTR7HhuI"},
    {14, "BJFF8j-dH7pDEw_U347w2CBM6xYM8Dk5fPPAktjib-opOqzvvbsER-WDHM4ONCSBf9O_obAHzCyygxmtpktDuiE"},
    {15, "BDKyWBvLbyZ-jMueORl3JwJnnEpCiZdN7yUvT0vOyjwpPBCDf6zfL4RWzvSkhAAFnwOni_1tQSl8dfXHbXqXsQ8"},
    {16, "BDXyZZnrl0tc2jdC5I61JjwkjK2kr7uet9tZjt8StTiJTAQQmnVOYBgbtP08PWDbecxnHghx3kJ8QXq1XE68y8c"},
    {17, "BFX68cb97m9_sweGdOVavFM3j5ot6gveg6xT4BtGahfGhKib-zdZyO9pwvv1cBda9ahkSzo1BQ4NVXp9qRyqVGU"},
};

ServerKeyTable BuildProduction() {
  ServerKeyTable::KeyMap keys;
  for (const auto& pinned : kPinnedKeys) {
    std::vector<std::uint8_t> point;
    if (!common::Base64Decode(pinned.point, point) || point.size() != 65) {
      platform::log::Log(platform::log::Level::kError, "server_keys",
                         "pinned key does not decode",
                         {{"key_id", std::to_string(pinned.id)}});
      continue;
    }
    keys.emplace(pinned.id, std::move(point));
  }
  return ServerKeyTable(kProductionTableVersion, std::move(keys));
}

}  // namespace

const ServerKeyTable& ServerKeyTable::Production() {
  static const ServerKeyTable table = BuildProduction();
  return table;
}

const std::vector<std::uint8_t>* ServerKeyTable::Find(std::uint32_t id) const {
  const auto it = keys_.find(id);
  if (it == keys_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::uint32_t ServerKeyTable::HighestId() const {
  if (keys_.empty()) {
    return 0;
  }
  return keys_.rbegin()->first;
}

}  // namespace ksm::core
