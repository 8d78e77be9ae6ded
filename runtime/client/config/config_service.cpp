#include "config_service.h"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <system_error>

#include "platform_log.h"

namespace ica::client {

namespace {

std::string CurrentUserName() {
  const char* env_user = std::getenv("USER");
  if (env_user && *env_user) {
    return env_user;
  }
  const passwd* pw = ::getpwuid(::getuid());
  if (pw && pw->pw_name) {
    return pw->pw_name;
  }
  return "default";
}

std::filesystem::path ResolveConfigDir(const std::string& config_path) {
  if (config_path.empty()) {
    std::error_code ec;
    return std::filesystem::current_path(ec);
  }
  std::filesystem::path p(config_path);
  return p.has_parent_path() ? p.parent_path() : std::filesystem::path{"."};
}

}  // namespace

bool ConfigService::Load(const std::string& config_path,
                         ClientConfig& out_cfg, std::string& error) {
  config_dir_ = ResolveConfigDir(config_path);
  if (config_path.empty()) {
    out_cfg = ClientConfig{};
    error.clear();
  } else if (!LoadClientConfig(config_path, out_cfg, error)) {
    return false;
  }
  ica::platform::log::SetMinLevel(out_cfg.log.level);
  return true;
}

std::filesystem::path ConfigService::ResolveCookieDirectory(
    const ClientConfig& cfg) {
  if (!cfg.session.cookie_directory.empty()) {
    return std::filesystem::path(cfg.session.cookie_directory);
  }
  std::error_code ec;
  std::filesystem::path base = std::filesystem::temp_directory_path(ec);
  if (ec || base.empty()) {
    base = std::filesystem::path{"/tmp"};
  }
  return base / "icloud_auth" / CurrentUserName();
}

Endpoints ConfigService::ResolveEndpoints(const ClientConfig& cfg) {
  Endpoints ep = Endpoints::ForRegion(cfg.endpoints.china_mainland);
  if (!cfg.endpoints.auth.empty()) {
    ep.auth = cfg.endpoints.auth;
  }
  if (!cfg.endpoints.setup.empty()) {
    ep.setup = cfg.endpoints.setup;
  }
  if (!cfg.endpoints.home.empty()) {
    ep.home = cfg.endpoints.home;
  }
  return ep;
}

}  // namespace ica::client
