#ifndef ICA_CLIENT_CONFIG_SERVICE_H
#define ICA_CLIENT_CONFIG_SERVICE_H

#include <filesystem>
#include <string>

#include "client_config.h"
#include "endpoints.h"

namespace ica::client {

class ConfigService {
 public:
  // Loads the file and applies the log level. An empty path yields defaults.
  bool Load(const std::string& config_path, ClientConfig& out_cfg,
            std::string& error);

  // Configured cookie directory, or <tmp>/icloud_auth/<user>.
  static std::filesystem::path ResolveCookieDirectory(const ClientConfig& cfg);
  static Endpoints ResolveEndpoints(const ClientConfig& cfg);

  const std::filesystem::path& config_dir() const { return config_dir_; }

 private:
  std::filesystem::path config_dir_;
};

}  // namespace ica::client

#endif  // ICA_CLIENT_CONFIG_SERVICE_H
