#ifndef ICA_CLIENT_SESSION_STORE_H
#define ICA_CLIENT_SESSION_STORE_H

#include <filesystem>
#include <string>
#include <string_view>

#include "session_state.h"

namespace ica::client {

// Durable copy of SessionState: <dir>/<id>.session holds the values as a JSON
// object, <dir>/<id>.cookiejar holds the cookies. Both files are replaced
// atomically so a crash leaves either the old or the new content.
class SessionStore {
 public:
  SessionStore(std::filesystem::path directory, std::string account_identifier);

  // Keeps [A-Za-z0-9_] only.
  static std::string SanitizeIdentifier(std::string_view identifier);

  // Never fails: missing, empty or corrupt files produce empty state.
  SessionState Load() const;
  bool Save(const SessionState& state, std::string& error) const;
  bool Clear(std::string& error) const;

  const std::filesystem::path& directory() const { return directory_; }
  const std::filesystem::path& session_path() const { return session_path_; }
  const std::filesystem::path& cookiejar_path() const { return cookiejar_path_; }

 private:
  std::filesystem::path directory_;
  std::filesystem::path session_path_;
  std::filesystem::path cookiejar_path_;
  std::filesystem::path lock_path_;
};

}  // namespace ica::client

#endif  // ICA_CLIENT_SESSION_STORE_H
