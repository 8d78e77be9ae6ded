#include "session_store.h"

#include <cctype>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "platform_fs.h"
#include "platform_log.h"
#include "platform_time.h"

namespace ica::client {

namespace pfs = ica::platform::fs;
namespace plog = ica::platform::log;

namespace {

constexpr std::size_t kMaxSessionFileBytes = 64 * 1024;
constexpr std::size_t kMaxCookieFileBytes = 1024 * 1024;

bool LoadValues(const std::filesystem::path& path, SessionValues& out) {
  out.clear();
  std::error_code ec;
  if (!pfs::Exists(path, ec)) {
    return false;
  }
  std::string text;
  if (!pfs::ReadFileText(path, kMaxSessionFileBytes, text, ec)) {
    plog::Log(plog::Level::kWarn, "session_store", "session file unreadable",
              {{"error", ec.message()}});
    return false;
  }
  if (text.empty()) {
    return false;
  }
  const auto json = nlohmann::json::parse(text, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    plog::Log(plog::Level::kWarn, "session_store",
              "session file corrupt, starting fresh");
    return false;
  }
  for (auto it = json.begin(); it != json.end(); ++it) {
    if (it.value().is_string()) {
      out[it.key()] = it.value().get<std::string>();
    }
  }
  return true;
}

bool LoadCookies(const std::filesystem::path& path, CookieJar& out) {
  out.Clear();
  std::error_code ec;
  if (!pfs::Exists(path, ec)) {
    return false;
  }
  std::string text;
  if (!pfs::ReadFileText(path, kMaxCookieFileBytes, text, ec)) {
    plog::Log(plog::Level::kWarn, "session_store", "cookie jar unreadable",
              {{"error", ec.message()}});
    return false;
  }
  std::string err;
  if (!CookieJar::ParseNetscapeText(text, out, err)) {
    plog::Log(plog::Level::kWarn, "session_store",
              "cookie jar corrupt, starting fresh", {{"error", err}});
    return false;
  }
  return true;
}

}  // namespace

SessionStore::SessionStore(std::filesystem::path directory,
                           std::string account_identifier)
    : directory_(std::move(directory)) {
  const std::string name = SanitizeIdentifier(account_identifier);
  session_path_ = directory_ / (name + ".session");
  cookiejar_path_ = directory_ / (name + ".cookiejar");
  lock_path_ = directory_ / (name + ".lock");
}

std::string SessionStore::SanitizeIdentifier(std::string_view identifier) {
  std::string out;
  out.reserve(identifier.size());
  for (const char ch : identifier) {
    const unsigned char uc = static_cast<unsigned char>(ch);
    // Bytes >= 0x80 belong to UTF-8 encoded letters and are kept.
    if (uc >= 0x80 || std::isalnum(uc) != 0 || ch == '_') {
      out.push_back(ch);
    }
  }
  return out;
}

SessionState SessionStore::Load() const {
  SessionState state;
  SessionValues values;
  if (LoadValues(session_path_, values)) {
    state.Merge(values);
  }
  CookieJar cookies;
  if (LoadCookies(cookiejar_path_, cookies)) {
    if (cookies.Remove(kDeviceTrackingCookie) > 0) {
      plog::Log(plog::Level::kDebug, "session_store",
                "dropped device tracking cookie");
    }
    const auto now =
        static_cast<std::int64_t>(ica::platform::NowUnixSeconds());
    const std::size_t expired = cookies.RemoveExpired(now);
    if (expired > 0) {
      plog::Log(plog::Level::kDebug, "session_store",
                "dropped expired cookies",
                {{"count", std::to_string(expired)}});
    }
    state.cookies() = std::move(cookies);
  }
  plog::Log(plog::Level::kDebug, "session_store", "session loaded",
            {{"values", std::to_string(state.values().size())},
             {"cookies", std::to_string(state.cookies().size())}});
  return state;
}

bool SessionStore::Save(const SessionState& state, std::string& error) const {
  error.clear();
  std::error_code ec;
  if (!pfs::CreatePrivateDirectories(directory_, ec)) {
    error = "create session directory failed: " + ec.message();
    return false;
  }
  pfs::ScopedFileLock lock(lock_path_);
  if (lock.status() != pfs::FileLockStatus::kOk) {
    error = lock.status() == pfs::FileLockStatus::kBusy
                ? "session files locked by another process"
                : "session lock failed";
    return false;
  }

  nlohmann::json values = nlohmann::json::object();
  for (const auto& kv : state.values()) {
    values[kv.first] = kv.second;
  }
  const std::string text =
      values.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (!pfs::AtomicWriteText(session_path_, text, ec)) {
    error = "write session file failed: " + ec.message();
    return false;
  }
  if (!pfs::AtomicWriteText(cookiejar_path_, state.cookies().ToNetscapeText(),
                            ec)) {
    error = "write cookie jar failed: " + ec.message();
    return false;
  }
  return true;
}

bool SessionStore::Clear(std::string& error) const {
  error.clear();
  std::error_code ec;
  for (const auto* path : {&session_path_, &cookiejar_path_}) {
    pfs::Remove(*path, ec);
    if (ec) {
      error = "remove " + path->filename().string() + " failed: " + ec.message();
      return false;
    }
  }
  return true;
}

}  // namespace ica::client
