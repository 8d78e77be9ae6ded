#ifndef ICA_PLATFORM_LOG_H
#define ICA_PLATFORM_LOG_H

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace ica::platform::log {

enum class Level : std::uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3
};

struct Field {
  std::string_view key;
  std::string_view value;
};

using LogCallback = void (*)(Level level,
                             const char* tag,
                             const char* message,
                             const Field* fields,
                             std::size_t field_count,
                             void* user_data);

// Replaces the default stdout/stderr sink. Passing nullptr restores it.
void SetLogCallback(LogCallback cb, void* user_data);
void SetMinLevel(Level level);
Level MinLevel();
bool ParseLevel(std::string_view text, Level& out);

void Log(Level level, std::string_view tag, std::string_view message);
void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields);

bool IsSensitiveKey(std::string_view key);
std::string RedactValue(std::string_view key, std::string_view value);
std::string RedactMessage(std::string_view message);

}  // namespace ica::platform::log

#endif  // ICA_PLATFORM_LOG_H
