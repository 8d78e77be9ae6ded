#include <termios.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "client_config.h"
#include "config_service.h"
#include "session_coordinator.h"

namespace {

using ica::client::ClassifiedError;
using ica::client::LoginState;
using ica::client::MfaKind;
using ica::client::MfaState;
using ica::client::SessionCoordinator;

std::string ReadLine(const std::string& prompt) {
  std::cout << prompt << std::flush;
  std::string line;
  std::getline(std::cin, line);
  return line;
}

std::string ReadSecret(const std::string& prompt) {
  const char* env = std::getenv("ICA_PASSWORD");
  if (env && *env) {
    return env;
  }
  termios old_attr{};
  const bool tty = ::isatty(STDIN_FILENO) == 1 &&
                   ::tcgetattr(STDIN_FILENO, &old_attr) == 0;
  if (tty) {
    termios no_echo = old_attr;
    no_echo.c_lflag &= static_cast<tcflag_t>(~ECHO);
    ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &no_echo);
  }
  std::string secret = ReadLine(prompt);
  if (tty) {
    ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &old_attr);
    std::cout << "\n";
  }
  return secret;
}

bool RunTwoStep(SessionCoordinator& coordinator) {
  auto& mfa = coordinator.mfa();
  ClassifiedError err;
  std::vector<ica::client::TrustedDevice> devices;
  if (!mfa.ListTrustedDevices(devices, err)) {
    std::cerr << "list devices failed: " << err.ToString() << "\n";
    return false;
  }
  if (devices.empty()) {
    std::cerr << "no trusted devices\n";
    return false;
  }
  for (std::size_t i = 0; i < devices.size(); ++i) {
    std::cout << "  " << i << ": " << devices[i].display_name << "\n";
  }
  const std::string choice = ReadLine("device index: ");
  std::size_t index = 0;
  try {
    index = static_cast<std::size_t>(std::stoul(choice));
  } catch (const std::exception&) {
    index = devices.size();
  }
  if (index >= devices.size()) {
    std::cerr << "invalid device index\n";
    return false;
  }
  if (!mfa.SendCode(devices[index], err)) {
    std::cerr << "send code failed: " << err.ToString() << "\n";
    return false;
  }
  for (;;) {
    const std::string code = ReadLine("verification code: ");
    if (mfa.SubmitCode(devices[index], code, err)) {
      return true;
    }
    if (!err.ok()) {
      std::cerr << "verification failed: " << err.ToString() << "\n";
      return false;
    }
    std::cerr << "wrong code, try again\n";
  }
}

bool RunTwoFactor(SessionCoordinator& coordinator) {
  auto& mfa = coordinator.mfa();
  ClassifiedError err;
  if (mfa.state() == MfaState::kAwaitingSecurityKey) {
    std::cerr << "security keys are not supported by this tool\n";
    return false;
  }
  if (mfa.state() == MfaState::kAwaitingSmsCode) {
    if (!mfa.RequestSmsCode(err)) {
      std::cerr << "sms request failed: " << err.ToString() << "\n";
      return false;
    }
    std::cout << "code sent to " << mfa.challenge().phone.number << "\n";
  }
  for (;;) {
    const std::string code = ReadLine("verification code: ");
    if (mfa.SubmitPushOrSmsCode(code, err)) {
      return true;
    }
    if (!err.ok()) {
      std::cerr << "verification failed: " << err.ToString() << "\n";
      return false;
    }
    std::cerr << "wrong code, try again\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "";
  ica::client::ConfigService config_service;
  ica::client::ClientConfig cfg;
  std::string error;
  if (!config_service.Load(config_path, cfg, error)) {
    std::cerr << "config: " << error << "\n";
    return 1;
  }
  std::string identifier = argc > 2 ? argv[2] : cfg.account.identifier;
  if (identifier.empty()) {
    identifier = ReadLine("Apple ID: ");
  }

  auto coordinator = SessionCoordinator::Create(
      cfg,
      ica::client::Credentials(identifier, ReadSecret("password: ")),
      error);
  if (!coordinator) {
    std::cerr << "setup: " << error << "\n";
    return 1;
  }

  ClassifiedError err;
  LoginState state = coordinator->Login(err);
  if (state == LoginState::kMfaChallengePending) {
    const bool confirmed = coordinator->requires_2fa() ||
                                   coordinator->mfa().challenge().kind !=
                                       MfaKind::kTrustedDevice
                               ? RunTwoFactor(*coordinator)
                               : RunTwoStep(*coordinator);
    if (!confirmed) {
      return 1;
    }
    state = coordinator->CompleteMfa(err);
  }
  if (state != LoginState::kAuthenticated) {
    std::cerr << "login failed: " << err.ToString() << "\n";
    return 1;
  }

  std::cout << "authenticated, dsid " << coordinator->dsid() << ", trusted "
            << (coordinator->is_trusted_session() ? "yes" : "no") << "\n";
  std::string url;
  if (coordinator->WebserviceUrl("drivews", url, err)) {
    std::cout << "drivews: " << url << "\n";
  }
  return 0;
}
