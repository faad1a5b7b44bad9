#include <array>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sp/common.h"
#include "sp/crypto/ct.h"
#include "sp/crypto/provider.h"
#include "sp/error.h"
#include "sp/errors.h"
#include "sp/orchestrator/backup_transport.h"
#include "sp/orchestrator/config.h"
#include "sp/orchestrator/event_bus.h"
#include "sp/orchestrator/identity_store.h"
#include "sp/orchestrator/transfer_service.h"
#include "sp/security/zeroizer.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <signal.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace {

  constexpr size_t kMaxPassphraseLen = 1024;

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 1;
  constexpr int kExitFailure = 3;

  void PrintUsage() {
    std::cerr << "SeedPort identity transfer\n";
    std::cerr << "Usage:\n";
    std::cerr << "  seedport [options] init\n";
    std::cerr << "  seedport [options] export-mnemonic\n";
    std::cerr << "  seedport [options] export-qr\n";
    std::cerr << "  seedport [options] import-mnemonic      (words on stdin)\n";
    std::cerr << "  seedport [options] import-qr            (one frame per line on stdin)\n";
    std::cerr << "  seedport [options] backup-create --id=<ref>\n";
    std::cerr << "  seedport [options] backup-restore --id=<ref>\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --identity=<path>          Identity file (default ~/.seedport/identity.hex)\n";
    std::cerr << "  --backup-dir=<dir>         Backup directory (default ~/.seedport/backups)\n";
    std::cerr << "  --log-file=<path>          JSON line event log\n";
    std::cerr << "  --argon2-memory=<KiB>      Argon2id memory for new backups (min 65536)\n";
    std::cerr << "  --argon2-iterations=<n>    Argon2id passes for new backups (min 2)\n";
    std::cerr << "  --argon2-parallelism=<n>   Argon2id lanes for new backups\n";
  }

  std::optional<std::string_view> FlagValue(std::string_view arg, std::string_view name) {
    if (arg.size() <= name.size() + 3 || arg.rfind("--", 0) != 0) {
      return std::nullopt;
    }
    auto body = arg.substr(2);
    if (body.rfind(name, 0) != 0 || body[name.size()] != '=') {
      return std::nullopt;
    }
    return body.substr(name.size() + 1);
  }

  bool ValidateNoEmbeddedNull(std::string_view value, std::string_view description) {
    if (value.find('\0') != std::string_view::npos) {
      std::cerr << "Validation error: " << description << " contains embedded NUL byte." << std::endl;
      return false;
    }
    return true;
  }

  bool StdinIsInteractive() {
#ifdef _WIN32
    DWORD mode = 0;
    return GetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), &mode) != 0;
#else
    return isatty(STDIN_FILENO) != 0;
#endif
  }

  bool PassphrasesEqual(std::string_view lhs, std::string_view rhs) noexcept {
    return sp::crypto::ct::CompareEqual(sp::TextBytes(lhs), sp::TextBytes(rhs));
  }

#ifdef _WIN32
  std::string ReadPassphrase(const std::string& prompt) {
    HANDLE input = GetStdHandle(STD_INPUT_HANDLE);
    DWORD original_mode = 0;
    if (input == INVALID_HANDLE_VALUE) {
      throw sp::Error{sp::ErrorDomain::IO, sp::errors::io::kConsoleUnavailable,
                      "Console unavailable for passphrase entry.", static_cast<int>(GetLastError())};
    }
    std::string passphrase;
    if (!GetConsoleMode(input, &original_mode)) {
      // Redirected input: first line of stdin.
      std::getline(std::cin, passphrase);
    } else {
      if (!SetConsoleMode(input, original_mode & ~static_cast<DWORD>(ENABLE_ECHO_INPUT))) {
        throw sp::Error{sp::ErrorDomain::IO, sp::errors::io::kConsoleEchoDisableFailed,
                        "Failed to disable console echo.", static_cast<int>(GetLastError())};
      }
      std::cout << prompt << std::flush;
      std::getline(std::cin, passphrase);
      SetConsoleMode(input, original_mode);
      std::cout << std::endl;
    }
    if (!passphrase.empty() && passphrase.back() == '\r') {
      passphrase.pop_back();
    }
    if (passphrase.size() > kMaxPassphraseLen) {
      sp::security::Zeroizer::WipeString(passphrase);
      throw sp::Error{sp::ErrorDomain::Validation, sp::errors::validation::kPassphraseRejected,
                      std::string(sp::errors::msg::kPassphraseTooLong), std::nullopt,
                      sp::Retryability::kRetryable};
    }
    return passphrase;
  }
#else  // _WIN32

  class TermiosGuard {
  public:
    TermiosGuard(int fd, const termios& state) : fd_(fd), state_(state), restored_(false) {}
    ~TermiosGuard() {
      Restore();
    }
    void Restore() {
      if (!restored_) {
        tcsetattr(fd_, TCSAFLUSH, &state_);
        restored_ = true;
      }
    }

  private:
    int fd_;
    termios state_;
    bool restored_;
  };

  std::atomic<char*> g_signal_buffer{nullptr};
  std::atomic<size_t> g_signal_length{0};

  void PassphraseSignalHandler(int sig) {
    auto* buffer = g_signal_buffer.load(std::memory_order_acquire);
    const size_t len = g_signal_length.load(std::memory_order_acquire);
    if (buffer && len > 0) {
      volatile char* wipe = buffer;
      for (size_t i = 0; i < len; ++i) {
        wipe[i] = 0;
      }
    }
    _exit(128 + sig);
  }

  // Wipes the in-flight passphrase buffer if the user interrupts the prompt.
  class PassphraseSignalGuard {
   public:
    PassphraseSignalGuard(char* buffer, size_t size) {
      g_signal_buffer.store(buffer, std::memory_order_release);
      g_signal_length.store(size, std::memory_order_release);
      struct sigaction sa {};
      sa.sa_handler = PassphraseSignalHandler;
      sigemptyset(&sa.sa_mask);
      sa.sa_flags = 0;
      sigaction(SIGINT, &sa, &old_int_);
      sigaction(SIGTERM, &sa, &old_term_);
    }
    ~PassphraseSignalGuard() {
      sigaction(SIGINT, &old_int_, nullptr);
      sigaction(SIGTERM, &old_term_, nullptr);
      g_signal_buffer.store(nullptr, std::memory_order_release);
      g_signal_length.store(0, std::memory_order_release);
    }

   private:
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
  };

  std::string ReadPassphraseLine(int fd, bool* overflow) {
    std::array<char, kMaxPassphraseLen + 1> buffer{};
    sp::security::Zeroizer::ScopeWiper<char> buf_guard(buffer.data(), buffer.size());
    PassphraseSignalGuard signal_guard(buffer.data(), buffer.size());

    size_t pos = 0;
    *overflow = false;
    while (true) {
      char ch = 0;
      ssize_t n = ::read(fd, &ch, 1);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        const int err = errno;
        throw sp::Error{sp::ErrorDomain::IO, sp::errors::io::kPassphraseReadFailed,
                        "Failed to read passphrase input.", err};
      }
      if (n == 0 || ch == '\n') {
        break;
      }
      if (ch == '\r') {
        continue;
      }
      if (ch == '\b' || ch == 0x7f) {
        if (pos > 0) {
          buffer[--pos] = 0;
        }
        continue;
      }
      if (pos >= kMaxPassphraseLen) {
        *overflow = true;
        continue;
      }
      buffer[pos++] = ch;
    }
    return std::string(buffer.data(), pos);
  }

  std::string ReadPassphrase(const std::string& prompt) {
    bool overflow = false;
    std::string passphrase;
    if (!StdinIsInteractive()) {
      // Scripted use: first line of stdin.
      passphrase = ReadPassphraseLine(STDIN_FILENO, &overflow);
    } else {
      termios original{};
      if (tcgetattr(STDIN_FILENO, &original) != 0) {
        const int err = errno;
        throw sp::Error{sp::ErrorDomain::IO, sp::errors::io::kConsoleUnavailable,
                        "Failed to query terminal attributes.", err};
      }
      TermiosGuard guard(STDIN_FILENO, original);
      termios silent = original;
      silent.c_lflag &= ~ECHO;
      if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) != 0) {
        const int err = errno;
        throw sp::Error{sp::ErrorDomain::IO, sp::errors::io::kConsoleEchoDisableFailed,
                        "Failed to disable terminal echo.", err};
      }
      std::cout << prompt << std::flush;
      passphrase = ReadPassphraseLine(STDIN_FILENO, &overflow);
      guard.Restore();
      std::cout << std::endl;
    }
    if (overflow) {
      sp::security::Zeroizer::WipeString(passphrase);
      throw sp::Error{sp::ErrorDomain::Validation, sp::errors::validation::kPassphraseRejected,
                      std::string(sp::errors::msg::kPassphraseTooLong), std::nullopt,
                      sp::Retryability::kRetryable};
    }
    return passphrase;
  }
#endif // _WIN32

  std::string_view DomainPrefix(sp::ErrorDomain domain) {
    switch (domain) {
    case sp::ErrorDomain::IO:
      return "I/O error";
    case sp::ErrorDomain::Security:
      return "Security error";
    case sp::ErrorDomain::Crypto:
      return "Cryptography error";
    case sp::ErrorDomain::Validation:
      return "Validation error";
    case sp::ErrorDomain::Config:
      return "Configuration error";
    case sp::ErrorDomain::Dependency:
      return "Dependency error";
    case sp::ErrorDomain::State:
      return "State error";
    case sp::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  std::string DescribeError(const sp::Error& err) {
    if (!sp::IsFrameworkErrorCode(err.domain, err.code)) {
      return std::string(err.what());
    }
    switch (err.code) {
    case sp::errors::validation::kChecksumMismatch:
      return std::string(err.what()) + ". Rescan all three frames.";
    case sp::errors::validation::kInvalidMnemonic:
      return std::string(err.what()) + ". Check the words and their order.";
    case sp::errors::io::kBackupNotFound:
      return std::string(err.what()) + ". Check the identity reference.";
    case sp::errors::state::kNoIdentity:
      return std::string(err.what()) + ". Run 'seedport init' or import one first.";
    default:
      return std::string(err.what());
    }
  }

  void ReportError(const sp::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << DescribeError(err) << '\n';

    sp::orchestrator::Event event;
    event.category = sp::orchestrator::EventCategory::kDiagnostics;
    event.severity = sp::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code), sp::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                sp::orchestrator::FieldPrivacy::kPublic, true);
    }
    try {
      sp::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  std::string ReadAllStdin() {
    std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    if (std::cin.bad()) {
      throw sp::Error{sp::ErrorDomain::IO, 0, "Failed to read standard input."};
    }
    return text;
  }

  int HandleInit(sp::orchestrator::IdentityTransfer& transfer) {
    (void)transfer.InitializeIdentity();
    std::cout << "Identity created." << std::endl;
    return kExitOk;
  }

  int HandleExportMnemonic(sp::orchestrator::IdentityTransfer& transfer) {
    const auto mnemonic = transfer.ExportMnemonic();
    const auto& words = mnemonic.Words();
    for (size_t i = 0; i < words.size(); ++i) {
      std::cout << (i + 1) << ". " << words[i] << '\n';
    }
    std::cout << std::flush;
    return kExitOk;
  }

  int HandleExportQr(sp::orchestrator::IdentityTransfer& transfer) {
    auto frames = transfer.ExportQrFrames();
    for (auto& frame : frames) {
      std::cout << frame << '\n';
      sp::security::Zeroizer::WipeString(frame);
    }
    std::cout << std::flush;
    return kExitOk;
  }

  int HandleImportMnemonic(sp::orchestrator::IdentityTransfer& transfer) {
    std::string text = ReadAllStdin();
    sp::security::Zeroizer::ScopeWiper<char> wipe(text.data(), text.size());
    (void)transfer.ImportMnemonic(text);
    std::cout << "Identity imported." << std::endl;
    return kExitOk;
  }

  int HandleImportQr(sp::orchestrator::IdentityTransfer& transfer) {
    std::vector<std::string> frames;
    std::string line;
    while (std::getline(std::cin, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (!line.empty()) {
        frames.push_back(line);
      }
      sp::security::Zeroizer::WipeString(line);
    }
    if (std::cin.bad()) {
      throw sp::Error{sp::ErrorDomain::IO, 0, "Failed to read standard input."};
    }
    try {
      (void)transfer.ImportQrFrames(frames);
    } catch (const sp::Error&) {
      for (auto& frame : frames) {
        sp::security::Zeroizer::WipeString(frame);
      }
      throw;
    }
    for (auto& frame : frames) {
      sp::security::Zeroizer::WipeString(frame);
    }
    std::cout << "Identity imported." << std::endl;
    return kExitOk;
  }

  int HandleBackupCreate(sp::orchestrator::IdentityTransfer& transfer, const std::string& identity_ref) {
    std::string passphrase = ReadPassphrase("Backup passphrase: ");
    sp::security::Zeroizer::ScopeWiper<char> wipe(passphrase.data(), passphrase.size());
    if (StdinIsInteractive()) {
      std::string confirm = ReadPassphrase("Confirm passphrase: ");
      sp::security::Zeroizer::ScopeWiper<char> wipe_confirm(confirm.data(), confirm.size());
      if (!PassphrasesEqual(passphrase, confirm)) {
        throw sp::Error{sp::ErrorDomain::Validation, sp::errors::validation::kPassphraseRejected,
                        "Passphrases do not match", std::nullopt, sp::Retryability::kRetryable};
      }
    }
    std::cerr << "Deriving key (this takes a moment)..." << std::endl;
    transfer.CreateBackupAsync(identity_ref, passphrase).get();
    std::cout << "Backup uploaded." << std::endl;
    return kExitOk;
  }

  int HandleBackupRestore(sp::orchestrator::IdentityTransfer& transfer, const std::string& identity_ref) {
    std::string passphrase = ReadPassphrase("Backup passphrase: ");
    sp::security::Zeroizer::ScopeWiper<char> wipe(passphrase.data(), passphrase.size());
    std::cerr << "Deriving key (this takes a moment)..." << std::endl;
    (void)transfer.RestoreBackupAsync(identity_ref, passphrase).get();
    std::cout << "Identity restored." << std::endl;
    return kExitOk;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    auto config = sp::orchestrator::TransferConfig::Load();
    std::optional<std::string> identity_ref;
    std::optional<std::string> cmd;

    for (int index = 1; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (!ValidateNoEmbeddedNull(arg, "argument")) {
        return kExitUsage;
      }
      if (arg.rfind("--", 0) != 0) {
        if (cmd) {
          PrintUsage();
          return kExitUsage;
        }
        cmd = std::string(arg);
        continue;
      }
      if (auto value = FlagValue(arg, "identity")) {
        config.identity_file = std::filesystem::path(std::string(*value));
        continue;
      }
      if (auto value = FlagValue(arg, "backup-dir")) {
        config.backup_dir = std::filesystem::path(std::string(*value));
        continue;
      }
      if (auto value = FlagValue(arg, "log-file")) {
        config.log_path = std::filesystem::path(std::string(*value));
        continue;
      }
      if (auto value = FlagValue(arg, "argon2-memory")) {
        config.argon2.memory_cost_kib = sp::orchestrator::ParseConfigNumber("--argon2-memory", *value);
        continue;
      }
      if (auto value = FlagValue(arg, "argon2-iterations")) {
        config.argon2.time_cost = sp::orchestrator::ParseConfigNumber("--argon2-iterations", *value);
        continue;
      }
      if (auto value = FlagValue(arg, "argon2-parallelism")) {
        config.argon2.parallelism = sp::orchestrator::ParseConfigNumber("--argon2-parallelism", *value);
        continue;
      }
      if (auto value = FlagValue(arg, "id")) {
        identity_ref = std::string(*value);
        continue;
      }
      PrintUsage();
      return kExitUsage;
    }

    if (!cmd) {
      PrintUsage();
      return kExitUsage;
    }
    config.Validate();
    sp::orchestrator::DefaultJsonLogger().SetPath(config.log_path);
    sp::crypto::EnsureCryptoProviderInitialized();

    sp::orchestrator::FileIdentityStore store(config.identity_file);
    sp::orchestrator::DirectoryBackupTransport transport(config.backup_dir);
    sp::orchestrator::IdentityTransfer transfer(store, transport, config.argon2);

    const bool needs_id = *cmd == "backup-create" || *cmd == "backup-restore";
    if (needs_id != identity_ref.has_value() || (identity_ref && identity_ref->empty())) {
      PrintUsage();
      return kExitUsage;
    }

    if (*cmd == "init") {
      return HandleInit(transfer);
    }
    if (*cmd == "export-mnemonic") {
      return HandleExportMnemonic(transfer);
    }
    if (*cmd == "export-qr") {
      return HandleExportQr(transfer);
    }
    if (*cmd == "import-mnemonic") {
      return HandleImportMnemonic(transfer);
    }
    if (*cmd == "import-qr") {
      return HandleImportQr(transfer);
    }
    if (*cmd == "backup-create") {
      return HandleBackupCreate(transfer, *identity_ref);
    }
    if (*cmd == "backup-restore") {
      return HandleBackupRestore(transfer, *identity_ref);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const sp::Error& err) {
    ReportError(err);
    return sp::ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "Internal error: " << err.what() << std::endl;
    return kExitFailure;
  }
}
