/// @file wardenctl.cpp
/// @brief Operator tool for the authentication core.
///
/// Usage:
///   wardenctl [--config <path>] hash <password>
///   wardenctl [--config <path>] verify <password> <encoded-hash>
///   wardenctl [--config <path>] issue <account-id> [ttl-seconds]
///   wardenctl [--config <path>] inspect <token>
///
/// Config resolution: --config flag > WARDEN_CONFIG_PATH env > default path,
/// and built-in defaults when none of those exist.

#include "warden/foundation/config_manager.hpp"
#include "warden/foundation/warden_logger.hpp"
#include "warden/service/activation_service.hpp"
#include "warden/service/auth_config.hpp"
#include "warden/service/auth_types.hpp"
#include "warden/service/clock.hpp"
#include "warden/service/credential_hasher.hpp"
#include "warden/service/token_signer.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char* kDefaultConfigPath = "/etc/warden/config.yaml";

void printUsage() {
    std::cerr << "usage: wardenctl [--config <path>] <command> [args]\n"
              << "  hash <password>                  hash a password with the configured cost\n"
              << "  verify <password> <hash>         check a password against a stored hash\n"
              << "  issue <account-id> [ttl-seconds] mint an activation token\n"
              << "  inspect <token>                  verify a token and print its payload\n";
}

/// Positional arguments with "--config <path>" removed.
std::vector<std::string_view> positionalArgs(int argc, char* argv[]) {
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config") {
            ++i;
            continue;
        }
        args.push_back(arg);
    }
    return args;
}

template <typename T>
bool parseNumber(std::string_view text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

void printValue(const warden::service::TokenValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        std::cout << *i;
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        std::cout << '"' << *s << '"';
    } else {
        std::cout << (std::get<bool>(value) ? "true" : "false");
    }
}

int runHash(const warden::service::CredentialHasher& hasher,
            const std::vector<std::string_view>& args) {
    if (args.size() != 2) {
        printUsage();
        return EXIT_FAILURE;
    }
    auto hashed = hasher.hash(args[1]);
    if (!hashed) {
        std::cerr << "hash failed: " << hashed.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << hashed.value().encoded << "\n";
    return EXIT_SUCCESS;
}

int runVerify(const warden::service::CredentialHasher& hasher,
              const std::vector<std::string_view>& args) {
    if (args.size() != 3) {
        printUsage();
        return EXIT_FAILURE;
    }
    if (!hasher.verify(args[1], args[2])) {
        std::cout << "mismatch\n";
        return EXIT_FAILURE;
    }
    std::cout << "match";
    if (hasher.needsRehash(args[2])) {
        std::cout << " (stored cost differs from configured cost; rehash on next change)";
    }
    std::cout << "\n";
    return EXIT_SUCCESS;
}

int runIssue(const warden::service::ActivationService& activation,
             const std::vector<std::string_view>& args) {
    uint64_t id = 0;
    long long ttl = 0;
    if (args.size() < 2 || args.size() > 3 || !parseNumber(args[1], id) || id == 0 ||
        (args.size() == 3 && (!parseNumber(args[2], ttl) || ttl <= 0 ||
                              ttl > warden::service::kMaxLifetime.count()))) {
        printUsage();
        return EXIT_FAILURE;
    }
    warden::service::AccountId accountId(id);

    auto token = args.size() == 3 ? activation.issueFor(accountId, std::chrono::seconds(ttl))
                                  : activation.issueFor(accountId);
    if (!token) {
        std::cerr << "issue failed: " << token.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << token.value() << "\n";
    return EXIT_SUCCESS;
}

int runInspect(const warden::service::TokenSigner& signer,
               const std::vector<std::string_view>& args) {
    if (args.size() != 2) {
        printUsage();
        return EXIT_FAILURE;
    }
    auto redeemed = signer.redeem(args[1]);
    if (!redeemed) {
        std::cout << "rejected: " << warden::service::tokenErrorName(redeemed.error()) << "\n";
        return EXIT_FAILURE;
    }
    for (const auto& [key, value] : redeemed.value()) {
        std::cout << key << " = ";
        printValue(value);
        std::cout << "\n";
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace warden;

    auto args = positionalArgs(argc, argv);
    if (args.empty()) {
        printUsage();
        return EXIT_FAILURE;
    }

    foundation::ConfigManager config;
    auto loaded = service::loadToolConfig(config, argc, argv, kDefaultConfigPath);
    if (!loaded) {
        std::cerr << "Failed to load config: " << loaded.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto authConfig = service::loadAuthConfig(config);
    if (!authConfig) {
        std::cerr << "Invalid config: " << authConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto& cfg = authConfig.value();

    auto clock = std::make_shared<service::SystemClock>();
    service::CredentialHasher hasher(cfg);
    auto signer = std::make_shared<const service::TokenSigner>(cfg, clock);

    const auto command = args.front();
    int status = EXIT_FAILURE;
    if (command == "hash") {
        status = runHash(hasher, args);
    } else if (command == "verify") {
        status = runVerify(hasher, args);
    } else if (command == "issue") {
        // No directory is consulted; issuing never checks that the id exists.
        service::ActivationService activation(cfg, signer, nullptr);
        status = runIssue(activation, args);
    } else if (command == "inspect") {
        status = runInspect(*signer, args);
    } else {
        std::cerr << "unknown command: " << command << "\n";
        printUsage();
    }

    auto flushed = foundation::WardenLogger::instance().flush();
    if (!flushed) {
        std::cerr << "log flush failed: " << flushed.error().message() << "\n";
    }
    return status;
}
