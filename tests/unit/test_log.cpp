#include <catch2/catch_test_macros.hpp>
#include "warden/debug/log.hpp"
#include "warden/core/format.hpp"
#include "warden/security/access_control_policy.hpp"
#include "warden/storage/secure_storage.hpp"
#include "helpers/fake_backend.hpp"
#include <mutex>
#include <string>
#include <vector>
using namespace warden;
using namespace warden::debug;
namespace {
struct CapturedLine {
    LogLevel level;
    std::string component;
    std::string line;
};
class SinkCapture {
public:
    SinkCapture() : previous_level_(Logger::GetLevel()) {
        Logger::SetSink([this](LogLevel level, std::string_view component, std::string_view line) {
            std::lock_guard guard(lock_);
            lines_.push_back({level, std::string(component), std::string(line)});
        });
    }
    ~SinkCapture() {
        Logger::SetSink({});
        Logger::SetLevel(previous_level_);
    }
    std::vector<CapturedLine> Lines() {
        std::lock_guard guard(lock_);
        return lines_;
    }
private:
    LogLevel previous_level_;
    std::mutex lock_;
    std::vector<CapturedLine> lines_;
};
}
TEST_CASE("Logger - Level parsing", "[log]") {
    REQUIRE(Logger::ParseLevel("trace", LogLevel::Off) == LogLevel::Trace);
    REQUIRE(Logger::ParseLevel("warn", LogLevel::Off) == LogLevel::Warn);
    REQUIRE(Logger::ParseLevel("off", LogLevel::Info) == LogLevel::Off);
    REQUIRE(Logger::ParseLevel("loud", LogLevel::Info) == LogLevel::Info);
    REQUIRE(std::string(Logger::LevelToString(LogLevel::Error)) == "ERROR");
}
TEST_CASE("Format shim - Mixed arguments", "[log][format]") {
    const std::string_view key = "wallet.seed";
    const size_t size = 32;
    REQUIRE(compat::format("Stored '{}' ({} bytes)", key, size) == "Stored 'wallet.seed' (32 bytes)");
    REQUIRE(compat::format("b{}p{}", 1, 0) == "b1p0");
    REQUIRE(compat::format("{}{}", std::string("Warden: "), "seed") == "Warden: seed");
}
TEST_CASE("Logger - Gating and sinks", "[log]") {
    SinkCapture capture;
    SECTION("Lines below the threshold are dropped") {
        Logger::SetLevel(LogLevel::Warn);
        WARDEN_LOG_INFO("test", "hidden {}", 1);
        WARDEN_LOG_WARN("test", "shown {}", 2);
        const auto lines = capture.Lines();
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].level == LogLevel::Warn);
        REQUIRE(lines[0].component == "test");
        REQUIRE(lines[0].line == "shown 2");
    }
    SECTION("Off silences everything") {
        Logger::SetLevel(LogLevel::Off);
        WARDEN_LOG_ERROR("test", "nothing");
        REQUIRE(capture.Lines().empty());
        REQUIRE_FALSE(Logger::IsEnabled(LogLevel::Off));
    }
    SECTION("Stored records are logged with their policy description, never their bytes") {
        Logger::SetLevel(LogLevel::Info);
        auto state = std::make_shared<test_helpers::FakeBackendState>();
        auto storage = storage::SecureStorage::FromBackends(
            configuration::StorageConfig::Default(), test_helpers::MakeFakeBackend(state), nullptr).Unwrap();
        const std::string secret = "correct-horse-battery-staple";
        const std::vector<uint8_t> bytes(secret.begin(), secret.end());
        REQUIRE(storage->Store("wallet_seed", bytes, security::AccessControlPolicy::HighSecurity()).IsOk());
        bool described = false;
        for (const auto& entry : capture.Lines()) {
            REQUIRE(entry.line.find(secret) == std::string::npos);
            if (entry.line.find("wallet_seed") != std::string::npos &&
                entry.line.find(security::AccessControlPolicy::HighSecurity().Describe()) != std::string::npos) {
                described = true;
            }
        }
        REQUIRE(described);
    }
}
