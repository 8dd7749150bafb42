// tests/test_config_manager.cpp
#include "config/config_manager.h"
#include "core/monitor_settings.h"
#include "test_support.h"
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace terminal_health;
using config::ConfigManager;

namespace {

std::filesystem::path tempConfigPath(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("terminal_health_" + name + ".ini");
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

void testWritesDefaultsWhenMissing() {
    auto path = tempConfigPath("defaults");
    std::filesystem::remove(path);

    auto& config = ConfigManager::getInstance();
    config.initialize(path.string());
    CHECK(std::filesystem::exists(path));
    CHECK_EQ(config.getConfigFilePath(), path.string());
    CHECK_EQ(config.getInt(config::KEY_POLLING_INTERVAL, -1), 30);
    CHECK_EQ(config.getString(config::KEY_FAST_BACKOFF), std::string("30,60,120,300"));
    CHECK_EQ(config.getString(config::KEY_REBOOT_REASON), std::string("security_reboot"));

    core::MonitorSettings settings = core::MonitorSettings::fromConfig(config);
    CHECK(settings.pollingInterval == Seconds(30));
    CHECK(settings.rebootGrace == Seconds(120));
    CHECK(settings.lifecycle.hardTimeout == Seconds(3600));
    CHECK(settings.lifecycle.proactiveRefresh == Seconds(3000));
    CHECK(settings.lifecycle.stuckAwaitingInput == Seconds(300));
    CHECK(settings.blipSettleDelay == std::chrono::milliseconds(500));
    CHECK_EQ(settings.milestoneEvery, 10);
    CHECK(settings.layout == devices::LayoutKind::ZERO_TOUCH);
    CHECK_EQ(settings.preset.amount, 100u);
    CHECK_EQ(settings.preset.category, std::string("default"));

    std::filesystem::remove(path);
}

void testLoadsValuesAndIgnoresUnknownKeys() {
    auto path = tempConfigPath("custom");
    writeFile(path,
        "# comment\n"
        "; another comment\n"
        "monitor.polling_interval_seconds = 10\r\n"
        "recovery.fast_backoff_schedule=5,10\n"
        "monitor.security_reboot_grace_seconds=90\n"
        "network_blip.settle_delay_ms=250\n"
        "printer.name=should be ignored\n"
        "not a key value line\n");

    auto& config = ConfigManager::getInstance();
    config.initialize(path.string());
    CHECK_EQ(config.getInt(config::KEY_POLLING_INTERVAL, -1), 10);
    CHECK(config.getAll().count("printer.name") == 0);

    core::MonitorSettings settings = core::MonitorSettings::fromConfig(config);
    CHECK(settings.pollingInterval == Seconds(10));
    CHECK(settings.rebootGrace == Seconds(90));
    CHECK(settings.blipSettleDelay == std::chrono::milliseconds(250));
    CHECK_EQ(settings.fastBackoff.toString(), std::string("5,10"));
    CHECK_EQ(settings.slowBackoff.toString(), std::string("60,120,300,600"));

    std::filesystem::remove(path);
}

void testInvalidValuesFallBack() {
    auto path = tempConfigPath("invalid");
    writeFile(path,
        "monitor.polling_interval_seconds=abc\n"
        "recovery.milestone_every_attempts=-4\n"
        "recovery.slow_backoff_schedule=60,,600\n"
        "payment_intent.proactive_refresh_seconds=4000\n"
        "payment_intent.hard_timeout_seconds=3600\n"
        "terminal.preset_amount=-5\n");

    auto& config = ConfigManager::getInstance();
    config.initialize(path.string());
    CHECK_EQ(config.getInt(config::KEY_POLLING_INTERVAL, 30), 30);

    core::MonitorSettings settings = core::MonitorSettings::fromConfig(config);
    CHECK(settings.pollingInterval == Seconds(30));
    CHECK_EQ(settings.milestoneEvery, 10);
    CHECK_EQ(settings.slowBackoff.toString(), std::string("60,120,300,600"));
    // Refresh must come before the hard timeout
    CHECK(settings.lifecycle.proactiveRefresh == Seconds(3000));
    CHECK(settings.lifecycle.hardTimeout == Seconds(3600));
    // Negative amount must not wrap around
    CHECK_EQ(settings.preset.amount, 100u);

    std::filesystem::remove(path);
}

void testSetSaveAndReload() {
    auto path = tempConfigPath("roundtrip");
    std::filesystem::remove(path);

    auto& config = ConfigManager::getInstance();
    config.initialize(path.string());
    config.setFromMap({{config::KEY_LAYOUT, "manual"}, {config::KEY_PRESET_AMOUNT, "450"}});
    config.saveIfInitialized();

    config.resetToDefaults();
    CHECK_EQ(config.getString(config::KEY_LAYOUT), std::string("zero_touch"));

    config.reloadFromFileIfExists();
    CHECK_EQ(config.getString(config::KEY_LAYOUT), std::string("manual"));
    CHECK_EQ(config.getInt(config::KEY_PRESET_AMOUNT, 0), 450);

    std::filesystem::remove(path);
}

} // namespace

int main() {
    test_support::quietLogs();
    std::cout << "=== Config Manager Test ===" << std::endl;

    test_support::runTest("writes defaults when missing", testWritesDefaultsWhenMissing);
    test_support::runTest("loads values and ignores unknown keys", testLoadsValuesAndIgnoresUnknownKeys);
    test_support::runTest("invalid values fall back", testInvalidValuesFallBack);
    test_support::runTest("set, save and reload", testSetSaveAndReload);

    return test_support::finish("Config Manager");
}
