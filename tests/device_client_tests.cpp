/**
 * @file device_client_tests.cpp
 * @brief openMonkey source file.
 */

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "openmonkey/device/device_client.hpp"
#include "openmonkey/device/property_dump.hpp"
#include "openmonkey/transport/mock_process_runner.hpp"
#include "openmonkey/transport/runner_factory.hpp"

int main() {
    // Dump values are coerced to bool, integer or string.
    {
        const auto properties = omk::parsePropertyDump(
            "Current Battery Service state:\n"
            "  AC powered: false\n"
            "  USB powered: true\n"
            "  level: 85\n"
            "  temperature: -5\n"
            "  technology: Li-ion\n"
            "  serial: 12abc\n"
            "  : orphan\n"
            "  empty:\n");
        assert(std::get<bool>(properties.at("AC powered")) == false);
        assert(std::get<bool>(properties.at("USB powered")) == true);
        assert(std::get<std::int64_t>(properties.at("level")) == 85);
        assert(std::get<std::int64_t>(properties.at("temperature")) == -5);
        assert(std::get<std::string>(properties.at("technology")) == "Li-ion");
        assert(std::get<std::string>(properties.at("serial")) == "12abc");
        assert(std::get<std::string>(properties.at("empty")).empty());
        assert(properties.count("Current Battery Service state") == 0U);
        assert(properties.count("") == 0U);

        assert(omk::integerProperty(properties, "level").value() == 85);
        assert(!omk::integerProperty(properties, "technology").has_value());
        assert(!omk::integerProperty(properties, "missing").has_value());
        assert(omk::booleanProperty(properties, "USB powered").value());
    }

    // Every command is prefixed with the adb path and the device serial.
    {
        omk::MockProcessRunner runner;
        runner.setBatteryLevels({57});
        omk::DeviceClient device(runner, {.adbPath = "adb", .serial = "emulator-5554"});

        assert(device.getProperty("sys.boot_completed") == "1");
        const std::vector<std::string> expected{"adb", "-s", "emulator-5554", "shell", "getprop", "sys.boot_completed"};
        assert(runner.lastCommand("getprop") == expected);

        assert(device.getBatteryLevel() == 57);
        device.reboot();
        device.waitReady();
        device.dismissKeyguard();
        assert(runner.countCommands("reboot") == 1U);
        assert(runner.countCommands("wait-for-device") == 1U);
        assert((runner.lastCommand("input") ==
                std::vector<std::string>{"adb", "-s", "emulator-5554", "shell", "input", "keyevent", "82"}));
    }

    // Non-zero exits raise CommandError carrying the command and exit code.
    {
        omk::MockProcessRunner runner;
        runner.failCommand("reboot", 1);
        omk::DeviceClient device(runner);

        bool threw = false;
        try {
            device.reboot();
        } catch (const omk::CommandError& ex) {
            threw = true;
            assert(ex.exitCode() == 1);
            assert(ex.command() == "adb reboot");
            assert(std::string(ex.what()).find("exit code 1") != std::string::npos);
        }
        assert(threw);

        threw = false;
        try {
            (void)device.executeCapturing({"sideload", "ota.zip"});
        } catch (const omk::CommandError& ex) {
            threw = true;
            assert(ex.exitCode() == 1);
        }
        assert(threw);
    }

    // A battery dump without a level is a command failure.
    {
        omk::MockProcessRunner runner;
        runner.setBatteryDump("Current Battery Service state:\n  present: true\n");
        omk::DeviceClient device(runner);

        bool threw = false;
        try {
            (void)device.getBatteryLevel();
        } catch (const omk::CommandError& ex) {
            threw = true;
            assert(ex.exitCode() == 0);
        }
        assert(threw);
    }

    // Levels outside 0..100 are rejected instead of narrowed.
    {
        for (const char* level : {"4294967396", "-1", "101"}) {
            omk::MockProcessRunner runner;
            runner.setBatteryDump(std::string("Current Battery Service state:\n  level: ") + level + "\n");
            omk::DeviceClient device(runner);

            bool threw = false;
            try {
                (void)device.getBatteryLevel();
            } catch (const omk::CommandError& ex) {
                threw = true;
                assert(ex.exitCode() == 0);
                assert(std::string(ex.what()).find("outside 0..100") != std::string::npos);
            }
            assert(threw);
        }

        omk::MockProcessRunner runner;
        runner.setBatteryDump("Current Battery Service state:\n  level: 100\n");
        omk::DeviceClient device(runner);
        assert(device.getBatteryLevel() == 100);
    }

    // A command cut short by keepRunning raises CommandError.
    {
        omk::MockProcessRunner runner;
        bool stop = false;
        omk::DeviceClientOptions options;
        options.keepRunning = [&stop] { return !stop; };
        omk::DeviceClient device(runner, options);
        device.reboot();

        stop = true;
        bool threw = false;
        try {
            device.waitReady();
        } catch (const omk::CommandError& ex) {
            threw = true;
            assert(std::string(ex.what()).find("interrupted") != std::string::npos);
        }
        assert(threw);
        assert(runner.countCommands("wait-for-device") == 1U);
    }

    // Bugreport output streams into the caller's sink.
    {
        omk::MockProcessRunner runner;
        runner.setBugreportText("== dumpstate: 2026-10-19 ==\n");
        omk::DeviceClient device(runner);
        std::ostringstream sink;
        device.bugreport(sink);
        assert(sink.str() == "== dumpstate: 2026-10-19 ==\n");
    }

    // Log stream spawn failures surface as CommandError.
    {
        omk::MockProcessRunner runner;
        runner.failSpawns(true);
        omk::DeviceClient device(runner);
        std::ostringstream sink;
        bool threw = false;
        try {
            (void)device.spawnLogStream({}, sink);
        } catch (const omk::CommandError& ex) {
            threw = true;
            assert(ex.exitCode() == 127);
        }
        assert(threw);
    }

    assert(omk::joinCommandLine({"adb", "shell", "monkey"}) == "adb shell monkey");
    assert(omk::joinCommandLine({"adb", "shell", "--match-description", "Sign in"}) ==
           "adb shell --match-description \"Sign in\"");

    // Device spec parsing.
    {
        omk::RunnerFactoryConfig cfg;
        std::string err;
        assert(omk::RunnerFactory::parseDeviceSpec("mock", cfg, err));
        assert(cfg.kind == omk::RunnerKind::Mock);

        assert(omk::RunnerFactory::parseDeviceSpec("adb:emulator-5554", cfg, err));
        assert(cfg.kind == omk::RunnerKind::Adb);
        assert(cfg.serial == "emulator-5554");

        assert(omk::RunnerFactory::parseDeviceSpec("adb", cfg, err));
        assert(cfg.serial.empty());

        assert(!omk::RunnerFactory::parseDeviceSpec("adb:", cfg, err));
        assert(!err.empty());
        assert(!omk::RunnerFactory::parseDeviceSpec("", cfg, err));
        assert(!omk::RunnerFactory::parseDeviceSpec("fastboot:1234", cfg, err));

        cfg.kind = omk::RunnerKind::Mock;
        auto runner = omk::RunnerFactory::create(cfg, err);
        assert(runner != nullptr);
        cfg.kind = omk::RunnerKind::Adb;
        runner = omk::RunnerFactory::create(cfg, err);
        assert(runner != nullptr);
    }

    std::cout << "device_client_tests passed\n";
    return 0;
}
