/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include "Core/NvsKeys.h"    ///< Preference needs to be singleton-like global to work

/// Load Core Functions
#include "Core/ConfigMigrations.h"
#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"

/// Load Modules
// Stores Modules
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"

#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/CommandModule/CommandModule.h"
#include "Modules/Device/DeviceLinkModule.h"
#include "Modules/Device/Client/SimulatedDeviceClient.h"
#include "Modules/Controls/ControlsModule.h"
#include "Modules/Console/ConsoleModule.h"

#include <string.h>

static Preferences preferences;
static ConfigStore registry;

static ModuleManager moduleManager;
static ServiceRegistry services;

/// Bench device: stands in for the purifier until a wire client is plugged in.
static SimulatedDevice              simDevice;
static SimulatedDeviceClientFactory simFactory(simDevice);

static CommandModule        commandModule;
static ConfigStoreModule    configStoreModule;
static LogSerialSinkModule  logSerialSinkModule;
static LogDispatcherModule  logDispatcherModule;
static LogHubModule         logHubModule;
static EventBusModule       eventBusModule;
static DeviceLinkModule     deviceLinkModule(simFactory);
static ControlsModule       controlsModule;
static ConsoleModule        consoleModule;

static const char* const kBenchStatus =
    "{\"pwr\":\"1\",\"func\":\"PH\",\"rh\":42,\"rhset\":50,"
    "\"fltsts0\":120,\"fltsts1\":2300,\"fltsts2\":2300,"
    "\"flttotal0\":360,\"flttotal1\":4800,\"flttotal2\":4800,"
    "\"wicksts\":3000,\"wicktotal\":4800}";

static void setupBenchDevice()
{
    simDevice.setStatus(kBenchStatus);
    simDevice.setMaxAgeS(Limits::Device::DefaultMaxAgeS);
    simDevice.setPushPeriodMs(15000);
}

[[noreturn]] static void haltSetup(const char* what)
{
    Serial.printf("[BOOT][ERR] %s\n", what ? what : "setup failed");
    while (true) {
        delay(1000);
    }
}

void setup() {
    Serial.begin(115200);
    delay(50);
    preferences.begin(NvsKeys::StorageNamespace, false);
    registry.setPreferences(preferences);
    if (!registry.runMigrations(CURRENT_CFG_VERSION, steps, MIGRATION_COUNT, NvsKeys::ConfigVersion)) {
        Serial.println("[BOOT][WRN] config migration failed, defaults restored");
    }

    setupBenchDevice();

    moduleManager.add(&logHubModule);
    moduleManager.add(&logDispatcherModule);
    moduleManager.add(&logSerialSinkModule);
    moduleManager.add(&eventBusModule);

    moduleManager.add(&commandModule);
    moduleManager.add(&configStoreModule);
    moduleManager.add(&deviceLinkModule);
    moduleManager.add(&controlsModule);
    moduleManager.add(&consoleModule);

    if (!moduleManager.initAll(registry, services)) {
        haltSetup("module init failed");
    }

    Serial.print(
        "\x1b[34m"
        "    _    _      _     _       _      _       \n"
        "   / \\  (_)_ __| |   (_)_ __ | | __ (_) ___  \n"
        "  / _ \\ | | '__| |   | | '_ \\| |/ / | |/ _ \\ \n"
        " / ___ \\| | |  | |___| | | | |   < _| | (_) |\n"
        "/_/   \\_\\_|_|  |_____|_|_| |_|_|\\_(_)_|\\___/ \n"
        "\x1b[0m"
        );
}

void loop() {
    vTaskDelay(pdMS_TO_TICKS(1000));
}
