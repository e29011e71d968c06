/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include "Core/NvsKeys.h"

/// Load Core Functions
#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"
#include "Core/Storage/NvsBlobStore.h"

/// Load Modules
// Network modules
#include "Modules/Network/TimeModule/TimeModule.h"
#include "Modules/Network/BleTransportModule/BleTransportModule.h"
// Stores Modules
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"

#include "Modules/IOModule/IOModule.h"
#include "Modules/SchedulerModule/SchedulerModule.h"

static Preferences preferences;   ///< Preference needs to be singleton-like global to work
static ConfigStore registry;
static NvsBlobStore taskBlobStore;

static ModuleManager moduleManager;
static ServiceRegistry services;

static LogHubModule         logHubModule;
static LogDispatcherModule  logDispatcherModule;
static LogSerialSinkModule  logSerialSinkModule;
static ConfigStoreModule    configStoreModule;
static TimeModule           timeModule;
static IOModule             ioModule;
static BleTransportModule   bleTransportModule;
static SchedulerModule      schedulerModule(taskBlobStore);

static void requireSetup(bool ok, const char* step)
{
    if (ok) return;
    Serial.printf("Setup failure: %s\n", step ? step : "unknown");
    while (true) delay(1000);
}

void setup() {
    Serial.begin(115200);
    delay(50);

    requireSetup(preferences.begin(NvsKeys::StorageNamespace, false), "open config namespace");
    registry.setPreferences(preferences);

    // A missing task namespace is not fatal: the scheduler runs from RAM and logs every failed write.
    if (!taskBlobStore.begin(NvsKeys::TaskStore::Namespace)) {
        Serial.printf("Task store unavailable (%s), schedules will not persist\n",
                      NvsKeys::TaskStore::Namespace);
    }

    requireSetup(moduleManager.add(&logHubModule), "add loghub");
    requireSetup(moduleManager.add(&logDispatcherModule), "add log dispatcher");
    requireSetup(moduleManager.add(&logSerialSinkModule), "add serial sink");
    requireSetup(moduleManager.add(&configStoreModule), "add config");
    requireSetup(moduleManager.add(&timeModule), "add time");
    requireSetup(moduleManager.add(&ioModule), "add io");
    requireSetup(moduleManager.add(&bleTransportModule), "add transport");
    requireSetup(moduleManager.add(&schedulerModule), "add scheduler");

    requireSetup(moduleManager.initAll(registry, services), "module init");

    Serial.print(
        "\x1b[35m"
        " __  __                                    \n"
        "|  \\/  | ___  _ __ __ _  __ _ _ __   __ _  \n"
        "| |\\/| |/ _ \\| '__/ _` |/ _` | '_ \\ / _` | \n"
        "| |  | | (_) | | | (_| | (_| | | | | (_| | \n"
        "|_|  |_|\\___/|_|  \\__, |\\__,_|_| |_|\\__,_| \n"
        "                  |___/   scheduler        \n"
        "\x1b[0m"
        );
}

void loop() {
    delay(20);
}
