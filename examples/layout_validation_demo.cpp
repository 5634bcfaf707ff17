/**
 * @file layout_validation_demo.cpp
 * @brief Discover plates from a state snapshot and validate a layout against one.
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "hasplint/config/runtime_settings.hpp"
#include "hasplint/discovery/device_discovery.hpp"
#include "hasplint/external/mock_entity_checker.hpp"
#include "hasplint/external/static_state_source.hpp"
#include "hasplint/layout/layout_models.hpp"
#include "hasplint/validation/validation_orchestrator.hpp"

namespace {

hpl::StateRecord state(const std::string& entityId, const std::string& value, const std::string& friendlyName) {
    hpl::StateRecord record;
    record.entityId = entityId;
    record.state = value;
    record.attributes["friendly_name"] = friendlyName;
    return record;
}

void printDevices(const std::vector<hpl::DeviceRecord>& devices) {
    std::cout << "devices=" << devices.size() << '\n';
    for (const auto& d : devices) {
        std::cout << "  id=" << d.deviceId
                  << " name=\"" << d.displayName << "\""
                  << " online=" << (d.online ? 1 : 0)
                  << " entities=" << d.entityRefs.size()
                  << " resolution=";
        if (d.resolution) {
            std::cout << d.resolution->width << 'x' << d.resolution->height;
        } else {
            std::cout << "unknown";
        }
        std::cout << '\n';
    }
}

void printResult(const std::string& deviceId, const hpl::ValidationResult& result,
                 const hpl::PipelineTrace& trace) {
    std::cout << "device=" << deviceId
              << " passed=" << (result.passed ? 1 : 0)
              << " errors=" << result.errors.size()
              << " warnings=" << result.warnings.size()
              << " stages=";
    for (std::size_t i = 0; i < trace.stages.size(); ++i) {
        std::cout << (i == 0 ? "" : ",") << hpl::toString(trace.stages[i]);
    }
    std::cout << '\n';

    for (const auto& e : result.errors) {
        std::cout << "  E [" << hpl::toString(e.kind) << "] " << e.message << '\n';
    }
    for (const auto& w : result.warnings) {
        std::cout << "  W [" << hpl::toString(w.kind) << "] " << w.message << '\n';
    }
}

} // namespace

int main() {
    auto kitchenStatus = state("binary_sensor.plate01_status", "on", "Kitchen Plate Status");
    kitchenStatus.attributes["model"] = "Lanbon L8-HD";
    auto kitchenBacklight = state("light.plate01_backlight", "on", "Kitchen Plate Backlight");
    kitchenBacklight.attributes["resolution"] = "480x320";

    auto source = std::make_shared<hpl::StaticStateSource>(std::vector<hpl::StateRecord>{
        kitchenStatus,
        kitchenBacklight,
        state("light.plate01_moodlight", "off", "Kitchen Plate Moodlight"),
        state("binary_sensor.plate02_status", "off", "Hallway Plate Status"),
        state("light.plate02_backlight", "on", "Hallway Plate Backlight"),
        state("light.kitchen_ceiling", "on", "Kitchen Ceiling"),
        state("switch.openhasp_prerelease", "off", "openHASP Prerelease"),
    });
    auto registry = std::make_shared<hpl::DiscoveryDeviceRegistry>(source);

    std::vector<hpl::DeviceRecord> devices;
    std::string error;
    if (!registry->listDevices(devices, error)) {
        std::cerr << "Discovery failed: " << error << '\n';
        return 1;
    }
    printDevices(devices);

    const std::string jsonl =
        "{\"page\":1,\"id\":0,\"obj\":\"page\"}\n"
        "{\"page\":1,\"id\":1,\"obj\":\"btn\",\"x\":10,\"y\":10,\"w\":200,\"h\":60,\"entity\":\"light.kitchen_ceiling\"}\n"
        "{\"page\":1,\"id\":2,\"obj\":\"slider\",\"x\":10,\"y\":50,\"w\":200,\"h\":40,\"entity\":\"light.plate01_moodlight\"}\n"
        "{\"page\":1,\"id\":3,\"obj\":\"label\",\"x\":400,\"y\":280,\"w\":120,\"h\":30,\"entity\":\"sensor.kitchen_temp\"}\n"
        "{\"page\":1,\"id\":3,\"obj\":\"switch\",\"x\":300,\"y\":10,\"w\":80,\"h\":40}\n";

    hpl::Layout layout;
    if (!hpl::LayoutParser::parseLayout(jsonl, layout, error)) {
        std::cerr << "Layout parse failed: " << error << '\n';
        return 1;
    }

    auto entities = std::make_shared<hpl::MockEntityChecker>(std::vector<std::string>{
        "light.kitchen_ceiling", "light.plate01_moodlight", "light.plate01_backlight",
    });

    auto settings = hpl::RuntimeSettings::fromEnvironment();
    settings.validation.checkOverlaps = true;
    hpl::ValidationOrchestrator orchestrator(entities, registry, settings.orchestrator);

    for (const std::string deviceId : {"plate01", "plate02", "plate09"}) {
        hpl::PipelineTrace trace;
        const auto result = orchestrator.validate(layout, deviceId, settings.validation, trace);
        printResult(deviceId, result, trace);
    }
    return 0;
}
