/**
 * @file config_and_loader_tests.cpp
 * @brief hasplint source file.
 */

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "hasplint/config/device_manifest_loader.hpp"
#include "hasplint/config/registry_factory.hpp"
#include "hasplint/config/runtime_settings.hpp"
#include "hasplint/external/static_state_source.hpp"
#include "hasplint/layout/layout_models.hpp"
#include "hasplint/validation/validation_types.hpp"

int main() {
    // Layout JSONL parsing.
    {
        const std::string text =
            "{\"page\":1,\"id\":0,\"obj\":\"page\"}\n"
            "\n"
            "{\"page\":1,\"id\":2,\"obj\":\"btn\",\"x\":10,\"y\":20,\"w\":100,\"h\":50,\"text\":\"On\",\"entity\":\"light.kitchen\"}\n"
            "{\"page\":2,\"id\":3,\"obj\":\"label\",\"x\":-5,\"y\":0,\"w\":60,\"h\":20,\"entity_id\":\"sensor.temp\"}\n"
            "{\"page\":2,\"obj\":\"dropdown_list\",\"x\":0,\"y\":30,\"w\":60,\"h\":20}\n";

        hpl::Layout layout;
        std::string error;
        assert(hpl::LayoutParser::parseLayout(text, layout, error));
        assert(error.empty());
        assert(layout.size() == 4);
        assert(layout[0].isPage());
        assert(layout[0].id == 0);
        assert(layout[1].kind == hpl::ObjectKind::Button);
        assert(layout[1].x == 10 && layout[1].y == 20 && layout[1].w == 100 && layout[1].h == 50);
        assert(layout[1].entityRef == std::string("light.kitchen"));
        assert(layout[2].x == -5);
        assert(layout[2].entityRef == std::string("sensor.temp"));
        assert(layout[3].kind == hpl::ObjectKind::Dropdown);
        assert(!layout[3].id.has_value());
        assert(!layout[3].entityRef.has_value());
        assert(layout[3].bounds().y == 30);
    }

    // Layout parse errors carry the line number.
    {
        hpl::Layout layout;
        std::string error;
        assert(!hpl::LayoutParser::parseLayout("{\"obj\":\"btn\",\"id\":1}\n{\"obj\":\"arc\",\"id\":2}\n", layout, error));
        assert(error.find("line 2") != std::string::npos);
        assert(error.find("arc") != std::string::npos);
        assert(layout.empty());

        assert(!hpl::LayoutParser::parseObjectLine("{\"id\":1}", error).has_value());
        assert(error.find("obj") != std::string::npos);
        assert(!hpl::LayoutParser::parseObjectLine("{\"obj\":\"btn\",\"x\":\"ten\"}", error).has_value());
        assert(error.find("'x'") != std::string::npos);

        assert(hpl::parseObjectKind("Button") == hpl::ObjectKind::Button);
        assert(!hpl::parseObjectKind("gauge").has_value());
        assert(std::string(hpl::toString(hpl::ObjectKind::Slider)) == "slider");
    }

    // Device manifest loading.
    {
        namespace fs = std::filesystem;
        const auto path = fs::temp_directory_path() / "hpl_device_manifest_test.json";
        {
            std::ofstream f(path);
            f << "{ \"devices\": ["
              << "{ \"deviceId\": \"plate01\", \"name\": \"Kitchen Plate\", \"model\": \"Lanbon-L8\","
              << "  \"entities\": [\"light.plate01_backlight\", \"sensor.plate01_status\"] },"
              << "{ \"deviceId\": \"plate02\", \"name\": \"Hall\", \"online\": false, \"modelKey\": \"wt32_sc01\" },"
              << "{ \"deviceId\": \"plate03\", \"width\": 1024, \"height\": 600, \"modelKey\": \"lanbon_l8\" },"
              << "{ \"deviceId\": \"plate04\", \"model\": \"Custom Build\" }"
              << "] }";
        }

        std::vector<hpl::DeviceRecord> devices;
        std::string error;
        assert(hpl::DeviceManifestLoader::loadFromJsonFile(path.string(), devices, error));
        assert(devices.size() == 4);

        assert(devices[0].deviceId == "plate01");
        assert(devices[0].displayName == "Kitchen Plate");
        assert(devices[0].online);
        assert(devices[0].entityRefs.size() == 2);
        assert(devices[0].resolution.has_value());
        assert(devices[0].resolution->width == 480 && devices[0].resolution->height == 320);

        assert(!devices[1].online);
        assert(devices[1].resolution->width == 320 && devices[1].resolution->height == 480);

        // Explicit dimensions win over the model key.
        assert(devices[2].resolution->width == 1024 && devices[2].resolution->height == 600);

        assert(!devices[3].resolution.has_value());

        fs::remove(path);
        assert(!hpl::DeviceManifestLoader::loadFromJsonFile(path.string(), devices, error));
        assert(error.find("Cannot open file") != std::string::npos);
    }

    // Device manifest rejects malformed content.
    {
        std::vector<hpl::DeviceRecord> devices;
        std::string error;
        assert(!hpl::DeviceManifestLoader::loadFromJsonText(
            "[{\"deviceId\":\"a\"},{\"deviceId\":\"a\"}]", devices, error));
        assert(error.find("Duplicate deviceId") != std::string::npos);
        assert(devices.empty());

        assert(!hpl::DeviceManifestLoader::loadFromJsonText("{\"devices\": []}", devices, error));
        assert(error.find("No device entries") != std::string::npos);

        assert(!hpl::DeviceManifestLoader::loadFromJsonText(
            "[{\"deviceId\":\"a\",\"modelKey\":\"no_such_panel\"}]", devices, error));
        assert(error.find("unknown modelKey") != std::string::npos);

        assert(!hpl::DeviceManifestLoader::loadFromJsonText(
            "[{\"deviceId\":\"a\",\"online\":maybe}]", devices, error));
        assert(error.find("parse error") != std::string::npos);

        assert(!hpl::DeviceManifestLoader::loadFromJsonText(
            "[{\"deviceId\":\"a\",\"width\":0,\"height\":320}]", devices, error));
        assert(error.find("width") != std::string::npos);

        // Dimensions beyond 32 bits must not wrap into a plausible size.
        assert(!hpl::DeviceManifestLoader::loadFromJsonText(
            "[{\"deviceId\":\"p\",\"width\":4294967776,\"height\":320}]", devices, error));
        assert(error.find("width") != std::string::npos);
        assert(devices.empty());
        assert(!hpl::DeviceManifestLoader::loadFromJsonText(
            "[{\"deviceId\":\"p\",\"width\":480,\"height\":2147483648}]", devices, error));
        assert(error.find("height") != std::string::npos);
        assert(hpl::DeviceManifestLoader::loadFromJsonText(
            "[{\"deviceId\":\"p\",\"width\":2147483647,\"height\":320}]", devices, error));
        assert(devices[0].resolution->width == 2147483647);
    }

    // Registry spec parsing and construction.
    {
        hpl::RegistryFactoryConfig cfg;
        std::string error;
        assert(hpl::RegistryFactory::parseRegistrySpec(" discovery ", cfg, error));
        assert(cfg.kind == hpl::RegistryKind::Discovery);

        assert(hpl::RegistryFactory::parseRegistrySpec("manifest:/tmp/devices.json", cfg, error));
        assert(cfg.kind == hpl::RegistryKind::Manifest);
        assert(cfg.manifestPath == "/tmp/devices.json");

        assert(!hpl::RegistryFactory::parseRegistrySpec("manifest:", cfg, error));
        assert(error.find("path") != std::string::npos);
        assert(!hpl::RegistryFactory::parseRegistrySpec("", cfg, error));
        assert(error == "registry spec is empty");
        assert(!hpl::RegistryFactory::parseRegistrySpec("mqtt:broker", cfg, error));
        assert(error.find("unsupported") != std::string::npos);

        hpl::RegistryFactoryConfig discovery;
        assert(hpl::RegistryFactory::create(discovery, nullptr, nullptr, error) == nullptr);
        assert(error.find("state source") != std::string::npos);

        auto source = std::make_shared<hpl::StaticStateSource>();
        auto registry = hpl::RegistryFactory::create(discovery, source, nullptr, error);
        assert(registry != nullptr);
        std::vector<hpl::DeviceRecord> devices;
        assert(registry->listDevices(devices, error));
        assert(devices.empty());

        hpl::RegistryFactoryConfig missingManifest;
        missingManifest.kind = hpl::RegistryKind::Manifest;
        missingManifest.manifestPath = "/nonexistent/hpl_devices.json";
        assert(hpl::RegistryFactory::create(missingManifest, nullptr, nullptr, error) == nullptr);
        assert(error.find("Cannot open file") != std::string::npos);

        namespace fs = std::filesystem;
        const auto path = fs::temp_directory_path() / "hpl_registry_factory_test.json";
        {
            std::ofstream f(path);
            f << "[{\"deviceId\":\"plate01\",\"modelKey\":\"esp32_8048s070\"}]";
        }
        hpl::RegistryFactoryConfig manifest;
        assert(hpl::RegistryFactory::parseRegistrySpec("manifest:" + path.string(), manifest, error));
        registry = hpl::RegistryFactory::create(manifest, nullptr, nullptr, error);
        assert(registry != nullptr);
        assert(registry->listDevices(devices, error));
        assert(devices.size() == 1);
        assert(devices[0].resolution->width == 800);
        fs::remove(path);
    }

    // Environment overrides.
    {
        const auto defaults = hpl::RuntimeSettings::fromEnvironment();
        assert(defaults.validation.checkEntities);
        assert(!defaults.validation.checkOverlaps);
        assert(defaults.orchestrator.entityCheckTimeout == std::chrono::milliseconds(5000));
        assert(defaults.orchestrator.maxParallelEntityChecks == 8);

        ::setenv("HPL_CHECK_OVERLAPS", "1", 1);
        ::setenv("HPL_CHECK_ENTITIES", "off", 1);
        ::setenv("HPL_SUPPRESS_WARNINGS", "maybe", 1);
        ::setenv("HPL_ENTITY_TIMEOUT_MS", "250", 1);
        ::setenv("HPL_DEVICE_TIMEOUT_MS", "-1", 1);
        ::setenv("HPL_MAX_PARALLEL_CHECKS", "0x10", 1);

        const auto settings = hpl::RuntimeSettings::fromEnvironment();
        assert(settings.validation.checkOverlaps);
        assert(!settings.validation.checkEntities);
        assert(!settings.validation.suppressWarnings);
        assert(settings.orchestrator.entityCheckTimeout == std::chrono::milliseconds(250));
        assert(settings.orchestrator.deviceLookupTimeout == std::chrono::milliseconds(10000));
        assert(settings.orchestrator.maxParallelEntityChecks == 16);

        ::unsetenv("HPL_CHECK_OVERLAPS");
        ::unsetenv("HPL_CHECK_ENTITIES");
        ::unsetenv("HPL_SUPPRESS_WARNINGS");
        ::unsetenv("HPL_ENTITY_TIMEOUT_MS");
        ::unsetenv("HPL_DEVICE_TIMEOUT_MS");
        ::unsetenv("HPL_MAX_PARALLEL_CHECKS");
    }

    // Kind names.
    {
        assert(std::string(hpl::toString(hpl::ErrorKind::ObjectId)) == "object_id");
        assert(hpl::parseErrorKind("coordinate") == hpl::ErrorKind::Coordinate);
        assert(!hpl::parseErrorKind("bogus").has_value());
        assert(std::string(hpl::toString(hpl::WarningKind::Overlap)) == "overlap");
    }

    std::cout << "config_and_loader_tests passed\n";
    return 0;
}
