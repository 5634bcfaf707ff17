/**
 * @file layout_check.cpp
 * @brief Validate a JSONL layout file against a device manifest.
 */

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "hasplint/config/registry_factory.hpp"
#include "hasplint/config/runtime_settings.hpp"
#include "hasplint/external/mock_entity_checker.hpp"
#include "hasplint/layout/layout_models.hpp"
#include "hasplint/validation/validation_orchestrator.hpp"

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <registry-spec> <layout.jsonl> <device-id>\n"
              << "  registry-spec: manifest:<path>\n"
              << "Entity references are checked against the entity lists in the manifest.\n"
              << "Stage switches and timeouts come from HPL_CHECK_*, HPL_*_TIMEOUT_MS.\n"
              << "Example:\n"
              << "  " << argv0 << " manifest:devices.json pages.jsonl plate01\n";
}

bool readText(const std::string& path, std::string& out) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        printUsage(argv[0]);
        return 2;
    }

    const std::string registrySpec = argv[1];
    const std::string layoutPath = argv[2];
    const std::string deviceId = argv[3];

    std::string error;
    hpl::RegistryFactoryConfig registryConfig;
    if (!hpl::RegistryFactory::parseRegistrySpec(registrySpec, registryConfig, error)) {
        std::cerr << "Invalid registry spec: " << error << '\n';
        return 2;
    }
    auto registry = hpl::RegistryFactory::create(registryConfig, nullptr, nullptr, error);
    if (!registry) {
        std::cerr << "Registry creation failed: " << error << '\n';
        return 2;
    }

    std::string text;
    if (!readText(layoutPath, text)) {
        std::cerr << "Cannot open layout: " << layoutPath << '\n';
        return 2;
    }
    hpl::Layout layout;
    if (!hpl::LayoutParser::parseLayout(text, layout, error)) {
        std::cerr << "Layout parse failed: " << error << '\n';
        return 2;
    }

    std::vector<hpl::DeviceRecord> devices;
    if (!registry->listDevices(devices, error)) {
        std::cerr << "Registry listing failed: " << error << '\n';
        return 2;
    }
    auto entities = std::make_shared<hpl::MockEntityChecker>();
    for (const auto& d : devices) {
        for (const auto& ref : d.entityRefs) {
            entities->addEntity(ref);
        }
    }

    const auto settings = hpl::RuntimeSettings::fromEnvironment();
    hpl::ValidationOrchestrator orchestrator(entities, registry, settings.orchestrator);
    const auto result = orchestrator.validate(layout, deviceId, settings.validation);

    for (const auto& e : result.errors) {
        std::cout << "error[" << hpl::toString(e.kind) << "] " << e.message << '\n';
    }
    for (const auto& w : result.warnings) {
        std::cout << "warning[" << hpl::toString(w.kind) << "] " << w.message << '\n';
    }
    std::cout << layoutPath << ": " << layout.size() << " object(s), "
              << result.errors.size() << " error(s), "
              << result.warnings.size() << " warning(s) -> "
              << (result.passed ? "PASS" : "FAIL") << '\n';
    return result.passed ? 0 : 1;
}
