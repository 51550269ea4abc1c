#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "yconf/store/config_store.hpp"

using namespace yconf;

namespace {
const char* const SAMPLE_CONFIG = R"(
defaults: &solver_defaults
  tolerance: 1.0e-6
  max_iterations: 500

solver:
  <<: *solver_defaults
  max_iterations: 2000

species:
  - name: H2O
    mass: 18.015
  - name: CO2
    mass: 44.01

output:
  fields: [temperature, pressure]
  enabled: yes
)";

void printHeader(const std::string& title) {
    std::cout << "\n=================================================="
              << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << "==================================================\n"
              << std::endl;
}

auto readFile(const std::string& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}
}  // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::string text;
    try {
        text = argc > 1 ? readFile(argv[1]) : std::string(SAMPLE_CONFIG);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    store::ConfigStore config;
    try {
        config = store::ConfigStore::from_yaml(text);
    } catch (const error::YamlError& e) {
        std::cerr << "Failed to parse configuration: " << e.getMessage()
                  << std::endl;
        return 1;
    }

    printHeader("Entries");
    for (const auto& entry : config.entries()) {
        std::cout << entry.path() << " (" << entry.size() << " value"
                  << (entry.size() == 1 ? "" : "s") << ")" << std::endl;
    }

    printHeader("Typed access");
    if (auto iterations = config.try_get<int>("solver%max_iterations")) {
        std::cout << "solver%max_iterations = " << *iterations << std::endl;
    }
    if (auto tolerance = config.try_get<double>("solver%tolerance")) {
        std::cout << "solver%tolerance = " << *tolerance << std::endl;
    }
    if (config.check("output%fields")) {
        for (const auto& field :
             config.get_array<std::string>("output%fields")) {
            std::cout << "output field: " << field << std::endl;
        }
    }
    std::cout << "top-level keys:";
    for (const auto& key : config.root_keys()) {
        std::cout << ' ' << key;
    }
    std::cout << std::endl;

    printHeader("Mutation");
    const auto steps =
        config.add_get("output%steps", 10, "Steps between snapshots");
    std::cout << "output%steps = " << steps << std::endl;
    try {
        config.update("output%steps", "often");
    } catch (const error::TypeError& e) {
        std::cout << "rejected update: " << e.getMessage() << std::endl;
    }

    printHeader("Serialized");
    SerializeOptions options;
    options.explicit_start = true;
    options.include_descriptions = true;
    std::cout << config.serialize(options);

    config.destroy();
    return 0;
}
