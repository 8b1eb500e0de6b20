#include "config.hpp"
#include "scenario.hpp"

#include <iostream>
#include <string>

using namespace settlemill;

int main(int argc, char* argv[])
{
    try {
        if (argc < 2) {
            std::cerr << "Usage: " << argv[0] << " <scenario.json> [deployment.json]" << std::endl;
            return 1;
        }

        std::string scenarioPath = argv[1];
        DeploymentConfig deployment;
        if (argc > 2) {
            std::cout << "Loading deployment from " << argv[2] << "..." << std::endl;
            deployment = DeploymentConfig::loadFromFile(argv[2]);
        }

        std::cout << "SettleMill Settlement Runtime" << std::endl;
        std::cout << "Loading scenario from " << scenarioPath << "..." << std::endl;
        auto steps = loadScenarioFile(scenarioPath);
        std::cout << "Loaded " << steps.size() << " steps." << std::endl;

        ScenarioRunner runner(deployment);
        runner.deploy();
        std::cout << "Deployed global config " << runner.globalConfig().toHex() << std::endl;

        size_t failures = 0;
        for (size_t index = 0; index < steps.size(); ++index) {
            StepResult result = runner.run(index, steps[index]);
            for (const auto& line : result.logs) {
                std::cout << "    " << line << std::endl;
            }

            std::cout << "[" << result.index << "] " << result.op << ": " << result.outcome;
            if (!steps[index].expectError.empty()) {
                std::cout << " (expected " << steps[index].expectError << ")";
            }
            std::cout << (result.passed ? "" : "  MISMATCH") << std::endl;

            if (!result.passed) {
                ++failures;
                if (!result.detail.empty()) {
                    std::cerr << "Step " << result.index << " failed: " << result.detail << std::endl;
                }
            }
        }

        std::cout << steps.size() - failures << "/" << steps.size() << " steps as expected." << std::endl;
        return failures == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
