#ifndef SANDBOX_ENVIRONMENT_HPP
#define SANDBOX_ENVIRONMENT_HPP

#include <string>
#include <vector>

namespace sandbox {

// Marker file present in every environment that finished its installation.
static const constexpr char* kEnvironmentReadyFile = "environment_ready";

// Names of the ready environments under root: subdirectories whose name does
// not start with '.', '_' or '-' and that contain the ready marker. Returns
// an empty list if root does not exist.
std::vector<std::string> ListEnvironments(const std::string& root);

// Script that activates an environment.
std::string ActivationScript(const std::string& root, const std::string& name);

// Runs command with the environment activated:
// bash -c "source <activate> && <command>".
std::vector<std::string> WrapInEnvironment(
    const std::string& root, const std::string& name,
    const std::vector<std::string>& command);

}  // namespace sandbox

#endif
