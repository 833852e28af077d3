#pragma once

#include "cloud/sim/sim_cloud_client.hpp"

#include <filesystem>
#include <string>

namespace netstack::cloud::sim {

// Persisted form of the simulated region so separate CLI invocations
// (create, collect, teardown) act on one shared control plane.

// Serializes the full state as JSON. Output is deterministic for a given
// state (maps are ordered), which keeps test fixtures diffable.
std::string SimStateToJson(const SimCloudState& state);

bool WriteSimState(const SimCloudState& state, const std::filesystem::path& output_path,
                   std::string& error);

// Loads state written by WriteSimState. A missing file is not an error: the
// region starts empty.
bool LoadSimState(const std::filesystem::path& input_path, SimCloudState& state,
                  std::string& error);

} // namespace netstack::cloud::sim
