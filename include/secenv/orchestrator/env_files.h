#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace secenv::orchestrator {

// Sorted names of regular files directly under |project_root| that start
// with ".env". Template and example files and containers are skipped.
std::vector<std::string> FindEnvFiles(const std::filesystem::path& project_root);

bool IsEligibleEnvFileName(const std::string& name);

}  // namespace secenv::orchestrator
