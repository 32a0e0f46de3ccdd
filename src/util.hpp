#pragma once

#include <optional>
#include <string>

std::optional<std::string> getEnv(const std::string& name);
std::optional<std::string> readFile(const std::string& path);
