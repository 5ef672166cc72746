#pragma once

#include <filesystem>
#include <string>

std::string readUtf8File(const std::filesystem::path& filePath);
