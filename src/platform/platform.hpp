#pragma once

#include <string>
#include <filesystem>

namespace platform {

// $HOME, then the password database, then the temp dir.
std::filesystem::path home_dir();

std::filesystem::path temp_dir();

// Creates an empty file {tmp}/<prefix>_XXXXXX that no other caller can
// receive. Throws std::runtime_error if it cannot be created.
std::filesystem::path temp_file(const std::string& prefix);

void sleep_ms(int ms);

} // namespace platform
