#pragma once

#include <filesystem>

namespace haq {
//! Get the path to the currently executing program
std::filesystem::path get_program_path();

/// @brief Gets the JSON schemas folder installed next to the executing program
/// @throws haq::core::HaqException if the folder is missing.
std::filesystem::path get_schema_root();
} // namespace haq
