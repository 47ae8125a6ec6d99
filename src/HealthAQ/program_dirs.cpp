#include "program_dirs.h"

#ifdef __linux__
#include <climits>
#include <unistd.h>
#endif
#ifdef _WIN32
#include <windows.h>
#endif

#include "HealthAQ.Core/exception.h"

#include <fmt/format.h>

#include <array>

namespace haq {
std::filesystem::path get_program_path() {
#if defined(__linux__)
    std::array<char, PATH_MAX> path{};
    if (readlink("/proc/self/exe", path.data(), path.size() - 1) == -1) {
        throw core::HaqException("Could not read the executing program path");
    }
#elif defined(_WIN32)
    std::array<wchar_t, MAX_PATH> path{};
    if (GetModuleFileNameW(nullptr, path.data(), static_cast<DWORD>(path.size())) == 0) {
        throw core::HaqException("Could not read the executing program path");
    }
#else
#error "Unsupported platform"
#endif

    return path.data();
}

std::filesystem::path get_schema_root() {
    auto root = get_program_path().parent_path() / "schemas";
    if (!std::filesystem::is_directory(root)) {
        throw core::HaqException(
            fmt::format("Schemas folder not found next to the program: {}", root.string()));
    }

    return root;
}
} // namespace haq
