#include "exception.h"

#include <fmt/format.h>

namespace haq::core {

HaqException::HaqException(const std::string &what_arg, const source_location location)
    : std::runtime_error{what_arg}, location_{location} {
    what_arg_ = fmt::format("{}:{}: {}", file_name(), line(), std::runtime_error::what());
}

const char *HaqException::what() const noexcept { return what_arg_.c_str(); }

const char *HaqException::message() const noexcept { return std::runtime_error::what(); }

std::uint_least32_t HaqException::line() const noexcept { return location_.line(); }

const char *HaqException::file_name() const noexcept { return location_.file_name(); }

const char *HaqException::function_name() const noexcept { return location_.function_name(); }

} // namespace haq::core
