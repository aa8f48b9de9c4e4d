#pragma once

#include <optional>
#include <utility>
#include <torctl/error/control_error.hpp>

namespace torctl::utils {

template <typename T>
using ErrorOr = std::pair<error::ControlErrorOpt, T>;

}  // namespace torctl::utils
