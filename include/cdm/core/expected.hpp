#pragma once

#include <expected>

#include "cdm/core/error.hpp"

namespace cdm {

template <class T>
using Expected = std::expected<T, Error>;

}  // namespace cdm
