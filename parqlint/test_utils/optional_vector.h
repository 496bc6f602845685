#pragma once

#include <optional>
#include <vector>

namespace parqlint {

// nullopt is a null value
template <typename T>
using OptionalVector = std::vector<std::optional<T>>;

}  // namespace parqlint
