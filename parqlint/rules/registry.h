#pragma once

#include <optional>
#include <string>
#include <vector>

#include "parqlint/lint/rule.h"

namespace parqlint::rules {

// Every rule, in the order they run.
std::vector<RulePtr> AllRules();

// Rules whose name is in `names`, all rules if not set. Unknown names match nothing.
std::vector<RulePtr> GetRules(const std::optional<std::vector<std::string>>& names);

}  // namespace parqlint::rules
