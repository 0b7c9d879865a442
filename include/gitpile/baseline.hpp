#pragma once
#include "gitpile/pile.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gitpile {

// Store `commit` as the pile's baseline ("BASELINE=<hash>" in the pile config)
void record_baseline(const Pile& pile, std::string_view commit);

// Baseline commit the pile was last generated against, if any
std::optional<std::string> read_baseline(const Pile& pile);

} // namespace gitpile
