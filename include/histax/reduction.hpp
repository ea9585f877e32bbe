#pragma once

#include <optional>
#include <string>

namespace histax {

// Closed set of whole-array reductions. On an ArrayTuple these always act
// on the broadcast ensemble, never member by member.
enum class Reduction { Sum, Any, All, Min, Max, Prod };

const char *reduction_name(Reduction op);

std::optional<Reduction> parse_reduction(const std::string &name);

} // namespace histax
