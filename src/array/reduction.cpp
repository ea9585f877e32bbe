#include "histax/reduction.hpp"

namespace histax {

const char *reduction_name(Reduction op) {
    switch (op) {
    case Reduction::Sum:
        return "sum";
    case Reduction::Any:
        return "any";
    case Reduction::All:
        return "all";
    case Reduction::Min:
        return "min";
    case Reduction::Max:
        return "max";
    case Reduction::Prod:
        return "prod";
    }
    return "unknown";
}

std::optional<Reduction> parse_reduction(const std::string &name) {
    for (auto op : {Reduction::Sum, Reduction::Any, Reduction::All,
                    Reduction::Min, Reduction::Max, Reduction::Prod}) {
        if (name == reduction_name(op))
            return op;
    }
    return std::nullopt;
}

} // namespace histax
