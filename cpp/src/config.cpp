#include "moegate/config.hpp"
#include <cmath>
#include <stdexcept>

namespace moegate {

void RoutingConfig::validate() const {
    if (!std::isfinite(capacity_factor) || capacity_factor < 0.0) {
        throw std::invalid_argument("RoutingConfig: capacity_factor must be a finite value >= 0");
    }
    if (!std::isfinite(eval_capacity_token_fraction) ||
        eval_capacity_token_fraction < 0.0 || eval_capacity_token_fraction > 1.0) {
        throw std::invalid_argument(
            "RoutingConfig: eval_capacity_token_fraction must be in [0, 1]");
    }
}

SecondExpertPolicy parse_second_expert_policy(const std::string& name) {
    if (name == "sampling") {
        return SecondExpertPolicy::Sampling;
    }
    if (name == "random") {
        return SecondExpertPolicy::Random;
    }
    return SecondExpertPolicy::Deterministic;
}

ExecutionStrategy parse_execution_strategy(const std::string& name) {
    if (name == "dense") {
        return ExecutionStrategy::Dense;
    }
    if (name == "sparse") {
        return ExecutionStrategy::Sparse;
    }
    throw std::invalid_argument("RoutingConfig: unknown execution strategy '" + name + "'");
}

std::string to_string(SecondExpertPolicy policy) {
    switch (policy) {
        case SecondExpertPolicy::Sampling:
            return "sampling";
        case SecondExpertPolicy::Random:
            return "random";
        case SecondExpertPolicy::Deterministic:
            return "deterministic";
    }
    return "deterministic";
}

std::string to_string(ExecutionStrategy strategy) {
    return strategy == ExecutionStrategy::Dense ? "dense" : "sparse";
}

} // namespace moegate
