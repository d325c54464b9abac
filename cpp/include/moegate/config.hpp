#pragma once
#include <string>

namespace moegate {

enum class SecondExpertPolicy {
    Sampling,       // Gumbel-max re-selection among non-first experts
    Random,         // runner-up kept with probability min(1, 2 * gate2)
    Deterministic,  // plain runner-up
};

enum class ExecutionStrategy {
    Dense,   // combine weights + dispatch mask, capacity enforced here
    Sparse,  // per-rank index/location/gate lists, capacity enforced by the caller
};

// Routing options, fixed for the lifetime of a gate.
//
// Interactions:
//  - eval mode with eval_capacity_token_fraction > 0 overrides both the top-1
//    (capacity_factor) and the top-2 (2 * ceil(S/E)) capacity formulas.
//  - capacity_factor only applies to top-1 routing.
//  - normalize_gate_prob_before_dropping only changes the weights of tokens
//    whose second choice (or first) is later dropped by capacity.
//  - batch_prioritized_routing changes admission order, never expert selection.
struct RoutingConfig {
    bool use_fp32 = false;
    double capacity_factor = 1.0;
    double eval_capacity_token_fraction = 0.25;
    SecondExpertPolicy second_expert_policy = SecondExpertPolicy::Sampling;
    bool normalize_gate_prob_before_dropping = false;
    bool batch_prioritized_routing = false;
    bool use_reduced_cosine = false;
    ExecutionStrategy strategy = ExecutionStrategy::Dense;

    void validate() const;
};

SecondExpertPolicy parse_second_expert_policy(const std::string& name);
ExecutionStrategy parse_execution_strategy(const std::string& name);
std::string to_string(SecondExpertPolicy policy);
std::string to_string(ExecutionStrategy strategy);

} // namespace moegate
