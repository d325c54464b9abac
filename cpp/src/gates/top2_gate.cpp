#include "moegate/gates/top2_gate.hpp"
#include "moegate/routing/top2.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace moegate {
namespace gates {

Top2GateImpl::Top2GateImpl(int64_t model_dim, int64_t num_experts, RoutingConfig config)
    : config_(config) {
    config_.validate();
    if (num_experts < 2) {
        throw std::invalid_argument("Top2Gate: num_experts must be >= 2");
    }
    scorer_ = register_module("scorer",
                              GateScorer(model_dim, num_experts, config_.use_reduced_cosine));
    spdlog::info("Top2Gate: model_dim={}, num_experts={}, second_expert_policy={}, "
                 "normalize_before_dropping={}, batch_prioritized={}, reduced_cosine={}, "
                 "strategy={}",
                 model_dim, num_experts, to_string(config_.second_expert_policy),
                 config_.normalize_gate_prob_before_dropping, config_.batch_prioritized_routing,
                 config_.use_reduced_cosine, to_string(config_.strategy));
}

routing::RoutingResult Top2GateImpl::forward(const torch::Tensor& input,
                                             const c10::optional<torch::Tensor>& mask) {
    scorer_->renormalize();
    auto logits = scorer_->score(input);
    return routing::top2_routing(logits, mask, config_, /*eval_mode=*/!is_training(), context_);
}

} // namespace gates
} // namespace moegate
