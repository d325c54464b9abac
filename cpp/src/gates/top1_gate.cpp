#include "moegate/gates/top1_gate.hpp"
#include "moegate/routing/top1.hpp"
#include <spdlog/spdlog.h>

namespace moegate {
namespace gates {

Top1GateImpl::Top1GateImpl(int64_t model_dim, int64_t num_experts, RoutingConfig config)
    : config_(config) {
    config_.validate();
    scorer_ = register_module("scorer",
                              GateScorer(model_dim, num_experts, config_.use_reduced_cosine));
    spdlog::info("Top1Gate: model_dim={}, num_experts={}, capacity_factor={}, "
                 "eval_capacity_token_fraction={}, reduced_cosine={}, strategy={}",
                 model_dim, num_experts, config_.capacity_factor,
                 config_.eval_capacity_token_fraction, config_.use_reduced_cosine,
                 to_string(config_.strategy));
}

routing::RoutingResult Top1GateImpl::forward(const torch::Tensor& input,
                                             const c10::optional<torch::Tensor>& mask) {
    scorer_->renormalize();
    auto logits = scorer_->score(input);
    return routing::top1_routing(logits, mask, config_, /*eval_mode=*/!is_training());
}

} // namespace gates
} // namespace moegate
