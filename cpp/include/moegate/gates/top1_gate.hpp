#pragma once
#include "moegate/config.hpp"
#include "moegate/gates/scorer.hpp"
#include "moegate/routing/common.hpp"
#include <torch/torch.h>

namespace moegate {
namespace gates {

// Top-1 gate: scores embeddings and routes each token to one expert.
//
//     Top1Gate gate(model_dim, num_experts);
//     auto result = gate(input);
//     const auto& dense = result.dense();
class Top1GateImpl : public torch::nn::Module {
public:
    Top1GateImpl(int64_t model_dim, int64_t num_experts, RoutingConfig config = {});

    // Renormalizes the scorer (reduced-cosine mode), scores `input` [S, D] and
    // routes with eval mode taken from !is_training().
    routing::RoutingResult forward(const torch::Tensor& input,
                                   const c10::optional<torch::Tensor>& mask = c10::nullopt);

    const RoutingConfig& config() const { return config_; }
    GateScorer& scorer() { return scorer_; }

private:
    RoutingConfig config_;
    GateScorer scorer_{nullptr};
};
TORCH_MODULE(Top1Gate);

} // namespace gates
} // namespace moegate
