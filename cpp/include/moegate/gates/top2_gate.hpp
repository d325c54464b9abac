#pragma once
#include "moegate/config.hpp"
#include "moegate/gates/scorer.hpp"
#include "moegate/routing/common.hpp"
#include "moegate/sampler_cache.hpp"
#include <torch/torch.h>

namespace moegate {
namespace gates {

// Top-2 gate: scores embeddings and routes each token to up to two experts.
// The gate owns the RoutingContext used by the sampling and random policies;
// seed it through context().generator for reproducible routing.
class Top2GateImpl : public torch::nn::Module {
public:
    Top2GateImpl(int64_t model_dim, int64_t num_experts, RoutingConfig config = {});

    routing::RoutingResult forward(const torch::Tensor& input,
                                   const c10::optional<torch::Tensor>& mask = c10::nullopt);

    const RoutingConfig& config() const { return config_; }
    GateScorer& scorer() { return scorer_; }
    RoutingContext& context() { return context_; }

private:
    RoutingConfig config_;
    GateScorer scorer_{nullptr};
    RoutingContext context_;
};
TORCH_MODULE(Top2Gate);

} // namespace gates
} // namespace moegate
