#pragma once
#include "moegate/config.hpp"
#include "moegate/routing/common.hpp"
#include "moegate/sampler_cache.hpp"
#include <torch/torch.h>

namespace moegate {
namespace routing {

// Routes each token to its best expert and to a second, distinct expert chosen
// by `config.second_expert_policy`. First choices claim slots before second
// choices; within a rank, slots go in sequence order or, with
// `batch_prioritized_routing`, in order of decreasing top-1 probability.
//
// Second-choice locations are offset by the total number of first-choice
// assignments to the expert, including ones later dropped by capacity.
//
// `context` supplies the Gumbel sampler and random generator for the
// sampling and random policies. Requires at least two experts.
RoutingResult top2_routing(const torch::Tensor& logits,
                           const c10::optional<torch::Tensor>& input_mask,
                           const RoutingConfig& config,
                           bool eval_mode,
                           RoutingContext& context);

} // namespace routing
} // namespace moegate
