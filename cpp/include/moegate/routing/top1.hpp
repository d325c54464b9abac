#pragma once
#include "moegate/config.hpp"
#include "moegate/routing/common.hpp"
#include <torch/torch.h>

namespace moegate {
namespace routing {

// Routes each token to its highest-probability expert, admitting tokens in
// sequence order until the expert's capacity is reached.
//
// logits:     [S, E] gate scores
// input_mask: optional [S] bool, true marks padding that must not be routed
RoutingResult top1_routing(const torch::Tensor& logits,
                           const c10::optional<torch::Tensor>& input_mask,
                           const RoutingConfig& config,
                           bool eval_mode);

} // namespace routing
} // namespace moegate
