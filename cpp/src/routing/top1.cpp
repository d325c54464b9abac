#include "moegate/routing/top1.hpp"
#include "moegate/numerics.hpp"
#include <spdlog/spdlog.h>

namespace moegate {
namespace routing {

RoutingResult top1_routing(const torch::Tensor& logits,
                           const c10::optional<torch::Tensor>& input_mask,
                           const RoutingConfig& config,
                           bool eval_mode) {
    auto gates = gate_probabilities(logits, config.use_fp32);
    const auto num_tokens = gates.size(0);
    const auto num_experts = gates.size(1);

    RoutingResult result;
    result.metadata["entropy_gating"] = entropy(gates).mean().item<double>();
    result.num_experts = num_experts;
    result.capacity = compute_capacity(num_tokens, num_experts, /*top_k=*/1,
                                       config.capacity_factor,
                                       config.eval_capacity_token_fraction, eval_mode);
    const auto capacity = result.capacity;

    auto indices1_s = torch::argmax(gates, /*dim=*/1);
    auto mask1 = one_hot(indices1_s, num_experts, /*unsqueeze_indices=*/true);
    auto nonpadding = nonpadding_or_undefined(input_mask, num_tokens, "top1_routing");
    if (nonpadding.defined()) {
        mask1 = mask1 * nonpadding.unsqueeze(-1).to(mask1.scalar_type());
    }

    record_balance_stats(result.metadata, 1, indices1_s, num_experts, num_tokens);

    auto gates1_s = (gates * mask1).sum(/*dim=*/1);
    auto locations1 = cumsum_sub_one(mask1);
    result.l_aux = balance_loss(gates, mask1);

    if (config.strategy == ExecutionStrategy::Sparse) {
        auto locations1_s = torch::sum(locations1 * mask1, /*dim=*/1);
        result.routing = SparseRouting{{indices1_s}, {locations1_s}, {gates1_s}};
        return result;
    }

    mask1 = mask1 * torch::lt(locations1, capacity);
    auto locations1_s = torch::sum(locations1 * mask1, /*dim=*/1);
    auto combine1_sec = combine_for_rank(gates1_s, mask1, locations1_s, capacity);
    auto dispatch_mask = combine1_sec.to(torch::kBool);

    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("top1_routing: tokens={} experts={} capacity={} admitted={}",
                      num_tokens, num_experts, capacity, mask1.sum().item<int64_t>());
    }

    result.routing = DenseRouting{combine1_sec.to(logits.scalar_type()), dispatch_mask};
    return result;
}

} // namespace routing
} // namespace moegate
