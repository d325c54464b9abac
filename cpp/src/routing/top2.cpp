#include "moegate/routing/top2.hpp"
#include "moegate/numerics.hpp"
#include <limits>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <spdlog/spdlog.h>

namespace moegate {
namespace routing {

namespace {

std::pair<torch::Tensor, torch::Tensor> normalize_pair(torch::Tensor gates1_s,
                                                       torch::Tensor gates2_s) {
    auto denom_s = gates1_s + gates2_s;
    denom_s = torch::clamp_min(denom_s, dtype_eps(denom_s.scalar_type()));
    return {gates1_s / denom_s, gates2_s / denom_s};
}

// Slot locations when tokens are admitted in order of decreasing top-1
// probability. Rows outside `mask` are zero.
torch::Tensor prioritized_locations(const torch::Tensor& mask, const torch::Tensor& order,
                                    const torch::Tensor& inverse_order) {
    auto sorted_mask = mask.index_select(0, order);
    auto sorted_locations = cumsum_sub_one(sorted_mask) * sorted_mask;
    return sorted_locations.index_select(0, inverse_order);
}

} // namespace

RoutingResult top2_routing(const torch::Tensor& logits,
                           const c10::optional<torch::Tensor>& input_mask,
                           const RoutingConfig& config,
                           bool eval_mode,
                           RoutingContext& context) {
    check_logits(logits, "top2_routing");
    if (logits.size(1) < 2) {
        throw std::runtime_error("top2_routing: at least two experts are required");
    }
    auto gates = gate_probabilities(logits, config.use_fp32);
    auto work_logits = config.use_fp32 ? logits.to(torch::kFloat) : logits;
    const auto num_tokens = gates.size(0);
    const auto num_experts = gates.size(1);

    RoutingResult result;
    result.metadata["entropy_gating"] = entropy(gates).mean().item<double>();
    result.num_experts = num_experts;
    result.capacity = compute_capacity(num_tokens, num_experts, /*top_k=*/2,
                                       config.capacity_factor,
                                       config.eval_capacity_token_fraction, eval_mode);
    const auto capacity = result.capacity;

    auto indices1_s = torch::argmax(gates, /*dim=*/1, /*keepdim=*/true);
    auto mask1 = one_hot(indices1_s, num_experts);

    auto logits_w_noise = work_logits;
    if (config.second_expert_policy == SecondExpertPolicy::Sampling) {
        // Gumbel-max trick: arg-max of noisy logits samples from the softmax.
        auto sampler = context.samplers.get(work_logits.device());
        logits_w_noise =
            work_logits + sampler->sample(work_logits.sizes(), context.generator)
                              .to(work_logits.scalar_type());
    }
    // The first choice is excluded so the two masks never share an expert.
    auto logits_except1 = logits_w_noise.masked_fill(mask1.to(torch::kBool),
                                                     -std::numeric_limits<double>::infinity());
    auto indices2_s = torch::argmax(logits_except1, /*dim=*/1, /*keepdim=*/true);
    auto mask2 = one_hot(indices2_s, num_experts);

    auto gates1_s = (gates * mask1).sum(/*dim=*/1);
    auto gates2_s = (gates * mask2).sum(/*dim=*/1);

    if (config.normalize_gate_prob_before_dropping) {
        std::tie(gates1_s, gates2_s) = normalize_pair(gates1_s, gates2_s);
    }

    if (config.second_expert_policy == SecondExpertPolicy::Random) {
        auto draws = torch::rand(gates2_s.sizes(), context.generator, gates2_s.options());
        auto sampled = (2 * gates2_s) > draws;
        mask2 = mask2 * sampled.unsqueeze(-1).to(mask2.scalar_type());
    }

    auto nonpadding = nonpadding_or_undefined(input_mask, num_tokens, "top2_routing");
    if (nonpadding.defined()) {
        auto keep = nonpadding.unsqueeze(-1).to(mask1.scalar_type());
        mask1 = mask1 * keep;
        mask2 = mask2 * keep;
    }

    torch::Tensor locations1;
    torch::Tensor locations2;
    if (config.batch_prioritized_routing) {
        auto importance_scores = -1 * std::get<0>(gates.max(/*dim=*/1));
        auto order = std::get<1>(importance_scores.sort(/*stable=*/true, /*dim=*/0,
                                                        /*descending=*/false));
        auto inverse_order = torch::empty_like(order).scatter_(
            0, order, torch::arange(num_tokens, order.options()));
        locations1 = prioritized_locations(mask1, order, inverse_order);
        locations2 = prioritized_locations(mask2, order, inverse_order);
    } else {
        locations1 = cumsum_sub_one(mask1);
        locations2 = cumsum_sub_one(mask2);
    }
    locations2 = locations2 + torch::sum(mask1, /*dim=*/{0}, /*keepdim=*/true);

    result.l_aux = balance_loss(gates, mask1);

    result.metadata["overflow_expert1"] = overflow_percent(mask1, locations1, capacity);
    result.metadata["overflow_expert2"] = overflow_percent(mask2, locations2, capacity);

    auto unfiltered_mask1 = mask1;
    auto unfiltered_mask2 = mask2;
    mask1 = mask1 * torch::lt(locations1, capacity);
    mask2 = mask2 * torch::lt(locations2, capacity);

    record_balance_stats(result.metadata, 1, indices1_s, num_experts, num_tokens);
    record_balance_stats(result.metadata, 2, indices2_s, num_experts, num_tokens);

    if (!config.normalize_gate_prob_before_dropping) {
        // Only the choices that survived capacity share the weight.
        std::tie(gates1_s, gates2_s) =
            normalize_pair((gates * mask1).sum(/*dim=*/1), (gates * mask2).sum(/*dim=*/1));
    }

    spdlog::debug("top2_routing: tokens={} experts={} capacity={} overflow1={:.2f}% "
                  "overflow2={:.2f}%",
                  num_tokens, num_experts, capacity, result.metadata["overflow_expert1"],
                  result.metadata["overflow_expert2"]);

    if (config.strategy == ExecutionStrategy::Sparse) {
        auto locations1_s = torch::sum(locations1 * unfiltered_mask1, /*dim=*/1);
        auto locations2_s = torch::sum(locations2 * unfiltered_mask2, /*dim=*/1);
        result.routing = SparseRouting{{indices1_s.squeeze(-1), indices2_s.squeeze(-1)},
                                       {locations1_s, locations2_s},
                                       {gates1_s, gates2_s}};
        return result;
    }

    auto locations1_s = torch::sum(locations1 * mask1, /*dim=*/1);
    auto locations2_s = torch::sum(locations2 * mask2, /*dim=*/1);
    auto combine_weights = combine_for_rank(gates1_s, mask1, locations1_s, capacity) +
                           combine_for_rank(gates2_s, mask2, locations2_s, capacity);
    auto dispatch_mask = combine_weights.to(torch::kBool);

    result.routing = DenseRouting{combine_weights.to(logits.scalar_type()), dispatch_mask};
    return result;
}

} // namespace routing
} // namespace moegate
