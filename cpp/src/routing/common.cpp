#include "moegate/routing/common.hpp"
#include "moegate/numerics.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace moegate {
namespace routing {

const DenseRouting& RoutingResult::dense() const {
    if (!is_dense()) {
        throw std::runtime_error("RoutingResult: routing was computed with the sparse strategy");
    }
    return std::get<DenseRouting>(routing);
}

const SparseRouting& RoutingResult::sparse() const {
    if (is_dense()) {
        throw std::runtime_error("RoutingResult: routing was computed with the dense strategy");
    }
    return std::get<SparseRouting>(routing);
}

int64_t compute_capacity(int64_t num_tokens, int64_t num_experts, int64_t top_k,
                         double capacity_factor, double eval_fraction, bool eval_mode) {
    if (num_experts <= 0) {
        throw std::invalid_argument("compute_capacity: num_experts must be > 0");
    }
    if (eval_mode && eval_fraction > 0.0) {
        return static_cast<int64_t>(std::ceil(eval_fraction * static_cast<double>(num_tokens)));
    }
    const int64_t tokens_per_expert = (num_tokens + num_experts - 1) / num_experts;
    if (top_k == 1) {
        return static_cast<int64_t>(capacity_factor * static_cast<double>(tokens_per_expert));
    }
    return top_k * tokens_per_expert;
}

torch::Tensor gate_probabilities(const torch::Tensor& logits, bool use_fp32) {
    check_logits(logits, "gate_probabilities");
    auto work = use_fp32 ? logits.to(torch::kFloat) : logits;
    return torch::softmax(work, /*dim=*/1);
}

torch::Tensor balance_loss(const torch::Tensor& gates, const torch::Tensor& mask1) {
    const auto num_experts = gates.size(1);
    auto me = torch::mean(gates, /*dim=*/0);
    auto ce = torch::mean(mask1.to(gates.scalar_type()), /*dim=*/0);
    return torch::mean(me * ce) * static_cast<double>(num_experts * num_experts);
}

torch::Tensor expert_histogram(const torch::Tensor& indices, int64_t num_experts,
                               int64_t num_tokens) {
    auto counts = torch::bincount(indices.reshape({-1}), /*weights=*/{}, num_experts);
    return counts.to(torch::kFloat) * 100.0 / static_cast<double>(num_tokens);
}

void record_balance_stats(RoutingMetadata& metadata, int rank, const torch::Tensor& indices,
                          int64_t num_experts, int64_t num_tokens) {
    const std::string prefix = "expert" + std::to_string(rank);
    auto hist = expert_histogram(indices, num_experts, num_tokens);
    metadata["unused_" + prefix + "_count"] = (hist == 0).sum().item<double>();

    auto sorted = std::get<0>(hist.sort(/*dim=*/0, /*descending=*/true)) +
                  dtype_tiny(torch::kFloat);
    const auto sample_count = std::max<int64_t>(
        static_cast<int64_t>(std::ceil(static_cast<double>(num_experts) * kBalanceSampleFraction)),
        1);
    metadata[prefix + "_balance_top"] = sorted.slice(0, 0, sample_count).sum().item<double>();
    metadata[prefix + "_balance_bottom"] =
        sorted.slice(0, num_experts - sample_count).sum().item<double>();
}

double overflow_percent(const torch::Tensor& mask, const torch::Tensor& locations,
                        int64_t capacity) {
    const auto total = mask.sum().item<double>();
    if (total == 0.0) {
        return 0.0;
    }
    const auto overflow = (mask * torch::ge(locations, capacity)).sum().item<double>();
    return 100.0 * overflow / total;
}

torch::Tensor combine_for_rank(const torch::Tensor& gates_s, const torch::Tensor& mask,
                               const torch::Tensor& locations_s, int64_t capacity) {
    // einsum("s,se->se") then einsum("se,sc->sec")
    auto gates_se = gates_s.unsqueeze(-1) * mask.to(gates_s.scalar_type());
    auto locations_sc = one_hot(locations_s, capacity, /*unsqueeze_indices=*/true);
    return torch::bmm(gates_se.unsqueeze(-1),
                      locations_sc.to(gates_se.scalar_type()).unsqueeze(1));
}

void check_logits(const torch::Tensor& logits, const char* who) {
    if (!logits.defined()) {
        throw std::runtime_error(std::string(who) + ": logits are undefined");
    }
    if (logits.dim() != 2) {
        throw std::runtime_error(std::string(who) + ": logits must be 2-D [tokens, experts], got " +
                                 std::to_string(logits.dim()) + "-D");
    }
    if (logits.size(1) == 0) {
        throw std::runtime_error(std::string(who) + ": logits must have at least one expert");
    }
    if (!logits.is_floating_point()) {
        throw std::runtime_error(std::string(who) + ": logits must be a floating point tensor");
    }
}

torch::Tensor nonpadding_or_undefined(const c10::optional<torch::Tensor>& input_mask,
                                      int64_t num_tokens, const char* who) {
    if (!input_mask.has_value() || !input_mask->defined()) {
        return torch::Tensor();
    }
    const auto& mask = *input_mask;
    if (mask.dim() != 1 || mask.size(0) != num_tokens) {
        throw std::runtime_error(std::string(who) + ": padding mask must be 1-D of length " +
                                 std::to_string(num_tokens));
    }
    if (mask.scalar_type() != torch::kBool) {
        throw std::runtime_error(std::string(who) + ": padding mask must be boolean");
    }
    if (!mask.any().item<bool>()) {
        return torch::Tensor();
    }
    return mask.logical_not();
}

} // namespace routing
} // namespace moegate
