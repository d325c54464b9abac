#pragma once
#include <torch/torch.h>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace moegate {
namespace routing {

// Fraction of experts summed into the top/bottom balance diagnostics.
constexpr double kBalanceSampleFraction = 0.2;

using RoutingMetadata = std::map<std::string, double>;

struct DenseRouting {
    torch::Tensor combine_weights;  // [S, E, C]
    torch::Tensor dispatch_mask;    // [S, E, C] bool
};

// One tensor per choice rank. Locations are not filtered by capacity.
struct SparseRouting {
    std::vector<torch::Tensor> indices;    // [S] int64
    std::vector<torch::Tensor> locations;  // [S] int64
    std::vector<torch::Tensor> gates;      // [S]
};

struct RoutingResult {
    torch::Tensor l_aux;
    RoutingMetadata metadata;
    int64_t capacity = 0;
    int64_t num_experts = 0;
    std::variant<DenseRouting, SparseRouting> routing;

    bool is_dense() const { return std::holds_alternative<DenseRouting>(routing); }
    const DenseRouting& dense() const;
    const SparseRouting& sparse() const;
};

// Per-expert token capacity for one routing call. In eval mode a positive
// `eval_fraction` gives ceil(fraction * S); otherwise top-1 uses
// floor(capacity_factor * ceil(S / E)) and top-2 uses 2 * ceil(S / E).
int64_t compute_capacity(int64_t num_tokens, int64_t num_experts, int64_t top_k,
                         double capacity_factor, double eval_fraction, bool eval_mode);

// Softmax over experts, promoted to float32 when `use_fp32` is set.
torch::Tensor gate_probabilities(const torch::Tensor& logits, bool use_fp32);

// Load balancing loss: mean(me * ce) * E^2 with me the mean gate probability and
// ce the mean first-choice assignment per expert.
torch::Tensor balance_loss(const torch::Tensor& gates, const torch::Tensor& mask1);

// Percent of tokens whose choice of the given rank is each expert.
torch::Tensor expert_histogram(const torch::Tensor& indices, int64_t num_experts,
                               int64_t num_tokens);

// Writes unused_expert{rank}_count, expert{rank}_balance_top and
// expert{rank}_balance_bottom for one choice rank.
void record_balance_stats(RoutingMetadata& metadata, int rank, const torch::Tensor& indices,
                          int64_t num_experts, int64_t num_tokens);

// Percent of assignments in `mask` whose location is at or past capacity.
double overflow_percent(const torch::Tensor& mask, const torch::Tensor& locations,
                        int64_t capacity);

// Builds the [S, E, C] combine tensor for one choice rank from per-token gate
// weights, a capacity-filtered mask and per-token slot locations.
torch::Tensor combine_for_rank(const torch::Tensor& gates_s, const torch::Tensor& mask,
                               const torch::Tensor& locations_s, int64_t capacity);

void check_logits(const torch::Tensor& logits, const char* who);

// Returns the non-padding indicator [S] or an undefined tensor when no token is padded.
torch::Tensor nonpadding_or_undefined(const c10::optional<torch::Tensor>& input_mask,
                                      int64_t num_tokens, const char* who);

} // namespace routing
} // namespace moegate
