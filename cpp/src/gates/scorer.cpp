#include "moegate/gates/scorer.hpp"
#include "moegate/numerics.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace moegate {
namespace gates {

namespace {

constexpr double kOrthogonalGain = 0.32;
constexpr double kCosineEps = 1e-4;

} // namespace

GateScorerImpl::GateScorerImpl(int64_t model_dim, int64_t num_experts, bool reduced_cosine)
    : model_dim_(model_dim), num_experts_(num_experts), reduced_cosine_(reduced_cosine) {
    if (model_dim_ <= 0 || num_experts_ <= 0) {
        throw std::invalid_argument("GateScorer: model_dim and num_experts must be > 0");
    }
    if (!reduced_cosine_) {
        wg_ = register_module(
            "wg", torch::nn::Linear(torch::nn::LinearOptions(model_dim_, num_experts_).bias(false)));
        return;
    }
    wg_reduction_ = register_module(
        "wg_reduction",
        torch::nn::Linear(torch::nn::LinearOptions(model_dim_, kReducedDim).bias(false)));
    directions_ = register_parameter("wg", torch::empty({num_experts_, kReducedDim}));
    torch::NoGradGuard no_grad;
    torch::nn::init::orthogonal_(directions_, kOrthogonalGain);
}

void GateScorerImpl::renormalize() {
    if (!reduced_cosine_) {
        return;
    }
    torch::NoGradGuard no_grad;
    auto norm = directions_.norm(2, std::vector<int64_t>{1}, /*keepdim=*/true)
                    .clamp_min(dtype_tiny(directions_.scalar_type()));
    directions_.mul_(kDirectionNorm / norm);
}

torch::Tensor GateScorerImpl::score(const torch::Tensor& input) {
    if (!input.defined() || input.dim() != 2) {
        throw std::runtime_error("GateScorer: input must be 2-D [tokens, model_dim]");
    }
    if (input.size(1) != model_dim_) {
        throw std::runtime_error("GateScorer: input last dim " + std::to_string(input.size(1)) +
                                 " does not match model_dim " + std::to_string(model_dim_));
    }
    if (!reduced_cosine_) {
        return wg_->forward(input);
    }

    auto reduced = wg_reduction_->forward(input);
    namespace F = torch::nn::functional;
    auto directions = F::normalize(directions_.to(torch::kFloat),
                                   F::NormalizeFuncOptions().p(2.0).dim(1).eps(kCosineEps));
    auto logits = reduced.to(torch::kFloat).matmul(directions.t()).to(reduced.scalar_type());
    return make_finite(logits);
}

const torch::Tensor& GateScorerImpl::expert_weights() const {
    return reduced_cosine_ ? directions_ : wg_->weight;
}

} // namespace gates
} // namespace moegate
