#include "moegate/numerics.hpp"
#include <limits>
#include <stdexcept>
#include <vector>
#include <spdlog/spdlog.h>

namespace moegate {

torch::Tensor one_hot(const torch::Tensor& indices, int64_t num_classes, bool unsqueeze_indices) {
    if (num_classes < 0) {
        throw std::invalid_argument("one_hot: num_classes must be >= 0");
    }
    auto idx = unsqueeze_indices ? indices.unsqueeze(-1) : indices;
    if (idx.dim() == 0 || idx.size(-1) != 1) {
        throw std::invalid_argument("one_hot: last dimension of indices must have size 1");
    }

    std::vector<int64_t> shape(idx.sizes().begin(), idx.sizes().end() - 1);
    shape.push_back(num_classes);
    auto output = torch::zeros(shape, idx.options());
    if (num_classes > 0) {
        output.scatter_(output.dim() - 1, idx, 1);
    }
    return output;
}

torch::Tensor cumsum_sub_one(const torch::Tensor& mask) {
    return torch::cumsum(mask, /*dim=*/0) - 1;
}

torch::Tensor entropy(const torch::Tensor& probs) {
    const double eps = dtype_eps(probs.scalar_type());
    auto logits = torch::log(probs.clamp(eps, 1.0 - eps));
    return -(probs * logits).sum(-1);
}

torch::Tensor make_finite(const torch::Tensor& scores) {
    auto ok = torch::isfinite(scores);
    if (ok.all().item<bool>()) {
        return scores;
    }
    if (!ok.any().item<bool>()) {
        spdlog::warn("make_finite: none of {} scores is finite, filling with 0", scores.numel());
        return torch::zeros_like(scores);
    }
    auto min_finite = scores.masked_select(ok).min();
    spdlog::warn("make_finite: replacing {} non-finite scores with {}",
                 (~ok).sum().item<int64_t>(), min_finite.item<double>());
    return torch::where(ok, scores, min_finite);
}

double dtype_eps(at::ScalarType dtype) {
    double eps = 0.0;
    AT_DISPATCH_FLOATING_TYPES_AND2(at::kHalf, at::kBFloat16, dtype, "dtype_eps", [&] {
        eps = static_cast<double>(std::numeric_limits<scalar_t>::epsilon());
    });
    return eps;
}

double dtype_tiny(at::ScalarType dtype) {
    double tiny = 0.0;
    AT_DISPATCH_FLOATING_TYPES_AND2(at::kHalf, at::kBFloat16, dtype, "dtype_tiny", [&] {
        tiny = static_cast<double>(std::numeric_limits<scalar_t>::min());
    });
    return tiny;
}

} // namespace moegate
