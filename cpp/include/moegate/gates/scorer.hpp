#pragma once
#include <torch/torch.h>

namespace moegate {
namespace gates {

// Maps token embeddings [S, D] to expert logits [S, E].
//
// Linear mode is a bias-free projection D -> E. Reduced-cosine mode projects to
// a 16-dim space and scores by cosine similarity against one learned direction
// per expert; renormalize() rescales those directions in place and must be
// called before score() whenever the directions may have changed.
class GateScorerImpl : public torch::nn::Module {
public:
    static constexpr int64_t kReducedDim = 16;
    static constexpr double kDirectionNorm = 1.5;

    GateScorerImpl(int64_t model_dim, int64_t num_experts, bool reduced_cosine);

    void renormalize();
    torch::Tensor score(const torch::Tensor& input);

    bool reduced_cosine() const { return reduced_cosine_; }
    int64_t model_dim() const { return model_dim_; }
    int64_t num_experts() const { return num_experts_; }

    // [E, D] in linear mode, [E, 16] in reduced-cosine mode.
    const torch::Tensor& expert_weights() const;

private:
    int64_t model_dim_;
    int64_t num_experts_;
    bool reduced_cosine_;
    torch::nn::Linear wg_{nullptr};
    torch::nn::Linear wg_reduction_{nullptr};
    torch::Tensor directions_;
};
TORCH_MODULE(GateScorer);

} // namespace gates
} // namespace moegate
