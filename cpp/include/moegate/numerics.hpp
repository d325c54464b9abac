#pragma once
#include <torch/torch.h>

namespace moegate {

// Indicator tensor over `num_classes`, same dtype as `indices`. The last
// dimension of `indices` must have size 1 unless `unsqueeze_indices` is set.
// A class count of zero yields an empty trailing dimension.
torch::Tensor one_hot(const torch::Tensor& indices, int64_t num_classes,
                      bool unsqueeze_indices = false);

// Running count along dim 0 minus one. For rows where `mask` is set this is the
// number of set rows strictly before it in the same column (its slot location);
// other rows hold garbage and must be masked by the caller.
torch::Tensor cumsum_sub_one(const torch::Tensor& mask);

// Per-row Shannon entropy in nats.
torch::Tensor entropy(const torch::Tensor& probs);

// Returns `scores` with non-finite entries replaced by the minimum finite entry
// (or 0 when nothing is finite). Out of place, so it is safe under autograd.
torch::Tensor make_finite(const torch::Tensor& scores);

// Machine epsilon / smallest normal value of a floating dtype.
double dtype_eps(at::ScalarType dtype);
double dtype_tiny(at::ScalarType dtype);

} // namespace moegate
