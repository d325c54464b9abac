#pragma once
#include <torch/torch.h>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace moegate {

// Standard Gumbel(0, 1) sampler with its parameters resident on one device.
class GumbelSampler {
public:
    explicit GumbelSampler(c10::Device device);

    torch::Tensor sample(at::IntArrayRef shape,
                         const c10::optional<at::Generator>& generator = c10::nullopt) const;

    c10::Device device() const { return loc_.device(); }

private:
    torch::Tensor loc_;
    torch::Tensor scale_;
};

class SamplerCache {
public:
    // Returns the sampler for `device`, creating it on first use.
    std::shared_ptr<const GumbelSampler> get(c10::Device device);

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<c10::Device, std::shared_ptr<const GumbelSampler>> samplers_;
};

// Per-execution resources for stochastic routing policies. One context is
// owned by each gate module; free-function callers pass their own.
struct RoutingContext {
    SamplerCache samplers;
    c10::optional<at::Generator> generator;

    RoutingContext() = default;
    explicit RoutingContext(uint64_t seed);
};

} // namespace moegate
