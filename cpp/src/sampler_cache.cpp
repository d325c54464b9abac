#include "moegate/sampler_cache.hpp"
#include "moegate/numerics.hpp"
#include <ATen/CPUGeneratorImpl.h>
#include <spdlog/spdlog.h>

namespace moegate {

GumbelSampler::GumbelSampler(c10::Device device)
    : loc_(torch::scalar_tensor(0.0, torch::TensorOptions().dtype(torch::kFloat).device(device))),
      scale_(torch::scalar_tensor(1.0, torch::TensorOptions().dtype(torch::kFloat).device(device))) {}

torch::Tensor GumbelSampler::sample(at::IntArrayRef shape,
                                    const c10::optional<at::Generator>& generator) const {
    const double tiny = dtype_tiny(torch::kFloat);
    const double upper = 1.0 - dtype_eps(torch::kFloat);
    auto u = torch::rand(shape, generator, loc_.options()).clamp_(tiny, upper);
    return loc_ - scale_ * torch::log(-torch::log(u));
}

std::shared_ptr<const GumbelSampler> SamplerCache::get(c10::Device device) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = samplers_.find(device);
    if (it != samplers_.end()) {
        return it->second;
    }
    spdlog::debug("SamplerCache: creating Gumbel sampler for {}", device.str());
    auto sampler = std::make_shared<const GumbelSampler>(device);
    samplers_.emplace(device, sampler);
    return sampler;
}

size_t SamplerCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samplers_.size();
}

void SamplerCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    samplers_.clear();
}

RoutingContext::RoutingContext(uint64_t seed)
    : generator(at::make_generator<at::CPUGeneratorImpl>(seed)) {}

} // namespace moegate
