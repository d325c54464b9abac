// test_numerics.cpp - Unit tests for shared routing numerics
//
// Tests verify:
// - One-hot encoding, including the empty class dimension
// - Per-column slot locations from cumsum_sub_one
// - Entropy and finite-score repair
// - Gumbel sampler cache reuse and seeded reproducibility

#include "moegate/numerics.hpp"
#include "moegate/sampler_cache.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace moegate;

namespace {

bool close(double a, double b, double tol = 1e-5) {
    return std::abs(a - b) <= tol;
}

void test_one_hot() {
    std::cout << "Test: One-hot encoding..." << std::flush;

    auto indices = torch::tensor({2, 0, 1}, torch::kLong);
    auto encoded = one_hot(indices, 3, /*unsqueeze_indices=*/true);

    assert(encoded.sizes() == torch::IntArrayRef({3, 3}));
    assert(encoded.scalar_type() == torch::kLong);
    assert(encoded[0][2].item<int64_t>() == 1);
    assert(encoded[1][0].item<int64_t>() == 1);
    assert(encoded[2][1].item<int64_t>() == 1);
    assert(encoded.sum().item<int64_t>() == 3);

    auto keepdim = one_hot(indices.unsqueeze(-1), 4);
    assert(keepdim.sizes() == torch::IntArrayRef({3, 4}));
    assert(keepdim.sum(1).eq(1).all().item<bool>());

    std::cout << " PASSED" << std::endl;
}

void test_one_hot_zero_classes() {
    std::cout << "Test: One-hot with zero classes..." << std::flush;

    auto indices = torch::zeros({3}, torch::kLong);
    auto encoded = one_hot(indices, 0, /*unsqueeze_indices=*/true);
    assert(encoded.sizes() == torch::IntArrayRef({3, 0}));

    std::cout << " PASSED" << std::endl;
}

void test_one_hot_rejects_wide_indices() {
    std::cout << "Test: One-hot rejects indices without a unit last dim..." << std::flush;

    bool threw = false;
    try {
        one_hot(torch::zeros({3, 2}, torch::kLong), 4);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << " PASSED" << std::endl;
}

void test_cumsum_sub_one_locations() {
    std::cout << "Test: Slot locations from cumsum_sub_one..." << std::flush;

    auto mask = torch::tensor({1, 0, 0, 1, 1, 0, 1, 1}, torch::kLong).reshape({4, 2});
    auto locations = cumsum_sub_one(mask);

    assert(locations[0][0].item<int64_t>() == 0);
    assert(locations[2][0].item<int64_t>() == 1);
    assert(locations[3][0].item<int64_t>() == 2);
    assert(locations[1][1].item<int64_t>() == 0);
    assert(locations[3][1].item<int64_t>() == 1);

    std::cout << " PASSED" << std::endl;
}

void test_entropy() {
    std::cout << "Test: Entropy of uniform and one-hot rows..." << std::flush;

    auto probs = torch::tensor({0.25f, 0.25f, 0.25f, 0.25f, 1.0f, 0.0f, 0.0f, 0.0f})
                     .reshape({2, 4});
    auto h = entropy(probs);
    assert(close(h[0].item<double>(), std::log(4.0)));
    assert(close(h[1].item<double>(), 0.0));

    std::cout << " PASSED" << std::endl;
}

void test_make_finite() {
    std::cout << "Test: Non-finite scores replaced by the minimum finite score..." << std::flush;

    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    auto scores = torch::tensor({1.0f, nan, -2.0f, inf}).reshape({2, 2});
    auto repaired = make_finite(scores);

    assert(torch::isfinite(repaired).all().item<bool>());
    assert(repaired[0][1].item<float>() == -2.0f);
    assert(repaired[1][1].item<float>() == -2.0f);
    assert(repaired[0][0].item<float>() == 1.0f);

    auto hopeless = torch::full({2, 3}, nan);
    assert(make_finite(hopeless).eq(0).all().item<bool>());

    std::cout << " PASSED" << std::endl;
}

void test_dtype_limits() {
    std::cout << "Test: dtype epsilon and tiny..." << std::flush;

    assert(dtype_eps(torch::kFloat) == static_cast<double>(std::numeric_limits<float>::epsilon()));
    assert(dtype_tiny(torch::kFloat) == static_cast<double>(std::numeric_limits<float>::min()));
    assert(dtype_eps(torch::kHalf) > dtype_eps(torch::kFloat));

    std::cout << " PASSED" << std::endl;
}

void test_sampler_cache_reuse() {
    std::cout << "Test: Sampler cache creates one sampler per device..." << std::flush;

    SamplerCache cache;
    assert(cache.size() == 0);
    auto first = cache.get(torch::kCPU);
    auto second = cache.get(torch::kCPU);
    assert(first.get() == second.get());
    assert(first->device() == c10::Device(torch::kCPU));
    assert(cache.size() == 1);

    cache.clear();
    assert(cache.size() == 0);

    std::cout << " PASSED" << std::endl;
}

void test_gumbel_samples() {
    std::cout << "Test: Gumbel samples are finite and seed-reproducible..." << std::flush;

    RoutingContext a(7);
    RoutingContext b(7);
    auto sa = a.samplers.get(torch::kCPU)->sample({200, 500}, a.generator);
    auto sb = b.samplers.get(torch::kCPU)->sample({200, 500}, b.generator);

    assert(sa.sizes() == torch::IntArrayRef({200, 500}));
    assert(torch::isfinite(sa).all().item<bool>());
    assert(torch::equal(sa, sb));
    // Mean of Gumbel(0, 1) is the Euler-Mascheroni constant.
    assert(close(sa.mean().item<double>(), 0.5772, 0.02));

    std::cout << " PASSED" << std::endl;
}

} // namespace

int main() {
    std::cout << "=== Routing Numerics Unit Tests ===" << std::endl;
    std::cout << std::endl;

    test_one_hot();
    test_one_hot_zero_classes();
    test_one_hot_rejects_wide_indices();
    test_cumsum_sub_one_locations();
    test_entropy();
    test_make_finite();
    test_dtype_limits();
    test_sampler_cache_reuse();
    test_gumbel_samples();

    std::cout << std::endl;
    std::cout << "=== All tests PASSED ===" << std::endl;

    return 0;
}
