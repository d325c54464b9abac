#include "moegate/bindings.hpp"
#include "moegate/config.hpp"
#include "moegate/gates/top1_gate.hpp"
#include "moegate/gates/top2_gate.hpp"
#include "moegate/routing/top1.hpp"
#include "moegate/routing/top2.hpp"
#include "moegate/sampler_cache.hpp"
#include <ATen/CPUGeneratorImpl.h>
#include <pybind11/stl.h>

namespace moegate {

namespace {

// Dense: (l_aux, combine_weights, dispatch_mask, metadata)
// Sparse: (l_aux, metadata, capacity, num_experts, indices, locations, gates)
py::tuple as_tuple(const routing::RoutingResult& result) {
    if (result.is_dense()) {
        const auto& dense = result.dense();
        return py::make_tuple(result.l_aux, dense.combine_weights, dense.dispatch_mask,
                              result.metadata);
    }
    const auto& sparse = result.sparse();
    return py::make_tuple(result.l_aux, result.metadata, result.capacity, result.num_experts,
                          sparse.indices, sparse.locations, sparse.gates);
}

// bind_module's own forward has no default for the padding mask.
template <typename Gate>
routing::RoutingResult gate_forward(Gate& gate, const torch::Tensor& input,
                                    c10::optional<torch::Tensor> mask) {
    return gate.forward(input, mask);
}

} // namespace

void bind_routing(py::module_& m) {
    auto routing_mod = m.def_submodule("routing", "Capacity-constrained token routing");

    py::enum_<SecondExpertPolicy>(routing_mod, "SecondExpertPolicy")
        .value("sampling", SecondExpertPolicy::Sampling)
        .value("random", SecondExpertPolicy::Random)
        .value("deterministic", SecondExpertPolicy::Deterministic);

    py::enum_<ExecutionStrategy>(routing_mod, "ExecutionStrategy")
        .value("dense", ExecutionStrategy::Dense)
        .value("sparse", ExecutionStrategy::Sparse);

    py::class_<RoutingConfig>(routing_mod, "RoutingConfig")
        .def(py::init<>())
        .def_readwrite("use_fp32", &RoutingConfig::use_fp32)
        .def_readwrite("capacity_factor", &RoutingConfig::capacity_factor)
        .def_readwrite("eval_capacity_token_fraction", &RoutingConfig::eval_capacity_token_fraction)
        .def_readwrite("second_expert_policy", &RoutingConfig::second_expert_policy)
        .def_readwrite("normalize_gate_prob_before_dropping",
                       &RoutingConfig::normalize_gate_prob_before_dropping)
        .def_readwrite("batch_prioritized_routing", &RoutingConfig::batch_prioritized_routing)
        .def_readwrite("use_reduced_cosine", &RoutingConfig::use_reduced_cosine)
        .def_readwrite("strategy", &RoutingConfig::strategy)
        .def("validate", &RoutingConfig::validate);

    routing_mod.def("parse_second_expert_policy", &parse_second_expert_policy);

    py::class_<routing::DenseRouting>(routing_mod, "DenseRouting")
        .def_readonly("combine_weights", &routing::DenseRouting::combine_weights)
        .def_readonly("dispatch_mask", &routing::DenseRouting::dispatch_mask);

    py::class_<routing::SparseRouting>(routing_mod, "SparseRouting")
        .def_readonly("indices", &routing::SparseRouting::indices)
        .def_readonly("locations", &routing::SparseRouting::locations)
        .def_readonly("gates", &routing::SparseRouting::gates);

    py::class_<routing::RoutingResult>(routing_mod, "RoutingResult")
        .def_readonly("l_aux", &routing::RoutingResult::l_aux)
        .def_readonly("metadata", &routing::RoutingResult::metadata)
        .def_readonly("capacity", &routing::RoutingResult::capacity)
        .def_readonly("num_experts", &routing::RoutingResult::num_experts)
        .def_property_readonly("is_dense", &routing::RoutingResult::is_dense)
        .def_property_readonly("dense", &routing::RoutingResult::dense,
                               py::return_value_policy::reference_internal)
        .def_property_readonly("sparse", &routing::RoutingResult::sparse,
                               py::return_value_policy::reference_internal)
        .def("as_tuple", &as_tuple);

    py::class_<RoutingContext>(routing_mod, "RoutingContext")
        .def(py::init<>())
        .def(py::init<uint64_t>(), py::arg("seed"));

    routing_mod.def("compute_capacity", &routing::compute_capacity,
                    py::arg("num_tokens"), py::arg("num_experts"), py::arg("top_k"),
                    py::arg("capacity_factor"), py::arg("eval_fraction"), py::arg("eval_mode"));

    routing_mod.def(
        "top1_routing",
        [](const torch::Tensor& logits, c10::optional<torch::Tensor> input_mask,
           const RoutingConfig& config, bool eval_mode) {
            config.validate();
            return routing::top1_routing(logits, input_mask, config, eval_mode);
        },
        py::arg("logits"), py::arg("input_mask") = py::none(), py::arg("config") = RoutingConfig(),
        py::arg("eval_mode") = false);

    routing_mod.def(
        "top2_routing",
        [](const torch::Tensor& logits, RoutingContext& context,
           c10::optional<torch::Tensor> input_mask, const RoutingConfig& config, bool eval_mode) {
            config.validate();
            return routing::top2_routing(logits, input_mask, config, eval_mode, context);
        },
        py::arg("logits"), py::arg("context"), py::arg("input_mask") = py::none(),
        py::arg("config") = RoutingConfig(), py::arg("eval_mode") = false);
}

void bind_gates(py::module_& m) {
    auto gates_mod = m.def_submodule("gates", "Gate modules");

    using namespace gates;

    torch::python::bind_module<Top1GateImpl>(gates_mod, "Top1Gate")
        .def(py::init<int64_t, int64_t, RoutingConfig>(),
             py::arg("model_dim"), py::arg("num_experts"), py::arg("config") = RoutingConfig())
        .def("renormalize", [](Top1GateImpl& gate) { gate.scorer()->renormalize(); })
        .def("forward", &gate_forward<Top1GateImpl>, py::arg("input"), py::arg("mask") = py::none())
        .def("__call__", &gate_forward<Top1GateImpl>, py::arg("input"),
             py::arg("mask") = py::none());

    torch::python::bind_module<Top2GateImpl>(gates_mod, "Top2Gate")
        .def(py::init<int64_t, int64_t, RoutingConfig>(),
             py::arg("model_dim"), py::arg("num_experts"), py::arg("config") = RoutingConfig())
        .def("renormalize", [](Top2GateImpl& gate) { gate.scorer()->renormalize(); })
        .def("forward", &gate_forward<Top2GateImpl>, py::arg("input"), py::arg("mask") = py::none())
        .def("__call__", &gate_forward<Top2GateImpl>, py::arg("input"),
             py::arg("mask") = py::none())
        .def("manual_seed", [](Top2GateImpl& gate, uint64_t seed) {
            gate.context().generator = at::make_generator<at::CPUGeneratorImpl>(seed);
        });
}

} // namespace moegate
