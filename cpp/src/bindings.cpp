#include <torch/extension.h>
#include "moegate/bindings.hpp"

PYBIND11_MODULE(_C, m) {
    m.doc() = "moegate: MoE token-to-expert routing C++ backend";

    moegate::bind_routing(m);
    moegate::bind_gates(m);
}
