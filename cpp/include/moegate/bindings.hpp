#pragma once
#include <torch/extension.h>

namespace moegate {

void bind_routing(py::module_& m);
void bind_gates(py::module_& m);

} // namespace moegate
