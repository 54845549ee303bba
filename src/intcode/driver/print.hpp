#pragma once

#include <string>

#include "intcode/common/diagnostic.hpp"

namespace intcode::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace intcode::driver
