// module_scanner.h - Literal scan of guest source for import statements
#pragma once

#include "api_export.h"
#include "execution_types.h"
#include <string>
#include <vector>

namespace codebox {

// Reports lines that start with "import " or "from " after trimming.
// Observability only: quoted text can produce false hits and conditional
// or dynamic imports can be missed.
CODEBOX_API std::vector<ReferencedModule> ScanReferencedModules(const std::string& source);

} // namespace codebox
