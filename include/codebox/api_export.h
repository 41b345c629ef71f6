#pragma once

// This header includes the CMake-generated export header
// and provides the CODEBOX_API macro used on public classes

#include "codebox/codebox_export.h"

#ifndef CODEBOX_API
    #define CODEBOX_API CODEBOX_EXPORT
#endif
