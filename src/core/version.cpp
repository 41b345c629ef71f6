// version.cpp - Library version
#include "codebox/codebox.h"

#include <cstdio>

namespace codebox {

const char* GetVersionString() {
    static char version[32];
    snprintf(version, sizeof(version), "%d.%d.%d",
             CODEBOX_VERSION_MAJOR,
             CODEBOX_VERSION_MINOR,
             CODEBOX_VERSION_PATCH);
    return version;
}

} // namespace codebox
