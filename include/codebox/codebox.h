#pragma once

// Main header file for codebox
// Include this to get the whole host-side pipeline

#define CODEBOX_VERSION_MAJOR 0
#define CODEBOX_VERSION_MINOR 1
#define CODEBOX_VERSION_PATCH 0

// API export macros
#include "api_export.h"

// Data model (order matters - no dependencies first)
#include "execution_types.h"
#include "module_catalog.h"
#include "bounded_buffer.h"

// Pipeline stages
#include "request_validator.h"
#include "resource_governor.h"
#include "executor.h"
#include "module_scanner.h"
#include "response_formatter.h"

// Service, configuration and counters
#include "sandbox_config.h"
#include "telemetry.h"
#include "code_execution_service.h"

// Advisory analysis for the CLI
#include "code_insights.h"

namespace codebox {

// Get version string
CODEBOX_API const char* GetVersionString();

} // namespace codebox
