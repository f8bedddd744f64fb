//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
// DEEPR_STDIO_MODE=1 starts in stdio mode; Logger::setStdioMode changes it at runtime.
bool Logger::sUseStderr = [](){
    const std::string v = GetEnvOrDefault("DEEPR_STDIO_MODE", "0");
    return (v == "1" || v == "true" || v == "TRUE");
}();
