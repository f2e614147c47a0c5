#ifndef MOCAP_LOG_HPP
#define MOCAP_LOG_HPP

#include <iostream>

// ============================================================================
// Log Level Control
// ============================================================================
// Higher number = more verbose
#define MOCAP_LOG_LEVEL_SILENT  0  // No logs
#define MOCAP_LOG_LEVEL_ERROR   1  // Errors only
#define MOCAP_LOG_LEVEL_WARN    2  // Warnings + errors
#define MOCAP_LOG_LEVEL_INFO    3  // Info + warnings + errors (default)
#define MOCAP_LOG_LEVEL_VERBOSE 4  // Per-frame and per-event details

// Override by defining MOCAP_LOG_LEVEL before including this header
// or with -DMOCAP_LOG_LEVEL=... on the compiler command line.
#ifndef MOCAP_LOG_LEVEL
#define MOCAP_LOG_LEVEL MOCAP_LOG_LEVEL_INFO
#endif

#define MOCAP_LOG_VERBOSE(msg) do { if(MOCAP_LOG_LEVEL >= MOCAP_LOG_LEVEL_VERBOSE) { std::cout << msg << std::endl; } } while(0)
#define MOCAP_LOG_INFO(msg)    do { if(MOCAP_LOG_LEVEL >= MOCAP_LOG_LEVEL_INFO)    { std::cout << msg << std::endl; } } while(0)
#define MOCAP_LOG_WARN(msg)    do { if(MOCAP_LOG_LEVEL >= MOCAP_LOG_LEVEL_WARN)    { std::cerr << msg << std::endl; } } while(0)
#define MOCAP_LOG_ERROR(msg)   do { if(MOCAP_LOG_LEVEL >= MOCAP_LOG_LEVEL_ERROR)   { std::cerr << "[ERROR] " << msg << std::endl; } } while(0)

inline const char* mocapLogLevelName() {
    #if MOCAP_LOG_LEVEL == MOCAP_LOG_LEVEL_SILENT
        return "SILENT";
    #elif MOCAP_LOG_LEVEL == MOCAP_LOG_LEVEL_ERROR
        return "ERROR";
    #elif MOCAP_LOG_LEVEL == MOCAP_LOG_LEVEL_WARN
        return "WARN";
    #elif MOCAP_LOG_LEVEL == MOCAP_LOG_LEVEL_INFO
        return "INFO";
    #elif MOCAP_LOG_LEVEL == MOCAP_LOG_LEVEL_VERBOSE
        return "VERBOSE";
    #else
        return "UNKNOWN";
    #endif
}

// Print current log level (call once at startup)
#define MOCAP_LOG_PRINT_LEVEL() do { std::cout << "[Log] Level: " << mocapLogLevelName() << " (" << MOCAP_LOG_LEVEL << ")" << std::endl; } while(0)

#endif // MOCAP_LOG_HPP
