#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <vector>
#include <string>
#include <memory>
#include <optional>

#include <sys/types.h>

// Swarmbed Version
#define SWARMBED_VERSION_MAJOR 0
#define SWARMBED_VERSION_MINOR 1
#define SWARMBED_VERSION_PATCH 0
#define SWARMBED_VERSION_STRING "0.1.0"

// Platform detection
#if defined(__linux__)
    #ifndef SWARMBED_PLATFORM_LINUX
        #define SWARMBED_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef SWARMBED_PLATFORM_MACOS
        #define SWARMBED_PLATFORM_MACOS
    #endif
#else
    #error "swarmbed drives daemons through POSIX process control and needs a POSIX platform"
#endif

// Utility macros
#define SWARMBED_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

// Constants
namespace swarmbed {
namespace constants {

// Per-node filesystem layout
constexpr const char* PID_FILE_NAME = "daemon.pid";
constexpr const char* PID_LOCK_FILE_NAME = "daemon.pid.lock";
constexpr const char* STDOUT_FILE_NAME = "daemon.stdout";
constexpr const char* STDERR_FILE_NAME = "daemon.stderr";
constexpr const char* CONFIG_FILE_NAME = "config";
constexpr const char* API_FILE_NAME = "api";
constexpr const char* NODESPEC_FILE_NAME = "nodespec.json";

// Shutdown escalation timings
constexpr std::chrono::milliseconds INTERRUPT_WAIT{1000};
constexpr std::chrono::milliseconds QUIT_WAIT{5000};
constexpr std::chrono::milliseconds LIVENESS_POLL_INTERVAL{10};

// Readiness policy
constexpr std::chrono::milliseconds READY_INITIAL_DELAY{100};
constexpr std::chrono::milliseconds READY_RETRY_INTERVAL{100};
constexpr uint32_t READY_ATTEMPTS = 10;

// Testbed layout
constexpr const char* ROOT_ENV_VAR = "SWARMBED_ROOT";
constexpr const char* DEFAULT_ROOT_DIR = "testbed";
constexpr const char* CONFIG_NAME = "swarmbed.conf";
constexpr uint16_t DEFAULT_API_PORT_BASE = 5001;

} // namespace constants
} // namespace swarmbed

// Core types
namespace swarmbed {

// Ordered KEY=VALUE entries handed to a child process
using Environment = std::vector<std::string>;

using Args = std::vector<std::string>;

using Pid = pid_t;

} // namespace swarmbed
