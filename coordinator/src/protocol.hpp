#pragma once

#include <cstddef>
#include <cstdint>

namespace coord {

inline constexpr const char* kDefaultAddress = "127.0.0.1";
inline constexpr uint16_t kDefaultPort = 8080;

// Size of the single read performed for a coordinator reply.
inline constexpr std::size_t kReceiveBufferSize = 1024;

// Identity used when registering the dependency map of a workload.
inline constexpr const char* kRegistrarId = "kubescr";

inline constexpr const char* kActionAddDependencies = "add_dependencies";
inline constexpr const char* kActionPreDump = "pre-dump";
inline constexpr const char* kActionPostDump = "post-dump";
inline constexpr const char* kActionPreRestore = "pre-restore";
inline constexpr const char* kActionPostRestore = "post-restore";

inline constexpr const char* kMessageAck = "ACK";
inline constexpr const char* kMessageTimeout = "timeout";
inline constexpr const char* kMessageNotConnected = "not connected";
inline constexpr const char* kMessageCheckpointExists = "checkpoint is already created";
inline constexpr const char* kMessageAlreadyConnected = "client already connected";

/// CRIU hook currently being executed.
inline constexpr const char* kEnvAction = "CRTOOLS_SCRIPT_ACTION";
/// Base directory of the CRIU images.
inline constexpr const char* kEnvImageDir = "CRTOOLS_IMAGE_DIR";

inline constexpr const char* kConfigFileName = "criu-coordinator.json";
inline constexpr const char* kGlobalConfigDir = "/etc/criu";

} // namespace coord
