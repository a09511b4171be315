/**
 * @file device_types.h
 * @brief Defines the core data structures of the device engine.
 * @details Contains the device record shared by the registry, discovery and monitoring
 *          components, the transient discovery result produced by scanners, the partial update
 *          patch applied by the registry, and the helpers that derive identities and export a
 *          device as a flat field map.
 */
#ifndef CAPTUREHUB_DEVICE_TYPES_H
#define CAPTUREHUB_DEVICE_TYPES_H

#include "field_map.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace capturehub {
namespace devices {

enum class DeviceKind {
    LOCAL,
    NETWORK
};

enum class DeviceType {
    VIDEO,
    AUDIO
};

enum class DeviceStatus {
    UNKNOWN,
    ONLINE,
    OFFLINE
};

/** @brief How a device entered the registry. Manual devices are exempt from auto-removal. */
enum class DeviceOrigin {
    MANUAL,
    DISCOVERED
};

/** @brief Provenance of a single mutable field. */
enum class FieldOrigin {
    USER,
    DISCOVERY
};

// Keys of the mutable fields whose provenance is tracked per device.
inline constexpr const char* kFieldName = "name";
inline constexpr const char* kFieldType = "type";
inline constexpr const char* kFieldProtocol = "protocol";

inline constexpr const char* kRedactedValue = "***";

const char* to_string(DeviceKind kind);
const char* to_string(DeviceType type);
const char* to_string(DeviceStatus status);
const char* to_string(DeviceOrigin origin);
const char* to_string(FieldOrigin origin);

bool parse_device_type(const std::string& text, DeviceType& out);
bool parse_device_status(const std::string& text, DeviceStatus& out);

/**
 * @struct NetworkEndpoint
 * @brief Addressing and credential fields of a network-attached device.
 */
struct NetworkEndpoint {
    std::string ip;
    int port = 0;
    std::string protocol;   ///< rtsp, rtmp, http, onvif, ...
    std::string username;   ///< Opaque, never logged.
    std::string password;   ///< Opaque, never logged.

    bool operator==(const NetworkEndpoint& other) const {
        return ip == other.ip && port == other.port && protocol == other.protocol &&
               username == other.username && password == other.password;
    }
    bool operator!=(const NetworkEndpoint& other) const { return !(*this == other); }
};

/**
 * @struct LocalEndpoint
 * @brief Handle of a locally attached device.
 */
struct LocalEndpoint {
    std::string system_path; ///< e.g. /dev/video0 or hw:1,0
    std::string driver;      ///< e.g. v4l2, alsa

    bool operator==(const LocalEndpoint& other) const {
        return system_path == other.system_path && driver == other.driver;
    }
    bool operator!=(const LocalEndpoint& other) const { return !(*this == other); }
};

/**
 * @struct DeviceInfo
 * @brief The registry record of one capture device.
 * @details Only the endpoint matching `kind` is meaningful; the other stays default
 *          constructed. `field_origins` records who last set each tracked mutable field.
 */
struct DeviceInfo {
    std::string device_id;
    std::string name;
    DeviceKind kind = DeviceKind::NETWORK;
    DeviceType type = DeviceType::VIDEO;
    DeviceStatus status = DeviceStatus::UNKNOWN;
    std::map<std::string, std::string> streams;    ///< stream_id -> URL or descriptor
    std::set<std::string> capabilities;
    DeviceOrigin origin = DeviceOrigin::MANUAL;
    std::map<std::string, FieldOrigin> field_origins;
    std::string source_protocol;                   ///< Scanner that first reported the device, if any.
    NetworkEndpoint network;
    LocalEndpoint local;

    bool operator==(const DeviceInfo& other) const {
        return device_id == other.device_id && name == other.name && kind == other.kind &&
               type == other.type && status == other.status && streams == other.streams &&
               capabilities == other.capabilities && origin == other.origin &&
               field_origins == other.field_origins && source_protocol == other.source_protocol &&
               network == other.network && local == other.local;
    }
    bool operator!=(const DeviceInfo& other) const { return !(*this == other); }
};

using DeviceMap = std::map<std::string, DeviceInfo>;

/**
 * @struct DiscoveryResult
 * @brief A transient candidate reported by one scanner during one cycle.
 * @details `raw_identity` is the protocol-native identifier (USN, endpoint reference,
 *          service instance name, device node) and is only used for diagnostics. The
 *          registry identity is derived from the addressing fields.
 */
struct DiscoveryResult {
    std::string source_protocol;
    std::string raw_identity;
    DeviceKind kind = DeviceKind::NETWORK;
    DeviceType type = DeviceType::VIDEO;
    std::string name;
    std::string ip;
    int port = 0;
    std::string protocol;
    std::string username;   ///< From per-protocol configuration, if any.
    std::string password;
    std::string system_path;
    std::string driver;
    std::map<std::string, std::string> streams;
    std::set<std::string> capabilities;
};

/**
 * @struct DevicePatch
 * @brief A partial update. Unset optionals leave the corresponding field untouched.
 * @details Empty credential values never overwrite stored credentials; set
 *          `clear_credentials` to drop them explicitly.
 */
struct DevicePatch {
    std::optional<std::string> name;
    std::optional<DeviceType> type;
    std::optional<std::string> protocol;
    std::optional<std::string> username;
    std::optional<std::string> password;
    bool clear_credentials = false;
    std::map<std::string, std::string> streams_to_add;
    std::vector<std::string> streams_to_remove;
    std::set<std::string> capabilities_to_add;
    std::set<std::string> capabilities_to_remove;

    bool empty() const {
        return !name && !type && !protocol && !username && !password && !clear_credentials &&
               streams_to_add.empty() && streams_to_remove.empty() &&
               capabilities_to_add.empty() && capabilities_to_remove.empty();
    }
};

/** @brief `{ip}:{port}` */
std::string make_network_device_id(const std::string& ip, int port);

/** @brief `video:/dev/video0`, `audio:hw:1,0` */
std::string make_local_device_id(DeviceType type, const std::string& system_path);

/** @brief Derives the registry identity of a discovery result, or "" if it lacks addressing. */
std::string derive_device_id(const DiscoveryResult& result);

/** @brief Builds a fresh registry record (origin DISCOVERED) from a discovery result. */
DeviceInfo device_from_discovery(const DiscoveryResult& result);

/**
 * @brief Exports a device as a flat field map.
 * @details Streams are flattened to `stream.<stream_id>` keys and capabilities to a sorted,
 *          comma-separated `capabilities` value. Credential keys are always present; with
 *          `redact_credentials` set, non-empty values are replaced by `***`.
 */
FieldMap to_fields(const DeviceInfo& device, bool redact_credentials = true);

/**
 * @brief Flattens a whole device list into one field map.
 * @details Adds `count` and, per device in id order, its `to_fields()` entries prefixed with
 *          `device.<index>.`; credentials are redacted.
 */
FieldMap devices_to_fields(const DeviceMap& devices);

/** @brief One-line, credential-free description for log messages. */
std::string describe(const DeviceInfo& device);

std::string join_capabilities(const std::set<std::string>& capabilities);
std::set<std::string> split_capabilities(const std::string& text);

} // namespace devices
} // namespace capturehub

#endif // CAPTUREHUB_DEVICE_TYPES_H
