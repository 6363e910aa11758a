#ifndef SPEAKER_REMOTE_CONFIG_LOADER_H
#define SPEAKER_REMOTE_CONFIG_LOADER_H

#include "core/daemon_constants.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace speaker_remote {

// One smart-plug controlled speaker, in configuration order
struct SpeakerConfig {
    std::string name;
    std::string host;
    uint16_t port = 0;
    std::vector<uint8_t> mac;  // hardware id bytes
    std::string devtype;       // device-type discriminator, passed through to the gateway
};

struct AppConfig {
    struct ReceiverConfig {
        std::string name;  // friendly name matched during discovery
    } receiver;

    std::vector<SpeakerConfig> speakers;

    struct BridgeConfig {
        std::string controlEndpoint = DaemonConstants::DEFAULT_BRIDGE_CONTROL_ENDPOINT;
        std::string eventEndpoint = DaemonConstants::DEFAULT_BRIDGE_EVENT_ENDPOINT;
        int requestTimeoutMs = DaemonConstants::DEFAULT_BRIDGE_TIMEOUT_MS;
    } bridge;

    struct TimingConfig {
        int pollIntervalSec = DaemonConstants::DEFAULT_POLL_INTERVAL_SEC;
        int gracePeriodSec = DaemonConstants::DEFAULT_GRACE_PERIOD_SEC;
        int discoveryRetrySec = DaemonConstants::DEFAULT_DISCOVERY_RETRY_SEC;
        int deviceTimeoutMs = DaemonConstants::DEFAULT_DEVICE_TIMEOUT_MS;
    } timing;
};

// Split "host:port" ("[v6]:port" accepted). Port must be 1-65535.
bool parseSpeakerAddress(const std::string& address, std::string& host, uint16_t& port);

// Decode a hex hardware id. ':', '-' and spaces between digit pairs are ignored.
bool parseMacAddress(const std::string& text, std::vector<uint8_t>& out);

// Lower-case hex without separators ("a1b2c3...")
std::string formatMacAddress(const std::vector<uint8_t>& mac);

// Parse a configuration document. On failure, error names the offending field.
bool parseAppConfig(const std::string& jsonText, AppConfig& outConfig, std::string& error);

// Read and parse a configuration file. A missing file is an error.
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   std::string& error);

}  // namespace speaker_remote

#endif  // SPEAKER_REMOTE_CONFIG_LOADER_H
