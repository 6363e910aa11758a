#include "core/config_loader.h"

#include "logging/logger.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace speaker_remote {

// Speakers keep file order, so an ordered object is required
using json = nlohmann::ordered_json;

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

bool readPositiveInt(const json& section, const char* key, int& target, const std::string& where,
                     std::string& error) {
    if (!section.contains(key)) {
        return true;
    }
    const auto& value = section[key];
    if (!value.is_number_integer() || value.get<int>() <= 0) {
        error = where + "." + key + " must be a positive integer";
        return false;
    }
    target = value.get<int>();
    return true;
}

bool readString(const json& section, const char* key, std::string& target,
                const std::string& where, std::string& error) {
    if (!section.contains(key)) {
        return true;
    }
    if (!section[key].is_string()) {
        error = where + "." + key + " must be a string";
        return false;
    }
    target = section[key].get<std::string>();
    return true;
}

bool parseSpeaker(const std::string& name, const json& entry, SpeakerConfig& out,
                  std::string& error) {
    const std::string where = "speakers." + name;
    if (!entry.is_object()) {
        error = where + " must be an object";
        return false;
    }

    out.name = name;

    if (!entry.contains("address") || !entry["address"].is_string()) {
        error = where + ".address is required (\"host:port\")";
        return false;
    }
    const auto address = entry["address"].get<std::string>();
    if (!parseSpeakerAddress(address, out.host, out.port)) {
        error = where + ".address is not a valid \"host:port\": " + address;
        return false;
    }

    if (!entry.contains("mac") || !entry["mac"].is_string()) {
        error = where + ".mac is required (hex string)";
        return false;
    }
    const auto mac = entry["mac"].get<std::string>();
    if (!parseMacAddress(mac, out.mac)) {
        error = where + ".mac is not a valid hex string: " + mac;
        return false;
    }

    if (!entry.contains("devtype") || !entry["devtype"].is_string()) {
        error = where + ".devtype is required (string)";
        return false;
    }
    out.devtype = entry["devtype"].get<std::string>();
    if (out.devtype.empty()) {
        error = where + ".devtype must not be empty";
        return false;
    }
    return true;
}

}  // namespace

bool parseSpeakerAddress(const std::string& address, std::string& host, uint16_t& port) {
    auto colonPos = address.rfind(':');
    if (colonPos == std::string::npos || colonPos == 0 || colonPos + 1 >= address.size()) {
        return false;
    }

    std::string hostPart = address.substr(0, colonPos);
    if (hostPart.front() == '[') {
        if (hostPart.size() < 3 || hostPart.back() != ']') {
            return false;
        }
        hostPart = hostPart.substr(1, hostPart.size() - 2);
    } else if (hostPart.find(':') != std::string::npos) {
        // Bare IPv6 without brackets is ambiguous
        return false;
    }

    const std::string portPart = address.substr(colonPos + 1);
    for (char c : portPart) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    if (portPart.size() > 5) {
        return false;
    }
    long value = std::strtol(portPart.c_str(), nullptr, 10);
    if (value < 1 || value > 65535) {
        return false;
    }

    host = hostPart;
    port = static_cast<uint16_t>(value);
    return true;
}

bool parseMacAddress(const std::string& text, std::vector<uint8_t>& out) {
    std::vector<uint8_t> bytes;
    int high = -1;
    for (char c : text) {
        if (c == ':' || c == '-' || c == ' ') {
            if (high >= 0) {
                return false;  // separator inside a byte
            }
            continue;
        }
        int value = hexValue(c);
        if (value < 0) {
            return false;
        }
        if (high < 0) {
            high = value;
        } else {
            bytes.push_back(static_cast<uint8_t>((high << 4) | value));
            high = -1;
        }
    }
    if (high >= 0 || bytes.empty()) {
        return false;
    }
    out = std::move(bytes);
    return true;
}

std::string formatMacAddress(const std::vector<uint8_t>& mac) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : mac) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

bool parseAppConfig(const std::string& jsonText, AppConfig& outConfig, std::string& error) {
    AppConfig config;

    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        error = std::string("config is not valid JSON: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        error = "config root must be an object";
        return false;
    }

    try {
        if (!j.contains("receiver") || !j["receiver"].is_object()) {
            error = "receiver section is required";
            return false;
        }
        const auto& receiver = j["receiver"];
        if (!receiver.contains("name") || !receiver["name"].is_string() ||
            receiver["name"].get<std::string>().empty()) {
            error = "receiver.name is required (non-empty string)";
            return false;
        }
        config.receiver.name = receiver["name"].get<std::string>();

        if (!j.contains("speakers") || !j["speakers"].is_object()) {
            error = "speakers section is required";
            return false;
        }
        for (const auto& item : j["speakers"].items()) {
            SpeakerConfig speaker;
            if (!parseSpeaker(item.key(), item.value(), speaker, error)) {
                return false;
            }
            config.speakers.push_back(std::move(speaker));
        }

        if (j.contains("bridge")) {
            const auto& bridge = j["bridge"];
            if (!bridge.is_object()) {
                error = "bridge must be an object";
                return false;
            }
            if (!readString(bridge, "controlEndpoint", config.bridge.controlEndpoint, "bridge",
                            error) ||
                !readString(bridge, "eventEndpoint", config.bridge.eventEndpoint, "bridge",
                            error) ||
                !readPositiveInt(bridge, "requestTimeoutMs", config.bridge.requestTimeoutMs,
                                 "bridge", error)) {
                return false;
            }
        }

        if (j.contains("timing")) {
            const auto& timing = j["timing"];
            if (!timing.is_object()) {
                error = "timing must be an object";
                return false;
            }
            if (!readPositiveInt(timing, "pollIntervalSec", config.timing.pollIntervalSec,
                                 "timing", error) ||
                !readPositiveInt(timing, "gracePeriodSec", config.timing.gracePeriodSec, "timing",
                                 error) ||
                !readPositiveInt(timing, "discoveryRetrySec", config.timing.discoveryRetrySec,
                                 "timing", error) ||
                !readPositiveInt(timing, "deviceTimeoutMs", config.timing.deviceTimeoutMs,
                                 "timing", error)) {
                return false;
            }
        }
    } catch (const json::exception& e) {
        error = std::string("config error: ") + e.what();
        return false;
    }

    outConfig = std::move(config);
    return true;
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   std::string& error) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        error = "cannot open config file: " + configPath.string();
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!parseAppConfig(buffer.str(), outConfig, error)) {
        return false;
    }

    LOG_DEBUG("Config: {} loaded (receiver '{}', {} speaker(s))", configPath.string(),
              outConfig.receiver.name, outConfig.speakers.size());
    return true;
}

}  // namespace speaker_remote
