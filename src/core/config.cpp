#include "nearshare/core/config.hpp"
#include "nearshare/core/utils.hpp"
#include <algorithm>
#include <cctype>

namespace nearshare::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# NearShare Configuration\n\n";

    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::int64_t Config::get_int64(const std::string& key, std::int64_t default_value) const {
    auto value = get_as<std::int64_t>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["device.name"] = utils::SystemUtils::host_name("nearshare");
    values_["log.level"] = "info";
    values_["log.file"] = "nearshare.log";
    values_["download.directory"] = (utils::FileUtils::get_home_dir() / "Downloads").string();
    values_["transfer.io_timeout_ms"] = "0";

    values_["radio.chunk_size"] = "1024";
    values_["radio.progress_interval_ms"] = "200";
    values_["radio.accept_timeout_ms"] = "30000";
    values_["radio.connect_timeout_ms"] = "20000";
    values_["radio.adapter"] = "hci0";
    values_["radio.service_uuid"] = "00001101-0000-1000-8000-00805f9b34fb";

    values_["group.chunk_size"] = "65536";
    values_["group.progress_interval_ms"] = "100";
    values_["group.accept_timeout_ms"] = "30000";
    values_["group.connect_timeout_ms"] = "15000";
    values_["group.port"] = "47800";
    values_["group.discovery_port"] = "47801";
    values_["group.discovery_address"] = "239.255.42.99";
    values_["group.announce_interval_ms"] = "2000";
    values_["group.peer_timeout_ms"] = "10000";

    values_["permissions.short_range_radio"] = "true";
    values_["permissions.local_wireless_group"] = "true";
}

std::string Config::trim(const std::string& str) const {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == str.end()) {
        return {};
    }

    auto end = str.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

} // namespace nearshare::core
