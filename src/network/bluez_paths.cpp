#include "nearshare/network/bluez_paths.hpp"
#include "nearshare/core/utils.hpp"
#include <algorithm>
#include <cctype>

namespace nearshare::network::bluez {

using core::utils::StringUtils;

namespace {
    constexpr const char* DEVICE_PREFIX = "dev_";
    constexpr std::size_t ADDRESS_LENGTH = 17;

    // Six hex octets joined by the given separator.
    bool is_address(const std::string& text, char separator) {
        if (text.size() != ADDRESS_LENGTH) {
            return false;
        }
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (i % 3 == 2) {
                if (text[i] != separator) {
                    return false;
                }
            } else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
                return false;
            }
        }
        return true;
    }

    std::string to_upper(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    }
}

std::string adapter_path(const std::string& adapter) {
    return std::string(PROFILE_MANAGER_PATH) + "/" + adapter;
}

std::optional<std::string> normalize_address(const std::string& address) {
    auto trimmed = StringUtils::trim(address);
    if (!is_address(trimmed, ':')) {
        return std::nullopt;
    }
    return to_upper(trimmed);
}

std::optional<std::string> device_path(const std::string& adapter_path, const std::string& address) {
    auto normalized = normalize_address(address);
    if (!normalized) {
        return std::nullopt;
    }
    std::replace(normalized->begin(), normalized->end(), ':', '_');
    return adapter_path + "/" + DEVICE_PREFIX + *normalized;
}

std::optional<std::string> address_from_device_path(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos || slash == 0) {
        return std::nullopt;
    }
    auto leaf = path.substr(slash + 1);
    if (!StringUtils::starts_with(leaf, DEVICE_PREFIX)) {
        return std::nullopt;
    }
    auto encoded = leaf.substr(std::char_traits<char>::length(DEVICE_PREFIX));
    if (!is_address(encoded, '_')) {
        return std::nullopt;
    }
    std::replace(encoded.begin(), encoded.end(), '_', ':');
    return to_upper(encoded);
}

bool belongs_to_adapter(const std::string& adapter_path, const std::string& device_path) {
    auto slash = device_path.rfind('/');
    return slash != std::string::npos && device_path.compare(0, slash, adapter_path) == 0 &&
           slash == adapter_path.size() && address_from_device_path(device_path).has_value();
}

} // namespace nearshare::network::bluez
