#pragma once

#include <optional>
#include <string>

namespace nearshare::network::bluez {

constexpr const char* SERVICE = "org.bluez";
constexpr const char* ADAPTER_INTERFACE = "org.bluez.Adapter1";
constexpr const char* DEVICE_INTERFACE = "org.bluez.Device1";
constexpr const char* PROFILE_MANAGER_INTERFACE = "org.bluez.ProfileManager1";
constexpr const char* PROFILE_INTERFACE = "org.bluez.Profile1";
constexpr const char* PROFILE_MANAGER_PATH = "/org/bluez";

// Serial Port Profile; peers that speak the transfer protocol register it.
constexpr const char* SERIAL_PORT_UUID = "00001101-0000-1000-8000-00805f9b34fb";

// "hci0" -> "/org/bluez/hci0"
std::string adapter_path(const std::string& adapter);

// Upper-case "AA:BB:CC:DD:EE:FF", or nullopt if the text is not a hardware address.
std::optional<std::string> normalize_address(const std::string& address);

// "/org/bluez/hci0" + "aa:bb:cc:dd:ee:ff" -> "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
std::optional<std::string> device_path(const std::string& adapter_path, const std::string& address);

// Inverse of device_path(); accepts only direct children of an adapter.
std::optional<std::string> address_from_device_path(const std::string& path);

bool belongs_to_adapter(const std::string& adapter_path, const std::string& device_path);

} // namespace nearshare::network::bluez
