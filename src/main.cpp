#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
#include "nearshare/core/cli.hpp"
#include "nearshare/core/command_registry.hpp"
#include "nearshare/core/config.hpp"
#include "nearshare/core/logger.hpp"
#include "nearshare/core/utils.hpp"
#include "nearshare/network/lan_group_adapter.hpp"
#if NEARSHARE_HAVE_SDBUS
#include "nearshare/network/bluez_radio_adapter.hpp"
#endif
#include "nearshare/session/transfer_coordinator.hpp"
#include "nearshare/storage/content_resolver.hpp"
#include "nearshare/storage/storage_config.hpp"
#include "nearshare/transport/group_transport.hpp"
#include "nearshare/transport/permission_gate.hpp"
#include "nearshare/transport/radio_transport.hpp"

namespace {

using namespace nearshare;

std::shared_ptr<session::TransferCoordinator> build_coordinator(const core::Config& config) {
    auto permissions = std::make_shared<transport::StaticPermissionGate>(
        config.get_bool("permissions.short_range_radio", true),
        config.get_bool("permissions.local_wireless_group", true));
    auto resolver = std::make_shared<storage::LocalContentResolver>();
    storage::StorageConfig storage(core::utils::FileUtils::expand_home(config.get_string("download.directory")));

    network::LanGroupOptions group_options;
    group_options.device_name = config.get_string("device.name", "nearshare");
    group_options.service_port = static_cast<std::uint16_t>(config.get_int("group.port", 47800));
    group_options.discovery.bind_port = static_cast<std::uint16_t>(config.get_int("group.discovery_port", 47801));
    group_options.discovery.target_port = group_options.discovery.bind_port;
    group_options.discovery.target_address = config.get_string("group.discovery_address", "239.255.42.99");
    group_options.discovery.announcement_interval =
        std::chrono::milliseconds(config.get_int64("group.announce_interval_ms", 2000));
    group_options.discovery.peer_timeout = std::chrono::milliseconds(config.get_int64("group.peer_timeout_ms", 10000));

    session::TransportSelector selector;
    selector.add(std::make_shared<transport::GroupTransport>(
        std::make_shared<network::LanGroupAdapter>(group_options),
        transport::TransportOptions::from_config(config, transport::TransportKind::LOCAL_WIRELESS_GROUP),
        permissions, resolver, storage));
#if NEARSHARE_HAVE_SDBUS
    network::BluezOptions radio_options;
    radio_options.adapter = config.get_string("radio.adapter", "hci0");
    radio_options.service_uuid = config.get_string("radio.service_uuid", network::bluez::SERIAL_PORT_UUID);
    radio_options.profile_name = config.get_string("device.name", "NearShare");
    radio_options.io_timeout = std::chrono::milliseconds(config.get_int64("transfer.io_timeout_ms", 0));
    selector.add(std::make_shared<transport::RadioTransport>(
        std::make_shared<network::BluezRadioAdapter>(radio_options),
        transport::TransportOptions::from_config(config, transport::TransportKind::SHORT_RANGE_RADIO),
        permissions, resolver, storage));
#else
    LOG_WARN("Built without sd-bus, short-range radio is unavailable");
#endif

    return std::make_shared<session::TransferCoordinator>(std::move(selector), permissions, resolver);
}

} // namespace

int main(int argc, char* argv[]) {
    nearshare::core::CommandLineParser parser("nearshare");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = nearshare::core::Config::instance();
    config.set_defaults();

    auto config_file = nearshare::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.nearshare.conf"));
    if (nearshare::core::utils::FileUtils::exists(config_file)) {
        config.load_from_file(config_file.string());
    }

    auto log_level = parser.has_option("verbose")
        ? nearshare::core::LogLevel::Debug
        : nearshare::core::Logger::parse_level(config.get_string("log.level", "info"));
    nearshare::core::Logger::initialize(config.get_string("log.file", "nearshare.log"), log_level);

    LOG_INFO("NearShare starting up");

    auto selection = nearshare::transport::parse_selection(parser.get_option("transport", "auto"));
    if (!selection) {
        std::cerr << "Error: unknown transport '" << parser.get_option("transport") << "'\n";
        return 1;
    }

    nearshare::core::CommandContext context;
    context.selection = *selection;
    context.discovery_timeout = std::chrono::seconds(std::max(1, parser.get_int_option("timeout", 10)));
    context.coordinator = build_coordinator(config);
    context.coordinator->start();

    nearshare::core::CommandRegistry command_registry(context);

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        context.coordinator->stop();
        nearshare::core::Logger::shutdown();
        return 0;
    }

    std::string command = args[0];
    auto result = command_registry.execute_command(command, args);

    if (result.success) {
        if (!result.message.empty()) {
            std::cout << result.message << "\n";
        }
    } else {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }

    context.coordinator->stop();
    LOG_INFO("NearShare shutting down");
    nearshare::core::Logger::shutdown();
    return result.exit_code;
}
