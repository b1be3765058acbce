#include "moiplink/common/Errors.h"
#include "moiplink/controller/MatrixController.h"
#include "moiplink/controller/SettingsLoader.h"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using moiplink::ConnectionState;
using moiplink::DeviceKind;
using moiplink::controller::MatrixController;
using moiplink::controller::Plane;

std::atomic_bool g_shouldStop{false};

void handleSignal(int) {
    g_shouldStop.store(true);
}

struct CliOptions {
    std::string configPath{"moiplink.yaml"};
    bool debug{false};
    long long waitMs{15000};
    int tx{0};
    int rx{0};
    int index{0};
    std::string kind;
    std::string name;
    std::string value;
    std::string outPath;
    std::string cecAction;
    std::string rawCommand;
    std::size_t rawLines{0};
};

void requireReady(MatrixController& controller, Plane plane, std::chrono::milliseconds wait) {
    if (!controller.waitUntilReady(plane, wait)) {
        throw moiplink::NetworkError(std::string(moiplink::controller::toString(plane)) +
                                     " plane did not become ready within " + std::to_string(wait.count()) + " ms");
    }
}

void printDevices(const MatrixController& controller) {
    const auto snapshot = controller.snapshot();
    if (snapshot->stale) {
        std::cout << "(state is stale: line plane not resynchronised)\n";
    }
    std::cout << std::left << std::setw(4) << "Kind" << std::setw(7) << "Index" << std::setw(32) << "Name"
              << std::setw(11) << "Subtype" << std::setw(9) << "Online" << "Source\n";
    for (const auto& device : controller.devices()) {
        std::string source = "-";
        if (device.kind == DeviceKind::Receiver) {
            auto route = snapshot->routing.find(device.index);
            source = route != snapshot->routing.end() && route->second.assigned()
                         ? "tx " + std::to_string(route->second.tx)
                         : "unassigned";
        }
        std::cout << std::left << std::setw(4) << (device.kind == DeviceKind::Transmitter ? "tx" : "rx")
                  << std::setw(7) << device.index << std::setw(32) << device.name << std::setw(11)
                  << moiplink::controller::toString(device.subtype) << std::setw(9) << (device.online ? "yes" : "no")
                  << source << '\n';
    }
}

void printRouting(const MatrixController& controller) {
    for (const auto& [rx, route] : controller.routing()) {
        std::cout << "rx " << rx << " <- ";
        if (route.assigned()) {
            std::cout << "tx " << route.tx;
        } else {
            std::cout << "unassigned";
        }
        std::cout << " (" << moiplink::controller::toString(route.origin) << ")\n";
    }
}

int watch(MatrixController& controller) {
    auto subscription = controller.subscribe([](const moiplink::controller::Event& event,
                                                const moiplink::controller::State& state) {
        if (const auto* changed = std::get_if<moiplink::controller::ConnectionChanged>(&event)) {
            std::cout << "[" << state.version << "] " << moiplink::controller::toString(changed->plane) << " is "
                      << moiplink::toString(changed->state) << std::endl;
            return;
        }
        std::cout << "[" << state.version << "] " << moiplink::controller::eventName(event) << std::endl;
    });
    while (!g_shouldStop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    spdlog::info("Stopping");
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"Binary MoIP controller link"};
    CliOptions options;

    app.add_option("-c,--config", options.configPath, "YAML configuration file");
    app.add_flag("--debug", options.debug, "Enable verbose debug logging");
    app.add_option("--wait-ms", options.waitMs, "How long to wait for the controller to become ready");
    app.require_subcommand(1);

    auto* devicesCmd = app.add_subcommand("devices", "List transmitters and receivers");
    auto* routingCmd = app.add_subcommand("routing", "Show the current routing table");

    auto* switchCmd = app.add_subcommand("switch", "Route a transmitter to a receiver");
    switchCmd->add_option("tx", options.tx, "Transmitter index")->required();
    switchCmd->add_option("rx", options.rx, "Receiver index")->required();

    auto* unassignCmd = app.add_subcommand("unassign", "Remove the source of a receiver");
    unassignCmd->add_option("rx", options.rx, "Receiver index")->required();

    auto* renameCmd = app.add_subcommand("rename", "Rename a transmitter or receiver");
    renameCmd->add_option("kind", options.kind, "tx or rx")->required();
    renameCmd->add_option("index", options.index, "Device index")->required();
    renameCmd->add_option("name", options.name, "New name")->required();

    auto* resolutionCmd = app.add_subcommand("resolution", "Set a receiver output resolution");
    resolutionCmd->add_option("rx", options.rx, "Receiver index")->required();
    resolutionCmd->add_option("value", options.value, "e.g. passthrough, fhd1080p60")->required();

    auto* hdcpCmd = app.add_subcommand("hdcp", "Set a receiver HDCP mode");
    hdcpCmd->add_option("rx", options.rx, "Receiver index")->required();
    hdcpCmd->add_option("value", options.value, "passthrough, hdcp14 or hdcp22")->required();

    auto* previewCmd = app.add_subcommand("preview", "Save a transmitter preview image");
    previewCmd->add_option("tx", options.tx, "Transmitter index")->required();
    previewCmd->add_option("--out", options.outPath, "Output JPEG path")->required();

    auto* cecCmd = app.add_subcommand("cec", "Send a CEC command through a receiver");
    cecCmd->add_option("rx", options.rx, "Receiver index")->required();
    cecCmd->add_option("action", options.cecAction, "on, standby, volume_up, volume_down or mute")->required();

    auto* rawCmd = app.add_subcommand("raw", "Send a raw line-protocol command");
    rawCmd->add_option("command", options.rawCommand, "Command such as ?Receivers")->required();
    rawCmd->add_option("--lines", options.rawLines, "Reply lines to collect for a query");

    auto* watchCmd = app.add_subcommand("watch", "Print state changes until interrupted");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    try {
        const auto settings = moiplink::controller::loadSettings(options.configPath);
        if (options.debug) {
            spdlog::set_level(spdlog::level::debug);
            spdlog::debug("Debug logging enabled");
        } else {
            spdlog::set_level(spdlog::level::from_str(settings.logLevel));
        }

        MatrixController controller(settings);
        controller.start();
        const std::chrono::milliseconds wait(options.waitMs);

        if (*watchCmd) {
            return watch(controller);
        }

        const bool needsRest = *renameCmd || *resolutionCmd || *hdcpCmd || *previewCmd || *devicesCmd;
        requireReady(controller, Plane::Line, wait);
        if (needsRest) {
            if (*devicesCmd) {
                if (!controller.waitUntilReady(Plane::Rest, wait)) {
                    spdlog::warn("Management plane unavailable; names and status come from the line plane only");
                }
            } else {
                requireReady(controller, Plane::Rest, wait);
            }
        }

        if (*devicesCmd) {
            printDevices(controller);
        } else if (*routingCmd) {
            printRouting(controller);
        } else if (*switchCmd) {
            controller.switchRoute(options.tx, options.rx);
            std::cout << "OK\n";
        } else if (*unassignCmd) {
            controller.unassign(options.rx);
            std::cout << "OK\n";
        } else if (*renameCmd) {
            controller.rename(moiplink::parseDeviceKind(options.kind), options.index, options.name);
            std::cout << "OK\n";
        } else if (*resolutionCmd) {
            std::cout << controller.setResolution(options.rx, options.value).dump(2) << '\n';
        } else if (*hdcpCmd) {
            std::cout << controller.setHdcp(options.rx, options.value).dump(2) << '\n';
        } else if (*previewCmd) {
            const auto image = controller.previewImage(options.tx);
            std::ofstream out(options.outPath, std::ios::binary);
            if (!out) {
                throw std::runtime_error("Cannot open " + options.outPath + " for writing");
            }
            out.write(image.data(), static_cast<std::streamsize>(image.size()));
            std::cout << "Wrote " << image.size() << " bytes to " << options.outPath << '\n';
        } else if (*cecCmd) {
            controller.sendCec(options.rx, moiplink::controller::parseCecAction(options.cecAction));
            std::cout << "OK\n";
        } else if (*rawCmd) {
            const auto frames = controller.sendRaw(options.rawCommand, options.rawLines);
            if (frames.empty()) {
                std::cout << "OK\n";
            }
            for (const auto& frame : frames) {
                std::cout << frame.text << '\n';
            }
        }
        controller.stop();
    } catch (const moiplink::CommandRejected& ex) {
        spdlog::error("Rejected by the controller: {}", ex.detail());
        return 1;
    } catch (const std::exception& ex) {
        spdlog::error("{}", ex.what());
        return 1;
    }
    return 0;
}
