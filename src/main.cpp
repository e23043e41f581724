#include "voice_replacer/app/app_options.h"
#include "voice_replacer/app/graceful_shutdown.h"
#include "voice_replacer/control/control_plane.h"
#include "voice_replacer/core/config_loader.h"
#include "voice_replacer/logging/logger.h"
#include "voice_replacer/pipeline/pipeline_controller.h"
#include "voice_replacer/ui/presenter.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace voice_replacer;

namespace {

constexpr auto kMainLoopInterval = std::chrono::milliseconds(100);

void printDevices(const pipeline::PipelineController& controller) {
    auto printList = [](const char* title, const std::vector<audio::DeviceInfo>& devices) {
        std::cout << title << ":" << '\n';
        if (devices.empty()) {
            std::cout << "  (none)" << '\n';
        }
        for (const auto& device : devices) {
            std::cout << "  [" << device.index << "] " << device.name << " (" << device.pcmName
                      << ")";
            if (device.isDefault) {
                std::cout << " [default]";
            }
            if (device.isVirtualCable) {
                std::cout << " [virtual cable]";
            }
            std::cout << '\n';
        }
    };

    printList("Input devices", controller.listInputDevices());
    printList("Output devices", controller.listOutputDevices());

    if (auto cable = controller.findVirtualCable()) {
        std::cout << "Virtual cable: [" << cable->index << "] " << cable->name << '\n';
    } else {
        std::cout << "No virtual cable found. Install VB-Audio Virtual Cable (or load snd-aloop)"
                  << '\n';
    }
}

void printVoices(const pipeline::PipelineController& controller) {
    std::cout << "Voices:" << '\n';
    for (const auto& entry : controller.listVoices()) {
        const auto& voice = entry.second;
        std::cout << "  " << voice.id << " - " << voice.description
                  << (voice.installed ? "" : " (not installed)") << '\n';
    }
}

void logStatsSummary(const pipeline::PipelineStatsSnapshot& stats) {
    LOG_INFO("[Main] Frames: {} captured, {} dropped", stats.framesCaptured, stats.framesDropped);
    LOG_INFO("[Main] Utterances: {} ({} abandoned, {} dropped, {} empty)", stats.utterances,
             stats.utterancesAbandoned, stats.utterancesDropped, stats.emptyRecognitions);
    LOG_INFO("[Main] Responses: {} spoken, {} interrupted; last latency {:.0f} ms",
             stats.responsesSpoken, stats.responsesInterrupted, stats.lastLatencyMs);
    LOG_INFO("[Main] Failures: recognition {}, synthesis {}, playback {}",
             stats.recognitionFailures, stats.synthesisFailures, stats.playbackFailures);
}

}  // namespace

int main(int argc, char* argv[]) {
    // stderr-only logging until the configuration is known
    logging::initializeEarly();

    app::AppOptions options;
    std::string error;
    if (!app::applyEnvOverrides(options, error)) {
        std::cerr << error << '\n';
        return 1;
    }
    bool showHelp = false;
    if (!app::parseArgs(argc, argv, options, showHelp, error)) {
        if (showHelp) {
            app::printHelp(argv[0]);
            return 0;
        }
        std::cerr << error << '\n';
        app::printHelp(argv[0]);
        return 1;
    }

    logging::initializeFromConfig(options.configPath,
                                  options.logLevel ? &*options.logLevel : nullptr);

    AppConfig config;
    if (!loadAppConfig(options.configPath, config)) {
        LOG_INFO("[Main] Using default configuration");
    }
    app::applyToConfig(options, config);

    pipeline::PipelineController controller(config, pipeline::createDefaultComponents(config));

    if (options.listDevices || options.listVoices) {
        if (options.listDevices) {
            printDevices(controller);
        }
        if (options.listVoices) {
            printVoices(controller);
        }
        logging::shutdown();
        return 0;
    }

    LOG_INFO("========================================");
    LOG_INFO("  Voice Replacer");
    LOG_INFO("========================================");

    app::installSignalHandlers();
    auto& signalState = app::getGlobalSignalState();
    signalState.reset();

    app::ShutdownController shutdown;
    shutdown.setSignalState(&signalState);
    shutdown.setLogCallback([](const std::string& message) { LOG_INFO("[Main] {}", message); });

    const bool initialized =
        controller.initialize([](const std::string& component, float fraction) {
            LOG_INFO("[Main] Loading {}: {:.0f}%", component, fraction * 100.0f);
        });
    if (!initialized) {
        LOG_ERROR("[Main] Initialization failed: {}", controller.status().lastError);
        logging::shutdown();
        return 1;
    }
    if (shutdown.processPendingSignals()) {
        LOG_INFO("[Main] Startup interrupted by signal");
        logging::shutdown();
        return 0;
    }

    auto presenters = std::make_shared<ui::CompositePresenter>();
    if (!config.control.headless) {
        presenters->add(std::make_shared<ui::ConsolePresenter>(std::cout));
    }

    std::unique_ptr<control::ControlPlane> controlPlane;
    if (config.control.enabled) {
        controlPlane = std::make_unique<control::ControlPlane>(controller, config.control.endpoint,
                                                               config.control.pubEndpoint);
        if (controlPlane->start()) {
            presenters->add(std::make_shared<control::ZmqPresenter>(controlPlane->server()));
        } else {
            LOG_WARN("[Main] ZeroMQ control unavailable on {}", config.control.endpoint);
            controlPlane.reset();
        }
    }
    if (config.control.headless && !controlPlane) {
        LOG_ERROR("[Main] Headless mode needs the ZeroMQ control API");
        logging::shutdown();
        return 1;
    }
    controller.attachPresenter(presenters);

    if (!controller.start()) {
        LOG_ERROR("[Main] Pipeline failed to start: {}", controller.status().lastError);
        if (!controlPlane) {
            logging::shutdown();
            return 1;
        }
        LOG_INFO("[Main] Waiting for START over ZeroMQ");
    } else if (!config.control.headless) {
        std::cout << "Listening. Speak into the microphone; press Ctrl+C to quit." << std::endl;
    }

    shutdown.setStopCallback([&controller] { controller.stop(); });
    while (shutdown.isRunning()) {
        if (shutdown.processPendingSignals()) {
            break;
        }
        std::this_thread::sleep_for(kMainLoopInterval);
    }

    if (controlPlane) {
        controlPlane->stop();
    }
    controller.stop();

    if (saveAppConfig(options.configPath, controller.currentConfig())) {
        LOG_INFO("[Main] Settings saved to {}", options.configPath);
    }
    logStatsSummary(controller.stats());

    LOG_INFO("[Main] Goodbye");
    logging::shutdown();
    return 0;
}
