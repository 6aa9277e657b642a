#include <unistd.h>

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "typing_coach/aggregation_worker.hpp"
#include "typing_coach/clock.hpp"
#include "typing_coach/config_loader.hpp"
#include "typing_coach/device_set.hpp"
#include "typing_coach/errors.hpp"
#include "typing_coach/key_listener.hpp"
#include "typing_coach/key_map.hpp"
#include "typing_coach/log.hpp"
#include "typing_coach/logging_gateway.hpp"
#include "typing_coach/operator_console.hpp"
#include "typing_coach/privacy_filter.hpp"
#include "typing_coach/typing_engine.hpp"

using tc::core::AggregationWorker;
using tc::core::ConfigError;
using tc::core::ConfigLoader;
using tc::core::EngineConfig;
using tc::core::EventQueue;
using tc::core::IgnoredWordSet;
using tc::core::KeyListener;
using tc::core::KeyMap;
using tc::core::LayoutSource;
using tc::core::Logger;
using tc::core::LoggingGateway;
using tc::core::NoDevicesAvailable;
using tc::core::OperatorConsole;
using tc::core::PasswordContext;
using tc::core::PrivacyFilter;
using tc::core::SnapshotBoard;
using tc::core::SteadyClock;
using tc::core::TypingEngine;
using tc::core::VisibilityFlag;
using tc::core::WordHasher;

namespace {

std::atomic<bool> g_stop{false};

void onSignal(int) {
    g_stop.store(true);
}

void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a stdin read in progress must return so the console can exit.
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::string config_path = "configs/example.toml";
        if (argc > 1) {
            config_path = argv[1];
        }

        ConfigLoader loader;
        EngineConfig config = loader.loadFromFile(config_path);
        Logger::instance().setLevel(config.log_level);
        if (config.words.dictionary) {
            tc::core::logInfo("Main", "Word list holds ", config.words.dictionary->size(), " words");
        }

        KeyMap key_map;
        for (const auto& [id, table] : config.layout.extra_layouts) {
            key_map.addLayout(id, table);
        }
        if (!key_map.hasLayout(config.layout.default_layout)) {
            throw ConfigError("unknown default layout " + config.layout.default_layout);
        }

        auto hasher = std::make_shared<const WordHasher>(WordHasher::keyFromHex(config.privacy.pepper_hex),
                                                         WordHasher::keyFromHex(config.privacy.user_key_hex));
        auto ignored = std::make_shared<IgnoredWordSet>(config.privacy.ignored_hashes);

        auto devices = tc::core::discoverKeyboards(config.listener.device_paths);
        if (devices.empty()) {
            throw NoDevicesAvailable();
        }

        installSignalHandlers();

        VisibilityFlag visibility;
        PasswordContext password_context;
        LayoutSource layout(config.layout.default_layout);
        LoggingGateway gateway(config.words.store_hashes);
        TypingEngine engine(config, key_map, PrivacyFilter(hasher, ignored, config.words.store_hashes),
                            gateway, layout);

        EventQueue queue(config.listener.queue_capacity);
        SteadyClock clock;
        SnapshotBoard board;
        AggregationWorker worker(engine, queue, clock, board, config.listener.flush_interval);
        KeyListener listener(std::move(devices), queue, visibility, password_context,
                             config.listener.visible_timeout);

        worker.start();
        listener.start();

        OperatorConsole console(board, visibility, password_context, layout, key_map, *ignored, *hasher,
                                listener);
        console.run(STDIN_FILENO, std::cin, std::cout, g_stop);

        listener.stop();
        queue.close();
        worker.join();

        if (listener.state() == KeyListener::State::NoDevices) {
            throw NoDevicesAvailable();
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
