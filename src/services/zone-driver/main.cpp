#include "CancellationToken.hpp"
#include "ConfigResolver.hpp"
#include "KeyPairProvisioner.hpp"
#include "SshChannel.hpp"
#include "StateStore.hpp"
#include "Tracing.hpp"
#include "ZoneErrors.hpp"
#include "ZoneLifecycle.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

namespace {
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }
    return ParseBoolValue(value).value_or(defaultValue);
}

int Usage() {
    std::cerr << "usage: zone-driver <create|destroy|show> <instance> [--config FILE]" << std::endl;
    return kExitUsage;
}

// SIGINT/SIGTERM are blocked in every thread and consumed here, so the run
// unwinds through normal code paths instead of a signal handler.
class SignalWatcher {
public:
    explicit SignalWatcher(CancellationToken& token)
        : token_(token) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
        worker_ = std::thread(&SignalWatcher::Run, this);
    }

    ~SignalWatcher() {
        stopping_ = true;
        pthread_kill(worker_.native_handle(), SIGUSR1);
        worker_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void Run() {
        while (true) {
            int signal = 0;
            if (sigwait(&signals_, &signal) != 0) {
                continue;
            }
            if (stopping_) {
                return;
            }
            if (signal == SIGINT || signal == SIGTERM) {
                std::cerr << "[Driver] Received signal " << signal << ", cancelling" << std::endl;
                token_.Cancel();
            }
        }
    }

    CancellationToken& token_;
    sigset_t signals_;
    std::atomic<bool> stopping_{false};
    std::thread worker_;
};

SshSettings BuildSshSettings(const DriverConfig& config) {
    SshSettings settings;
    settings.host = config.globalZoneHost;
    settings.user = config.globalZoneUsername;
    settings.port = config.globalZonePort;
    settings.controlDir = config.sshControlDir;
    settings.commandTimeout = config.commandTimeout;
    return settings;
}

void PrintState(const RunState& state) {
    std::cout << StateStore::Serialize(state);
}

int RunCreate(ZoneLifecycle& lifecycle, RunState& state) {
    try {
        lifecycle.Create(state);
    } catch (const NetworkTimeoutError& ex) {
        std::cerr << "[Driver] Zone never became reachable: " << ex.what() << std::endl;
        return kExitFailure;
    } catch (const ZoneError& ex) {
        std::cerr << "[Driver] Create failed: " << ex.what() << std::endl;
        if (state.HasZone()) {
            std::cerr << "[Driver] Partial zone " << state.zoneName << " recorded; run destroy to remove it" << std::endl;
        }
        return kExitFailure;
    } catch (const std::exception& ex) {
        std::cerr << "[Driver] Create aborted: " << ex.what() << std::endl;
        return kExitFailure;
    }

    PrintState(state);
    return 0;
}

int RunDestroy(ZoneLifecycle& lifecycle, RunState& state) {
    const DestroyReport report = lifecycle.Destroy(state);
    for (const auto& failure : report.failures) {
        std::cerr << "[Driver] " << failure.step << " step reported: " << failure.detail << std::endl;
    }
    if (!report.Clean()) {
        std::cerr << "[Driver] Teardown finished with " << report.failures.size()
                  << " unsuccessful step(s); the global zone may need inspection" << std::endl;
    }
    return 0;
}
} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.size() < 2) {
        return Usage();
    }

    const std::string action = args[0];
    const std::string instance = args[1];
    std::string configFile;
    for (size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            configFile = args[++i];
        } else {
            return Usage();
        }
    }
    if (action != "create" && action != "destroy" && action != "show") {
        return Usage();
    }

    std::signal(SIGPIPE, SIG_IGN);

    // Threads started from here on, the exporter's included, inherit the
    // blocked SIGINT/SIGTERM mask.
    CancellationToken cancel;
    SignalWatcher watcher(cancel);

    TraceConfig traceConfig;
    traceConfig.enabled = GetEnvBool("ZONE_DRIVER_OTEL_ENABLED", false);
    traceConfig.endpoint = GetEnvOrDefault("ZONE_DRIVER_OTEL_ENDPOINT", "");
    traceConfig.serviceName = GetEnvOrDefault("ZONE_DRIVER_OTEL_SERVICE_NAME", "zone-driver");
    Tracer::Instance().Configure(traceConfig);

    DriverConfig config;
    try {
        config = ConfigResolver().Resolve(instance, configFile);
    } catch (const ConfigError& ex) {
        std::cerr << "[Driver] " << ex.what() << std::endl;
        return kExitUsage;
    }

    StateStore store(config.stateDir);
    RunState state;
    try {
        state = store.Load(instance);
    } catch (const ZoneError& ex) {
        std::cerr << "[Driver] " << ex.what() << std::endl;
        return kExitFailure;
    }

    if (action == "show") {
        PrintState(state);
        return 0;
    }

    SshChannel channel(BuildSshSettings(config));
    KeyPairProvisioner keys(config.sshPublicKey, config.sshPrivateKey,
        config.kitchenUserName + "@" + instance);
    ZoneLifecycle lifecycle(config, channel, keys, &cancel);
    lifecycle.SetStateListener([&store, &instance](const RunState& current) {
        store.Save(instance, current);
    });

    const int exitCode = action == "create" ? RunCreate(lifecycle, state) : RunDestroy(lifecycle, state);

    channel.Close();
    Tracer::Instance().Shutdown();
    return exitCode;
}
