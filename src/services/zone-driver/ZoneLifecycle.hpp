#pragma once

#include "CancellationToken.hpp"
#include "DriverConfig.hpp"
#include "PortSelector.hpp"
#include "RemoteChannel.hpp"
#include "RunState.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

class KeyPairProvisioner;
class ZoneError;

constexpr int kZoneSshPort = 22;

struct DestroyStepFailure {
    std::string step;
    std::string command;
    int exitStatus = -1;
    std::string detail;
};

struct DestroyReport {
    std::vector<DestroyStepFailure> failures;

    bool Clean() const { return failures.empty(); }
};

// Drives a zone from nothing to reachable and back on the global zone.
class ZoneLifecycle {
public:
    using NameGenerator = std::function<std::string(const std::string& instanceName)>;
    // Called after every change to the run state. May throw
    // StatePersistenceError; during Create that aborts the run and tears down
    // what was recorded, during Destroy it is only logged.
    using StateListener = std::function<void(const RunState&)>;

    ZoneLifecycle(
        const DriverConfig& config,
        RemoteChannel& channel,
        KeyPairProvisioner& keys,
        CancellationToken* cancel = nullptr,
        NameGenerator names = NameGenerator(),
        PortSelector::RandomPort randomPort = PortSelector::RandomPort());

    void SetStateListener(StateListener listener);

    // Fills `state` step by step; on failure it holds exactly what Destroy
    // needs to unwind. A cancelled create, or one whose state could not be
    // persisted, is destroyed before rethrowing.
    void Create(RunState& state);

    // Best effort and idempotent. Never throws for remote failures.
    DestroyReport Destroy(RunState& state);

    // Polls until the zone reports a DHCP address or the bounds run out.
    std::string WaitForAddress(const std::string& zoneName);

    static std::optional<std::string> ParseDhcpAddress(const std::string& showAddrOutput);
    static std::string BuildRedirectRule(int port, const std::string& zoneIp);

    static RemoteCommand BuildTempRootCommand(const std::string& tempRoot);
    static RemoteCommand BuildTempDirCommand(const std::string& tempRoot);
    static RemoteCommand BuildRemoveDirCommand(const std::string& dir);
    static RemoteCommand BuildConfigureCommand(const std::string& zoneName, const std::string& configPath);
    static RemoteCommand BuildCloneCommand(const std::string& zoneName, const std::string& profilePath,
        const std::string& templateZone);
    static RemoteCommand BuildBootCommand(const std::string& zoneName);
    static RemoteCommand BuildHaltCommand(const std::string& zoneName);
    static RemoteCommand BuildUninstallCommand(const std::string& zoneName);
    static RemoteCommand BuildDeleteCommand(const std::string& zoneName);
    static RemoteCommand BuildShowAddressCommand(const std::string& zoneName);
    static RemoteCommand BuildNatInstallCommand(int port, const std::string& zoneIp);
    static RemoteCommand BuildNatRemoveCommand(int port, const std::string& zoneIp);

private:
    struct LocalArtifacts {
        std::string configPath;
        std::string profilePath;
    };

    void CreateSteps(RunState& state);
    void TearDownAfter(const ZoneError& cause, RunState& state);
    LocalArtifacts WriteArtifacts(const std::string& zoneName);
    void RemoveLocalArtifacts(const LocalArtifacts& artifacts) const;
    std::string MakeRemoteWorkDir();
    void InstallZone(RunState& state, const std::string& workDir, const LocalArtifacts& artifacts);
    void CleanupRemoteWorkDir(const std::string& workDir);
    void SetupNetworking(RunState& state);

    CommandResult RunStep(const char* step, const RemoteCommand& command);
    bool RunBestEffort(const char* step, const RemoteCommand& command, DestroyReport& report);
    void Advance(RunState& state, ZonePhase phase);
    void Notify(const RunState& state);
    void RecordTeardown(RunState& state, ZonePhase phase);

    const DriverConfig& config_;
    RemoteChannel& channel_;
    KeyPairProvisioner& keys_;
    CancellationToken neverCancelled_;
    CancellationToken* cancel_;
    NameGenerator names_;
    PortSelector ports_;
    StateListener listener_;
};
