#include "ZoneLifecycle.hpp"

#include "ArtifactRenderer.hpp"
#include "KeyPairProvisioner.hpp"
#include "Tracing.hpp"
#include "ZoneErrors.hpp"
#include "ZoneName.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <system_error>
#include <utility>

namespace {
constexpr const char* kZonecfg = "/usr/sbin/zonecfg";
constexpr const char* kZoneadm = "/usr/sbin/zoneadm";
constexpr const char* kZlogin = "/usr/sbin/zlogin";
constexpr const char* kIpnat = "/usr/sbin/ipnat";
constexpr const char* kTempDirName = "kitchen_tmp";

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

void WriteArtifact(const std::filesystem::path& path, const std::string& content) {
    {
        std::ofstream output(path, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw ArtifactError("Unable to write " + path.string());
        }
        output.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!output.good()) {
            throw ArtifactError("Unable to write " + path.string());
        }
    }

    std::error_code error;
    std::filesystem::permissions(path,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, error);
    if (error) {
        throw ArtifactError("Unable to restrict " + path.string() + ": " + error.message());
    }
}
} // namespace

ZoneLifecycle::ZoneLifecycle(
    const DriverConfig& config,
    RemoteChannel& channel,
    KeyPairProvisioner& keys,
    CancellationToken* cancel,
    NameGenerator names,
    PortSelector::RandomPort randomPort)
    : config_(config),
      channel_(channel),
      keys_(keys),
      cancel_(cancel ? cancel : &neverCancelled_),
      names_(names ? std::move(names) : NameGenerator(GenerateZoneName)),
      ports_(channel, std::move(randomPort)) {}

void ZoneLifecycle::SetStateListener(StateListener listener) {
    listener_ = std::move(listener);
}

void ZoneLifecycle::Create(RunState& state) {
    if (state.HasZone()) {
        throw ZoneError("Instance " + config_.instanceName + " already owns zone " + state.zoneName
            + "; destroy it first");
    }

    ScopedSpan span("zone.create");
    span.Set("zone.instance", config_.instanceName);
    try {
        CreateSteps(state);
    } catch (const OperationCancelled& ex) {
        TearDownAfter(ex, state);
        throw;
    } catch (const StatePersistenceError& ex) {
        TearDownAfter(ex, state);
        throw;
    }

    span.Set("zone.name", state.zoneName);
    span.Set("zone.port", static_cast<int64_t>(state.zonePort));
    span.End(true);
}

void ZoneLifecycle::TearDownAfter(const ZoneError& cause, RunState& state) {
    std::cerr << "[Zone] " << cause.what() << "; tearing down zone "
              << (state.HasZone() ? state.zoneName : std::string("(none)")) << std::endl;
    const DestroyReport report = Destroy(state);
    if (!report.Clean()) {
        std::cerr << "[Zone] Teardown after aborted create left " << report.failures.size()
                  << " failed step(s)" << std::endl;
    }
}

void ZoneLifecycle::CreateSteps(RunState& state) {
    keys_.Ensure();
    Advance(state, ZonePhase::KEYS_READY);
    cancel_->ThrowIfCancelled("key provisioning");

    state.zoneName = config_.zoneName.empty() ? names_(config_.instanceName) : config_.zoneName;
    if (!IsValidZoneName(state.zoneName)) {
        const std::string invalid = state.zoneName;
        state.zoneName.clear();
        throw ZoneError("Generated zone name is invalid: " + invalid);
    }
    Notify(state);
    std::cout << "[Zone] Creating zone " << state.zoneName << " from template " << config_.zoneTemplate << std::endl;

    const LocalArtifacts artifacts = WriteArtifacts(state.zoneName);
    const std::string workDir = MakeRemoteWorkDir();
    try {
        InstallZone(state, workDir, artifacts);
    } catch (...) {
        CleanupRemoteWorkDir(workDir);
        RemoveLocalArtifacts(artifacts);
        throw;
    }
    CleanupRemoteWorkDir(workDir);
    RemoveLocalArtifacts(artifacts);

    SetupNetworking(state);

    state.hostname = config_.transportHost;
    state.port = state.zonePort;
    state.username = config_.kitchenUserName;
    Notify(state);
    std::cout << "[Zone] Zone " << state.zoneName << " reachable at " << state.hostname << ":" << state.port
              << " as " << state.username << std::endl;
}

ZoneLifecycle::LocalArtifacts ZoneLifecycle::WriteArtifacts(const std::string& zoneName) {
    ZoneConfigParams zoneParams;
    zoneParams.zonePath = config_.zonePathRoot + zoneName;
    zoneParams.zoneLowerLink = config_.zoneLowerLink;
    zoneParams.zoneComment = config_.zoneComment;

    ProfileParams profileParams;
    profileParams.zoneName = zoneName;
    profileParams.kitchenUserName = config_.kitchenUserName;
    profileParams.sshPublicKey = keys_.ReadPublicKey();

    const std::string zoneConfig = ArtifactRenderer::RenderZoneConfig(zoneParams);
    const std::string profile = ArtifactRenderer::RenderProfile(profileParams);

    const std::filesystem::path dir(config_.artifactDir);
    std::error_code error;
    std::filesystem::create_directories(dir, error);
    if (error) {
        throw ArtifactError("Unable to create artifact directory " + dir.string() + ": " + error.message());
    }

    LocalArtifacts artifacts;
    artifacts.configPath = (dir / (zoneName + ".cfg")).string();
    artifacts.profilePath = (dir / (zoneName + "_profile.xml")).string();
    WriteArtifact(artifacts.configPath, zoneConfig);
    WriteArtifact(artifacts.profilePath, profile);
    return artifacts;
}

void ZoneLifecycle::RemoveLocalArtifacts(const LocalArtifacts& artifacts) const {
    if (config_.keepConfig) {
        return;
    }

    for (const auto& path : {artifacts.configPath, artifacts.profilePath}) {
        std::error_code error;
        std::filesystem::remove(path, error);
        if (error) {
            std::cerr << "[Zone] Unable to remove " << path << ": " << error.message() << std::endl;
        }
    }
}

std::string ZoneLifecycle::MakeRemoteWorkDir() {
    const std::string tempRoot = config_.zonePathRoot + kTempDirName;
    RunStep("prepare", BuildTempRootCommand(tempRoot));

    const RemoteCommand mktemp = BuildTempDirCommand(tempRoot);
    const CommandResult result = RunStep("mktemp", mktemp);
    const std::string workDir = Trim(result.stdoutText);
    if (workDir.rfind(tempRoot + "/", 0) != 0 || workDir.find('\n') != std::string::npos) {
        throw ZoneCommandError("mktemp returned an unexpected path: " + workDir, mktemp.ToString(),
            result.exitStatus, result.stderrText);
    }
    return workDir;
}

void ZoneLifecycle::InstallZone(RunState& state, const std::string& workDir, const LocalArtifacts& artifacts) {
    channel_.Upload(artifacts.configPath, workDir, cancel_);
    channel_.Upload(artifacts.profilePath, workDir, cancel_);
    Advance(state, ZonePhase::ARTIFACTS_STAGED);

    const std::string remoteConfig = workDir + "/" + std::filesystem::path(artifacts.configPath).filename().string();
    const std::string remoteProfile = workDir + "/" + std::filesystem::path(artifacts.profilePath).filename().string();

    RunStep("configure", BuildConfigureCommand(state.zoneName, remoteConfig));
    Advance(state, ZonePhase::ZONE_CONFIGURED);

    RunStep("clone", BuildCloneCommand(state.zoneName, remoteProfile, config_.zoneTemplate));
    Advance(state, ZonePhase::ZONE_CLONED);

    RunStep("boot", BuildBootCommand(state.zoneName));
    Advance(state, ZonePhase::ZONE_BOOTED);
}

void ZoneLifecycle::CleanupRemoteWorkDir(const std::string& workDir) {
    if (config_.keepConfig) {
        std::cout << "[Zone] Keeping remote config in " << workDir << std::endl;
        return;
    }

    try {
        const CommandResult result = channel_.Exec(BuildRemoveDirCommand(workDir));
        if (!result.Ok()) {
            std::cerr << "[Zone] Cleanup of " << workDir << " exited " << result.exitStatus << ": "
                      << Trim(result.stderrText) << std::endl;
        }
    } catch (const ZoneError& ex) {
        std::cerr << "[Zone] Cleanup of " << workDir << " failed: " << ex.what() << std::endl;
    }
}

void ZoneLifecycle::SetupNetworking(RunState& state) {
    Advance(state, ZonePhase::NETWORK_PENDING);
    std::cout << "[Zone] Waiting for zone " << state.zoneName << " to start" << std::endl;

    state.zoneIp = WaitForAddress(state.zoneName);
    Notify(state);

    // Recorded before the rule goes in so an interrupted install is still
    // removed by Destroy.
    state.zonePort = ports_.Select(config_.zonePort);
    Notify(state);

    RunStep("nat", BuildNatInstallCommand(state.zonePort, state.zoneIp));
    Advance(state, ZonePhase::NETWORK_READY);
}

std::string ZoneLifecycle::WaitForAddress(const std::string& zoneName) {
    ScopedSpan span("zone.network.wait");
    span.Set("zone.name", zoneName);

    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(config_.zoneReadyInterval);
    const auto deadline = std::chrono::steady_clock::now() + config_.zoneReadyTimeout;
    const RemoteCommand showAddr = BuildShowAddressCommand(zoneName);

    int attempt = 0;
    while (attempt < config_.zoneReadyAttempts) {
        if (!cancel_->WaitFor(interval)) {
            throw OperationCancelled("Cancelled while waiting for zone " + zoneName + " network");
        }
        ++attempt;

        try {
            const CommandResult result = channel_.Exec(showAddr, cancel_);
            if (result.Ok()) {
                if (auto address = ParseDhcpAddress(result.stdoutText)) {
                    span.Set("zone.ip", *address);
                    span.Set("poll.attempts", static_cast<int64_t>(attempt));
                    span.End(true);
                    return *address;
                }
            }
        } catch (const RemoteChannelError& ex) {
            std::cerr << "[Zone] Address poll " << attempt << " for " << zoneName << " failed: " << ex.what() << std::endl;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    span.Set("poll.attempts", static_cast<int64_t>(attempt));
    throw NetworkTimeoutError("Zone " + zoneName + " did not obtain a DHCP address after "
        + std::to_string(attempt) + " attempt(s)", attempt);
}

DestroyReport ZoneLifecycle::Destroy(RunState& state) {
    ScopedSpan span("zone.destroy");
    span.Set("zone.instance", config_.instanceName);
    DestroyReport report;

    if (state.HasForward()) {
        RunBestEffort("nat", BuildNatRemoveCommand(state.zonePort, state.zoneIp), report);
        state.zonePort = 0;
        state.zoneIp.clear();
        RecordTeardown(state, ZonePhase::NAT_REMOVED);
    }

    if (state.HasZone()) {
        span.Set("zone.name", state.zoneName);
        std::cout << "[Zone] Destroying zone " << state.zoneName << std::endl;
        RunBestEffort("halt", BuildHaltCommand(state.zoneName), report);
        RunBestEffort("uninstall", BuildUninstallCommand(state.zoneName), report);
        RecordTeardown(state, ZonePhase::ZONE_UNINSTALLED);
        RunBestEffort("delete", BuildDeleteCommand(state.zoneName), report);
        RecordTeardown(state, ZonePhase::ZONE_DELETED);
        state.zoneName.clear();
    }

    state.zoneIp.clear();
    state.zonePort = 0;
    state.hostname.clear();
    state.port = 0;
    state.username.clear();
    RecordTeardown(state, ZonePhase::IDLE);

    span.Set("destroy.failures", static_cast<int64_t>(report.failures.size()));
    span.End(report.Clean());
    return report;
}

std::optional<std::string> ZoneLifecycle::ParseDhcpAddress(const std::string& showAddrOutput) {
    static const std::regex dhcpAddress(R"(net0/v4\s+dhcp\s+ok\s+([0-9.]+)/\d+)");

    std::smatch match;
    if (std::regex_search(showAddrOutput, match, dhcpAddress)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::string ZoneLifecycle::BuildRedirectRule(int port, const std::string& zoneIp) {
    return "rdr net0 0.0.0.0/0 port " + std::to_string(port) + " -> " + zoneIp + " port "
        + std::to_string(kZoneSshPort);
}

RemoteCommand ZoneLifecycle::BuildTempRootCommand(const std::string& tempRoot) {
    return RemoteCommand{"mkdir", "-p", tempRoot};
}

RemoteCommand ZoneLifecycle::BuildTempDirCommand(const std::string& tempRoot) {
    return RemoteCommand{"mktemp", "-d", "-p", tempRoot};
}

RemoteCommand ZoneLifecycle::BuildRemoveDirCommand(const std::string& dir) {
    return RemoteCommand{"rm", "-rf", dir};
}

RemoteCommand ZoneLifecycle::BuildConfigureCommand(const std::string& zoneName, const std::string& configPath) {
    return RemoteCommand{kZonecfg, "-z", zoneName, "-f", configPath};
}

RemoteCommand ZoneLifecycle::BuildCloneCommand(
    const std::string& zoneName,
    const std::string& profilePath,
    const std::string& templateZone) {
    return RemoteCommand{kZoneadm, "-z", zoneName, "clone", "-c", profilePath, templateZone};
}

RemoteCommand ZoneLifecycle::BuildBootCommand(const std::string& zoneName) {
    return RemoteCommand{kZoneadm, "-z", zoneName, "boot"};
}

RemoteCommand ZoneLifecycle::BuildHaltCommand(const std::string& zoneName) {
    return RemoteCommand{kZoneadm, "-z", zoneName, "halt"};
}

RemoteCommand ZoneLifecycle::BuildUninstallCommand(const std::string& zoneName) {
    return RemoteCommand{kZoneadm, "-z", zoneName, "uninstall", "-F"};
}

RemoteCommand ZoneLifecycle::BuildDeleteCommand(const std::string& zoneName) {
    return RemoteCommand{kZonecfg, "-z", zoneName, "delete", "-F"};
}

RemoteCommand ZoneLifecycle::BuildShowAddressCommand(const std::string& zoneName) {
    return RemoteCommand{kZlogin, zoneName, "ipadm", "show-addr"};
}

RemoteCommand ZoneLifecycle::BuildNatInstallCommand(int port, const std::string& zoneIp) {
    RemoteCommand command{kIpnat, "-f", "-"};
    command.WithStdin(BuildRedirectRule(port, zoneIp) + "\n");
    return command;
}

RemoteCommand ZoneLifecycle::BuildNatRemoveCommand(int port, const std::string& zoneIp) {
    RemoteCommand command{kIpnat, "-r", "-f", "-"};
    command.WithStdin(BuildRedirectRule(port, zoneIp) + "\n");
    return command;
}

CommandResult ZoneLifecycle::RunStep(const char* step, const RemoteCommand& command) {
    ScopedSpan span("zone.exec");
    span.Set("zone.step", step);
    span.Set("command", command.ToString());

    const CommandResult result = channel_.Exec(command, cancel_);
    span.Set("exit_status", static_cast<int64_t>(result.exitStatus));
    if (!result.Ok()) {
        std::cerr << "[Zone] " << step << " failed (exit " << result.exitStatus << "): " << command.ToString()
                  << "\n" << Trim(result.stderrText) << std::endl;
        throw ZoneCommandError(std::string("Zone step '") + step + "' failed with exit status "
            + std::to_string(result.exitStatus), command.ToString(), result.exitStatus, result.stderrText);
    }

    span.End(true);
    return result;
}

bool ZoneLifecycle::RunBestEffort(const char* step, const RemoteCommand& command, DestroyReport& report) {
    ScopedSpan span("zone.exec");
    span.Set("zone.step", step);
    span.Set("command", command.ToString());

    DestroyStepFailure failure;
    failure.step = step;
    failure.command = command.ToString();
    try {
        const CommandResult result = channel_.Exec(command);
        span.Set("exit_status", static_cast<int64_t>(result.exitStatus));
        if (result.Ok()) {
            span.End(true);
            return true;
        }
        failure.exitStatus = result.exitStatus;
        failure.detail = Trim(result.stderrText);
    } catch (const ZoneError& ex) {
        failure.detail = ex.what();
    }

    std::cerr << "[Zone] " << step << " did not succeed (" << failure.command << "): " << failure.detail << std::endl;
    report.failures.push_back(std::move(failure));
    return false;
}

void ZoneLifecycle::Advance(RunState& state, ZonePhase phase) {
    state.phase = phase;
    Notify(state);
}

void ZoneLifecycle::Notify(const RunState& state) {
    if (listener_) {
        listener_(state);
    }
}

void ZoneLifecycle::RecordTeardown(RunState& state, ZonePhase phase) {
    state.phase = phase;
    try {
        Notify(state);
    } catch (const ZoneError& ex) {
        std::cerr << "[Zone] Unable to record " << ToString(phase) << " for "
                  << config_.instanceName << ": " << ex.what() << std::endl;
    }
}
