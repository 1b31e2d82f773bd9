#include "sandbox/SandboxRuntime.hpp"
#include "errors/AgentErrors.hpp"
#include "utils/Scrubber.hpp"
#include "utils/TarArchive.hpp"

#include <spdlog/spdlog.h>

namespace data_agent {

// --- SandboxHandle ---

SandboxHandle::SandboxHandle(std::shared_ptr<ContainerEngine> engine, std::shared_ptr<UnitRegistry> registry, UnitKey key)
    : engine_(std::move(engine)), registry_(std::move(registry)), key_(std::move(key)) {}

SandboxHandle::~SandboxHandle() {
    destroy();
}

void SandboxHandle::create(const UnitSpec& spec) {
    id_ = engine_->create_unit(spec);
    state_ = State::CREATED;
    tracked_ = registry_->track(key_, id_);
    if (!tracked_) {
        // Deadline already fired for this request: nobody else will clean up.
        destroy();
        throw TimeoutError("Request " + key_.request_id + " was cancelled before block " +
                           std::to_string(key_.ordinal) + " could run");
    }
    spdlog::info("🐳 Unit {} created for request {} block {}", id_.substr(0, 12), key_.request_id, key_.ordinal);
}

void SandboxHandle::start() {
    engine_->start(id_);
    state_ = State::RUNNING;
}

void SandboxHandle::inject(const std::string& tar_stream, const std::string& dest_dir) {
    engine_->inject_files(id_, tar_stream, dest_dir);
}

ExecCapture SandboxHandle::exec(const std::vector<std::string>& command, const std::string& workdir,
                                std::chrono::milliseconds timeout) {
    auto cap = engine_->exec_and_capture(id_, command, workdir, timeout);
    state_ = State::EXITED;
    return cap;
}

void SandboxHandle::destroy() noexcept {
    if (state_ == State::PENDING || state_ == State::DESTROYED) return;
    state_ = State::DESTROYED;

    // A tracked unit the registry no longer knows was destroyed by the reaper.
    if (tracked_ && !registry_->release(id_)) return;
    try {
        engine_->destroy(id_);
        spdlog::info("🧹 Unit {} destroyed", id_.substr(0, 12));
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Teardown of unit {} failed (ignored): {}", id_.substr(0, 12), e.what());
    }
}

// --- SandboxRuntime ---

SandboxRuntime::SandboxRuntime(std::shared_ptr<ContainerEngine> engine, std::shared_ptr<UnitRegistry> registry,
                               SandboxSettings settings)
    : engine_(std::move(engine)), registry_(std::move(registry)), settings_(std::move(settings)) {}

void SandboxRuntime::ensure_base_image() {
    if (image_ready_.load()) return;

    std::lock_guard<std::mutex> lock(image_mutex_);
    if (image_ready_.load()) return;

    if (!engine_->image_exists(settings_.image)) {
        spdlog::info("📥 Pulling base image {} ...", settings_.image);
        engine_->pull_image(settings_.image);
        spdlog::info("✅ Base image {} pulled", settings_.image);
    }
    image_ready_.store(true);
}

std::string SandboxRuntime::script_name(const CodeUnit& unit) {
    try {
        return safe_basename(unit.filename.empty() ? ExecutionPlan::kDefaultUnitFilename : unit.filename);
    } catch (const ValidationError&) {
        return ExecutionPlan::kDefaultUnitFilename;
    }
}

UnitSpec SandboxRuntime::unit_spec(const UnitKey& key) const {
    UnitSpec spec;
    spec.image = settings_.image;
    spec.name = "data-agent-" + key.request_id + "-" + std::to_string(key.ordinal);
    spec.workdir = settings_.workdir;
    spec.network = settings_.network;
    spec.memory = settings_.memory;
    spec.cpus = settings_.cpus;
    spec.labels = {{"data-agent.request", key.request_id}, {"data-agent.block", std::to_string(key.ordinal)}};
    return spec;
}

RawOutput SandboxRuntime::run(const CodeUnit& unit,
                              const std::vector<WorkspaceFile>& files,
                              std::chrono::milliseconds timeout,
                              const UnitKey& key) {
    const auto started = std::chrono::steady_clock::now();
    const std::string script = script_name(unit);

    TarArchive tar;
    try {
        for (const auto& f : files) {
            if (f.name == script) continue;   // the script wins a name clash
            tar.add_file(f.name, f.bytes);
        }
        tar.add_file(script, unit.code);
    } catch (const std::invalid_argument& e) {
        throw ProvisioningError(std::string("Cannot pack workspace: ") + e.what());
    }
    const std::string stream = tar.finish();

    SandboxHandle handle(engine_, registry_, key);
    handle.create(unit_spec(key));
    handle.start();
    handle.inject(stream, settings_.workdir);
    spdlog::info("📦 Injected {} file(s) ({} bytes) into unit {}", tar.entry_count(), stream.size(), handle.id().substr(0, 12));

    ExecCapture cap = handle.exec({settings_.interpreter, script}, settings_.workdir, timeout);
    handle.destroy();

    RawOutput out;
    out.text = decode_utf8_lossy(cap.output);
    out.exit_code = cap.exit_code;
    out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (cap.timed_out) {
        throw ExecutionError("Block " + std::to_string(key.ordinal) + " exceeded its " +
                             std::to_string(timeout.count()) + " ms timeout",
                             cap.exit_code, out.text, true);
    }

    spdlog::info("🏁 Block {} exited with {} after {} ms ({} chars of output)",
                 key.ordinal, out.exit_code, out.elapsed.count(), out.text.size());
    return out;
}

}
