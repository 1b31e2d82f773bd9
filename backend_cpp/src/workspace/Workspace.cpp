#include "workspace/Workspace.hpp"
#include "errors/AgentErrors.hpp"
#include "utils/Scrubber.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <set>
#include <spdlog/spdlog.h>
#include <stdlib.h>

namespace data_agent {

namespace {

void write_file(const fs::path& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw ProvisioningError("Cannot create " + path.string());
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw ProvisioningError("Short write to " + path.string());
}

fs::path make_private_dir() {
    std::string tmpl = (fs::temp_directory_path() / "data_agent_XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw ProvisioningError(std::string("mkdtemp failed: ") + std::strerror(errno));
    }
    return fs::path(buf.data());
}

}

std::string safe_basename(const std::string& filename) {
    std::string name = filename;
    std::replace(name.begin(), name.end(), '\\', '/');
    size_t slash = name.find_last_of('/');
    if (slash != std::string::npos) name = name.substr(slash + 1);
    if (name.empty() || name == "." || name == ".." || name.find('\0') != std::string::npos) {
        throw ValidationError("Unusable attachment filename: '" + filename + "'");
    }
    if (name.size() > 255) throw ValidationError("Attachment filename longer than 255 bytes");
    return name;
}

Workspace::Workspace(fs::path root) : root_(std::move(root)) {}

Workspace::~Workspace() {
    remove();
}

std::shared_ptr<Workspace> Workspace::stage(const std::optional<std::string>& question,
                                            const std::vector<Attachment>& attachments) {
    if (!question.has_value()) {
        throw ValidationError(std::string(kQuestionFile) + " is required");
    }

    std::set<std::string> names{kQuestionFile};
    std::vector<std::string> basenames;
    basenames.reserve(attachments.size());
    for (const auto& a : attachments) {
        std::string base = safe_basename(a.filename);
        if (!names.insert(base).second) {
            throw ValidationError("Duplicate attachment filename: '" + base + "'");
        }
        basenames.push_back(base);
    }

    std::shared_ptr<Workspace> ws(new Workspace(make_private_dir()));
    write_file(ws->question_path(), *question);
    ws->question_text_ = decode_utf8_lossy(*question);

    for (size_t i = 0; i < attachments.size(); ++i) {
        fs::path dst = ws->root_ / basenames[i];
        write_file(dst, attachments[i].bytes);
        ws->saved_.push_back(dst);
    }

    spdlog::info("📂 Workspace staged at {} ({} attachment(s))", ws->root_.string(), ws->saved_.size());
    return ws;
}

std::vector<std::string> Workspace::attachment_names() const {
    std::vector<std::string> names;
    names.reserve(saved_.size());
    for (const auto& p : saved_) names.push_back(p.filename().string());
    return names;
}

std::vector<WorkspaceFile> Workspace::read_files() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (removed_) throw ProvisioningError("Workspace already removed: " + root_.string());

    std::vector<WorkspaceFile> files;
    try {
        for (const auto& entry : fs::directory_iterator(root_)) {
            if (!entry.is_regular_file()) continue;
            std::ifstream in(entry.path(), std::ios::binary);
            if (!in.is_open()) throw ProvisioningError("Cannot read " + entry.path().string());
            std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            files.push_back({entry.path().filename().string(), std::move(bytes)});
        }
    } catch (const fs::filesystem_error& e) {
        throw ProvisioningError(std::string("Workspace unreadable: ") + e.what());
    }
    std::sort(files.begin(), files.end(), [](const WorkspaceFile& a, const WorkspaceFile& b) { return a.name < b.name; });
    return files;
}

void Workspace::remove() noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    if (removed_) return;
    removed_ = true;
    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) spdlog::warn("⚠️ Failed to remove workspace {}: {}", root_.string(), ec.message());
    else spdlog::debug("🧹 Workspace {} removed", root_.string());
}

bool Workspace::removed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return removed_;
}

}
