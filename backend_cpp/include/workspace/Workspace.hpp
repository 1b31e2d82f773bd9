#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace data_agent {

namespace fs = std::filesystem;

struct Attachment {
    std::string filename;   // as uploaded; reduced to its basename when staged
    std::string bytes;
};

// One file of the workspace, as injected into a sandbox unit.
struct WorkspaceFile {
    std::string name;
    std::string bytes;
};

// Per-request staging directory. The directory and everything in it is
// removed when the last owner lets go, or earlier through remove().
class Workspace {
public:
    static constexpr const char* kQuestionFile = "questions.txt";

    // Throws ValidationError if the question is absent or an attachment name
    // is unusable (empty, "." or "..", or a duplicate basename).
    static std::shared_ptr<Workspace> stage(const std::optional<std::string>& question,
                                            const std::vector<Attachment>& attachments);

    ~Workspace();
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const fs::path& root() const { return root_; }
    fs::path question_path() const { return root_ / kQuestionFile; }

    // Paths of the staged attachments, in upload order.
    const std::vector<fs::path>& saved_files() const { return saved_; }
    std::vector<std::string> attachment_names() const;

    // Question decoded permissively (invalid UTF-8 replaced).
    const std::string& question_text() const { return question_text_; }

    // Snapshot of every regular file in the workspace, sorted by name.
    // Throws ProvisioningError if the workspace is gone or unreadable.
    std::vector<WorkspaceFile> read_files() const;

    // Idempotent; never throws.
    void remove() noexcept;
    bool removed() const;

private:
    explicit Workspace(fs::path root);

    fs::path root_;
    std::vector<fs::path> saved_;
    std::string question_text_;
    mutable std::mutex mtx_;
    bool removed_ = false;
};

// Reduces an uploaded filename to a safe basename or throws ValidationError.
std::string safe_basename(const std::string& filename);

}
