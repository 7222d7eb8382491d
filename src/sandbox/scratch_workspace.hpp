#pragma once

#include <filesystem>
#include <string>

namespace coderun::sandbox {

// A uniquely named directory holding the source file of one execution.
// The directory and everything written into it are removed on destruction.
class ScratchWorkspace {
public:
    enum class Access {
        // Owner only (0700 directory, 0600 source).
        kPrivate,
        // Readable by every user, for runtimes that read the source as
        // another uid (0755 directory, 0644 source).
        kShared
    };

    // Throws std::filesystem::filesystem_error when the directory or the
    // source file cannot be created.
    ScratchWorkspace(const std::filesystem::path& root,
                     const std::string& extension,
                     const std::string& code,
                     Access access = Access::kPrivate);
    ~ScratchWorkspace();

    ScratchWorkspace(const ScratchWorkspace&) = delete;
    ScratchWorkspace& operator=(const ScratchWorkspace&) = delete;

    const std::filesystem::path& Directory() const { return directory_; }
    const std::filesystem::path& SourceFile() const { return source_file_; }
    std::string SourceFileName() const { return source_file_.filename().string(); }

    // temp_directory_path() when root is empty.
    static std::filesystem::path ResolveRoot(const std::string& root);

private:
    std::filesystem::path directory_;
    std::filesystem::path source_file_;
};

}  // namespace coderun::sandbox
