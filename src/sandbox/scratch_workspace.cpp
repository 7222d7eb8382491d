#include "sandbox/scratch_workspace.hpp"

#include <fstream>
#include <system_error>

#include <errno.h>
#include <sys/stat.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace coderun::sandbox {
namespace fs = std::filesystem;

ScratchWorkspace::ScratchWorkspace(const fs::path& root,
                                   const std::string& extension,
                                   const std::string& code,
                                   Access access)
    : directory_(root / utils::MakeUniqueToken("coderun-")) {
    // Created owner-only so no other user can look inside before the
    // permissions below are settled.
    if (::mkdir(directory_.c_str(), S_IRWXU) != 0) {
        throw fs::filesystem_error(
            "cannot create scratch directory",
            directory_,
            std::error_code(errno, std::generic_category()));
    }
    source_file_ = directory_ / ("main" + extension);
    const bool shared = access == Access::kShared;
    try {
        fs::permissions(directory_,
                        shared ? fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                     fs::perms::others_read | fs::perms::others_exec
                               : fs::perms::owner_all,
                        fs::perm_options::replace);
        std::ofstream output(source_file_, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw fs::filesystem_error(
                "cannot create source file",
                source_file_,
                std::make_error_code(std::errc::permission_denied));
        }
        output << code;
        output.close();
        if (!output) {
            throw fs::filesystem_error(
                "cannot write source file",
                source_file_,
                std::make_error_code(std::errc::io_error));
        }
        fs::permissions(source_file_,
                        shared ? fs::perms::owner_read | fs::perms::owner_write |
                                     fs::perms::group_read | fs::perms::others_read
                               : fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace);
    } catch (...) {
        std::error_code ec;
        fs::remove_all(directory_, ec);
        throw;
    }
}

ScratchWorkspace::~ScratchWorkspace() {
    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec) {
        utils::LogWarn("sandbox", "failed to remove " + directory_.string() + ": " + ec.message());
    }
}

fs::path ScratchWorkspace::ResolveRoot(const std::string& root) {
    if (!root.empty()) {
        return fs::path(root);
    }
    return fs::temp_directory_path();
}

}  // namespace coderun::sandbox
