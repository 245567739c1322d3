/**
 * @file workspace.cpp
 * @brief Workspace staging and removal
 * 
 * @date 2025
 */

#include "runcage/core/workspace.hpp"
#include "runcage/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#include <stdlib.h>

namespace runcage {
namespace core {

namespace fs = std::filesystem;

namespace {

constexpr fs::perms kDirPerms = fs::perms::owner_all |
                                fs::perms::group_read | fs::perms::group_exec |
                                fs::perms::others_read | fs::perms::others_exec;

constexpr fs::perms kFilePerms = fs::perms::owner_read | fs::perms::owner_write |
                                 fs::perms::group_read | fs::perms::others_read;

fs::path CreateUniqueDirectory(const fs::path& parent) {
    std::string tmpl = (parent / "runcage-ws-XXXXXX").string();
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        throw WorkspaceError("Cannot create workspace under " + parent.string() +
                             ": " + std::strerror(errno));
    }
    return fs::path(buffer.data());
}

} // anonymous namespace

// ============================================================================
// WORKSPACE
// ============================================================================

Workspace::Workspace(fs::path root)
    : root_(std::move(root)) {
}

Workspace::~Workspace() {
    Release();
}

Workspace::Workspace(Workspace&& other) noexcept
    : root_(std::move(other.root_)),
      main_file_(std::move(other.main_file_)),
      has_stdin_(other.has_stdin_) {
    other.root_.clear();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        Release();
        root_ = std::move(other.root_);
        main_file_ = std::move(other.main_file_);
        has_stdin_ = other.has_stdin_;
        other.root_.clear();
    }
    return *this;
}

void Workspace::Release() {
    if (root_.empty()) {
        return;
    }

    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        spdlog::warn("Failed to remove workspace {}: {}", root_.string(), ec.message());
    } else {
        spdlog::debug("Removed workspace {}", root_.string());
    }
    root_.clear();
}

void Workspace::WriteFile(const std::string& relative_path, const std::string& content) {
    if (!IsContainedRelativePath(relative_path)) {
        throw WorkspaceError("Path escapes workspace: '" + relative_path + "'");
    }

    fs::path target = root_ / fs::path(relative_path);

    std::error_code ec;
    fs::path parent = target.parent_path();
    if (parent != root_) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw WorkspaceError("Cannot create directory " + parent.string() + ": " + ec.message());
        }
        // Every directory between root and target needs to be traversable
        for (fs::path dir = parent; dir != root_ && !dir.empty(); dir = dir.parent_path()) {
            fs::permissions(dir, kDirPerms, ec);
        }
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw WorkspaceError("Cannot open " + target.string() + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw WorkspaceError("Failed writing " + target.string());
    }

    fs::permissions(target, kFilePerms, ec);
    if (ec) {
        throw WorkspaceError("Cannot set permissions on " + target.string() + ": " + ec.message());
    }
}

// ============================================================================
// STAGING
// ============================================================================

bool IsContainedRelativePath(const std::string& relative_path) {
    if (relative_path.empty()) {
        return false;
    }

    fs::path p(relative_path);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) {
        return false;
    }

    for (const auto& part : p) {
        if (part == "..") {
            return false;
        }
    }

    return p.filename() != "" && p.filename() != ".";
}

Workspace StageWorkspace(const ExecutionRequest& request,
                         const LanguageSpec& spec,
                         const fs::path& root) {
    fs::path parent = root;
    if (parent.empty()) {
        std::error_code ec;
        parent = fs::temp_directory_path(ec);
        if (ec) {
            throw WorkspaceError("No temporary directory: " + ec.message());
        }
    }

    Workspace workspace(CreateUniqueDirectory(parent));

    std::error_code ec;
    fs::permissions(workspace.path(), kDirPerms, ec);
    if (ec) {
        throw WorkspaceError("Cannot set permissions on " + workspace.path().string() +
                             ": " + ec.message());
    }

    std::string main_file = "code" + spec.file_extension;
    workspace.WriteFile(main_file, request.code);
    workspace.SetMainFile(main_file);

    if (request.stdin_input) {
        workspace.WriteFile(kStdinFileName, *request.stdin_input);
        workspace.MarkStdinStaged();
    }

    for (const auto& [relative_path, content] : request.auxiliary_files) {
        // Staged names are reserved
        auto normalized = std::filesystem::path(relative_path).lexically_normal();
        if (normalized == main_file || normalized == kStdinFileName) {
            throw WorkspaceError("Auxiliary file '" + relative_path +
                                 "' collides with a staged file");
        }
        workspace.WriteFile(relative_path, content);
    }

    spdlog::debug("Staged workspace {} ({} auxiliary files)",
                  workspace.path().string(), request.auxiliary_files.size());
    return workspace;
}

} // namespace core
} // namespace runcage
