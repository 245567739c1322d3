/**
 * @file workspace.hpp
 * @brief Per-execution host directory holding the staged source files
 * 
 * The workspace is bind-mounted read-only into the container. It lives
 * exactly as long as its Workspace owner: the destructor removes the whole
 * tree, on success, on failure and during exception unwinding.
 * 
 * **Layout**:
 * ```
 * runcage-ws-XXXXXX/
 *   code.<ext>          main source file
 *   .runcage_stdin      stdin text (optional)
 *   <aux paths...>      auxiliary files, parent dirs created
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "runcage/core/execution_types.hpp"
#include "runcage/core/language_registry.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace runcage {
namespace core {

/// Name of the staged stdin file inside the workspace
constexpr const char* kStdinFileName = ".runcage_stdin";

/**
 * @class Workspace
 * @brief Move-only owner of a staged directory
 */
class Workspace {
public:
    /// Takes ownership of an existing directory
    explicit Workspace(std::filesystem::path root);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;

    /// Host directory
    const std::filesystem::path& path() const { return root_; }

    /// File name of the main source, relative to the workspace ("code.py")
    const std::string& main_file() const { return main_file_; }

    /// Whether a stdin file was staged
    bool has_stdin() const { return has_stdin_; }

    /**
     * @brief Write a file below the workspace
     * @param relative_path Relative path; must not be absolute or contain ".."
     * @param content File bytes
     * 
     * @throws WorkspaceError on escaping paths or I/O failure
     */
    void WriteFile(const std::string& relative_path, const std::string& content);

    void SetMainFile(const std::string& name) { main_file_ = name; }
    void MarkStdinStaged() { has_stdin_ = true; }

    /// Remove the directory now; safe to call more than once
    void Release();

private:
    std::filesystem::path root_;
    std::string main_file_;
    bool has_stdin_{false};
};

/**
 * @brief Stage a request's files into a fresh workspace
 * 
 * Creates `<root>/runcage-ws-XXXXXX` (mode 0755), writes `code<ext>`, the
 * stdin file when requested, then every auxiliary file.
 * 
 * @param request Execution request
 * @param spec Resolved language
 * @param root Parent directory; system temp directory when empty
 * @return Owning Workspace
 * 
 * @throws WorkspaceError if the directory or any file cannot be written
 */
Workspace StageWorkspace(const ExecutionRequest& request,
                         const LanguageSpec& spec,
                         const std::filesystem::path& root = {});

/**
 * @brief Check that a relative path stays inside its base directory
 * @return false for empty, absolute or ".."-containing paths
 */
bool IsContainedRelativePath(const std::string& relative_path);

} // namespace core
} // namespace runcage
