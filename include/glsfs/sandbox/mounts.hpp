/*
 * Mount table - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Association between canonical sandbox paths and host directories. Built
 *   once by probe(): the workspace is always present (created on the host
 *   when missing) and read-write; Desktop, Documents and Downloads are
 *   read-only and only mounted when they exist on the host. Aliases
 *   (/workspace, the sandbox home itself) translate to the workspace but are
 *   not separate container mounts.
 */
#pragma once
#include <string>
#include <vector>

namespace glsfs {

enum class MountMode { ReadOnly, ReadWrite };

const char* to_string(MountMode m);

struct FolderMapping {
    std::string sandbox_path;
    std::string host_path;
    MountMode mode = MountMode::ReadOnly;
    bool alias = false;      // translated but not mounted/listed separately
    bool available = true;   // cleared when the smoke test cannot list it
};

class MountTable {
public:
    MountTable() = default;

    // Throws InitializationError when the workspace cannot be created.
    static MountTable probe(const std::string& sandbox_home, const std::string& host_home,
                            const std::string& workspace_dir);

    void add(FolderMapping m);

    const std::vector<FolderMapping>& mappings() const { return m_mappings; }

    // Real mounts (aliases excluded), in insertion order.
    std::vector<FolderMapping> mounts() const;

    const FolderMapping* find(const std::string& sandbox_path) const;
    void set_available(const std::string& sandbox_path, bool available);

    // Rewrite sandbox paths in a command to host paths. Single left-to-right
    // pass; at each position the longest matching sandbox path wins, so
    // /home/user/Desktop is never handled as /home/user + "/Desktop".
    std::string to_host(const std::string& command) const;

    // First read-only mount the command names, by sandbox or host path.
    // A longer read-write mapping at the same position shadows it.
    const FolderMapping* readonly_reference(const std::string& command) const;

    const std::string& workspace_host() const { return m_workspace_host; }
private:
    std::vector<const FolderMapping*> longest_first() const;

    std::vector<FolderMapping> m_mappings;
    std::string m_workspace_host;
};

} // namespace glsfs
