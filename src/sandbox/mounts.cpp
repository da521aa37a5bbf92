/*
 * Mount table - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/sandbox/mounts.hpp>
#include <glsfs/core/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace glsfs {

namespace {

bool path_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c=='_' || c=='-' || c=='.' || c=='/';
}

// path starts at s[i] as a whole path (or a prefix ending at a '/')
bool path_at(const std::string& s, std::size_t i, const std::string& path) {
    if (path.empty() || s[i]!='/' || (i>0 && path_char(s[i-1]))) return false;
    if (s.compare(i, path.size(), path)!=0) return false;
    std::size_t end = i + path.size();
    return end>=s.size() || !path_char(s[end]) || s[end]=='/';
}

} // namespace

const char* to_string(MountMode m) { return m==MountMode::ReadOnly ? "ro" : "rw"; }

MountTable MountTable::probe(const std::string& sandbox_home, const std::string& host_home,
                             const std::string& workspace_dir) {
    MountTable t;
    std::error_code ec;
    fs::create_directories(workspace_dir, ec);
    if (ec || !fs::is_directory(workspace_dir))
        throw InitializationError("cannot create workspace " + workspace_dir + ": " + ec.message());
    t.m_workspace_host = fs::weakly_canonical(workspace_dir, ec).string();
    if (ec) t.m_workspace_host = workspace_dir;

    t.add({sandbox_home + "/workspace", t.m_workspace_host, MountMode::ReadWrite, false, true});
    t.add({"/workspace", t.m_workspace_host, MountMode::ReadWrite, true, true});
    for (auto name : {"Desktop", "Documents", "Downloads"}) {
        fs::path host = fs::path(host_home) / name;
        if (!fs::is_directory(host, ec)) {
            spdlog::info("mounts: {} not found on host, skipping", host.string());
            continue;
        }
        t.add({sandbox_home + "/" + name, host.string(), MountMode::ReadOnly, false, true});
    }
    // Anything else under the sandbox home lands in the workspace locally.
    t.add({sandbox_home, t.m_workspace_host, MountMode::ReadWrite, true, true});
    for (auto &m : t.mounts())
        spdlog::info("mounts: {} -> {} ({})", m.host_path, m.sandbox_path, to_string(m.mode));
    return t;
}

void MountTable::add(FolderMapping m) {
    while (m.sandbox_path.size()>1 && m.sandbox_path.back()=='/') m.sandbox_path.pop_back();
    if (m.mode==MountMode::ReadWrite && !m.alias && m_workspace_host.empty()) m_workspace_host = m.host_path;
    m_mappings.push_back(std::move(m));
}

std::vector<FolderMapping> MountTable::mounts() const {
    std::vector<FolderMapping> out;
    for (auto &m : m_mappings) if (!m.alias) out.push_back(m);
    return out;
}

const FolderMapping* MountTable::find(const std::string& sandbox_path) const {
    for (auto &m : m_mappings) if (m.sandbox_path==sandbox_path) return &m;
    return nullptr;
}

void MountTable::set_available(const std::string& sandbox_path, bool available) {
    for (auto &m : m_mappings) if (m.sandbox_path==sandbox_path) m.available = available;
}

std::vector<const FolderMapping*> MountTable::longest_first() const {
    std::vector<const FolderMapping*> order;
    for (auto &m : m_mappings) order.push_back(&m);
    std::stable_sort(order.begin(), order.end(), [](const FolderMapping* a, const FolderMapping* b) {
        return a->sandbox_path.size() > b->sandbox_path.size();
    });
    return order;
}

std::string MountTable::to_host(const std::string& command) const {
    auto order = longest_first();
    std::string out;
    out.reserve(command.size());
    std::size_t i = 0;
    while (i<command.size()) {
        const FolderMapping* hit = nullptr;
        for (auto m : order) if (path_at(command, i, m->sandbox_path)) { hit = m; break; }
        if (hit) { out += hit->host_path; i += hit->sandbox_path.size(); continue; }
        out.push_back(command[i++]);
    }
    return out;
}

const FolderMapping* MountTable::readonly_reference(const std::string& command) const {
    auto order = longest_first();
    for (std::size_t i=0;i<command.size();++i) {
        for (auto m : order) {
            if (path_at(command, i, m->sandbox_path)) {
                if (m->mode==MountMode::ReadOnly) return m;
                break;
            }
        }
        for (auto m : order)
            if (m->mode==MountMode::ReadOnly && path_at(command, i, m->host_path)) return m;
    }
    return nullptr;
}

} // namespace glsfs
