#include "sftppull/MockSftpClient.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>

namespace sftppull {

namespace {

std::string normalizedDir(const std::string& path) {
    if (path.empty()) return "/";
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

// "/a/b/c.txt" -> {"/a/b", "c.txt"}
void splitRemote(const std::string& path, std::string& dir, std::string& name) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        dir = "/";
        name = path;
        return;
    }
    dir = pos == 0 ? std::string("/") : path.substr(0, pos);
    name = path.substr(pos + 1);
}

bool consume(std::map<std::string, int>& pending, const std::string& key) {
    auto it = pending.find(key);
    if (it == pending.end() || it->second <= 0) return false;
    --it->second;
    return true;
}

} // namespace

bool MockSftpClient::connect(const SessionOptions& opt, TransferError& err) {
    ++connectCalls_;
    if (opt.host.empty() || opt.username.empty()) {
        err.set("Host and username are required", 0, ErrorCategory::State, opt.host);
        return false;
    }
    if (pendingConnectFailures_ > 0) {
        --pendingConnectFailures_;
        err.set("Mock connect failure", -13, connectFailureCategory_, opt.host);
        return false;
    }
    if (!expectedFingerprint_.empty() && opt.hostkey_fingerprint != expectedFingerprint_) {
        err.set("Host key does not match the pinned fingerprint", 0,
                ErrorCategory::HostKey, opt.host);
        return false;
    }
    connected_ = true;
    lastOpt_ = opt;
    return true;
}

void MockSftpClient::disconnect() {
    connected_ = false;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          TransferError& err) {
    ++listCalls_;
    if (!connected_) {
        err.set("Not connected", 0, ErrorCategory::State, remote_path);
        return false;
    }
    if (pendingListFailures_ > 0) {
        --pendingListFailures_;
        err.set("Mock listing failure", -7, ErrorCategory::Network, remote_path);
        return false;
    }
    const std::string path = normalizedDir(remote_path);
    auto it = fs_.find(path);
    if (it == fs_.end()) {
        err.set("Remote path not found in mock", 2, ErrorCategory::NotFound, path);
        return false;
    }
    out = it->second;
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
        if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // dirs first
        return a.name < b.name;
    });
    return true;
}

bool MockSftpClient::get(const std::string& remote,
                         const std::string& local,
                         TransferError& err) {
    ++getCalls_;
    if (!connected_) {
        err.set("Not connected", 0, ErrorCategory::State, remote);
        return false;
    }
    if (consume(pendingGetFailures_, remote)) {
        err.set("Mock download failure", 4, ErrorCategory::RemoteIo, remote);
        return false;
    }
    auto it = content_.find(remote);
    if (it == content_.end()) {
        err.set("No such file", 2, ErrorCategory::NotFound, remote);
        return false;
    }
    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        err.set("Could not open local file for writing", errno, ErrorCategory::LocalIo, local);
        return false;
    }
    out << it->second;
    out.close();

    if (vanishAfterGet_[remote]) {
        vanishAfterGet_[remote] = false;
        eraseEntry(remote);
    }
    return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path,
                                TransferError& err) {
    ++removeCalls_;
    if (!connected_) {
        err.set("Not connected", 0, ErrorCategory::State, remote_path);
        return false;
    }
    if (consume(pendingRemoveFailures_, remote_path)) {
        err.set("Mock remove failure", 3, ErrorCategory::Permission, remote_path);
        return false;
    }
    if (!eraseEntry(remote_path)) {
        err.set("No such file", 2, ErrorCategory::NotFound, remote_path);
        return false;
    }
    return true;
}

void MockSftpClient::addDir(const std::string& dir, const std::string& name) {
    const std::string d = normalizedDir(dir);
    fs_[d].push_back(FileInfo{name, true, 0, 0, 0040755});
    fs_.emplace(joinRemotePath(d, name), std::vector<FileInfo>{});
}

void MockSftpClient::addFile(const std::string& dir, const std::string& name,
                             const std::string& content) {
    const std::string d = normalizedDir(dir);
    fs_[d].push_back(FileInfo{name, false, content.size(), 0, 0100644});
    content_[joinRemotePath(d, name)] = content;
}

bool MockSftpClient::hasFile(const std::string& dir, const std::string& name) const {
    auto it = fs_.find(normalizedDir(dir));
    if (it == fs_.end()) return false;
    return std::any_of(it->second.begin(), it->second.end(),
                       [&name](const FileInfo& e) { return !e.is_dir && e.name == name; });
}

void MockSftpClient::failConnects(int n, ErrorCategory cat) {
    pendingConnectFailures_ = n;
    connectFailureCategory_ = cat;
}

void MockSftpClient::failLists(int n) {
    pendingListFailures_ = n;
}

void MockSftpClient::failGets(const std::string& remote_path, int n) {
    pendingGetFailures_[remote_path] = n;
}

void MockSftpClient::failRemoves(const std::string& remote_path, int n) {
    pendingRemoveFailures_[remote_path] = n;
}

void MockSftpClient::vanishAfterGet(const std::string& remote_path) {
    vanishAfterGet_[remote_path] = true;
}

bool MockSftpClient::eraseEntry(const std::string& remote_path) {
    std::string dir, name;
    splitRemote(remote_path, dir, name);
    auto it = fs_.find(normalizedDir(dir));
    if (it == fs_.end()) return false;
    auto& entries = it->second;
    auto e = std::find_if(entries.begin(), entries.end(),
                          [&name](const FileInfo& fi) { return !fi.is_dir && fi.name == name; });
    if (e == entries.end()) return false;
    entries.erase(e);
    content_.erase(joinRemotePath(normalizedDir(dir), name));
    return true;
}

} // namespace sftppull
