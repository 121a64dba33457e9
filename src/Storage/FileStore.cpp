#include "FileStore.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const char* kTempMarker = ".tmp-";

bool IsTempName(const std::string& name) {
    return !name.empty() && name[0] == '.' && name.find(kTempMarker) != std::string::npos;
}

std::string ErrnoText() {
    return std::strerror(errno);
}

// Writes all bytes to fd and syncs it. Returns an error description, empty on success.
std::string WriteAndSync(int fd, const std::vector<uint8_t>& bytes) {
    const uint8_t* data = bytes.data();
    size_t remaining = bytes.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return "write failed: " + ErrnoText();
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        return "fsync failed: " + ErrnoText();
    }
    return {};
}

} // namespace

FileStore::FileStore(fs::path root)
    : _root(std::move(root))
    , _temp_counter(0) {
    std::error_code ec;
    fs::create_directories(_root, ec);
    if (ec) {
        throw WriteError("Could not create store root " + _root.string() + ": " + ec.message());
    }
}

fs::path FileStore::Resolve(const std::string& path) const {
    fs::path relative = fs::path(path).lexically_normal();
    if (path.empty() || relative.empty() || relative.is_absolute() || relative.has_root_path()) {
        throw std::invalid_argument("Invalid store path: '" + path + "'");
    }
    for (const fs::path& part : relative) {
        if (part == "..") {
            throw std::invalid_argument("Store path leaves the store: '" + path + "'");
        }
    }
    return _root / relative;
}

void FileStore::EnsureParent(const fs::path& target, const std::string& key) {
    std::vector<fs::path> missing;
    std::error_code ec;
    for (fs::path dir = target.parent_path(); !dir.empty() && dir != _root && !fs::exists(dir, ec); dir = dir.parent_path()) {
        missing.push_back(dir);
    }
    if (missing.empty()) {
        return;
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw WriteError("Could not create folders for " + key + ": " + ec.message());
    }
    // Outermost first, so each new entry is durable before anything below it.
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        SyncDirectory(it->parent_path());
    }
}

void FileStore::SyncDirectory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        throw WriteError("Could not open folder " + dir.string() + " for sync: " + ErrnoText());
    }
    std::string error;
    if (::fsync(fd) != 0) {
        error = ErrnoText();
    }
    ::close(fd);
    if (!error.empty()) {
        throw WriteError("Could not sync folder " + dir.string() + ": " + error);
    }
}

std::shared_ptr<std::mutex> FileStore::PathLock(const std::string& path) {
    std::lock_guard<std::mutex> lock(_locks_mutex);
    auto& entry = _locks[fs::path(path).lexically_normal().generic_string()];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

void FileStore::Save(const std::string& path, const std::vector<uint8_t>& bytes) {
    const fs::path target = Resolve(path);
    if (target.filename().empty()) {
        throw std::invalid_argument("Store path names a folder: '" + path + "'");
    }

    std::shared_ptr<std::mutex> pathMutex = PathLock(path);
    std::lock_guard<std::mutex> lock(*pathMutex);

    EnsureParent(target, path);

    const fs::path temp = target.parent_path()
        / ("." + target.filename().string() + kTempMarker + std::to_string(::getpid()) + "-"
           + std::to_string(_temp_counter.fetch_add(1)));

    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw WriteError("Could not create " + path + ": " + ErrnoText());
    }
    std::string error = WriteAndSync(fd, bytes);
    if (::close(fd) != 0 && error.empty()) {
        error = "close failed: " + ErrnoText();
    }

    std::error_code ec;
    if (error.empty()) {
        fs::rename(temp, target, ec);
        if (ec) {
            error = "rename failed: " + ec.message();
        }
    }
    if (!error.empty()) {
        fs::remove(temp, ec);
        throw WriteError("Could not save " + path + ": " + error);
    }
    // The rename is only durable once the folder entry is.
    SyncDirectory(target.parent_path());

    DEBUG_LOG("Saved " << bytes.size() << " bytes to " << path << DEBUG_LOG_ENDL);
}

void FileStore::Append(const std::string& path, const std::vector<uint8_t>& bytes) {
    const fs::path target = Resolve(path);

    std::shared_ptr<std::mutex> pathMutex = PathLock(path);
    std::lock_guard<std::mutex> lock(*pathMutex);

    EnsureParent(target, path);

    std::error_code ec;
    const bool created = !fs::exists(target, ec);
    int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd < 0) {
        throw WriteError("Could not open " + path + " for append: " + ErrnoText());
    }
    std::string error = WriteAndSync(fd, bytes);
    if (::close(fd) != 0 && error.empty()) {
        error = "close failed: " + ErrnoText();
    }
    if (!error.empty()) {
        throw WriteError("Could not append to " + path + ": " + error);
    }
    if (created) {
        SyncDirectory(target.parent_path());
    }
}

std::vector<uint8_t> FileStore::Load(const std::string& path) const {
    const fs::path target = Resolve(path);

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw NotFound("No stored file at " + path);
    }

    std::ifstream in(target, std::ios::binary);
    if (!in) {
        throw NotFound("Could not open stored file " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool FileStore::Exists(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(Resolve(path), ec);
}

std::vector<std::string> FileStore::List(const std::string& folder) const {
    std::string prefix = fs::path(folder).lexically_normal().generic_string();
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    if (prefix == ".") {
        prefix.clear();
    }

    const fs::path dir = prefix.empty() ? _root : Resolve(prefix);

    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return out;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code statEc;
        if (!it->is_regular_file(statEc)) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (IsTempName(name)) {
            continue;
        }
        out.push_back(prefix.empty() ? name : prefix + "/" + name);
    }
    std::sort(out.begin(), out.end());
    return out;
}
