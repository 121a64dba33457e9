#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "IStore.hpp"

// IStore on a private directory. Save writes a temporary sibling and renames it over
// the target; writers to the same key are serialized. New folder entries (created
// folders, renamed or newly appended files) are synced before a write returns.
class FileStore : public IStore {
public:
    explicit FileStore(std::filesystem::path root);

    void Save(const std::string& path, const std::vector<uint8_t>& bytes) override;
    void Append(const std::string& path, const std::vector<uint8_t>& bytes) override;
    std::vector<uint8_t> Load(const std::string& path) const override;
    bool Exists(const std::string& path) const override;
    std::vector<std::string> List(const std::string& folder) const override;

    const std::filesystem::path& Root() const { return _root; }

protected:
    // fsyncs a folder so entries added to it survive a crash. Throws WriteError.
    virtual void SyncDirectory(const std::filesystem::path& dir);

private:
    void EnsureParent(const std::filesystem::path& target, const std::string& key);
    // Maps a key into the store root. Throws std::invalid_argument for keys that
    // are empty, absolute or climb out with "..".
    std::filesystem::path Resolve(const std::string& path) const;
    std::shared_ptr<std::mutex> PathLock(const std::string& path);

    std::filesystem::path _root;
    std::mutex _locks_mutex;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> _locks;
    std::atomic<uint64_t> _temp_counter;
};
