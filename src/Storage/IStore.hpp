#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../common/Errors.hpp"

// Hierarchical key -> bytes storage. Keys look like "renders/mixdown.wav".
class IStore {
public:
    virtual ~IStore() = default;

    // Replaces the content at path atomically; readers see old or new bytes, never a mix.
    // Missing parent folders are created. Throws WriteError.
    virtual void Save(const std::string& path, const std::vector<uint8_t>& bytes) = 0;

    // Adds bytes to the end of path, creating it if needed. Throws WriteError.
    virtual void Append(const std::string& path, const std::vector<uint8_t>& bytes) = 0;

    // Throws NotFound.
    virtual std::vector<uint8_t> Load(const std::string& path) const = 0;

    virtual bool Exists(const std::string& path) const = 0;

    // Files directly inside folder, as full keys, in lexicographic order.
    virtual std::vector<std::string> List(const std::string& folder) const = 0;

    // Last file of List(folder), or nothing if the folder has no files.
    std::optional<std::vector<uint8_t>> LoadLatest(const std::string& folder) const {
        std::vector<std::string> files = List(folder);
        if (files.empty()) {
            return std::nullopt;
        }
        return Load(files.back());
    }
};
