#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "core/shot_types.hpp"

namespace fs = std::filesystem;

/**
 * @brief Deterministic, human-inspectable location of one cached artifact
 *
 * Keys depend only on task identity; the working directory supplies the
 * namespace. No timestamps or random components, so re-running the same
 * configuration against the same directory finds the same entries.
 */
class CacheKey
{
public:
    static CacheKey forTask(const TaskId &task);
    static CacheKey frame(int shot_idx, ArtifactKind kind);
    static CacheKey shotVideo(int shot_idx);
    static CacheKey selectorOutput(int shot_idx, ArtifactKind frame_kind);
    static CacheKey transitionVideo(int parent_cam_idx, int child_cam_idx);
    static CacheKey newCameraImage(int parent_cam_idx, int child_cam_idx);
    static CacheKey cameraTree();
    static CacheKey runManifest();

    const std::string &relativePath() const { return relative_path_; }

    bool operator==(const CacheKey &other) const { return relative_path_ == other.relative_path_; }
    bool operator!=(const CacheKey &other) const { return !(*this == other); }

private:
    explicit CacheKey(std::string relative_path) : relative_path_(std::move(relative_path)) {}

    std::string relative_path_;
};

/**
 * @brief Path-based persistence of task results under one working directory
 *
 * Entries are written once and never edited in place: save() writes a
 * temporary sibling and renames it over the target, remove() deletes a stale
 * entry. Disk failures raise FatalIOError; a missing entry raises
 * NotFoundError from load().
 *
 * Safe for concurrent use. Writers of distinct keys never touch the same
 * file and a second write of one key simply replaces the first.
 *
 * Construction sweeps temporary files left behind by processes that died
 * mid-write.
 */
class CacheStore
{
public:
    explicit CacheStore(const fs::path &working_dir);

    const fs::path &workingDir() const { return working_dir_; }
    fs::path pathFor(const CacheKey &key) const;

    bool exists(const CacheKey &key) const;

    GeneratedArtifact load(const CacheKey &key) const;
    void save(const CacheKey &key, const GeneratedArtifact &artifact);

    nlohmann::json loadJson(const CacheKey &key) const;
    void saveJson(const CacheKey &key, const nlohmann::json &doc);

    // Copy an existing entry to another key (used when one artifact stands in for another)
    void copy(const CacheKey &from, const CacheKey &to);

    // Delete a stale entry; returns false when it did not exist
    bool remove(const CacheKey &key);

    /**
     * @brief Hex SHA-256 of an entry's bytes
     * @throws NotFoundError when the entry does not exist
     */
    std::string digest(const CacheKey &key) const;

    static std::string sha256Hex(const std::vector<uint8_t> &data);

    /**
     * @brief Delete temp siblings whose writer process is gone
     * @return number of files removed
     */
    size_t removeStaleTempFiles();

private:
    void writeAtomically(const fs::path &target, const std::vector<uint8_t> &data);

    fs::path working_dir_;
};
