#include "core/cache_store.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <openssl/sha.h>
#include <sstream>
#include <cerrno>
#include <csignal>
#include <system_error>
#include <unistd.h>

namespace
{
    std::string shotDir(int shot_idx)
    {
        return "shots/" + std::to_string(shot_idx) + "/";
    }

    const std::string kTempMarker = ".tmp-";

    // Writer pid of a "<name>.tmp-<pid>-<n>" file, or 0 for any other file
    pid_t tempFileOwner(const std::string &filename)
    {
        const size_t marker = filename.rfind(kTempMarker);
        if (marker == std::string::npos)
        {
            return 0;
        }
        const size_t start = marker + kTempMarker.size();
        const size_t dash = filename.find('-', start);
        if (dash == std::string::npos || dash == start)
        {
            return 0;
        }
        long long pid = 0;
        for (size_t i = start; i < dash; ++i)
        {
            if (filename[i] < '0' || filename[i] > '9')
            {
                return 0;
            }
            pid = pid * 10 + (filename[i] - '0');
            if (pid > std::numeric_limits<pid_t>::max())
            {
                return 0;
            }
        }
        return static_cast<pid_t>(pid);
    }

    bool processAlive(pid_t pid)
    {
        return kill(pid, 0) == 0 || errno == EPERM;
    }

    std::string transitionDir(int parent_cam_idx, int child_cam_idx)
    {
        return "transitions/cam_" + std::to_string(parent_cam_idx) + "_to_cam_" +
               std::to_string(child_cam_idx) + "/";
    }

    std::atomic<uint64_t> tmp_counter{0};
}

CacheKey CacheKey::forTask(const TaskId &task)
{
    if (task.kind == ArtifactKind::SHOT_VIDEO)
    {
        return shotVideo(task.shot_idx);
    }
    return frame(task.shot_idx, task.kind);
}

CacheKey CacheKey::frame(int shot_idx, ArtifactKind kind)
{
    if (!ArtifactKinds::isFrame(kind))
    {
        throw std::invalid_argument("CacheKey::frame requires a frame kind, got " + ArtifactKinds::getName(kind));
    }
    return CacheKey(shotDir(shot_idx) + ArtifactKinds::getName(kind) + ".png");
}

CacheKey CacheKey::shotVideo(int shot_idx)
{
    return CacheKey(shotDir(shot_idx) + "video.mp4");
}

CacheKey CacheKey::selectorOutput(int shot_idx, ArtifactKind frame_kind)
{
    return CacheKey(shotDir(shot_idx) + ArtifactKinds::getName(frame_kind) + "_selector_output.json");
}

CacheKey CacheKey::transitionVideo(int parent_cam_idx, int child_cam_idx)
{
    return CacheKey(transitionDir(parent_cam_idx, child_cam_idx) + "transition.mp4");
}

CacheKey CacheKey::newCameraImage(int parent_cam_idx, int child_cam_idx)
{
    return CacheKey(transitionDir(parent_cam_idx, child_cam_idx) + "new_camera.png");
}

CacheKey CacheKey::cameraTree()
{
    return CacheKey("camera_tree.json");
}

CacheKey CacheKey::runManifest()
{
    return CacheKey("run_manifest.json");
}

CacheStore::CacheStore(const fs::path &working_dir)
    : working_dir_(working_dir)
{
    std::error_code ec;
    fs::create_directories(working_dir_, ec);
    if (ec)
    {
        throw FatalIOError("Cannot create working directory " + working_dir_.string() + ": " + ec.message());
    }
    removeStaleTempFiles();
}

fs::path CacheStore::pathFor(const CacheKey &key) const
{
    return working_dir_ / key.relativePath();
}

bool CacheStore::exists(const CacheKey &key) const
{
    std::error_code ec;
    bool found = fs::is_regular_file(pathFor(key), ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        throw FatalIOError("Cannot stat " + pathFor(key).string() + ": " + ec.message());
    }
    return found;
}

GeneratedArtifact CacheStore::load(const CacheKey &key) const
{
    const fs::path path = pathFor(key);
    if (!exists(key))
    {
        throw NotFoundError("No cached artifact at " + path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw FatalIOError("Cannot open cached artifact " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        throw FatalIOError("Read failed for cached artifact " + path.string());
    }

    std::string format = path.extension().string();
    if (!format.empty() && format.front() == '.')
    {
        format.erase(0, 1);
    }
    return GeneratedArtifact(data, format);
}

void CacheStore::save(const CacheKey &key, const GeneratedArtifact &artifact)
{
    writeAtomically(pathFor(key), artifact.data);
    Logger::debug("Cached " + key.relativePath() + " (" + std::to_string(artifact.data.size()) + " bytes)");
}

nlohmann::json CacheStore::loadJson(const CacheKey &key) const
{
    GeneratedArtifact artifact = load(key);
    try
    {
        return nlohmann::json::parse(artifact.data.begin(), artifact.data.end());
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ValidationError("Cached document " + key.relativePath() + " is not valid JSON: " + e.what());
    }
}

void CacheStore::saveJson(const CacheKey &key, const nlohmann::json &doc)
{
    save(key, GeneratedArtifact::fromString(doc.dump(4), "json"));
}

void CacheStore::copy(const CacheKey &from, const CacheKey &to)
{
    save(to, load(from));
}

bool CacheStore::remove(const CacheKey &key)
{
    std::error_code ec;
    bool removed = fs::remove(pathFor(key), ec);
    if (ec)
    {
        throw FatalIOError("Cannot remove " + pathFor(key).string() + ": " + ec.message());
    }
    if (removed)
    {
        Logger::info("Removed stale cache entry " + key.relativePath());
    }
    return removed;
}

std::string CacheStore::digest(const CacheKey &key) const
{
    return sha256Hex(load(key).data);
}

std::string CacheStore::sha256Hex(const std::vector<uint8_t> &data)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

size_t CacheStore::removeStaleTempFiles()
{
    std::vector<fs::path> stale;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(working_dir_, ec), end; !ec && it != end; it.increment(ec))
    {
        if (!it->is_regular_file(ec))
        {
            continue;
        }
        const pid_t owner = tempFileOwner(it->path().filename().string());
        if (owner > 0 && owner != getpid() && !processAlive(owner))
        {
            stale.push_back(it->path());
        }
    }
    if (ec)
    {
        Logger::warn("Temp file sweep of " + working_dir_.string() + " incomplete: " + ec.message());
    }

    size_t removed = 0;
    for (const auto &path : stale)
    {
        std::error_code remove_ec;
        if (fs::remove(path, remove_ec))
        {
            ++removed;
        }
        else if (remove_ec)
        {
            Logger::warn("Cannot remove stale temp file " + path.string() + ": " + remove_ec.message());
        }
    }
    if (removed > 0)
    {
        Logger::info("Removed " + std::to_string(removed) + " stale temp files under " + working_dir_.string());
    }
    return removed;
}

void CacheStore::writeAtomically(const fs::path &target, const std::vector<uint8_t> &data)
{
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec)
    {
        throw FatalIOError("Cannot create directory " + target.parent_path().string() + ": " + ec.message());
    }

    // Unique per process and per write so concurrent writers of one key never share a temp file
    fs::path tmp = target;
    tmp += kTempMarker + std::to_string(getpid()) + "-" + std::to_string(tmp_counter.fetch_add(1));

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            throw FatalIOError("Cannot open " + tmp.string() + " for writing");
        }
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out)
        {
            out.close();
            fs::remove(tmp, ec);
            throw FatalIOError("Write failed for " + target.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec)
    {
        std::error_code cleanup_ec;
        fs::remove(tmp, cleanup_ec);
        throw FatalIOError("Cannot move " + tmp.string() + " into place: " + ec.message());
    }
}
