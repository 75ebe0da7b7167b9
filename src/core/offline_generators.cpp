#include "core/offline_generators.hpp"
#include "core/cache_store.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>

namespace
{
    // The offline selector passes at most this many references on
    const size_t MAX_SELECTED_REFERENCES = 3;

    void simulateLatency(const OfflineSettings &settings)
    {
        if (settings.latency.count() > 0)
        {
            std::this_thread::sleep_for(settings.latency);
        }
    }

    std::string digestOf(const std::string &text)
    {
        return CacheStore::sha256Hex(std::vector<uint8_t>(text.begin(), text.end()));
    }

    std::string joinPaths(const std::vector<std::string> &paths)
    {
        std::string out;
        for (const auto &path : paths)
        {
            out += path + "\n";
        }
        return out;
    }
}

OfflineSettings OfflineSettings::fromYaml(const YAML::Node &node)
{
    OfflineSettings settings;
    if (node && node.IsMap() && node["latency_ms"])
    {
        int latency_ms = node["latency_ms"].as<int>();
        if (latency_ms < 0)
        {
            throw ConfigError("latency_ms must not be negative");
        }
        settings.latency = std::chrono::milliseconds(latency_ms);
    }
    return settings;
}

nlohmann::json OfflineTextGenerator::selectReferencesAndPrompt(const FramePromptRequest &request)
{
    simulateLatency(settings_);

    nlohmann::json pairs = nlohmann::json::array();
    for (size_t i = 0; i < request.available_references.size() && i < MAX_SELECTED_REFERENCES; ++i)
    {
        const auto &reference = request.available_references[i];
        pairs.push_back({reference.path, reference.description});
    }

    nlohmann::json out;
    out["reference_image_path_and_text_pairs"] = pairs;
    out["text_prompt"] = request.frame_desc;
    return out;
}

GeneratedArtifact OfflineImageGenerator::generateImage(const ImageRequest &request)
{
    simulateLatency(settings_);

    std::ostringstream body;
    body << "STORYREEL OFFLINE IMAGE\n"
         << "size: " << request.size << "\n"
         << "prompt-sha256: " << digestOf(request.prompt) << "\n"
         << "references-sha256: " << digestOf(joinPaths(request.reference_image_paths)) << "\n";
    return GeneratedArtifact::fromString(body.str(), "png");
}

GeneratedArtifact OfflineVideoGenerator::generateVideo(const VideoRequest &request)
{
    simulateLatency(settings_);

    std::ostringstream body;
    body << "STORYREEL OFFLINE VIDEO\n"
         << "duration: " << request.duration_seconds << "s\n"
         << "keyframes: " << request.reference_image_paths.size() << "\n"
         << "prompt-sha256: " << digestOf(request.prompt) << "\n"
         << "keyframes-sha256: " << digestOf(joinPaths(request.reference_image_paths)) << "\n";
    return GeneratedArtifact::fromString(body.str(), "mp4");
}

GeneratedArtifact OfflineFrameGrabber::grabLastFrame(const std::filesystem::path &video_path)
{
    simulateLatency(settings_);

    std::ifstream in(video_path, std::ios::binary);
    if (!in)
    {
        throw NotFoundError("Cannot open video for frame grab: " + video_path.string());
    }
    std::vector<uint8_t> video((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    std::ostringstream body;
    body << "STORYREEL OFFLINE IMAGE\n"
         << "grabbed-from-sha256: " << CacheStore::sha256Hex(video) << "\n";
    return GeneratedArtifact::fromString(body.str(), "png");
}
