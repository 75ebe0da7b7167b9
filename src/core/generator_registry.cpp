#include "core/generator_registry.hpp"
#include "core/offline_generators.hpp"
#include "logging/logger.hpp"

namespace
{
    template <typename Map>
    typename Map::mapped_type findFactory(const Map &factories, GeneratorCapability capability,
                                          const std::string &provider)
    {
        auto it = factories.find(provider);
        if (it == factories.end())
        {
            std::string known;
            for (const auto &entry : factories)
            {
                known += (known.empty() ? "" : ", ") + entry.first;
            }
            throw ConfigError("Unknown " + GeneratorCapabilities::getName(capability) + " provider '" + provider +
                              "' (registered: " + (known.empty() ? "none" : known) + ")");
        }
        return it->second;
    }

    template <typename Map>
    std::vector<std::string> keysOf(const Map &factories)
    {
        std::vector<std::string> out;
        for (const auto &entry : factories)
        {
            out.push_back(entry.first);
        }
        return out;
    }
}

GeneratorRegistry GeneratorRegistry::withBuiltins()
{
    GeneratorRegistry registry;
    registry.registerText("offline", [](const YAML::Node &settings)
                          { return std::make_shared<OfflineTextGenerator>(OfflineSettings::fromYaml(settings)); });
    registry.registerImage("offline", [](const YAML::Node &settings)
                           { return std::make_shared<OfflineImageGenerator>(OfflineSettings::fromYaml(settings)); });
    registry.registerVideo("offline", [](const YAML::Node &settings)
                           { return std::make_shared<OfflineVideoGenerator>(OfflineSettings::fromYaml(settings)); });
    registry.registerFrameGrabber("offline", [](const YAML::Node &settings)
                                  { return std::make_shared<OfflineFrameGrabber>(OfflineSettings::fromYaml(settings)); });
    return registry;
}

void GeneratorRegistry::registerText(const std::string &provider, TextFactory factory)
{
    text_factories_[provider] = std::move(factory);
}

void GeneratorRegistry::registerImage(const std::string &provider, ImageFactory factory)
{
    image_factories_[provider] = std::move(factory);
}

void GeneratorRegistry::registerVideo(const std::string &provider, VideoFactory factory)
{
    video_factories_[provider] = std::move(factory);
}

void GeneratorRegistry::registerFrameGrabber(const std::string &provider, FrameGrabberFactory factory)
{
    frame_grabber_factories_[provider] = std::move(factory);
}

std::shared_ptr<TextGenerator> GeneratorRegistry::createText(const std::string &provider, const YAML::Node &settings) const
{
    Logger::debug("Creating text generator: " + provider);
    return findFactory(text_factories_, GeneratorCapability::TEXT, provider)(settings);
}

std::shared_ptr<ImageGenerator> GeneratorRegistry::createImage(const std::string &provider, const YAML::Node &settings) const
{
    Logger::debug("Creating image generator: " + provider);
    return findFactory(image_factories_, GeneratorCapability::IMAGE, provider)(settings);
}

std::shared_ptr<VideoGenerator> GeneratorRegistry::createVideo(const std::string &provider, const YAML::Node &settings) const
{
    Logger::debug("Creating video generator: " + provider);
    return findFactory(video_factories_, GeneratorCapability::VIDEO, provider)(settings);
}

std::shared_ptr<FrameGrabber> GeneratorRegistry::createFrameGrabber(const std::string &provider, const YAML::Node &settings) const
{
    Logger::debug("Creating frame grabber: " + provider);
    return findFactory(frame_grabber_factories_, GeneratorCapability::FRAME_GRABBER, provider)(settings);
}

bool GeneratorRegistry::hasProvider(GeneratorCapability capability, const std::string &provider) const
{
    switch (capability)
    {
    case GeneratorCapability::TEXT:
        return text_factories_.count(provider) > 0;
    case GeneratorCapability::IMAGE:
        return image_factories_.count(provider) > 0;
    case GeneratorCapability::VIDEO:
        return video_factories_.count(provider) > 0;
    case GeneratorCapability::FRAME_GRABBER:
        return frame_grabber_factories_.count(provider) > 0;
    }
    return false;
}

std::vector<std::string> GeneratorRegistry::providers(GeneratorCapability capability) const
{
    switch (capability)
    {
    case GeneratorCapability::TEXT:
        return keysOf(text_factories_);
    case GeneratorCapability::IMAGE:
        return keysOf(image_factories_);
    case GeneratorCapability::VIDEO:
        return keysOf(video_factories_);
    case GeneratorCapability::FRAME_GRABBER:
        return keysOf(frame_grabber_factories_);
    }
    return {};
}
