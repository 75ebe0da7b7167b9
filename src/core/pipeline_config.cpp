#include "core/pipeline_config.hpp"
#include "logging/logger.hpp"
#include <fstream>

std::shared_ptr<GuardedCall> ServiceConfig::makeGuard() const
{
    std::shared_ptr<RateLimiter> limiter;
    if (max_requests_per_minute > 0 || max_requests_per_day > 0)
    {
        limiter = std::make_shared<RateLimiter>(max_requests_per_minute, max_requests_per_day, name);
        Logger::info("Rate limit for " + name + ": " + limiter->describe());
    }
    return std::make_shared<GuardedCall>(name, limiter, std::make_shared<RetryPolicy>(retry));
}

PipelineConfig::PipelineConfig()
{
    assign(defaultYaml());
}

YAML::Node PipelineConfig::defaultYaml()
{
    return YAML::Load(R"(
        working_dir: "./work"
        log_level: "INFO"
        max_concurrency: 8
        text_generator:
          provider: "offline"
          max_attempts: 3
          initial_backoff_ms: 500
          backoff_multiplier: 2.0
          max_backoff_ms: 30000
          max_requests_per_minute: 0
          max_requests_per_day: 0
        image_generator:
          provider: "offline"
          max_attempts: 3
          initial_backoff_ms: 1000
          backoff_multiplier: 2.0
          max_backoff_ms: 60000
          max_requests_per_minute: 0
          max_requests_per_day: 0
        video_generator:
          provider: "offline"
          max_attempts: 3
          initial_backoff_ms: 5000
          backoff_multiplier: 2.0
          max_backoff_ms: 120000
          max_requests_per_minute: 0
          max_requests_per_day: 0
        frame_grabber:
          provider: "offline"
          max_attempts: 1
          initial_backoff_ms: 0
          backoff_multiplier: 1.0
          max_backoff_ms: 0
          max_requests_per_minute: 0
          max_requests_per_day: 0
    )");
}

void PipelineConfig::mergeInto(YAML::Node base, const YAML::Node &overlay)
{
    for (auto it = overlay.begin(); it != overlay.end(); ++it)
    {
        const std::string key = it->first.as<std::string>();
        if (base[key] && base[key].IsMap() && it->second.IsMap())
        {
            mergeInto(base[key], it->second);
        }
        else
        {
            base[key] = YAML::Clone(it->second);
        }
    }
}

PipelineConfig PipelineConfig::loadFromFile(const std::string &file_path)
{
    std::ifstream file_check(file_path);
    if (!file_check.good())
    {
        throw ConfigError("Configuration file not found: " + file_path);
    }

    YAML::Node node;
    try
    {
        node = YAML::LoadFile(file_path);
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigError("Cannot parse " + file_path + ": " + e.what());
    }

    PipelineConfig config = fromYaml(node);
    Logger::info("Configuration loaded from: " + file_path);
    return config;
}

PipelineConfig PipelineConfig::fromString(const std::string &yaml_text)
{
    try
    {
        return fromYaml(YAML::Load(yaml_text));
    }
    catch (const YAML::ParserException &e)
    {
        throw ConfigError(std::string("Cannot parse configuration: ") + e.what());
    }
}

PipelineConfig PipelineConfig::fromYaml(const YAML::Node &node)
{
    if (node && !node.IsNull() && !node.IsMap())
    {
        throw ConfigError("Configuration root must be a mapping");
    }

    YAML::Node merged = defaultYaml();
    if (node && node.IsMap())
    {
        mergeInto(merged, node);
    }

    PipelineConfig config;
    config.assign(merged);
    config.validate();
    return config;
}

void PipelineConfig::assign(const YAML::Node &merged)
{
    try
    {
        working_dir_ = merged["working_dir"].as<std::string>();
        log_level_ = merged["log_level"].as<std::string>();
        max_concurrency_ = merged["max_concurrency"].as<int>();
        text_generator_ = parseService("text_generator", merged["text_generator"]);
        image_generator_ = parseService("image_generator", merged["image_generator"]);
        video_generator_ = parseService("video_generator", merged["video_generator"]);
        frame_grabber_ = parseService("frame_grabber", merged["frame_grabber"]);
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }
}

ServiceConfig PipelineConfig::parseService(const std::string &name, const YAML::Node &node)
{
    if (!node.IsMap())
    {
        throw ConfigError(name + " must be a mapping");
    }

    ServiceConfig service;
    service.name = name;
    service.provider = node["provider"].as<std::string>();
    service.retry.max_attempts = node["max_attempts"].as<int>();
    service.retry.initial_backoff = std::chrono::milliseconds(node["initial_backoff_ms"].as<long long>());
    service.retry.backoff_multiplier = node["backoff_multiplier"].as<double>();
    service.retry.max_backoff = std::chrono::milliseconds(node["max_backoff_ms"].as<long long>());
    service.max_requests_per_minute = node["max_requests_per_minute"].as<int>();
    service.max_requests_per_day = node["max_requests_per_day"].as<int>();
    service.settings = YAML::Clone(node);
    return service;
}

void PipelineConfig::setWorkingDir(const std::string &working_dir)
{
    working_dir_ = working_dir;
    validate();
}

void PipelineConfig::setLogLevel(const std::string &log_level)
{
    log_level_ = log_level;
    validate();
}

void PipelineConfig::setMaxConcurrency(int max_concurrency)
{
    max_concurrency_ = max_concurrency;
    validate();
}

void PipelineConfig::validate() const
{
    if (working_dir_.empty())
    {
        throw ConfigError("working_dir must not be empty");
    }
    if (!Logger::isValidLevel(log_level_))
    {
        throw ConfigError("Invalid log level: " + log_level_);
    }
    if (max_concurrency_ < 1)
    {
        throw ConfigError("max_concurrency must be at least 1, got " + std::to_string(max_concurrency_));
    }
    validateService(text_generator_);
    validateService(image_generator_);
    validateService(video_generator_);
    validateService(frame_grabber_);
}

void PipelineConfig::validateService(const ServiceConfig &service)
{
    if (service.provider.empty())
    {
        throw ConfigError(service.name + ".provider must not be empty");
    }
    if (service.retry.max_attempts < 1)
    {
        throw ConfigError(service.name + ".max_attempts must be at least 1");
    }
    if (service.retry.initial_backoff.count() < 0 || service.retry.max_backoff.count() < 0)
    {
        throw ConfigError(service.name + " backoff delays must not be negative");
    }
    if (service.retry.backoff_multiplier < 1.0)
    {
        throw ConfigError(service.name + ".backoff_multiplier must be at least 1.0");
    }
    if (service.max_requests_per_minute < 0 || service.max_requests_per_day < 0)
    {
        throw ConfigError(service.name + " request quotas must not be negative");
    }
}

YAML::Node PipelineConfig::toYaml() const
{
    YAML::Node node;
    node["working_dir"] = working_dir_;
    node["log_level"] = log_level_;
    node["max_concurrency"] = max_concurrency_;
    for (const ServiceConfig *service : {&text_generator_, &image_generator_, &video_generator_, &frame_grabber_})
    {
        YAML::Node section;
        section["provider"] = service->provider;
        section["max_attempts"] = service->retry.max_attempts;
        section["initial_backoff_ms"] = static_cast<long long>(service->retry.initial_backoff.count());
        section["backoff_multiplier"] = service->retry.backoff_multiplier;
        section["max_backoff_ms"] = static_cast<long long>(service->retry.max_backoff.count());
        section["max_requests_per_minute"] = service->max_requests_per_minute;
        section["max_requests_per_day"] = service->max_requests_per_day;
        node[service->name] = section;
    }
    return node;
}
