#pragma once

#include <memory>
#include <string>
#include <yaml-cpp/yaml.h>
#include "core/guarded_call.hpp"
#include "core/retry_policy.hpp"

/**
 * @brief Provider and call policy of one remote service class
 */
struct ServiceConfig
{
    std::string name;
    std::string provider = "offline";
    RetryOptions retry;
    int max_requests_per_minute = 0;
    int max_requests_per_day = 0;

    // Whole YAML section, handed to the provider factory
    YAML::Node settings;

    // Limiter (or nullptr when both quotas are 0) plus retry policy
    std::shared_ptr<GuardedCall> makeGuard() const;
};

/**
 * @brief Resolved run configuration loaded from YAML
 *
 * Values not present in the file fall back to built-in defaults. Every
 * numeric policy is validated at load time; problems raise ConfigError so
 * the run never starts with a half-valid configuration.
 */
class PipelineConfig
{
public:
    PipelineConfig();

    static PipelineConfig loadFromFile(const std::string &file_path);
    static PipelineConfig fromYaml(const YAML::Node &node);
    static PipelineConfig fromString(const std::string &yaml_text);

    const std::string &getWorkingDir() const { return working_dir_; }
    const std::string &getLogLevel() const { return log_level_; }
    int getMaxConcurrency() const { return max_concurrency_; }

    const ServiceConfig &getTextGenerator() const { return text_generator_; }
    const ServiceConfig &getImageGenerator() const { return image_generator_; }
    const ServiceConfig &getVideoGenerator() const { return video_generator_; }
    const ServiceConfig &getFrameGrabber() const { return frame_grabber_; }

    // Command-line overrides
    void setWorkingDir(const std::string &working_dir);
    void setLogLevel(const std::string &log_level);
    void setMaxConcurrency(int max_concurrency);

    /**
     * @throws ConfigError describing the first invalid value
     */
    void validate() const;

    YAML::Node toYaml() const;

private:
    void assign(const YAML::Node &merged);

    static YAML::Node defaultYaml();
    static void mergeInto(YAML::Node base, const YAML::Node &overlay);
    static ServiceConfig parseService(const std::string &name, const YAML::Node &node);
    static void validateService(const ServiceConfig &service);

    std::string working_dir_;
    std::string log_level_;
    int max_concurrency_ = 8;
    ServiceConfig text_generator_;
    ServiceConfig image_generator_;
    ServiceConfig video_generator_;
    ServiceConfig frame_grabber_;
};
