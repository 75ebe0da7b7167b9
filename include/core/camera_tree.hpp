#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "core/shot_types.hpp"

/**
 * @brief Forest of cameras in introduction order
 *
 * A camera's parent always appears earlier in cameras(); validate() checks
 * this (and the shot-membership rules) rather than trusting whoever built or
 * serialized the tree.
 */
class CameraTree
{
public:
    CameraTree() = default;
    explicit CameraTree(std::vector<Camera> cameras);

    const std::vector<Camera> &cameras() const { return cameras_; }
    size_t size() const { return cameras_.size(); }
    bool empty() const { return cameras_.empty(); }

    const Camera *findCamera(int cam_idx) const;

    /**
     * @brief Camera filming the given shot
     * @throws NotFoundError when no camera contains the shot
     */
    const Camera &cameraOf(int shot_idx) const;

    std::vector<const Camera *> roots() const;
    std::vector<const Camera *> children(int cam_idx) const;

    /**
     * @brief Position of a camera in introduction order, or -1
     */
    int introductionIndex(int cam_idx) const;

    /**
     * @brief Check the forest against the shot list
     * @throws ValidationError describing the first violated rule
     */
    void validate(const std::vector<Shot> &shots) const;

    nlohmann::json toJson() const;
    static CameraTree fromJson(const nlohmann::json &doc);

private:
    std::vector<Camera> cameras_;
};

/**
 * @brief How much of a child shot's content a parent shot already establishes
 */
struct ShotCoverage
{
    bool fully_covers = false;
    std::optional<std::string> missing_info;
};

/**
 * @brief Composition-similarity decisions used while building the camera tree
 *
 * The planner that makes these calls in production (an LLM comparing shot
 * compositions) is an external collaborator; it plugs in behind this
 * interface.
 */
class ShotMatcher
{
public:
    virtual ~ShotMatcher() = default;

    // Similarity of two shots' compositions in [0, 1]
    virtual double similarity(const Shot &a, const Shot &b) const = 0;

    // Minimum similarity for a shot to stay on an already open camera
    virtual double sameCameraThreshold() const = 0;

    // Minimum similarity for an earlier camera to become the parent of a new one
    virtual double parentThreshold() const = 0;

    virtual ShotCoverage coverage(const Shot &parent, const Shot &child) const = 0;
};

/**
 * @brief Token-overlap matcher over the shots' visual descriptions
 */
class DescriptionOverlapMatcher : public ShotMatcher
{
public:
    explicit DescriptionOverlapMatcher(double same_camera_threshold = 0.6,
                                       double parent_threshold = 0.2,
                                       double full_coverage_threshold = 0.8);

    double similarity(const Shot &a, const Shot &b) const override;
    double sameCameraThreshold() const override { return same_camera_threshold_; }
    double parentThreshold() const override { return parent_threshold_; }
    ShotCoverage coverage(const Shot &parent, const Shot &child) const override;

    static std::vector<std::string> tokenize(const std::string &text);

private:
    double same_camera_threshold_;
    double parent_threshold_;
    double full_coverage_threshold_;
};

/**
 * @brief Classification-then-linking construction of the camera forest
 *
 * For each shot in order: join the camera named by its cam_idx hint, or the
 * most similar open camera, or open a new one. A new camera is linked to the
 * parent named by its hints, or else to the best-matching earlier camera;
 * ties prefer the most recently active camera.
 */
class CameraTreeBuilder
{
public:
    explicit CameraTreeBuilder(std::shared_ptr<const ShotMatcher> matcher = nullptr);

    /**
     * @throws ValidationError when hints reference unknown or later cameras/shots
     */
    CameraTree build(const std::vector<Shot> &shots) const;

private:
    struct ParentChoice
    {
        int cam_idx = -1;
        int shot_idx = -1;
        double score = 0.0;
        int last_active_shot = -1;
    };

    void linkFromHints(Camera &camera, const Shot &shot, const std::vector<Camera> &cameras,
                       const std::vector<Shot> &shots) const;
    void linkByMatching(Camera &camera, const Shot &shot, const std::vector<Camera> &cameras,
                        const std::vector<Shot> &shots) const;

    std::shared_ptr<const ShotMatcher> matcher_;
};
