#include "core/camera_tree.hpp"
#include "core/shot_list_io.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <set>

namespace
{
    const std::set<std::string> kStopWords = {
        "the", "and", "with", "from", "into", "onto", "that", "this", "his", "her",
        "their", "its", "are", "was", "were", "for", "while", "over", "under", "shot"};

    std::map<int, const Shot *> indexShots(const std::vector<Shot> &shots)
    {
        std::map<int, const Shot *> by_idx;
        for (const auto &shot : shots)
        {
            by_idx[shot.idx] = &shot;
        }
        return by_idx;
    }

    Camera *findMutable(std::vector<Camera> &cameras, int cam_idx)
    {
        auto it = std::find_if(cameras.begin(), cameras.end(), [cam_idx](const Camera &c)
                               { return c.idx == cam_idx; });
        return it == cameras.end() ? nullptr : &*it;
    }

    const Camera *findConst(const std::vector<Camera> &cameras, int cam_idx)
    {
        auto it = std::find_if(cameras.begin(), cameras.end(), [cam_idx](const Camera &c)
                               { return c.idx == cam_idx; });
        return it == cameras.end() ? nullptr : &*it;
    }

    const Camera *cameraContaining(const std::vector<Camera> &cameras, int shot_idx)
    {
        for (const auto &camera : cameras)
        {
            if (std::find(camera.active_shot_idxs.begin(), camera.active_shot_idxs.end(), shot_idx) !=
                camera.active_shot_idxs.end())
            {
                return &camera;
            }
        }
        return nullptr;
    }

    int nextFreeCameraIdx(const std::vector<Camera> &cameras)
    {
        int next = 0;
        for (const auto &camera : cameras)
        {
            next = std::max(next, camera.idx + 1);
        }
        return next;
    }
}

// ---------------------------------------------------------------------------
// CameraTree
// ---------------------------------------------------------------------------

CameraTree::CameraTree(std::vector<Camera> cameras)
    : cameras_(std::move(cameras))
{
}

const Camera *CameraTree::findCamera(int cam_idx) const
{
    return findConst(cameras_, cam_idx);
}

const Camera &CameraTree::cameraOf(int shot_idx) const
{
    const Camera *camera = cameraContaining(cameras_, shot_idx);
    if (!camera)
    {
        throw NotFoundError("No camera films shot " + std::to_string(shot_idx));
    }
    return *camera;
}

std::vector<const Camera *> CameraTree::roots() const
{
    std::vector<const Camera *> out;
    for (const auto &camera : cameras_)
    {
        if (camera.isRoot())
            out.push_back(&camera);
    }
    return out;
}

std::vector<const Camera *> CameraTree::children(int cam_idx) const
{
    std::vector<const Camera *> out;
    for (const auto &camera : cameras_)
    {
        if (camera.parent_cam_idx && *camera.parent_cam_idx == cam_idx)
            out.push_back(&camera);
    }
    return out;
}

int CameraTree::introductionIndex(int cam_idx) const
{
    for (size_t i = 0; i < cameras_.size(); ++i)
    {
        if (cameras_[i].idx == cam_idx)
            return static_cast<int>(i);
    }
    return -1;
}

void CameraTree::validate(const std::vector<Shot> &shots) const
{
    auto shots_by_idx = indexShots(shots);
    std::map<int, int> owner; // shot idx -> camera idx
    std::set<int> seen_cameras;
    int previous_leading_shot = -1;

    for (size_t position = 0; position < cameras_.size(); ++position)
    {
        const Camera &camera = cameras_[position];
        const std::string cam_name = "Camera " + std::to_string(camera.idx);

        if (!seen_cameras.insert(camera.idx).second)
        {
            throw ValidationError(cam_name + " appears more than once");
        }
        if (camera.active_shot_idxs.empty())
        {
            throw ValidationError(cam_name + " films no shots");
        }

        for (size_t i = 0; i < camera.active_shot_idxs.size(); ++i)
        {
            int shot_idx = camera.active_shot_idxs[i];
            if (shots_by_idx.find(shot_idx) == shots_by_idx.end())
            {
                throw ValidationError(cam_name + " references unknown shot " + std::to_string(shot_idx));
            }
            if (i > 0 && shot_idx <= camera.active_shot_idxs[i - 1])
            {
                throw ValidationError(cam_name + " does not keep its shots in original order");
            }
            if (!owner.emplace(shot_idx, camera.idx).second)
            {
                throw ValidationError("Shot " + std::to_string(shot_idx) + " belongs to cameras " +
                                      std::to_string(owner[shot_idx]) + " and " + std::to_string(camera.idx));
            }
        }

        if (camera.leadingShotIdx() <= previous_leading_shot)
        {
            throw ValidationError(cam_name + " is listed out of introduction order");
        }
        previous_leading_shot = camera.leadingShotIdx();

        if (camera.parent_cam_idx.has_value() != camera.parent_shot_idx.has_value())
        {
            throw ValidationError(cam_name + " must name both a parent camera and a parent shot, or neither");
        }
        if (!camera.parent_cam_idx)
        {
            continue;
        }

        int parent_position = introductionIndex(*camera.parent_cam_idx);
        if (parent_position < 0)
        {
            throw ValidationError(cam_name + " has unknown parent camera " + std::to_string(*camera.parent_cam_idx));
        }
        if (static_cast<size_t>(parent_position) >= position)
        {
            throw ValidationError(cam_name + " has parent camera " + std::to_string(*camera.parent_cam_idx) +
                                  " that is not introduced before it");
        }

        const Camera &parent = cameras_[parent_position];
        int parent_shot = *camera.parent_shot_idx;
        if (std::find(parent.active_shot_idxs.begin(), parent.active_shot_idxs.end(), parent_shot) ==
            parent.active_shot_idxs.end())
        {
            throw ValidationError(cam_name + " derives from shot " + std::to_string(parent_shot) +
                                  " which camera " + std::to_string(parent.idx) + " does not film");
        }
        if (parent_shot >= camera.leadingShotIdx())
        {
            throw ValidationError(cam_name + " derives from shot " + std::to_string(parent_shot) +
                                  " which does not precede its first shot");
        }
    }

    for (const auto &shot : shots)
    {
        if (owner.find(shot.idx) == owner.end())
        {
            throw ValidationError("Shot " + std::to_string(shot.idx) + " is not filmed by any camera");
        }
    }
}

nlohmann::json CameraTree::toJson() const
{
    return ShotListIO::camerasToJson(cameras_);
}

CameraTree CameraTree::fromJson(const nlohmann::json &doc)
{
    return CameraTree(ShotListIO::camerasFromJson(doc));
}

// ---------------------------------------------------------------------------
// DescriptionOverlapMatcher
// ---------------------------------------------------------------------------

DescriptionOverlapMatcher::DescriptionOverlapMatcher(double same_camera_threshold,
                                                     double parent_threshold,
                                                     double full_coverage_threshold)
    : same_camera_threshold_(same_camera_threshold),
      parent_threshold_(parent_threshold),
      full_coverage_threshold_(full_coverage_threshold)
{
}

std::vector<std::string> DescriptionOverlapMatcher::tokenize(const std::string &text)
{
    std::set<std::string> unique;
    std::string current;
    auto flush = [&]()
    {
        if (current.size() >= 3 && kStopWords.find(current) == kStopWords.end())
        {
            unique.insert(current);
        }
        current.clear();
    };

    for (char c : text)
    {
        if (std::isalnum(static_cast<unsigned char>(c)))
        {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        else
        {
            flush();
        }
    }
    flush();
    return std::vector<std::string>(unique.begin(), unique.end());
}

double DescriptionOverlapMatcher::similarity(const Shot &a, const Shot &b) const
{
    auto ta = tokenize(a.visual_desc);
    auto tb = tokenize(b.visual_desc);
    if (ta.empty() || tb.empty())
    {
        return 0.0;
    }

    std::vector<std::string> shared;
    std::set_intersection(ta.begin(), ta.end(), tb.begin(), tb.end(), std::back_inserter(shared));
    size_t union_size = ta.size() + tb.size() - shared.size();
    return static_cast<double>(shared.size()) / static_cast<double>(union_size);
}

ShotCoverage DescriptionOverlapMatcher::coverage(const Shot &parent, const Shot &child) const
{
    auto tp = tokenize(parent.visual_desc);
    auto tc = tokenize(child.visual_desc);

    ShotCoverage result;
    if (tc.empty())
    {
        result.fully_covers = true;
        return result;
    }

    std::vector<std::string> missing;
    std::set_difference(tc.begin(), tc.end(), tp.begin(), tp.end(), std::back_inserter(missing));
    double covered = 1.0 - static_cast<double>(missing.size()) / static_cast<double>(tc.size());

    result.fully_covers = covered >= full_coverage_threshold_;
    if (!result.fully_covers)
    {
        std::string note;
        for (const auto &token : missing)
        {
            if (!note.empty())
                note += ", ";
            note += token;
        }
        result.missing_info = "Not established by the parent shot: " + note;
    }
    return result;
}

// ---------------------------------------------------------------------------
// CameraTreeBuilder
// ---------------------------------------------------------------------------

CameraTreeBuilder::CameraTreeBuilder(std::shared_ptr<const ShotMatcher> matcher)
    : matcher_(std::move(matcher))
{
    if (!matcher_)
    {
        matcher_ = std::make_shared<DescriptionOverlapMatcher>();
    }
}

CameraTree CameraTreeBuilder::build(const std::vector<Shot> &shots) const
{
    auto shots_by_idx = indexShots(shots);
    std::vector<Camera> cameras;

    for (const auto &shot : shots)
    {
        // Classification: reuse an open camera or open a new one
        Camera *target = nullptr;
        bool has_parent_hint = shot.parent_cam_idx.has_value() || shot.parent_shot_idx.has_value();

        if (shot.cam_idx)
        {
            target = findMutable(cameras, *shot.cam_idx);
            if (target && has_parent_hint)
            {
                Logger::warn("Shot " + std::to_string(shot.idx) + " joins open camera " +
                             std::to_string(target->idx) + "; its parent hints are ignored");
            }
        }
        else if (!has_parent_hint && !cameras.empty())
        {
            double best = -1.0;
            int best_last_shot = -1;
            for (auto &camera : cameras)
            {
                const Shot &last = *shots_by_idx.at(camera.active_shot_idxs.back());
                double score = matcher_->similarity(last, shot);
                if (score < matcher_->sameCameraThreshold())
                    continue;
                if (score > best || (score == best && last.idx > best_last_shot))
                {
                    best = score;
                    best_last_shot = last.idx;
                    target = &camera;
                }
            }
        }

        if (target)
        {
            target->active_shot_idxs.push_back(shot.idx);
            continue;
        }

        Camera camera;
        camera.idx = shot.cam_idx ? *shot.cam_idx : nextFreeCameraIdx(cameras);
        camera.active_shot_idxs.push_back(shot.idx);
        camera.parent_frame = shot.parent_frame.value_or(ArtifactKind::FIRST_FRAME);

        // Linking
        if (has_parent_hint)
        {
            linkFromHints(camera, shot, cameras, shots);
        }
        else
        {
            linkByMatching(camera, shot, cameras, shots);
        }

        if (camera.parent_cam_idx)
        {
            Logger::debug("Camera " + std::to_string(camera.idx) + " derives from camera " +
                          std::to_string(*camera.parent_cam_idx) + " via shot " +
                          std::to_string(*camera.parent_shot_idx) +
                          (camera.is_parent_fully_covers_child.value_or(false) ? "" : " (partial coverage)"));
        }
        cameras.push_back(std::move(camera));
    }

    CameraTree tree(std::move(cameras));
    tree.validate(shots);
    Logger::info("Constructed camera tree: " + std::to_string(tree.size()) + " cameras, " +
                 std::to_string(tree.roots().size()) + " roots");
    return tree;
}

void CameraTreeBuilder::linkFromHints(Camera &camera, const Shot &shot, const std::vector<Camera> &cameras,
                                      const std::vector<Shot> &shots) const
{
    const std::string shot_name = "Shot " + std::to_string(shot.idx);
    const Camera *parent = nullptr;

    if (shot.parent_cam_idx)
    {
        parent = findConst(cameras, *shot.parent_cam_idx);
        if (!parent)
        {
            throw ValidationError(shot_name + " names parent camera " + std::to_string(*shot.parent_cam_idx) +
                                  " which is not introduced before it");
        }
    }
    else
    {
        parent = cameraContaining(cameras, *shot.parent_shot_idx);
        if (!parent)
        {
            throw ValidationError(shot_name + " names parent shot " + std::to_string(*shot.parent_shot_idx) +
                                  " which no earlier camera films");
        }
    }

    int parent_shot = -1;
    if (shot.parent_shot_idx)
    {
        parent_shot = *shot.parent_shot_idx;
        if (std::find(parent->active_shot_idxs.begin(), parent->active_shot_idxs.end(), parent_shot) ==
            parent->active_shot_idxs.end())
        {
            throw ValidationError(shot_name + " names parent shot " + std::to_string(parent_shot) +
                                  " which camera " + std::to_string(parent->idx) + " does not film");
        }
    }
    else
    {
        // Most recent shot of the parent camera
        parent_shot = parent->active_shot_idxs.back();
    }

    camera.parent_cam_idx = parent->idx;
    camera.parent_shot_idx = parent_shot;
    camera.missing_info = shot.missing_info;
    if (shot.is_parent_fully_covers_child)
    {
        camera.is_parent_fully_covers_child = *shot.is_parent_fully_covers_child;
    }
    else if (shot.missing_info)
    {
        camera.is_parent_fully_covers_child = false;
    }
    else
    {
        auto shots_by_idx = indexShots(shots);
        ShotCoverage coverage = matcher_->coverage(*shots_by_idx.at(parent_shot), shot);
        camera.is_parent_fully_covers_child = coverage.fully_covers;
        camera.missing_info = coverage.missing_info;
    }

    if (!camera.is_parent_fully_covers_child.value_or(false) && !camera.missing_info)
    {
        camera.missing_info = "Parent shot does not fully establish this composition";
    }
}

void CameraTreeBuilder::linkByMatching(Camera &camera, const Shot &shot, const std::vector<Camera> &cameras,
                                       const std::vector<Shot> &shots) const
{
    auto shots_by_idx = indexShots(shots);
    ParentChoice best;

    for (const auto &candidate : cameras)
    {
        int last_active = candidate.active_shot_idxs.back();
        for (int candidate_shot : candidate.active_shot_idxs)
        {
            double score = matcher_->similarity(*shots_by_idx.at(candidate_shot), shot);
            if (score < matcher_->parentThreshold())
                continue;

            // Ties go to the most recently active camera, then to its latest shot
            bool better = score > best.score ||
                          (score == best.score &&
                           (last_active > best.last_active_shot ||
                            (last_active == best.last_active_shot && candidate_shot > best.shot_idx)));
            if (best.cam_idx < 0 || better)
            {
                best.cam_idx = candidate.idx;
                best.shot_idx = candidate_shot;
                best.score = score;
                best.last_active_shot = last_active;
            }
        }
    }

    if (best.cam_idx < 0)
    {
        return; // Root camera
    }

    ShotCoverage coverage = matcher_->coverage(*shots_by_idx.at(best.shot_idx), shot);
    camera.parent_cam_idx = best.cam_idx;
    camera.parent_shot_idx = best.shot_idx;
    camera.is_parent_fully_covers_child = coverage.fully_covers;
    camera.missing_info = coverage.missing_info;
}
