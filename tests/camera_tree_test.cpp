#include <map>
#include "core/camera_tree.hpp"
#include "test_base.hpp"

namespace
{
    // Similarity table keyed by (lower idx, higher idx); unlisted pairs score 0
    class TableMatcher : public ShotMatcher
    {
    public:
        void set(int a, int b, double score) { scores_[{std::min(a, b), std::max(a, b)}] = score; }

        double similarity(const Shot &a, const Shot &b) const override
        {
            if (a.idx == b.idx)
                return 1.0;
            auto it = scores_.find({std::min(a.idx, b.idx), std::max(a.idx, b.idx)});
            return it == scores_.end() ? 0.0 : it->second;
        }
        double sameCameraThreshold() const override { return 0.8; }
        double parentThreshold() const override { return 0.3; }
        ShotCoverage coverage(const Shot &, const Shot &) const override
        {
            return ShotCoverage{true, std::nullopt};
        }

    private:
        std::map<std::pair<int, int>, double> scores_;
    };

    Camera camera(int idx, std::vector<int> shots)
    {
        Camera c;
        c.idx = idx;
        c.active_shot_idxs = std::move(shots);
        return c;
    }

    Camera childCamera(int idx, std::vector<int> shots, int parent_cam, int parent_shot)
    {
        Camera c = camera(idx, std::move(shots));
        c.parent_cam_idx = parent_cam;
        c.parent_shot_idx = parent_shot;
        c.is_parent_fully_covers_child = true;
        return c;
    }
}

class CameraTreeTest : public TestBase
{
};

TEST_F(CameraTreeTest, HintsDecideMembershipAndParentage)
{
    Shot opening = makeCameraShot(0, 0);
    Shot close_up = makeChildShot(1, 1, 0, 0);
    close_up.is_parent_fully_covers_child = true;
    Shot back_wide = makeCameraShot(2, 0);
    Shot back_close = makeCameraShot(3, 1);

    CameraTree tree = CameraTreeBuilder().build({opening, close_up, back_wide, back_close});

    ASSERT_EQ(tree.size(), 2u);
    EXPECT_EQ(tree.cameras()[0].active_shot_idxs, (std::vector<int>{0, 2}));
    EXPECT_TRUE(tree.cameras()[0].isRoot());

    const Camera &child = tree.cameras()[1];
    EXPECT_EQ(child.active_shot_idxs, (std::vector<int>{1, 3}));
    EXPECT_EQ(child.parent_cam_idx, 0);
    EXPECT_EQ(child.parent_shot_idx, 0);
    EXPECT_EQ(child.is_parent_fully_covers_child, true);
    EXPECT_FALSE(child.missing_info.has_value());

    EXPECT_EQ(tree.cameraOf(3).idx, 1);
    EXPECT_EQ(tree.roots().size(), 1u);
    ASSERT_EQ(tree.children(0).size(), 1u);
    EXPECT_EQ(tree.children(0)[0]->idx, 1);
}

TEST_F(CameraTreeTest, ParentCameraHintWithoutShotUsesItsLatestShot)
{
    Shot a = makeCameraShot(0, 0);
    Shot b = makeCameraShot(1, 0);
    Shot c = makeShot(2);
    c.parent_cam_idx = 0;
    c.missing_info = "the red door";

    CameraTree tree = CameraTreeBuilder().build({a, b, c});

    ASSERT_EQ(tree.size(), 2u);
    const Camera &child = tree.cameras()[1];
    EXPECT_EQ(child.parent_shot_idx, 1);
    EXPECT_EQ(child.is_parent_fully_covers_child, false);
    EXPECT_EQ(child.missing_info, std::string("the red door"));
}

TEST_F(CameraTreeTest, SimilarShotsShareCameraAndPartialOverlapLinksChild)
{
    Shot wide = makeShot(0, VariationType::SMALL, "harbor dawn fishing boats moored");
    Shot wide_again = makeShot(1, VariationType::SMALL, "harbor dawn fishing boats moored");
    Shot keeper = makeShot(2, VariationType::SMALL, "harbor boats closeup lighthouse keeper waving");
    Shot desert = makeShot(3, VariationType::SMALL, "desert highway abandoned truck dust");

    CameraTree tree = CameraTreeBuilder().build({wide, wide_again, keeper, desert});

    ASSERT_EQ(tree.size(), 3u);
    EXPECT_EQ(tree.cameras()[0].active_shot_idxs, (std::vector<int>{0, 1}));

    const Camera &keeper_cam = tree.cameras()[1];
    EXPECT_EQ(keeper_cam.active_shot_idxs, std::vector<int>{2});
    EXPECT_EQ(keeper_cam.parent_cam_idx, 0);
    EXPECT_EQ(keeper_cam.parent_shot_idx, 1); // tie between shots 0 and 1 goes to the later one
    EXPECT_EQ(keeper_cam.is_parent_fully_covers_child, false);
    ASSERT_TRUE(keeper_cam.missing_info.has_value());
    EXPECT_NE(keeper_cam.missing_info->find("lighthouse"), std::string::npos);

    EXPECT_TRUE(tree.cameras()[2].isRoot());
}

TEST_F(CameraTreeTest, MatchingTiesPreferMostRecentlyActiveCamera)
{
    auto matcher = std::make_shared<TableMatcher>();
    matcher->set(0, 2, 0.5);
    matcher->set(1, 2, 0.5);

    CameraTree tree = CameraTreeBuilder(matcher).build({makeShot(0), makeShot(1), makeShot(2)});

    ASSERT_EQ(tree.size(), 3u);
    EXPECT_EQ(tree.cameras()[2].parent_cam_idx, 1);
    EXPECT_EQ(tree.cameras()[2].parent_shot_idx, 1);
}

TEST_F(CameraTreeTest, ShotRejoinsBestMatchingOpenCamera)
{
    auto matcher = std::make_shared<TableMatcher>();
    matcher->set(0, 2, 0.9);
    matcher->set(1, 2, 0.85);

    CameraTree tree = CameraTreeBuilder(matcher).build({makeShot(0), makeShot(1), makeShot(2)});

    ASSERT_EQ(tree.size(), 2u);
    EXPECT_EQ(tree.cameras()[0].active_shot_idxs, (std::vector<int>{0, 2}));
}

TEST_F(CameraTreeTest, HintNamingLaterCameraIsRejected)
{
    Shot a = makeCameraShot(0, 0);
    Shot b = makeChildShot(1, 1, 5, 0);
    EXPECT_THROW(CameraTreeBuilder().build({a, b}), ValidationError);

    Shot c = makeChildShot(1, 1, 0, 3);
    EXPECT_THROW(CameraTreeBuilder().build({a, c}), ValidationError);
}

TEST_F(CameraTreeTest, ValidateRejectsMalformedForests)
{
    std::vector<Shot> shots = {makeShot(0), makeShot(1), makeShot(2)};

    // Shot filmed by two cameras
    EXPECT_THROW(CameraTree({camera(0, {0, 1}), childCamera(1, {1, 2}, 0, 0)}).validate(shots), ValidationError);
    // Shots out of original order inside a camera
    EXPECT_THROW(CameraTree({camera(0, {1, 0}), camera(1, {2})}).validate(shots), ValidationError);
    // Parent introduced after the child
    EXPECT_THROW(CameraTree({camera(0, {0}), childCamera(1, {1}, 2, 2), camera(2, {2})}).validate(shots),
                 ValidationError);
    // Parent shot that does not precede the child's first shot
    EXPECT_THROW(CameraTree({camera(0, {0, 2}), childCamera(1, {1}, 0, 2)}).validate(shots), ValidationError);
    // Shot filmed by no camera
    EXPECT_THROW(CameraTree({camera(0, {0, 1})}).validate(shots), ValidationError);
    // Unknown shot
    EXPECT_THROW(CameraTree({camera(0, {0, 1, 2, 7})}).validate(shots), ValidationError);

    EXPECT_NO_THROW(CameraTree({camera(0, {0, 2}), childCamera(1, {1}, 0, 0)}).validate(shots));
}

TEST_F(CameraTreeTest, CameraOfUnknownShotRaisesNotFound)
{
    CameraTree tree({camera(0, {0})});
    EXPECT_THROW(tree.cameraOf(4), NotFoundError);
    EXPECT_EQ(tree.findCamera(3), nullptr);
    EXPECT_EQ(tree.introductionIndex(0), 0);
    EXPECT_EQ(tree.introductionIndex(3), -1);
}

TEST_F(CameraTreeTest, JsonRoundTripPreservesTree)
{
    Camera child = childCamera(1, {1, 3}, 0, 0);
    child.parent_frame = ArtifactKind::LAST_FRAME;
    child.is_parent_fully_covers_child = false;
    child.missing_info = "the red door";
    CameraTree tree({camera(0, {0, 2}), child});

    CameraTree restored = CameraTree::fromJson(tree.toJson());

    ASSERT_EQ(restored.size(), 2u);
    const Camera &copy = restored.cameras()[1];
    EXPECT_EQ(copy.active_shot_idxs, (std::vector<int>{1, 3}));
    EXPECT_EQ(copy.parent_cam_idx, 0);
    EXPECT_EQ(copy.parent_shot_idx, 0);
    EXPECT_EQ(copy.parent_frame, ArtifactKind::LAST_FRAME);
    EXPECT_EQ(copy.is_parent_fully_covers_child, false);
    EXPECT_EQ(copy.missing_info, std::string("the red door"));
    EXPECT_EQ(restored.toJson(), tree.toJson());
}

TEST_F(CameraTreeTest, TokenizerDropsShortAndStopWords)
{
    auto tokens = DescriptionOverlapMatcher::tokenize("The keeper, with his LAMP, on the pier");
    EXPECT_EQ(tokens, (std::vector<std::string>{"keeper", "lamp", "pier"}));
}
