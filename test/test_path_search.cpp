// test/test_path_search.cpp

#include <gtest/gtest.h>
#include "racetrack/core/path_search.hpp"
#include "racetrack/core/track_loader.hpp"
#include "racetrack/core/turn_engine.hpp"

using namespace racetrack;

class PathSearchTest : public ::testing::Test {
protected:
    // 直線レーン（3ターンでゴールに到達）
    std::vector<std::string> lane_track;

    void SetUp() override {
        lane_track = {
            "#########",
            "#a     >#",
            "#########"
        };
    }

    // 計画をエンジン上で再生し、最後の結果を返す
    static TurnOutcome replay(TurnEngine& engine, std::size_t index, const Plan& plan) {
        TurnOutcome outcome = TurnOutcome::Ignored;
        for (const auto& acceleration : plan) {
            outcome = engine.take_turn(index, acceleration);
            if (outcome != TurnOutcome::Moved) {
                break;
            }
        }
        return outcome;
    }
};

// TEST 1: 隣接ゴールへの1手計画
TEST_F(PathSearchTest, AdjacentFinishYieldsSingleMove) {
    // Given: スタートの右隣に右向きゴール
    auto layout = parse_track_lines({"#####", "#a> #", "#####"});
    PathSearch search(layout.grid);

    // When: 探索
    auto result = search.search(Vector(1, 1), Vector(0, 0), {});

    // Then: 1要素の計画
    ASSERT_TRUE(result.found());
    ASSERT_EQ(result.plan.size(), 1u);
    EXPECT_EQ(result.plan[0], Vector(1, 0));
    EXPECT_EQ(result.states_explored, 2u);
    EXPECT_GE(result.elapsed_ms, 0.0);
}

// TEST 2: 最少ターン数の計画
TEST_F(PathSearchTest, FindsFewestAccelerations) {
    // Given: 3ターン必要な直線レーン
    auto layout = parse_track_lines(lane_track);
    PathSearch search(layout.grid);

    // When: 探索
    auto result = search.search(Vector(1, 1), Vector(0, 0), {});

    // Then: 右への加速3回
    ASSERT_TRUE(result.found());
    const Plan expected = {Vector(1, 0), Vector(1, 0), Vector(1, 0)};
    EXPECT_EQ(result.plan, expected);
}

// TEST 3: ゴールのないトラック
TEST_F(PathSearchTest, NoFinishIsUnreachable) {
    // Given: ゴールのない閉じた通路
    auto layout = parse_track_lines({"######", "#a   #", "#    #", "######"});
    PathSearch search(layout.grid);

    // When: 探索
    auto result = search.search(Vector(1, 1), Vector(0, 0), {});

    // Then: 無限ループせずに失敗を報告
    EXPECT_FALSE(result.found());
    EXPECT_EQ(result.status, SearchStatus::Unreachable);
    EXPECT_TRUE(result.plan.empty());
    EXPECT_GT(result.states_explored, 0u);
}

// TEST 4: 深さ上限
TEST_F(PathSearchTest, DepthLimitReached) {
    // Given: 最大深さ2（ゴールには3手必要）
    auto layout = parse_track_lines(lane_track);
    PathSearch search(layout.grid, SearchLimits(2, 1000));

    // When: 探索
    auto result = search.search(Vector(1, 1), Vector(0, 0), {});

    // Then: 深さ上限による失敗
    EXPECT_EQ(result.status, SearchStatus::DepthLimitReached);
    EXPECT_TRUE(result.plan.empty());

    // 深さ3なら見つかる
    PathSearch deeper(layout.grid, SearchLimits(3, 1000));
    auto found = deeper.search(Vector(1, 1), Vector(0, 0), {});
    ASSERT_TRUE(found.found());
    EXPECT_EQ(found.plan.size(), 3u);
}

// TEST 5: 状態数上限
TEST_F(PathSearchTest, StateLimitReached) {
    // Given: 展開状態数1
    auto layout = parse_track_lines(lane_track);
    PathSearch search(layout.grid, SearchLimits(500, 1));

    // When: 探索
    auto result = search.search(Vector(1, 1), Vector(0, 0), {});

    // Then: 状態数上限による失敗
    EXPECT_EQ(result.status, SearchStatus::StateLimitReached);
    EXPECT_EQ(result.states_explored, 1u);
    EXPECT_TRUE(result.plan.empty());
}

// TEST 6: 逆方向のゴール通過を避ける
TEST_F(PathSearchTest, AvoidsIncorrectFinishCrossing) {
    // Given: 左向きゴールの左側にスタート（直進すると逆方向通過）
    auto layout = parse_track_lines({
        "#########",
        "#       #",
        "#a<     #",
        "#########"
    });
    PathSearch search(layout.grid);
    TurnEngine engine(layout.grid, layout.vehicles);

    // When: 探索
    auto result = search.search_for(engine, 0);

    // Then: 計画を再生すると逆方向通過なしで勝利
    ASSERT_TRUE(result.found());
    EXPECT_EQ(replay(engine, 0, result.plan), TurnOutcome::Won);
    EXPECT_FALSE(engine.crossing_record(0).has_incorrect_crossing);
    EXPECT_FALSE(engine.vehicle(0).is_crashed());
}

// TEST 7: 他車両の位置は障害として扱う
TEST_F(PathSearchTest, OtherVehiclesBlockTheWay) {
    // Given: ゴールまでの唯一の通路に他車両
    auto layout = parse_track_lines({"#######", "#a b> #", "#######"});
    PathSearch search(layout.grid);
    TurnEngine engine(layout.grid, layout.vehicles);

    // When: レース中の車両として探索
    auto blocked = search.search_for(engine, 0);

    // Then: 到達不可能
    EXPECT_EQ(blocked.status, SearchStatus::Unreachable);

    // 他車両がいなければ到達可能
    auto free = search.search(Vector(1, 1), Vector(0, 0), {});
    EXPECT_TRUE(free.found());
}

// TEST 8: 移動中の車両からの探索
TEST_F(PathSearchTest, SearchFromMovingState) {
    // Given: すでに右向きに速度を持つ車両
    auto layout = parse_track_lines(lane_track);
    PathSearch search(layout.grid);

    // When: 速度(2,0)で(2,1)から探索
    auto result = search.search(Vector(2, 1), Vector(2, 0), {});

    // Then: 計画の通過位置はゴールで終わる
    ASSERT_TRUE(result.found());
    auto waypoints = plan_waypoints(Vector(2, 1), Vector(2, 0), result.plan);
    ASSERT_EQ(waypoints.size(), result.plan.size() + 1);
    EXPECT_EQ(waypoints.back(), Vector(7, 1));
}

// TEST 9: 計画の通過位置
TEST_F(PathSearchTest, PlanWaypoints) {
    // Given: 右への加速3回
    const Plan plan = {Vector(1, 0), Vector(1, 0), Vector(1, 0)};

    // When: 通過位置を計算
    auto waypoints = plan_waypoints(Vector(1, 1), Vector(0, 0), plan);

    // Then: 速度が累積した位置
    const std::vector<Vector> expected = {
        Vector(1, 1), Vector(2, 1), Vector(4, 1), Vector(7, 1)
    };
    EXPECT_EQ(waypoints, expected);
}

// TEST 10: 状態名
TEST_F(PathSearchTest, StatusNames) {
    EXPECT_STREQ(to_string(SearchStatus::Found), "Found");
    EXPECT_STREQ(to_string(SearchStatus::DepthLimitReached), "DepthLimitReached");
    EXPECT_STREQ(to_string(SearchStatus::StateLimitReached), "StateLimitReached");
    EXPECT_STREQ(to_string(SearchStatus::Unreachable), "Unreachable");
}

// TEST 11: 一時オブジェクトのグリッドから構築した探索
TEST_F(PathSearchTest, OwnsGridBuiltFromTemporary) {
    // Given: 読み込み結果の一時オブジェクトから直接構築
    PathSearch search(parse_track_lines(lane_track).grid);

    // When: 構築元の寿命が尽きた後に探索
    auto result = search.search(Vector(1, 1), Vector(0, 0), {});

    // Then: 直線レーンの3手計画
    ASSERT_TRUE(result.found());
    const Plan expected = {Vector(1, 0), Vector(1, 0), Vector(1, 0)};
    EXPECT_EQ(result.plan, expected);
}

// メイン関数
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
