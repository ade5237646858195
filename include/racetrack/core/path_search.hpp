#ifndef RACETRACK_CORE_PATH_SEARCH_HPP_
#define RACETRACK_CORE_PATH_SEARCH_HPP_

#include "racetrack/core/grid.hpp"
#include "racetrack/core/types.hpp"
#include <cstddef>
#include <memory>
#include <unordered_set>
#include <vector>

namespace racetrack {

class TurnEngine;

/**
 * @brief 探索結果の状態
 */
enum class SearchStatus {
    Found,
    DepthLimitReached,    // 最大深さで打ち切られた状態があり、ゴール未到達
    StateLimitReached,    // 展開状態数の上限に到達
    Unreachable           // 到達可能な状態を全て展開してもゴールなし
};

const char* to_string(SearchStatus status);

/**
 * @brief 探索結果
 */
struct SearchResult {
    SearchStatus status;
    Plan plan;                      // 加速度列（Found以外は空）
    std::size_t states_explored;    // 展開した状態数
    double elapsed_ms;              // 探索時間 [ms]

    SearchResult() : status(SearchStatus::Unreachable), states_explored(0), elapsed_ms(0.0) {}

    bool found() const { return status == SearchStatus::Found; }
};

/**
 * @brief 探索ノード（位置・速度と親への逆参照）
 */
struct SearchNode {
    Vector position;
    Vector velocity;
    Vector acceleration;              // このノードを生成した加速度
    int depth;
    std::shared_ptr<SearchNode> parent;

    SearchNode(const Vector& pos, const Vector& vel, const Vector& acc, int d,
               std::shared_ptr<SearchNode> p = nullptr)
        : position(pos), velocity(vel), acceleration(acc), depth(d), parent(p) {}
};

/**
 * @brief 幅優先探索による加速度計画クラス
 *
 * (位置, 速度) の状態空間を探索し、最少ターン数でゴールを正方向に通過する加速度列を求める。
 * 逆方向のゴール通過を含む遷移は全て除外するため、2回通過による勝利は計画しない。
 */
class PathSearch {
public:
    /**
     * @brief コンストラクタ
     * @param grid トラックグリッド（コピーを保持する）
     * @param limits 探索の打ち切り条件
     */
    explicit PathSearch(Grid grid, const SearchLimits& limits = SearchLimits());

    /**
     * @brief 指定状態から加速度計画を探索
     * @param position 開始位置
     * @param velocity 開始速度
     * @param occupied 他車両の位置（探索中は静止しているとみなす）
     * @return 探索結果
     */
    SearchResult search(const Vector& position, const Vector& velocity,
                        const std::vector<Vector>& occupied) const;

    /**
     * @brief レース中の車両について加速度計画を探索
     * @param engine ターンエンジン
     * @param vehicle_index 車両インデックス
     * @return 探索結果
     * @throws std::out_of_range 車両インデックスが範囲外の場合
     */
    SearchResult search_for(const TurnEngine& engine, std::size_t vehicle_index) const;

    const SearchLimits& limits() const { return limits_; }

private:
    Grid grid_;
    SearchLimits limits_;

    /**
     * @brief 探索状態のキー
     */
    struct SearchKey {
        Vector position;
        Vector velocity;

        bool operator==(const SearchKey& other) const {
            return position == other.position && velocity == other.velocity;
        }
    };

    struct SearchKeyHash {
        std::size_t operator()(const SearchKey& key) const {
            VectorHash hash;
            return hash(key.position) ^ (hash(key.velocity) << 1);
        }
    };

    /**
     * @brief ゴール判定（現在セルが正方向のゴール）
     */
    bool is_goal(const SearchNode& node) const;

    /**
     * @brief 1ターン分の移動が安全か判定
     * @param from 移動元
     * @param to 移動先
     * @param velocity 移動速度
     * @param occupied 他車両の位置
     * @return 衝突も逆方向通過もなければtrue
     */
    bool is_valid_move(const Vector& from, const Vector& to, const Vector& velocity,
                       const std::unordered_set<Vector, VectorHash>& occupied) const;

    /**
     * @brief ゴールノードから加速度列を再構築
     */
    Plan reconstruct_plan(std::shared_ptr<SearchNode> goal_node) const;
};

/**
 * @brief 加速度計画を再生した場合の通過位置
 * @param position 開始位置
 * @param velocity 開始速度
 * @param plan 加速度列
 * @return 各ターン後の位置（開始位置を含む）
 */
std::vector<Vector> plan_waypoints(const Vector& position, const Vector& velocity,
                                   const Plan& plan);

} // namespace racetrack

#endif // RACETRACK_CORE_PATH_SEARCH_HPP_
