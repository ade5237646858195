#ifndef RACETRACK_CORE_RACE_CONTROLLER_HPP_
#define RACETRACK_CORE_RACE_CONTROLLER_HPP_

#include "racetrack/core/move_source.hpp"
#include "racetrack/core/path_search.hpp"
#include "racetrack/core/turn_engine.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace racetrack {

/**
 * @brief レース終了状態
 */
enum class RaceStatus {
    Won,                // 勝者確定
    AllCrashed,         // 全車両クラッシュ
    Terminated,         // 供給元が終了を要求
    TurnLimitReached    // ターン数上限
};

const char* to_string(RaceStatus status);

/**
 * @brief レース実行結果
 */
struct RaceResult {
    RaceStatus status;
    std::optional<std::size_t> winner;
    int turns;

    RaceResult() : status(RaceStatus::TurnLimitReached), turns(0) {}
};

/**
 * @brief レース進行制御器
 *
 * アクティブ車両の供給元から加速度を取得してターンを実行し、次の車両に交代する。
 */
class RaceController {
public:
    /**
     * @brief コンストラクタ
     * @param engine ターンエンジン
     */
    explicit RaceController(TurnEngine engine);

    const TurnEngine& engine() const { return engine_; }
    int turns_executed() const { return turns_executed_; }

    /**
     * @brief 車両の加速度供給元を設定
     * @param vehicle_index 車両インデックス
     * @param source 供給元
     * @throws std::out_of_range 車両インデックスが範囲外の場合
     */
    void set_move_source(std::size_t vehicle_index, std::unique_ptr<MoveSource> source);

    /**
     * @brief 経路探索の計画を車両に割り当て
     *
     * 探索に失敗した場合はその場で停止し続ける供給元を割り当てる。
     *
     * @param vehicle_index 車両インデックス
     * @param limits 探索の打ち切り条件
     * @return 探索結果
     */
    SearchResult assign_path_search(std::size_t vehicle_index,
                                    const SearchLimits& limits = SearchLimits());

    /**
     * @brief 探索計画の通過位置（計画未割り当ての場合は空）
     */
    const std::vector<Vector>& planned_waypoints(std::size_t vehicle_index) const;

    /**
     * @brief アクティブ車両の1ターンを実行
     * @return レースが継続する場合true
     * @throws std::logic_error アクティブ車両に供給元が未設定の場合
     */
    bool execute_turn();

    /**
     * @brief レースを終了まで実行
     * @param max_turns 最大ターン数
     * @return 実行結果
     */
    RaceResult run(int max_turns);

    /**
     * @brief 現在のレース状態から結果を作成
     */
    RaceResult result() const;

    /**
     * @brief 統計情報取得
     * @return 統計情報マップ
     */
    std::unordered_map<std::string, double> get_stats() const;

private:
    TurnEngine engine_;
    std::vector<std::unique_ptr<MoveSource>> sources_;
    std::vector<std::vector<Vector>> planned_waypoints_;
    int turns_executed_;
    bool terminated_;

    // 統計情報
    std::unordered_map<std::string, double> stats_;
};

} // namespace racetrack

#endif // RACETRACK_CORE_RACE_CONTROLLER_HPP_
