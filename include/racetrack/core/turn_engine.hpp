#ifndef RACETRACK_CORE_TURN_ENGINE_HPP_
#define RACETRACK_CORE_TURN_ENGINE_HPP_

#include "racetrack/core/grid.hpp"
#include "racetrack/core/vehicle.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace racetrack {

/**
 * @brief 車両ごとのゴール通過記録
 */
struct CrossingRecord {
    bool has_incorrect_crossing;   // 逆方向通過の有無
    int consecutive_correct;       // 最後の逆方向通過以降の連続正方向通過数

    CrossingRecord() : has_incorrect_crossing(false), consecutive_correct(0) {}
};

/**
 * @brief 1ターンの結果
 */
enum class TurnOutcome {
    Ignored,    // 勝者確定済みまたはクラッシュ済みで何もしない
    Moved,
    Crashed,
    Won
};

const char* to_string(TurnOutcome outcome);

/**
 * @brief ターン処理エンジン
 *
 * 加速・経路ラスタライズ・衝突判定・ゴール通過判定を行い、車両状態と勝者を更新する。
 * 勝者確定後のターン要求は全て無視される。
 */
class TurnEngine {
public:
    /**
     * @brief コンストラクタ
     * @param grid トラックグリッド
     * @param vehicles 車両リスト（インデックスはレース中固定）
     */
    TurnEngine(Grid grid, std::vector<Vehicle> vehicles);

    const Grid& grid() const { return grid_; }
    std::size_t vehicle_count() const { return entries_.size(); }
    std::size_t active_index() const { return active_index_; }
    std::optional<std::size_t> winner() const { return winner_; }
    bool is_finished() const { return winner_.has_value(); }

    /**
     * @brief クラッシュしていない車両が残っているか
     */
    bool has_active_vehicle() const;

    const Vehicle& vehicle(std::size_t index) const;
    std::vector<Vehicle> vehicles() const;
    const CrossingRecord& crossing_record(std::size_t index) const;

    /**
     * @brief 指定車両以外のクラッシュしていない車両位置
     * @param self 除外する車両インデックス
     * @return 車両位置リスト
     */
    std::vector<Vector> occupied_by_others(std::size_t self) const;

    /**
     * @brief 指定車両のターンを実行
     * @param vehicle_index 車両インデックス
     * @param acceleration 加速度（未設定は不正引数）
     * @return ターン結果
     * @throws std::invalid_argument 加速度が未設定の場合
     * @throws std::out_of_range 車両インデックスが範囲外の場合
     */
    TurnOutcome take_turn(std::size_t vehicle_index, const std::optional<Vector>& acceleration);

    /**
     * @brief アクティブ車両のターンを実行
     */
    TurnOutcome take_turn(const std::optional<Vector>& acceleration);

    /**
     * @brief 次のクラッシュしていない車両をアクティブにする（該当なしなら変更なし）
     */
    void advance_active();

private:
    struct RaceEntry {
        Vehicle vehicle;
        CrossingRecord crossing;
    };

    Grid grid_;
    std::vector<RaceEntry> entries_;
    std::size_t active_index_;
    std::optional<std::size_t> winner_;

    bool is_occupied_by_other(const Vector& cell, std::size_t self) const;

    /**
     * @brief ゴール通過の処理
     * @return 勝利が確定した場合true
     */
    bool process_finish_crossing(RaceEntry& entry, bool correct_direction);

    /**
     * @brief 残り1台なら勝者に設定
     */
    void check_sole_survivor();

    RaceEntry& entry_at(std::size_t index);
    const RaceEntry& entry_at(std::size_t index) const;
};

} // namespace racetrack

#endif // RACETRACK_CORE_TURN_ENGINE_HPP_
