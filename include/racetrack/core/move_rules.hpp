#ifndef RACETRACK_CORE_MOVE_RULES_HPP_
#define RACETRACK_CORE_MOVE_RULES_HPP_

#include "racetrack/core/types.hpp"

namespace racetrack {

/**
 * @brief 移動経路上の1セルで発生する事象
 */
enum class CellEvent {
    Pass,               // 通過可能
    Collision,          // 壁または他車両との衝突
    CorrectCrossing,    // ゴールを正しい方向に通過
    IncorrectCrossing   // ゴールを逆方向に通過
};

/**
 * @brief 経路セルの判定（TurnEngineとPathSearchで共通）
 *
 * 他車両による衝突は通常トラックセルでのみ発生し、ゴールセル上の車両は障害にならない。
 *
 * @param kind セル種別
 * @param occupied_by_other クラッシュしていない他車両がセル上にいるか
 * @param velocity 今回ターンの速度（加速後）
 * @return セル事象
 */
CellEvent classify_cell(CellKind kind, bool occupied_by_other, const Vector& velocity);

} // namespace racetrack

#endif // RACETRACK_CORE_MOVE_RULES_HPP_
