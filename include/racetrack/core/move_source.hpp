#ifndef RACETRACK_CORE_MOVE_SOURCE_HPP_
#define RACETRACK_CORE_MOVE_SOURCE_HPP_

#include "racetrack/core/types.hpp"
#include <cstddef>
#include <optional>

namespace racetrack {

/**
 * @brief 加速度の供給元インターフェース
 *
 * アクティブ車両のターンごとに1回呼ばれる。
 */
class MoveSource {
public:
    virtual ~MoveSource() = default;

    /**
     * @brief 次のターンの加速度を取得
     * @return 加速度（レースを終了する場合はstd::nullopt）
     */
    virtual std::optional<Vector> next_acceleration() = 0;
};

/**
 * @brief 加速度計画を順に再生する供給元（計画終了後はゼロ加速度）
 */
class PlanMoveSource : public MoveSource {
public:
    explicit PlanMoveSource(Plan plan);

    std::optional<Vector> next_acceleration() override;

    const Plan& plan() const { return plan_; }
    std::size_t remaining() const;

private:
    Plan plan_;
    std::size_t next_index_;
};

/**
 * @brief 常にゼロ加速度を返す供給元
 */
class HoldStillMoveSource : public MoveSource {
public:
    std::optional<Vector> next_acceleration() override;
};

} // namespace racetrack

#endif // RACETRACK_CORE_MOVE_SOURCE_HPP_
