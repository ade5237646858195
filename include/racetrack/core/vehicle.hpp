#ifndef RACETRACK_CORE_VEHICLE_HPP_
#define RACETRACK_CORE_VEHICLE_HPP_

#include "racetrack/core/types.hpp"

namespace racetrack {

/**
 * @brief レース車両クラス
 *
 * 速度は慣性として保持され、加速度の加算でのみ変化する。クラッシュ状態は元に戻らない。
 */
class Vehicle {
public:
    /**
     * @brief コンストラクタ
     * @param id 車両ID（トラック内で一意な1文字）
     * @param start_position スタート位置
     */
    Vehicle(char id, const Vector& start_position);

    char id() const { return id_; }
    const Vector& position() const { return position_; }
    const Vector& velocity() const { return velocity_; }
    bool is_crashed() const { return crashed_; }
    int move_count() const { return move_count_; }

    /**
     * @brief 現在速度で移動した場合の到達位置
     */
    Vector next_position() const;

    /**
     * @brief 加速度を速度に加算（成分の範囲制限なし）
     * @param acceleration 加速度
     */
    void accelerate(const Vector& acceleration);

    /**
     * @brief 現在速度で移動し、移動回数を加算
     */
    void move();

    /**
     * @brief 指定位置でクラッシュ
     * @param crash_position クラッシュ位置
     */
    void crash(const Vector& crash_position);

private:
    char id_;
    Vector position_;
    Vector velocity_;
    bool crashed_;
    int move_count_;
};

} // namespace racetrack

#endif // RACETRACK_CORE_VEHICLE_HPP_
