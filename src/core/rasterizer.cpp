// src/core/rasterizer.cpp

#include "racetrack/core/rasterizer.hpp"
#include <cstdlib>

namespace racetrack {

namespace {
    // Bresenhamのステップパラメータ
    struct StepParameters {
        Vector parallel_step;    // 高速軸のみの移動
        Vector diagonal_step;    // 両軸の移動
        int distance_slow_axis;
        int distance_fast_axis;
        int initial_error;
    };

    StepParameters compute_step_parameters(const Vector& diff) {
        const Vector dist = diff.abs();
        const Vector dir = diff.signum();

        StepParameters params;
        params.diagonal_step = dir;
        int slow_direction = 0;

        if (dist.x > dist.y) {
            // x軸が高速軸
            params.parallel_step = Vector(dir.x, 0);
            params.distance_slow_axis = dist.y;
            params.distance_fast_axis = dist.x;
            slow_direction = dir.y;
        } else {
            // y軸が高速軸（同距離の場合もこちら）
            params.parallel_step = Vector(0, dir.y);
            params.distance_slow_axis = dist.x;
            params.distance_fast_axis = dist.y;
            slow_direction = dir.x;
        }

        // 中点の丸めは常に座標の小さい側へ寄せる
        params.initial_error = (slow_direction < 0)
            ? (params.distance_fast_axis - 1) / 2
            : params.distance_fast_axis / 2;
        return params;
    }
}

std::vector<Vector> rasterize(const Vector& start, const Vector& end) {
    std::vector<Vector> cells;
    Vector current = start;
    cells.push_back(current);

    if (start == end) {
        return cells;
    }

    const StepParameters params = compute_step_parameters(end - start);
    cells.reserve(static_cast<std::size_t>(params.distance_fast_axis) + 1);

    int error = params.initial_error;
    for (int step = 0; step < params.distance_fast_axis; ++step) {
        error -= params.distance_slow_axis;
        if (error < 0) {
            error += params.distance_fast_axis;
            current = current + params.diagonal_step;
        } else {
            current = current + params.parallel_step;
        }
        cells.push_back(current);
    }

    return cells;
}

}  // namespace racetrack
