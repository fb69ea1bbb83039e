#ifndef STAND_ALLOC_DEMO_INSTANCE_HPP
#define STAND_ALLOC_DEMO_INSTANCE_HPP

#include "stand_alloc/domain.hpp"

namespace stand_alloc {
namespace demo {

/**
 * @brief デモ用の問題インスタンス
 *
 * 4ターン × 5スタンド（1L, 1C, 2L, 2C, 2R）、
 * 1L-1C と 2L-2C の占有時間窓による隣接ルール。
 */
Problem make_demo_problem();

} // namespace demo
} // namespace stand_alloc

#endif // STAND_ALLOC_DEMO_INSTANCE_HPP
