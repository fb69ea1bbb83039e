/**
 * @file error.hpp
 * @brief 入力設定エラーの例外型
 */
#ifndef STAND_ALLOC_ERROR_HPP
#define STAND_ALLOC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace stand_alloc {

/**
 * @brief 呼び出し側の入力設定エラー
 *
 * 時間窓の反転、実行可能性行列の次元不一致、未知のスタンドを参照する
 * 隣接ルールなど。モデル構築中に検出し、求解前に送出する。
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace stand_alloc

#endif // STAND_ALLOC_ERROR_HPP
