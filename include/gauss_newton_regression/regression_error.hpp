#ifndef GAUSS_NEWTON_REGRESSION_REGRESSION_ERROR_HPP
#define GAUSS_NEWTON_REGRESSION_REGRESSION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gauss_newton_regression {

  // 全ての回帰エラーの共通基底 (catch用)
  class RegressionError
  {
  public:
    virtual ~RegressionError() {}
  };

  // 引数の長さ不一致、係数インデックス範囲外、行列サイズ不一致
  class InvalidArgument : public std::invalid_argument, public RegressionError
  {
  public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
  };

  // ピボットが見つからない列がある (正規方程式が特異)
  class SingularMatrix : public std::runtime_error, public RegressionError
  {
  public:
    SingularMatrix(const std::string& what, int column)
      : std::runtime_error(what), column_(column) {}

    // ピボットが見つからなかった列 (-1: 列に依らない)
    int column() const { return column_; }

  private:
    int column_;
  };

  // yが全て同じ値 (TSS = 0) でR^2が定義できない
  class DegenerateData : public std::runtime_error, public RegressionError
  {
  public:
    explicit DegenerateData(const std::string& what) : std::runtime_error(what) {}
  };

} // namespace gauss_newton_regression

#endif // GAUSS_NEWTON_REGRESSION_REGRESSION_ERROR_HPP
