#include "IndicatorOperations.hpp"
#include "ArithmeticOperations.hpp"
#include "dag/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace dag {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/**
 * Scalar as a whole number >= minimum, or InvalidParameterError
 */
size_t integralScalar(const Parameters& params, const std::string& name, double minimum) {
    if (!params.hasScalar()) {
        throw InvalidParameterError("'" + name + "' is required");
    }
    double v = *params.scalar();
    if (v < minimum || std::floor(v) != v) {
        throw InvalidParameterError("'" + name + "' must be an integer >= " +
                                    std::to_string(static_cast<int>(minimum)) +
                                    ", got " + std::to_string(v));
    }
    return static_cast<size_t>(v);
}

} // anonymous namespace

// =============================================================================
// SMA
// =============================================================================

void SmaUnit::validate(const Parameters& params) const {
    integralScalar(params, "window_size", 1);
    if (params.columns().size() != 1) {
        throw InvalidParameterError("SMA takes exactly one column, got " +
                                    std::to_string(params.columns().size()));
    }
}

ColumnData SmaUnit::execute(const Parameters& params, const DataTable& table) const {
    size_t window = integralScalar(params, "window_size", 1);
    const auto& src = *resolveColumns(params, table).at(0);

    ColumnData out(src.size(), NaN);
    double sum = 0.0;
    for (size_t i = 0; i < src.size(); ++i) {
        sum += src[i];
        if (i >= window) {
            sum -= src[i - window];
        }
        if (i + 1 >= window) {
            out[i] = sum / static_cast<double>(window);
        }
    }
    return out;
}

// =============================================================================
// ADX
// =============================================================================

void AdxUnit::validate(const Parameters& params) const {
    integralScalar(params, "time_period", 2);
    if (params.columns().size() != 3) {
        throw InvalidParameterError("ADX takes exactly three columns (high, low, close), got " +
                                    std::to_string(params.columns().size()));
    }
}

ColumnData AdxUnit::execute(const Parameters& params, const DataTable& table) const {
    size_t period = integralScalar(params, "time_period", 2);
    auto columns = resolveColumns(params, table);
    const auto& high = *columns.at(0);
    const auto& low = *columns.at(1);
    const auto& close = *columns.at(2);

    const size_t rows = high.size();
    ColumnData out(rows, NaN);
    if (rows < 2 * period) {
        return out;
    }

    const double n = static_cast<double>(period);
    double trSum = 0.0, plusSum = 0.0, minusSum = 0.0;
    double adx = 0.0;
    double dxSum = 0.0;

    for (size_t i = 1; i < rows; ++i) {
        double upMove = high[i] - high[i - 1];
        double downMove = low[i - 1] - low[i];
        double plusDm = (upMove > downMove && upMove > 0.0) ? upMove : 0.0;
        double minusDm = (downMove > upMove && downMove > 0.0) ? downMove : 0.0;
        double tr = std::max({high[i] - low[i],
                              std::fabs(high[i] - close[i - 1]),
                              std::fabs(low[i] - close[i - 1])});

        // Wilder smoothing: plain sum over the first period, then decay
        if (i <= period) {
            trSum += tr;
            plusSum += plusDm;
            minusSum += minusDm;
        } else {
            trSum = trSum - trSum / n + tr;
            plusSum = plusSum - plusSum / n + plusDm;
            minusSum = minusSum - minusSum / n + minusDm;
        }

        if (i < period) {
            continue;
        }

        double plusDi = trSum > 0.0 ? 100.0 * plusSum / trSum : 0.0;
        double minusDi = trSum > 0.0 ? 100.0 * minusSum / trSum : 0.0;
        double diSum = plusDi + minusDi;
        double dx = diSum > 0.0 ? 100.0 * std::fabs(plusDi - minusDi) / diSum : 0.0;

        if (i < 2 * period - 1) {
            dxSum += dx;
        } else if (i == 2 * period - 1) {
            dxSum += dx;
            adx = dxSum / n;
            out[i] = adx;
        } else {
            adx = (adx * (n - 1.0) + dx) / n;
            out[i] = adx;
        }
    }
    return out;
}

OperationUnitPtr makeSmaUnit() {
    return std::make_shared<const SmaUnit>();
}

OperationUnitPtr makeAdxUnit() {
    return std::make_shared<const AdxUnit>();
}

} // namespace dag
