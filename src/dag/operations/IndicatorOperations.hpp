#pragma once

#include "dag/OperationRegistry.hpp"

namespace dag {

/**
 * SMA: simple moving average of the first column
 *
 * Window = scalar (integer >= 1). The first window-1 rows are NaN.
 */
class SmaUnit : public OperationUnit {
public:
    void validate(const Parameters& params) const override;
    ColumnData execute(const Parameters& params, const DataTable& table) const override;
};

/**
 * ADX: Wilder's Average Directional Index
 *
 * Columns are (high, low, close), scalar is the period (integer >= 2).
 * Rows before index 2*period-1 are NaN.
 */
class AdxUnit : public OperationUnit {
public:
    void validate(const Parameters& params) const override;
    ColumnData execute(const Parameters& params, const DataTable& table) const override;
};

OperationUnitPtr makeSmaUnit();
OperationUnitPtr makeAdxUnit();

} // namespace dag
