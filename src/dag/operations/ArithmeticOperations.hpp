#pragma once

#include "dag/OperationRegistry.hpp"

namespace dag {

/**
 * ADD: element-wise sum of every referenced column, plus the scalar
 */
class AddUnit : public OperationUnit {
public:
    ColumnData execute(const Parameters& params, const DataTable& table) const override;
};

OperationUnitPtr makeAddUnit();

/**
 * Fetch the referenced columns, checking they exist and share a length
 * Throws std::runtime_error otherwise
 */
std::vector<const ColumnData*> resolveColumns(const Parameters& params, const DataTable& table);

} // namespace dag
