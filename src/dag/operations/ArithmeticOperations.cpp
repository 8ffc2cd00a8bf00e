#include "ArithmeticOperations.hpp"
#include <stdexcept>

namespace dag {

std::vector<const ColumnData*> resolveColumns(const Parameters& params, const DataTable& table) {
    std::vector<const ColumnData*> result;
    result.reserve(params.columns().size());

    for (const auto& name : params.columns()) {
        if (!table.hasColumn(name)) {
            throw std::runtime_error("Column '" + name + "' not found in data table");
        }
        const auto& col = table.getColumn(name);
        if (!result.empty() && col.size() != result.front()->size()) {
            throw std::runtime_error("Column '" + name + "' has " + std::to_string(col.size()) +
                                     " rows, expected " + std::to_string(result.front()->size()));
        }
        result.push_back(&col);
    }
    return result;
}

ColumnData AddUnit::execute(const Parameters& params, const DataTable& table) const {
    auto columns = resolveColumns(params, table);
    double value = params.scalar().value_or(0.0);

    size_t rows = columns.empty() ? 0 : columns.front()->size();
    ColumnData out(rows, value);
    for (const auto* col : columns) {
        for (size_t i = 0; i < rows; ++i) {
            out[i] += (*col)[i];
        }
    }
    return out;
}

OperationUnitPtr makeAddUnit() {
    return std::make_shared<const AddUnit>();
}

} // namespace dag
