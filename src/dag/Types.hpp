#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dag {

/**
 * Operation kinds - closed set, resolved once at the registry boundary
 */
enum class OperationKind {
    Add,   // Sum of columns plus a scalar
    Sma,   // Simple moving average
    Adx    // Average Directional Index (Wilder)
};

/**
 * Convert OperationKind to its wire name ("ADD", "SMA", "ADX")
 */
std::string kindToString(OperationKind kind);

/**
 * Convert a wire name to OperationKind
 * Throws UnknownKindError if the name is not a known kind
 */
OperationKind stringToKind(const std::string& str);

/**
 * Same as stringToKind but without throwing
 */
std::optional<OperationKind> tryStringToKind(const std::string& str);

/**
 * Reference to a named column ({"column": "close"})
 */
struct ColumnRef {
    std::string name;

    bool operator==(const ColumnRef&) const = default;
};

/**
 * One entry of a client parameter list: a column reference or a numeric scalar
 */
using ParamEntry = std::variant<ColumnRef, double>;

/**
 * Parameter list as supplied by a client (document order)
 */
using ParamList = std::vector<ParamEntry>;

/**
 * Canonical internal parameter shape
 *
 * Ordered column references plus an optional scalar. Built once when a
 * node is added and never mutated afterwards.
 */
class Parameters {
public:
    Parameters() = default;
    Parameters(std::vector<std::string> columns, std::optional<double> scalar);

    /**
     * Build from a client list
     * Column entries keep their order; a second scalar entry throws InvalidParameterError
     */
    static Parameters fromList(const ParamList& list);

    /**
     * Back to client form: columns first, then the scalar (if any)
     */
    ParamList toList() const;

    const std::vector<std::string>& columns() const { return m_columns; }
    const std::optional<double>& scalar() const { return m_scalar; }
    bool hasScalar() const { return m_scalar.has_value(); }

    bool operator==(const Parameters&) const = default;

private:
    std::vector<std::string> m_columns;
    std::optional<double> m_scalar;
};

/**
 * Describe a parameter set for error messages, e.g. "columns=[x, y], value=5"
 */
std::string describeParameters(const Parameters& params);

/**
 * A node of the graph
 */
struct Node {
    std::string id;
    OperationKind kind;
    Parameters parameters;
};

/**
 * A directed edge source -> target (target depends on source)
 */
struct Edge {
    std::string source;
    std::string target;

    bool operator==(const Edge&) const = default;
};

/**
 * Numeric column data
 */
using ColumnData = std::vector<double>;

/**
 * Named numeric columns - the data operation units read from
 *
 * Node outputs are published here under the node id once their stage
 * completes, so downstream nodes can reference them as columns.
 */
class DataTable {
public:
    DataTable() = default;

    /**
     * Load a CSV file: one header line, then numeric rows
     * Empty cells become NaN; throws std::runtime_error on non-numeric cells
     */
    static DataTable readCsv(const std::string& filepath, char delimiter = ',');

    void setColumn(const std::string& name, ColumnData data);
    bool hasColumn(const std::string& name) const;

    /**
     * Throws std::out_of_range if the column does not exist
     */
    const ColumnData& getColumn(const std::string& name) const;

    std::vector<std::string> getColumnNames() const;
    size_t columnCount() const { return m_columns.size(); }

    /**
     * Row count of the longest column
     */
    size_t rowCount() const;

private:
    std::map<std::string, ColumnData> m_columns;
};

} // namespace dag
