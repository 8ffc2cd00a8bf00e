#include "dag/Types.hpp"
#include "dag/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace dag {

// =============================================================================
// OperationKind
// =============================================================================

std::string kindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::Add: return "ADD";
        case OperationKind::Sma: return "SMA";
        case OperationKind::Adx: return "ADX";
    }
    return "UNKNOWN";
}

std::optional<OperationKind> tryStringToKind(const std::string& str) {
    if (str == "ADD") return OperationKind::Add;
    if (str == "SMA") return OperationKind::Sma;
    if (str == "ADX") return OperationKind::Adx;
    return std::nullopt;
}

OperationKind stringToKind(const std::string& str) {
    auto kind = tryStringToKind(str);
    if (!kind) {
        throw UnknownKindError(str);
    }
    return *kind;
}

// =============================================================================
// Parameters
// =============================================================================

Parameters::Parameters(std::vector<std::string> columns, std::optional<double> scalar)
    : m_columns(std::move(columns))
    , m_scalar(scalar)
{}

Parameters Parameters::fromList(const ParamList& list) {
    std::vector<std::string> columns;
    std::optional<double> scalar;

    for (const auto& entry : list) {
        if (const auto* col = std::get_if<ColumnRef>(&entry)) {
            if (col->name.empty()) {
                throw InvalidParameterError("Column reference with empty name");
            }
            columns.push_back(col->name);
        } else {
            if (scalar) {
                throw InvalidParameterError("More than one 'value' entry in parameter list");
            }
            double value = std::get<double>(entry);
            if (!std::isfinite(value)) {
                throw InvalidParameterError("Parameter 'value' must be a finite number");
            }
            scalar = value;
        }
    }

    return Parameters(std::move(columns), scalar);
}

ParamList Parameters::toList() const {
    ParamList list;
    list.reserve(m_columns.size() + (m_scalar ? 1 : 0));
    for (const auto& col : m_columns) {
        list.emplace_back(ColumnRef{col});
    }
    if (m_scalar) {
        list.emplace_back(*m_scalar);
    }
    return list;
}

std::string describeParameters(const Parameters& params) {
    std::ostringstream oss;
    oss << "columns=[";
    for (size_t i = 0; i < params.columns().size(); ++i) {
        if (i > 0) oss << ", ";
        oss << params.columns()[i];
    }
    oss << "]";
    if (params.hasScalar()) {
        oss << ", value=" << *params.scalar();
    }
    return oss.str();
}

// =============================================================================
// DataTable
// =============================================================================

namespace {

std::vector<std::string> splitLine(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool inQuotes = false;

    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
        } else if (c == delimiter && !inQuotes) {
            fields.push_back(current);
            current.clear();
        } else if (c != '\r') {
            current += c;
        }
    }
    fields.push_back(current);

    // Trim surrounding whitespace
    for (auto& f : fields) {
        auto first = f.find_first_not_of(" \t");
        auto last = f.find_last_not_of(" \t");
        f = (first == std::string::npos) ? "" : f.substr(first, last - first + 1);
    }
    return fields;
}

} // anonymous namespace

DataTable DataTable::readCsv(const std::string& filepath, char delimiter) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    DataTable table;
    std::vector<std::string> headers;
    std::vector<ColumnData> columns;
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(file, line)) {
        lineNumber++;

        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        auto fields = splitLine(line, delimiter);

        if (headers.empty()) {
            headers = fields;
            columns.resize(headers.size());
            continue;
        }

        for (size_t i = 0; i < headers.size(); ++i) {
            const std::string value = (i < fields.size()) ? fields[i] : "";
            if (value.empty()) {
                columns[i].push_back(std::numeric_limits<double>::quiet_NaN());
                continue;
            }

            char* end = nullptr;
            double parsed = std::strtod(value.c_str(), &end);
            if (end != value.c_str() + value.size()) {
                throw std::runtime_error("Non-numeric value '" + value + "' at line " +
                                         std::to_string(lineNumber) + ", column '" +
                                         headers[i] + "' in " + filepath);
            }
            columns[i].push_back(parsed);
        }
    }

    for (size_t i = 0; i < headers.size(); ++i) {
        table.setColumn(headers[i], std::move(columns[i]));
    }
    return table;
}

void DataTable::setColumn(const std::string& name, ColumnData data) {
    m_columns[name] = std::move(data);
}

bool DataTable::hasColumn(const std::string& name) const {
    return m_columns.find(name) != m_columns.end();
}

const ColumnData& DataTable::getColumn(const std::string& name) const {
    auto it = m_columns.find(name);
    if (it == m_columns.end()) {
        throw std::out_of_range("Column not found: " + name);
    }
    return it->second;
}

std::vector<std::string> DataTable::getColumnNames() const {
    std::vector<std::string> names;
    names.reserve(m_columns.size());
    for (const auto& [name, data] : m_columns) {
        names.push_back(name);
    }
    return names;
}

size_t DataTable::rowCount() const {
    size_t rows = 0;
    for (const auto& [name, data] : m_columns) {
        rows = std::max(rows, data.size());
    }
    return rows;
}

} // namespace dag
