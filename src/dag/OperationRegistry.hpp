#pragma once

#include "dag/Types.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dag {

/**
 * Executable unit behind an operation kind
 *
 * Implementations must be safe to call concurrently: the same unit
 * instance serves every node of its kind.
 */
class OperationUnit {
public:
    virtual ~OperationUnit() = default;

    /**
     * Unit-specific checks beyond parameter presence
     * Throws on invalid parameters (default: accepts everything)
     */
    virtual void validate(const Parameters& params) const;

    /**
     * Compute the output column from the parameters and the data table
     * Throws on failure
     */
    virtual ColumnData execute(const Parameters& params, const DataTable& table) const = 0;
};

using OperationUnitPtr = std::shared_ptr<const OperationUnit>;

/**
 * How a required parameter is satisfied by the canonical shape
 */
enum class ParamRole {
    Column,  // the i-th Column spec needs at least i+1 column references
    Scalar   // needs the scalar value
};

struct ParamSpec {
    std::string name;
    ParamRole role;
};

/**
 * Registry entry: kind -> (unit, ordered required parameters)
 */
struct Capability {
    OperationKind kind;
    OperationUnitPtr unit;
    std::vector<ParamSpec> required;

    /**
     * Required parameter names in declaration order
     */
    std::vector<std::string> requiredNames() const;
};

/**
 * Table of operation capabilities
 *
 * Built once from an explicit capability list and read-only afterwards,
 * so concurrent lookups need no locking.
 *
 * Usage:
 *   // Process-wide table (ADD, SMA, ADX)
 *   const auto& reg = OperationRegistry::defaults();
 *   reg.validate(OperationKind::Add, params);
 *
 *   // Custom table (tests, embedding)
 *   OperationRegistry custom({{OperationKind::Add, myUnit, {{"column", ParamRole::Column}}}});
 */
class OperationRegistry {
public:
    /**
     * Build from capabilities; a kind listed twice throws std::invalid_argument
     */
    explicit OperationRegistry(std::vector<Capability> capabilities);

    // Non-copyable
    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    /**
     * Process-wide table with the built-in operations
     */
    static const OperationRegistry& defaults();

    // === Lookup ===

    /**
     * Throws UnknownKindError if the kind is not registered
     */
    const Capability& lookup(OperationKind kind) const;

    /**
     * Resolve a wire name ("ADD") then look it up
     * Throws UnknownKindError
     */
    const Capability& lookup(const std::string& kind) const;

    bool has(OperationKind kind) const;

    /**
     * Registered kinds, in wire-name order
     */
    std::vector<OperationKind> kinds() const;

    // === Validation ===

    /**
     * Check that every required parameter of the kind is present
     * Throws UnknownKindError or MissingParameterError (missing names in
     * registry order). Values are not type-checked.
     */
    void validate(OperationKind kind, const Parameters& params) const;

    size_t size() const { return m_capabilities.size(); }

private:
    std::unordered_map<OperationKind, Capability> m_capabilities;
};

} // namespace dag
