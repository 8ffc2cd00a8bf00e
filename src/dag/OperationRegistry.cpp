#include "dag/OperationRegistry.hpp"
#include "dag/Errors.hpp"
#include "dag/operations/ArithmeticOperations.hpp"
#include "dag/operations/IndicatorOperations.hpp"
#include <algorithm>
#include <stdexcept>

namespace dag {

void OperationUnit::validate(const Parameters& /*params*/) const {}

std::vector<std::string> Capability::requiredNames() const {
    std::vector<std::string> names;
    names.reserve(required.size());
    for (const auto& spec : required) {
        names.push_back(spec.name);
    }
    return names;
}

OperationRegistry::OperationRegistry(std::vector<Capability> capabilities) {
    for (auto& cap : capabilities) {
        if (!cap.unit) {
            throw std::invalid_argument("Capability " + kindToString(cap.kind) + " has no unit");
        }
        auto kind = cap.kind;
        if (!m_capabilities.emplace(kind, std::move(cap)).second) {
            throw std::invalid_argument("Capability registered twice: " + kindToString(kind));
        }
    }
}

const OperationRegistry& OperationRegistry::defaults() {
    static const OperationRegistry instance({
        {OperationKind::Add, makeAddUnit(), {
            {"column", ParamRole::Column},
            {"value", ParamRole::Scalar}
        }},
        {OperationKind::Sma, makeSmaUnit(), {
            {"column", ParamRole::Column},
            {"window_size", ParamRole::Scalar}
        }},
        {OperationKind::Adx, makeAdxUnit(), {
            {"high", ParamRole::Column},
            {"low", ParamRole::Column},
            {"close", ParamRole::Column},
            {"time_period", ParamRole::Scalar}
        }}
    });
    return instance;
}

const Capability& OperationRegistry::lookup(OperationKind kind) const {
    auto it = m_capabilities.find(kind);
    if (it == m_capabilities.end()) {
        throw UnknownKindError(kindToString(kind));
    }
    return it->second;
}

const Capability& OperationRegistry::lookup(const std::string& kind) const {
    auto resolved = tryStringToKind(kind);
    if (!resolved || !has(*resolved)) {
        throw UnknownKindError(kind);
    }
    return lookup(*resolved);
}

bool OperationRegistry::has(OperationKind kind) const {
    return m_capabilities.find(kind) != m_capabilities.end();
}

std::vector<OperationKind> OperationRegistry::kinds() const {
    std::vector<OperationKind> result;
    result.reserve(m_capabilities.size());
    for (const auto& [kind, cap] : m_capabilities) {
        result.push_back(kind);
    }
    std::sort(result.begin(), result.end(), [](OperationKind a, OperationKind b) {
        return kindToString(a) < kindToString(b);
    });
    return result;
}

void OperationRegistry::validate(OperationKind kind, const Parameters& params) const {
    const auto& cap = lookup(kind);

    std::vector<std::string> missing;
    size_t columnIndex = 0;
    for (const auto& spec : cap.required) {
        switch (spec.role) {
            case ParamRole::Column:
                if (params.columns().size() <= columnIndex) {
                    missing.push_back(spec.name);
                }
                ++columnIndex;
                break;
            case ParamRole::Scalar:
                if (!params.hasScalar()) {
                    missing.push_back(spec.name);
                }
                break;
        }
    }

    if (!missing.empty()) {
        throw MissingParameterError(kindToString(kind), std::move(missing),
                                    cap.requiredNames(), describeParameters(params));
    }
}

} // namespace dag
