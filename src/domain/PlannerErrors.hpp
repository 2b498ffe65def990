/**
 * @file PlannerErrors.hpp
 * @brief Structural error taxonomy of the playlist generation engine.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace playoutplanner::domain {

/**
 * @class PlannerError
 * @brief Base of the engine's structural errors.
 */
class PlannerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class InvalidTemplate
 * @brief Raised when a schedule template has unordered, overlapping or malformed slots.
 */
class InvalidTemplate : public PlannerError {
public:
    explicit InvalidTemplate(std::vector<std::string> problems)
        : PlannerError(Join("Invalid schedule template", problems)), m_problems(std::move(problems)) {}

    const std::vector<std::string>& problems() const { return m_problems; }

private:
    static std::string Join(const std::string& title, const std::vector<std::string>& lines) {
        std::string message = title;
        for (const auto& line : lines) {
            message += "\n - " + line;
        }
        return message;
    }

    std::vector<std::string> m_problems;
};

/**
 * @class InvalidCatalog
 * @brief Raised when scanned media violates the catalog invariants.
 */
class InvalidCatalog : public PlannerError {
public:
    using PlannerError::PlannerError;
};

/**
 * @class CategoryNotFound
 * @brief Raised by the catalog when a category has no bucket at all.
 *
 * Recoverable: the selection policy turns it into an unfillable slot.
 */
class CategoryNotFound : public PlannerError {
public:
    explicit CategoryNotFound(const std::string& category)
        : PlannerError("Category not found in catalog: " + category), m_category(category) {}

    const std::string& category() const { return m_category; }

private:
    std::string m_category;
};

/**
 * @class AssemblyInvariantViolation
 * @brief Raised when an assembled document fails its own validation.
 */
class AssemblyInvariantViolation : public PlannerError {
public:
    explicit AssemblyInvariantViolation(std::vector<std::string> violations)
        : PlannerError(Describe(violations)), m_violations(std::move(violations)) {}

    const std::vector<std::string>& violations() const { return m_violations; }

private:
    static std::string Describe(const std::vector<std::string>& violations) {
        std::string message = "Assembled playlist violates its invariants";
        for (const auto& v : violations) {
            message += "\n - " + v;
        }
        return message;
    }

    std::vector<std::string> m_violations;
};

} // namespace playoutplanner::domain
