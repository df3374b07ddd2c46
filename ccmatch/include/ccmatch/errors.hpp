#ifndef CCMATCH_ERRORS_HPP
#define CCMATCH_ERRORS_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ccmatch {

/**
 * Fatal error raised before any matching work starts: a missing column,
 * an invalid option value or malformed input data.
 */
class ConfigurationError : public std::runtime_error {
private:
    std::string option_;
    std::string column_;
    std::optional<std::string> case_id_;

public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}

    ConfigurationError(const std::string& message, std::string option, std::string column,
                       std::optional<std::string> case_id = std::nullopt)
        : std::runtime_error(message)
        , option_(std::move(option))
        , column_(std::move(column))
        , case_id_(std::move(case_id)) {}

    static ConfigurationError missing_column(const std::string& option, const std::string& column,
                                             const std::string& table) {
        return ConfigurationError("column '" + column + "' referenced by " + option +
                                  " is missing from the " + table + " table",
                                  option, column);
    }

    static ConfigurationError invalid_option(const std::string& option, const std::string& detail) {
        return ConfigurationError("invalid " + option + ": " + detail, option, std::string());
    }

    // Name of the option that triggered the error, empty if not option-related
    const std::string& option() const { return option_; }

    // Offending column, empty if not column-related
    const std::string& column() const { return column_; }

    const std::optional<std::string>& case_id() const { return case_id_; }
};

/**
 * Syntax error in an extra_conditions expression.
 */
class ExpressionError : public ConfigurationError {
private:
    std::size_t position_;

public:
    ExpressionError(const std::string& message, std::size_t position)
        : ConfigurationError("extra_conditions: " + message + " at offset " + std::to_string(position),
                             "extra_conditions", std::string())
        , position_(position) {}

    std::size_t position() const { return position_; }
};

/**
 * A single case failed while the run was in progress. The run is aborted and
 * no partial result is returned.
 */
class TaskFailure : public std::runtime_error {
private:
    std::size_t case_position_;
    std::string case_id_;

public:
    TaskFailure(std::size_t case_position, std::string case_id, const std::string& cause)
        : std::runtime_error("matching failed for case " + case_id + " (position " +
                             std::to_string(case_position) + "): " + cause)
        , case_position_(case_position)
        , case_id_(std::move(case_id)) {}

    std::size_t case_position() const { return case_position_; }
    const std::string& case_id() const { return case_id_; }
};

} // namespace ccmatch

#endif // CCMATCH_ERRORS_HPP
