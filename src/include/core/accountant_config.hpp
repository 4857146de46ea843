#pragma once
#include "core/config_loader.hpp"
#include "core/errors.hpp"
#include "core/privacy_types.hpp"
#include "utils/logger.hpp"
#include <sstream>
#include <string>
#include <stdexcept>

namespace dp_ledger {

/**
 * @brief Construction options of an Accountant
 *
 * epsilon is the total epsilon budget, delta the total delta budget and
 * slack the share of delta set aside for the advanced composition bound.
 */
struct AccountantConfig {
    double epsilon = 0.0;
    double delta = 0.0;
    double slack = 0.0;
    double tolerance = kDefaultTolerance;
    LogLevel log_level = LogLevel::INFO;

    void validate() const;
};

/**
 * @brief Validate budget parameters
 *
 * Comparisons are written so that NaN fails every check.
 */
inline void AccountantConfig::validate() const {
    if (!(epsilon >= 0.0)) {
        throw ConfigurationError("AccountantConfig: epsilon must be non-negative");
    }
    if (!(delta >= 0.0 && delta < 1.0)) {
        throw ConfigurationError("AccountantConfig: delta must be in [0, 1)");
    }
    if (!(slack >= 0.0)) {
        throw ConfigurationError("AccountantConfig: slack must be non-negative");
    }
    if (slack > delta) {
        throw ConfigurationError("AccountantConfig: slack must not exceed delta");
    }
    if (slack > 0.0 && delta == 0.0) {
        throw ConfigurationError("AccountantConfig: slack requires a non-zero delta budget");
    }
    if (!(tolerance > 0.0 && tolerance < 1.0)) {
        throw ConfigurationError("AccountantConfig: tolerance must be in (0, 1)");
    }
}

/**
 * @brief Load AccountantConfig from an INI file
 *
 * [accountant] epsilon is required; delta, slack and tolerance default as in
 * AccountantConfig. [logging] level is optional.
 */
inline AccountantConfig load_accountant_config(const std::string& filename) {
    ConfigLoader loader;
    if (!loader.load(filename)) {
        throw std::runtime_error("Failed to load configuration file: " + filename);
    }

    AccountantConfig config;

    ConfigSection accountant_sec = loader.get_section("accountant");
    if (!accountant_sec.has("epsilon")) {
        throw ConfigurationError("Missing [accountant] epsilon in " + filename);
    }
    config.epsilon = accountant_sec.get_double("epsilon");
    config.delta = accountant_sec.get_double("delta", config.delta);
    config.slack = accountant_sec.get_double("slack", config.slack);
    config.tolerance = accountant_sec.get_double("tolerance", config.tolerance);

    ConfigSection logging_sec = loader.get_section("logging");
    if (logging_sec.has("level")) {
        config.log_level = string_to_log_level(logging_sec.get("level"));
    }

    config.validate();
    return config;
}

inline bool save_accountant_config(const AccountantConfig& config, const std::string& filename) {
    ConfigLoader loader;
    std::ostringstream eps, delta, slack, tol;
    eps.precision(17);
    delta.precision(17);
    slack.precision(17);
    tol.precision(17);
    eps << config.epsilon;
    delta << config.delta;
    slack << config.slack;
    tol << config.tolerance;

    ConfigSection& acc = loader.sections["accountant"];
    acc.name = "accountant";
    acc.values["epsilon"] = eps.str();
    acc.values["delta"] = delta.str();
    acc.values["slack"] = slack.str();
    acc.values["tolerance"] = tol.str();

    ConfigSection& logging = loader.sections["logging"];
    logging.name = "logging";
    logging.values["level"] = log_level_to_string(config.log_level);

    return loader.save(filename);
}

inline void apply_logging_config(const AccountantConfig& config) {
    Logger::get().set_level(config.log_level);
}

} // namespace dp_ledger
