/**
 * @file schema_version.hpp
 * @brief A single versioned structural change of the canonical store
 *
 * A schema_version pairs a forward script with its reverse script and the
 * introspection probes that tell whether its effects are visible in the
 * database. The probes let the migration manager resolve versions left in
 * the "applying" state by a crash without re-running the forward script.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace vigil::storage {

/**
 * @enum probe_kind
 * @brief Schema object a probe looks for
 */
enum class probe_kind {
    table,   ///< table named by schema_probe::table
    column,  ///< column schema_probe::name of schema_probe::table
    index    ///< index named by schema_probe::name
};

/**
 * @struct schema_probe
 * @brief One observable effect of a forward script
 */
struct schema_probe {
    probe_kind kind{probe_kind::table};
    std::string table;
    std::string name;
};

/**
 * @struct schema_version
 * @brief Uniquely identified structural change
 */
struct schema_version {
    /// Unique id; built-in ids sort in application order ("001_...")
    std::string id;

    std::string description;

    /// Executed inside one transaction; must not delete rows
    std::string forward_script;

    /// Undoes forward_script
    std::string reverse_script;

    /// Ids that must be applied first
    std::vector<std::string> dependencies;

    /// Effects checked when resolving an interrupted apply
    std::vector<schema_probe> probes;

    /// Tables whose row counts scale the duration estimate
    std::vector<std::string> affected_tables;

    /// Tables the forward script creates (allowed to vanish on rollback)
    std::vector<std::string> created_tables;

    /// Duration on an empty database
    std::chrono::seconds estimated_duration{5};

    /// Always defer to an explicit maintenance window
    bool requires_maintenance_mode{false};

    /**
     * @brief Hex SHA-256 over id and both scripts
     *
     * Recorded in the bookkeeping table when the version is applied so a
     * changed script under an existing id can be detected.
     */
    [[nodiscard]] auto checksum() const -> std::string;
};

}  // namespace vigil::storage
