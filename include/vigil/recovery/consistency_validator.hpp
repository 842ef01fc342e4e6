/**
 * @file consistency_validator.hpp
 * @brief Compares archive contents with the canonical store
 *
 * The validator is report-only; the single mutating operation,
 * repair_missing_references(), is an explicit operator action.
 */

#pragma once

#include <vigil/core/durability_config.hpp>
#include <vigil/core/entity_type.hpp>
#include <vigil/core/result.hpp>
#include <vigil/storage/canonical_store.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::recovery {

/**
 * @enum divergence_kind
 * @brief Ways archive and canonical store can disagree
 */
enum class divergence_kind {
    missing_row,             ///< archived event with no matching row
    missing_archive_path,    ///< row whose archive_path is empty
    unresolved_archive_path  ///< row whose archive_path does not exist on disk
};

[[nodiscard]] auto to_string(divergence_kind kind) -> std::string_view;

/**
 * @brief One finding of the validator
 */
struct divergence {
    divergence_kind kind{divergence_kind::missing_row};
    std::string key;           ///< natural key of the record
    std::string archive_path;  ///< partition (missing_row) or stored path
    std::size_t line_number{0};
};

/**
 * @brief Findings for one entity type
 */
struct divergence_report {
    core::entity_type type{core::entity_type::user};
    std::size_t partitions{0};
    std::size_t archive_records{0};
    std::size_t canonical_rows{0};
    std::size_t unparsed_lines{0};
    std::vector<divergence> divergences;

    [[nodiscard]] auto consistent() const noexcept -> bool { return divergences.empty(); }

    [[nodiscard]] auto count(divergence_kind kind) const noexcept -> std::size_t;
};

/**
 * @brief Row counts of the canonical store
 */
struct store_snapshot {
    std::map<core::entity_type, std::size_t> rows;

    /// Activity lines of prayer files (not counted under prayer)
    std::size_t prayer_activity_rows{0};

    [[nodiscard]] auto total() const noexcept -> std::size_t;
};

/**
 * @brief Outcome of repair_missing_references()
 */
struct repair_report {
    core::entity_type type{core::entity_type::user};
    std::size_t backfilled{0};
    std::size_t still_missing{0};  ///< archived events with no row at all
};

/**
 * @class consistency_validator
 * @brief Detects divergence between the archive and the canonical store
 */
class consistency_validator {
public:
    /**
     * @param config Archive root; must outlive the validator
     * @param store Canonical store; must outlive the validator
     */
    consistency_validator(const core::durability_config& config,
                          storage::canonical_store& store);

    /**
     * @brief Compare one entity type
     *
     * For prayers both the prayer rows and their activity rows are checked.
     */
    [[nodiscard]] auto validate(core::entity_type type) const -> Result<divergence_report>;

    /**
     * @brief validate() for every entity type in recovery order
     */
    [[nodiscard]] auto validate_all() const -> Result<std::vector<divergence_report>>;

    [[nodiscard]] auto snapshot() const -> Result<store_snapshot>;

    /**
     * @brief Backfill empty archive paths of rows the archive proves exist
     *
     * Runs in one store transaction. Rows with no archived counterpart are
     * left untouched.
     */
    [[nodiscard]] auto repair_missing_references(core::entity_type type)
        -> Result<repair_report>;

private:
    [[nodiscard]] auto check_rows(core::entity_type type, divergence_report& report) const
        -> VoidResult;

    const core::durability_config& config_;
    storage::canonical_store& store_;
};

}  // namespace vigil::recovery
