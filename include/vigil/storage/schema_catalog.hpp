/**
 * @file schema_catalog.hpp
 * @brief Registry of schema versions known to the application
 */

#pragma once

#include <vigil/core/result.hpp>
#include <vigil/storage/schema_version.hpp>

#include <string_view>
#include <vector>

namespace vigil::storage {

/**
 * @brief Ordered set of schema versions
 *
 * Registration order is the tie-breaker when several pending versions are
 * ready at the same time, so topological ordering stays deterministic.
 *
 * @example
 * @code
 * auto catalog = schema_catalog::builtin();
 * auto added = catalog.add(schema_version{"007_prayer_tags", ...});
 * @endcode
 */
class schema_catalog {
public:
    /**
     * @brief Register a version
     * @return invalid_argument when the id is empty or already registered
     */
    [[nodiscard]] auto add(schema_version version) -> VoidResult;

    /**
     * @brief Look up a version by id
     * @return nullptr when unknown
     */
    [[nodiscard]] auto find(std::string_view id) const -> const schema_version*;

    [[nodiscard]] auto versions() const noexcept -> const std::vector<schema_version>& {
        return versions_;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return versions_.size(); }

    /**
     * @brief The canonical store schema shipped with the application
     *
     * 001 creates the entity and event tables, 002 adds archive_path back
     * references, 003 adds natural-key indexes, 004 adds the recovery
     * checkpoint table and 005 adds placeholder flags.
     */
    [[nodiscard]] static auto builtin() -> schema_catalog;

private:
    std::vector<schema_version> versions_;
};

}  // namespace vigil::storage
