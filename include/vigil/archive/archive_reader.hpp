/**
 * @file archive_reader.hpp
 * @brief Lazy, restartable parsing of archive partitions into typed events
 */

#pragma once

#include <vigil/archive/archive_event.hpp>
#include <vigil/core/durability_config.hpp>
#include <vigil/core/entity_type.hpp>
#include <vigil/core/result.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <vector>

namespace vigil::archive {

/**
 * @class event_sequence
 * @brief Events of one partition, produced on demand
 *
 * Each call to begin() reopens the file and starts a fresh parser, so a
 * sequence can be iterated any number of times. Lines the grammar rejects
 * are yielded as unparsed_line events, never dropped. A file that cannot be
 * reopened yields a single unparsed_line describing the failure.
 *
 * @code
 * for (const auto& parsed : reader.parse(core::entity_type::user, path).value()) {
 *     if (is_unparsed(parsed.event)) { ... }
 * }
 * @endcode
 */
class event_sequence {
public:
    struct cursor;

    /**
     * @class iterator
     * @brief Single-pass input iterator over one reading of the file
     */
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = parsed_event;
        using difference_type = std::ptrdiff_t;
        using pointer = const parsed_event*;
        using reference = const parsed_event&;

        iterator() = default;

        [[nodiscard]] auto operator*() const -> reference;
        [[nodiscard]] auto operator->() const -> pointer;
        auto operator++() -> iterator&;
        void operator++(int) { ++*this; }

        [[nodiscard]] auto operator==(const iterator& other) const noexcept -> bool;
        [[nodiscard]] auto operator!=(const iterator& other) const noexcept -> bool {
            return !(*this == other);
        }

    private:
        friend class event_sequence;
        explicit iterator(std::shared_ptr<cursor> state);

        [[nodiscard]] auto at_end() const noexcept -> bool;

        std::shared_ptr<cursor> state_;
    };

    event_sequence(core::entity_type type, std::filesystem::path path,
                   std::shared_ptr<std::atomic<std::uint64_t>> error_counter);

    [[nodiscard]] auto begin() const -> iterator;
    [[nodiscard]] auto end() const -> iterator;

    [[nodiscard]] auto type() const noexcept -> core::entity_type { return type_; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    core::entity_type type_;
    std::filesystem::path path_;
    std::shared_ptr<std::atomic<std::uint64_t>> error_counter_;
};

/**
 * @class archive_reader
 * @brief Entry point for reading an archive tree
 *
 * Parsing has no side effects besides the reader's unparsed-line counter,
 * which is shared by every sequence the reader hands out.
 *
 * Thread Safety: parse() and list_partitions() may be called concurrently;
 * a single event_sequence iterator must not be shared between threads.
 */
class archive_reader {
public:
    explicit archive_reader(const core::durability_config& config);

    /**
     * @brief Parse one partition file
     * @return The lazy sequence, or archive_io_error when the file is not readable
     */
    [[nodiscard]] auto parse(core::entity_type type, const std::filesystem::path& path) const
        -> Result<event_sequence>;

    /**
     * @brief Partition files of @p type under the configured root, in path order
     */
    [[nodiscard]] auto list_partitions(core::entity_type type) const
        -> Result<std::vector<std::filesystem::path>>;

    /**
     * @brief Unparsed lines yielded so far by this reader's sequences
     */
    [[nodiscard]] auto error_count() const noexcept -> std::uint64_t;

    void reset_error_count() noexcept;

    [[nodiscard]] auto root() const -> const std::filesystem::path&;

private:
    const core::durability_config& config_;
    std::shared_ptr<std::atomic<std::uint64_t>> error_counter_;
};

}  // namespace vigil::archive
