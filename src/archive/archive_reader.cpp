/**
 * @file archive_reader.cpp
 * @brief Implementation of the lazy partition parser
 */

#include <vigil/archive/archive_reader.hpp>

#include <vigil/archive/archive_grammar.hpp>
#include <vigil/archive/archive_layout.hpp>
#include <vigil/compat/format.hpp>
#include <vigil/integration/logger_adapter.hpp>

#include <fstream>
#include <optional>
#include <string>

namespace vigil::archive {

using integration::logger_adapter;
using kcenon::common::make_error;

// =============================================================================
// Cursor
// =============================================================================

struct event_sequence::cursor {
    std::ifstream stream;
    std::unique_ptr<line_parser> parser;
    std::filesystem::path path;
    std::size_t line_number{0};
    bool exhausted{false};
    std::optional<parsed_event> current;
    std::shared_ptr<std::atomic<std::uint64_t>> error_counter;

    void emit(parsed_event event) {
        if (is_unparsed(event.event)) {
            error_counter->fetch_add(1, std::memory_order_relaxed);
            const auto& bad = std::get<unparsed_line>(event.event);
            logger_adapter::warn("Unparsed line {}:{}: {}", path.string(), event.line_number,
                                 bad.reason);
        }
        current = std::move(event);
    }

    void advance() {
        current.reset();
        std::string line;
        while (!exhausted) {
            if (std::getline(stream, line)) {
                ++line_number;
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (auto parsed = parser->feed(line, line_number)) {
                    emit(std::move(*parsed));
                    return;
                }
                continue;
            }

            exhausted = true;
            if (auto parsed = parser->finish()) {
                emit(std::move(*parsed));
                return;
            }
        }
    }
};

// =============================================================================
// Iterator
// =============================================================================

event_sequence::iterator::iterator(std::shared_ptr<cursor> state)
    : state_(std::move(state)) {}

auto event_sequence::iterator::operator*() const -> reference { return *state_->current; }

auto event_sequence::iterator::operator->() const -> pointer {
    return &*state_->current;
}

auto event_sequence::iterator::operator++() -> iterator& {
    state_->advance();
    return *this;
}

auto event_sequence::iterator::at_end() const noexcept -> bool {
    return !state_ || !state_->current.has_value();
}

auto event_sequence::iterator::operator==(const iterator& other) const noexcept -> bool {
    if (at_end() || other.at_end()) {
        return at_end() == other.at_end();
    }
    return state_ == other.state_;
}

// =============================================================================
// Sequence
// =============================================================================

event_sequence::event_sequence(core::entity_type type, std::filesystem::path path,
                               std::shared_ptr<std::atomic<std::uint64_t>> error_counter)
    : type_(type), path_(std::move(path)), error_counter_(std::move(error_counter)) {}

auto event_sequence::begin() const -> iterator {
    auto state = std::make_shared<cursor>();
    state->path = path_;
    state->parser = make_line_parser(type_);
    state->error_counter = error_counter_;
    state->stream.open(path_, std::ios::in | std::ios::binary);

    if (!state->stream.is_open()) {
        state->exhausted = true;
        state->emit(parsed_event{
            0, unparsed_line{path_.string(), "archive file could not be opened"}});
        return iterator{std::move(state)};
    }

    state->advance();
    return iterator{std::move(state)};
}

auto event_sequence::end() const -> iterator { return iterator{}; }

// =============================================================================
// Reader
// =============================================================================

archive_reader::archive_reader(const core::durability_config& config)
    : config_(config),
      error_counter_(std::make_shared<std::atomic<std::uint64_t>>(0)) {}

auto archive_reader::parse(core::entity_type type, const std::filesystem::path& path) const
    -> Result<event_sequence> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return make_error<event_sequence>(
            error_codes::archive_io_error,
            vigil::compat::format("Archive file not found: {}", path.string()), "archive");
    }
    return event_sequence{type, path, error_counter_};
}

auto archive_reader::list_partitions(core::entity_type type) const
    -> Result<std::vector<std::filesystem::path>> {
    return archive::list_partitions(config_.archive_root, type);
}

auto archive_reader::error_count() const noexcept -> std::uint64_t {
    return error_counter_->load(std::memory_order_relaxed);
}

void archive_reader::reset_error_count() noexcept {
    error_counter_->store(0, std::memory_order_relaxed);
}

auto archive_reader::root() const -> const std::filesystem::path& {
    return config_.archive_root;
}

}  // namespace vigil::archive
