#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace kdeflow {

enum class KdeErrorKind : std::uint8_t {
    EmptyPopulation,
    InvalidInput,
    ShapeMismatch,
    MissingInput,
};

[[nodiscard]] auto to_string(KdeErrorKind kind) -> std::string_view;

/// Failure of a density computation.
///
/// `row` is set for static/dynamic calls, `group_key` for aggregating calls;
/// call-level failures (shape, column kinds, options) carry neither.
struct KdeError {
    KdeErrorKind kind = KdeErrorKind::InvalidInput;
    std::string message;
    std::optional<std::size_t> row;
    std::optional<std::string> group_key;

    [[nodiscard]] auto format() const -> std::string;
};

/// Thrown by the table-level ops when a runtime call fails.
class KdeException : public std::runtime_error {
   public:
    explicit KdeException(KdeError error)
        : std::runtime_error(error.format()), error_(std::move(error)) {}

    [[nodiscard]] auto error() const noexcept -> const KdeError& { return error_; }

   private:
    KdeError error_;
};

}  // namespace kdeflow
