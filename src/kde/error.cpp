#include <kdeflow/kde/error.hpp>

#include <fmt/format.h>

namespace kdeflow {

auto to_string(KdeErrorKind kind) -> std::string_view {
    switch (kind) {
        case KdeErrorKind::EmptyPopulation:
            return "EmptyPopulation";
        case KdeErrorKind::InvalidInput:
            return "InvalidInput";
        case KdeErrorKind::ShapeMismatch:
            return "ShapeMismatch";
        case KdeErrorKind::MissingInput:
            return "MissingInput";
    }
    return "Unknown";
}

auto KdeError::format() const -> std::string {
    if (group_key.has_value()) {
        return fmt::format("{}: {} (group {})", to_string(kind), message, *group_key);
    }
    if (row.has_value()) {
        return fmt::format("{}: {} (row {})", to_string(kind), message, *row);
    }
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace kdeflow
