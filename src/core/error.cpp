/// @file error.cpp
/// @brief Error handling implementation for vfsh_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Per-code failure counters

#include <vfsh/core/error.hpp>
#include <array>
#include <atomic>
#include <sstream>
#include <vector>

namespace vfsh_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_vfs_error(const VfsError& err) {
    std::ostringstream oss;
    oss << "[VfsError] " << err.message;
    return oss.str();
}

std::string format_command_error(const CommandError& err) {
    std::ostringstream oss;
    oss << "[CommandError] " << err.message;

    if (!err.command.empty() && err.kind != CommandError::Kind::UnknownCommand &&
        err.kind != CommandError::Kind::DuplicateCommand) {
        oss << " (command: " << err.command << ")";
    }

    return oss.str();
}

std::string format_load_error(const LoadError& err) {
    std::ostringstream oss;
    oss << "[LoadError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, VfsError>) {
            oss << detail::format_vfs_error(err);
        } else if constexpr (std::is_same_v<T, CommandError>) {
            oss << detail::format_command_error(err);
        } else if constexpr (std::is_same_v<T, LoadError>) {
            oss << detail::format_load_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

namespace {

constexpr std::size_t k_code_count = static_cast<std::size_t>(ErrorCode::Internal) + 1;

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::array<std::atomic<std::uint64_t>, k_code_count> by_code{};
};

ErrorStats s_error_stats;

} // anonymous namespace

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    auto index = static_cast<std::size_t>(error.code());
    if (index < k_code_count) {
        s_error_stats.by_code[index].fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t error_count(ErrorCode code) {
    auto index = static_cast<std::size_t>(code);
    if (index >= k_code_count) {
        return 0;
    }
    return s_error_stats.by_code[index].load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    for (auto& counter : s_error_stats.by_code) {
        counter.store(0, std::memory_order_relaxed);
    }
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << total_error_count() << "\n";

    for (std::size_t i = 0; i < k_code_count; ++i) {
        auto count = s_error_stats.by_code[i].load(std::memory_order_relaxed);
        if (count > 0) {
            oss << "  " << error_code_name(static_cast<ErrorCode>(i)) << ": " << count << "\n";
        }
    }

    return oss.str();
}

} // namespace debug

} // namespace vfsh_core
