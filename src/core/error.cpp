/// @file error.cpp
/// @brief Error handling implementation for keyfix_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <keyfix/core/error.hpp>
#include <sstream>
#include <vector>

namespace keyfix_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_format_error(const FormatError& err) {
    std::ostringstream oss;
    oss << "[FormatError] " << err.message;
    if (!err.path.empty() && err.message.find(err.path) == std::string::npos) {
        oss << " (file: " << err.path << ")";
    }
    return oss.str();
}

std::string format_bounds_error(const BufferBoundsError& err) {
    std::ostringstream oss;
    oss << "[BufferBoundsError] " << err.message;
    return oss.str();
}

std::string format_component_error(const UnsupportedComponentTypeError& err) {
    std::ostringstream oss;
    oss << "[UnsupportedComponentTypeError] " << err.message;
    return oss.str();
}

std::string format_io_error(const IoError& err) {
    std::ostringstream oss;
    oss << "[IoError] " << err.message;
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
        } else if constexpr (std::is_same_v<T, FormatError>) {
            oss << detail::format_format_error(err);
        } else if constexpr (std::is_same_v<T, BufferBoundsError>) {
            oss << detail::format_bounds_error(err);
        } else if constexpr (std::is_same_v<T, UnsupportedComponentTypeError>) {
            oss << detail::format_component_error(err);
        } else if constexpr (std::is_same_v<T, IoError>) {
            oss << detail::format_io_error(err);
        }
    }, error.variant());

    if (!error.context().empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : error.context()) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

const char* error_kind_name(const Error& error) {
    if (error.is<FormatError>()) return "FormatError";
    if (error.is<BufferBoundsError>()) return "BufferBoundsError";
    if (error.is<UnsupportedComponentTypeError>()) return "UnsupportedComponentTypeError";
    if (error.is<IoError>()) return "IoError";
    return "Error";
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

} // namespace keyfix_core
