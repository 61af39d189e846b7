#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace httpdl {

enum class Errc {
    invalid_url = 1,
    network_error,
    range_not_satisfiable,
    incomplete_transfer,
    io_error,
    not_found,
    invalid_transition,
};

[[nodiscard]] const std::error_category& download_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

// Exception thrown for failures reported synchronously to callers. Transfer
// failures inside a running session never escape as exceptions, they end up
// in the Error state instead.
class DownloadError : public std::runtime_error {
public:
    explicit DownloadError(Errc code);
    DownloadError(Errc code, const std::string& detail);

    [[nodiscard]] Errc errc() const noexcept { return code_; }
    [[nodiscard]] std::error_code code() const noexcept { return make_error_code(code_); }

private:
    Errc code_;
};

} // namespace httpdl

namespace std {
template <>
struct is_error_code_enum<httpdl::Errc> : true_type {};
} // namespace std
