#include "httpdl/error.hpp"

#include <fmt/format.h>

namespace httpdl {

namespace {

class DownloadCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "httpdl"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::invalid_url:           return "invalid url";
            case Errc::network_error:         return "network error";
            case Errc::range_not_satisfiable: return "range not satisfiable";
            case Errc::incomplete_transfer:   return "incomplete transfer";
            case Errc::io_error:              return "io error";
            case Errc::not_found:             return "download not found";
            case Errc::invalid_transition:    return "invalid state transition";
        }
        return "unknown error";
    }
};

} // namespace

const std::error_category& download_category() noexcept {
    static const DownloadCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), download_category()};
}

DownloadError::DownloadError(Errc code)
    : std::runtime_error(make_error_code(code).message()), code_(code) {}

DownloadError::DownloadError(Errc code, const std::string& detail)
    : std::runtime_error(detail.empty()
                             ? make_error_code(code).message()
                             : fmt::format("{}: {}", make_error_code(code).message(), detail)),
      code_(code) {}

} // namespace httpdl
