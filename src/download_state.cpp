#include "httpdl/download_state.hpp"

#include <stdexcept>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace httpdl {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

DownloadId newDownloadId() {
    // random_generator is not thread safe, one per thread
    thread_local boost::uuids::random_generator generator;
    return generator();
}

std::string toString(const DownloadId& id) {
    return boost::uuids::to_string(id);
}

DownloadId parseDownloadId(const std::string& text) {
    try {
        return boost::uuids::string_generator{}(text);
    } catch (const std::runtime_error&) {
        throw DownloadError(Errc::not_found, "malformed download id '" + text + "'");
    }
}

std::string_view stateName(const DownloadState& state) noexcept {
    return std::visit(overloaded{
                          [](const state::Running&) { return std::string_view{"Running"}; },
                          [](const state::Paused&) { return std::string_view{"Paused"}; },
                          [](const state::Complete&) { return std::string_view{"Complete"}; },
                          [](const state::Error&) { return std::string_view{"Error"}; },
                      },
                      state);
}

std::optional<std::uint64_t> bytesDownloaded(const DownloadState& state) noexcept {
    return std::visit(overloaded{
                          [](const state::Running& s) -> std::optional<std::uint64_t> {
                              return s.bytes_downloaded;
                          },
                          [](const state::Paused& s) -> std::optional<std::uint64_t> {
                              return s.bytes_downloaded;
                          },
                          [](const state::Complete&) -> std::optional<std::uint64_t> {
                              return std::nullopt;
                          },
                          [](const state::Error&) -> std::optional<std::uint64_t> {
                              return std::nullopt;
                          },
                      },
                      state);
}

} // namespace httpdl
