#pragma once

#include "lanlink/store/endpoint_store.hpp"

#include <filesystem>
#include <string>

namespace lanlink
{

/**
 * @brief EndpointStore backed by a single owner-only file.
 *
 * The value lives in <directory>/<key>. The directory is created with mode 0700 and the
 * file with mode 0600; writes go to a temporary sibling that is renamed into place so a
 * crash never leaves a half-written endpoint behind.
 */
class FileEndpointStore : public EndpointStore
{
public:
    static constexpr const char* default_key = "lan_base_url";

    explicit FileEndpointStore(std::filesystem::path directory, std::string key = default_key);

    void save(const Endpoint& endpoint) override;
    std::optional<Endpoint> load() override;
    void clear() override;

    const std::filesystem::path& path() const noexcept { return _path; }

    /// $XDG_STATE_HOME/lanlink, falling back to $HOME/.local/state/lanlink, then ./.lanlink.
    static std::filesystem::path default_directory();

private:
    void ensure_directory();

    std::filesystem::path _directory;
    std::filesystem::path _path;
};

} // namespace lanlink
