#include "lanlink/store/file_endpoint_store.hpp"

#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/net/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <utility>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace lanlink
{

namespace fs = std::filesystem;

FileEndpointStore::FileEndpointStore(fs::path directory, std::string key) : _directory(std::move(directory)), _path(_directory / key)
{
}

fs::path FileEndpointStore::default_directory()
{
    if (const char* state_home = std::getenv("XDG_STATE_HOME"); state_home != nullptr && *state_home != '\0')
    {
        return fs::path(state_home) / "lanlink";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0')
    {
        return fs::path(home) / ".local" / "state" / "lanlink";
    }
    return fs::path(".lanlink");
}

void FileEndpointStore::ensure_directory()
{
    std::error_code ec;
    fs::create_directories(_directory, ec);
    if (ec)
    {
        throw StorageError("cannot create " + _directory.string() + ": " + ec.message());
    }
    fs::permissions(_directory, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
    {
        throw StorageError("cannot restrict " + _directory.string() + ": " + ec.message());
    }
}

void FileEndpointStore::save(const Endpoint& endpoint)
{
    ensure_directory();

    const fs::path temporary = _path.string() + ".tmp";
    const std::string content = endpoint.to_string() + "\n";

    int descriptor = ::open(temporary.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (descriptor < 0)
    {
        throw StorageError("cannot open " + temporary.string() + ": " + std::strerror(errno));
    }

    std::size_t written = 0;
    while (written < content.size())
    {
        const ssize_t result = ::write(descriptor, content.data() + written, content.size() - written);
        if (result < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const std::string reason = std::strerror(errno);
            ::close(descriptor);
            ::unlink(temporary.c_str());
            throw StorageError("cannot write " + temporary.string() + ": " + reason);
        }
        written += static_cast<std::size_t>(result);
    }

    if (::fsync(descriptor) != 0 || ::close(descriptor) != 0)
    {
        const std::string reason = std::strerror(errno);
        ::unlink(temporary.c_str());
        throw StorageError("cannot flush " + temporary.string() + ": " + reason);
    }

    std::error_code ec;
    fs::rename(temporary, _path, ec);
    if (ec)
    {
        ::unlink(temporary.c_str());
        throw StorageError("cannot replace " + _path.string() + ": " + ec.message());
    }

    LANLINK_LOG_DEBUG("Saved endpoint " << endpoint << " to " << _path.string());
}

std::optional<Endpoint> FileEndpointStore::load()
{
    std::error_code ec;
    if (!fs::exists(_path, ec))
    {
        if (ec)
        {
            throw StorageError("cannot stat " + _path.string() + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream file(_path);
    if (!file)
    {
        throw StorageError("cannot read " + _path.string());
    }

    std::string line;
    std::getline(file, line);
    if (file.bad())
    {
        throw StorageError("cannot read " + _path.string());
    }

    auto endpoint = Endpoint::parse(line);
    if (!endpoint)
    {
        throw StorageError("stored value in " + _path.string() + " is not an endpoint");
    }
    return endpoint;
}

void FileEndpointStore::clear()
{
    std::error_code ec;
    fs::remove(_path, ec);
    if (ec)
    {
        throw StorageError("cannot remove " + _path.string() + ": " + ec.message());
    }
    LANLINK_LOG_DEBUG("Cleared " << _path.string());
}

} // namespace lanlink
