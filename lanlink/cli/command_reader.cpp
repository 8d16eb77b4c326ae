#include "lanlink/cli/command_reader.hpp"

#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/net/errors.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/read_until.hpp>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <istream>
#include <optional>
#include <string>
#include <utility>

#include <unistd.h>

namespace lanlink
{

namespace
{

const char* const usage = "Commands: code <payload> | retry | forget | status | items | add <title> | rename <id> <title> | delete <id> | quit";

std::optional<std::int64_t> parse_id(const std::string& text)
{
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 18)
    {
        return std::nullopt;
    }
    return std::stoll(text);
}

std::pair<std::string, std::string> split_first_word(const std::string& line)
{
    const auto separator = line.find(' ');
    if (separator == std::string::npos)
    {
        return {line, std::string()};
    }
    return {line.substr(0, separator), line.substr(separator + 1)};
}

} // namespace

CommandReader::CommandReader(boost::asio::io_context& io_context, ConnectionReconciler& reconciler, ItemsClient& items, std::ostream& out)
    : _io_context(io_context), _input(io_context), _reconciler(reconciler), _items(items), _out(out)
{
}

bool CommandReader::attach(int descriptor)
{
    const int duplicate = ::dup(descriptor);
    if (duplicate < 0)
    {
        LANLINK_LOG_ERROR("Cannot read commands, dup(" << descriptor << ") failed: " << std::strerror(errno));
        return false;
    }

    boost::system::error_code error_code;
    _input.assign(duplicate, error_code);
    if (error_code)
    {
        // e.g. a regular file redirected to stdin, which epoll refuses to watch
        LANLINK_LOG_ERROR("Cannot read commands from descriptor " << descriptor << ": " << error_code.message());
        ::close(duplicate);
        return false;
    }
    return true;
}

void CommandReader::start()
{
    if (!_input.is_open())
    {
        return;
    }

    boost::asio::async_read_until(_input, _buffer, '\n',
                                  [this](const boost::system::error_code& error_code, std::size_t) { handle_line(error_code); });
}

void CommandReader::handle_line(const boost::system::error_code& error_code)
{
    if (error_code)
    {
        LANLINK_LOG_DEBUG("Command input closed: " << error_code.message());
        return;
    }

    std::istream stream(&_buffer);
    std::string line;
    std::getline(stream, line);

    if (!execute(line))
    {
        _io_context.stop();
        return;
    }
    start();
}

bool CommandReader::execute(const std::string& line)
{
    const auto [verb, detail] = split_first_word(line);

    if (verb == "code")
    {
        try
        {
            auto candidate = _reconciler.submit_code(detail);
            _out << "Trying " << candidate.endpoint << std::endl;
        }
        catch (const InvalidCodeError& error)
        {
            _out << "Invalid code: " << error.what() << std::endl;
        }
    }
    else if (verb == "retry")
    {
        _reconciler.retry_discovery();
    }
    else if (verb == "forget")
    {
        _reconciler.forget();
    }
    else if (verb == "status")
    {
        _out << _reconciler.status() << std::endl;
    }
    else if (verb == "items")
    {
        _items.async_list(
            [this](const boost::system::error_code& error_code, const std::vector<Item>& items)
            {
                if (error_code)
                {
                    print_error("List items", error_code);
                    return;
                }
                if (items.empty())
                {
                    _out << "No items" << std::endl;
                }
                for (const auto& item : items)
                {
                    _out << item.id << "  " << item.title << "  (" << item.updated_at << ")" << std::endl;
                }
            });
    }
    else if (verb == "add")
    {
        _items.async_create(detail,
                            [this](const boost::system::error_code& error_code, const Item& item)
                            {
                                if (error_code)
                                {
                                    print_error("Add item", error_code);
                                    return;
                                }
                                _out << "Added " << item.id << "  " << item.title << std::endl;
                            });
    }
    else if (verb == "rename" || verb == "delete")
    {
        const auto [id_text, title] = split_first_word(detail);
        const auto id               = parse_id(id_text);
        if (!id)
        {
            _out << "Usage: " << (verb == "rename" ? "rename <id> <title>" : "delete <id>") << std::endl;
        }
        else if (verb == "rename")
        {
            _items.async_rename(*id, title,
                                [this](const boost::system::error_code& error_code, const Item& item)
                                {
                                    if (error_code)
                                    {
                                        print_error("Rename item", error_code);
                                        return;
                                    }
                                    _out << "Renamed " << item.id << "  " << item.title << std::endl;
                                });
        }
        else
        {
            const auto removed = *id;
            _items.async_remove(removed,
                                [this, removed](const boost::system::error_code& error_code)
                                {
                                    if (error_code)
                                    {
                                        print_error("Delete item", error_code);
                                        return;
                                    }
                                    _out << "Deleted " << removed << std::endl;
                                });
        }
    }
    else if (verb == "quit")
    {
        return false;
    }
    else if (!verb.empty())
    {
        _out << usage << std::endl;
    }
    return true;
}

void CommandReader::print_error(const std::string& action, const boost::system::error_code& error_code)
{
    if (error_code == boost::asio::error::not_connected)
    {
        _out << action << ": not connected to a server" << std::endl;
        return;
    }
    _out << action << " failed: " << error_code.message() << std::endl;
}

} // namespace lanlink
