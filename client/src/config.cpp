#include "chunkdrive/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace chunkdrive::client
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::uint64_t parse_unsigned(const std::string &value, const std::string &flag)
        {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
            {
                throw std::runtime_error(flag + " expects a non-negative integer, got '" + value + "'");
            }
            return std::stoull(value);
        }

        CommandKind parse_command(const std::string &value)
        {
            if (value == "upload")
            {
                return CommandKind::Upload;
            }
            if (value == "download")
            {
                return CommandKind::Download;
            }
            if (value == "stat")
            {
                return CommandKind::Stat;
            }
            throw std::runtime_error("Unknown command: " + value);
        }

    } // namespace

    std::string usage()
    {
        return "Usage: chunkdrive_client --host <HOST> --port <PORT> --token <TOKEN> [--prefix <PATH>]\n"
               "                         [--container <PATH>] [--timeout <SECONDS>] [--retries <N>] [--log <FILE>]\n"
               "                         <command> ...\n"
               "  upload   <local_path> <remote_directory> [--name <NAME>] [--content-type <TYPE>]\n"
               "           [--part-size <BYTES>] [--concurrency <N>]\n"
               "  download <file_id> <local_directory> [--range <START-END> [--in-place]] [--name <NAME>]\n"
               "           [--mirror-path] [--temp-dir <DIR>] [--part-size <BYTES>] [--concurrency <N>]\n"
               "  stat     <file_id>\n";
    }

    std::vector<std::uint64_t> parse_range_argument(const std::string &value)
    {
        std::vector<std::uint64_t> endpoints;
        const auto dash = value.find('-');
        if (dash == std::string::npos)
        {
            endpoints.push_back(parse_unsigned(value, "--range"));
            return endpoints;
        }
        endpoints.push_back(parse_unsigned(value.substr(0, dash), "--range"));
        const auto tail = value.substr(dash + 1);
        if (!tail.empty())
        {
            endpoints.push_back(parse_unsigned(tail, "--range"));
        }
        return endpoints;
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(usage());
        }

        ClientConfig config;
        std::optional<std::string> command;
        int index = 1;

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--host")
            {
                config.service.host = require_value(index, argc, argv, arg);
            }
            else if (arg == "--port")
            {
                const auto port = parse_unsigned(require_value(index, argc, argv, arg), arg);
                if (port == 0 || port > 65535)
                {
                    throw std::runtime_error("--port must be between 1 and 65535");
                }
                config.service.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--token")
            {
                config.service.access_token = require_value(index, argc, argv, arg);
            }
            else if (arg == "--prefix")
            {
                config.service.api_prefix = require_value(index, argc, argv, arg);
            }
            else if (arg == "--container")
            {
                config.service.upload_container = require_value(index, argc, argv, arg);
            }
            else if (arg == "--timeout")
            {
                config.service.request_timeout =
                    std::chrono::seconds(parse_unsigned(require_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--retries")
            {
                const auto attempts = parse_unsigned(require_value(index, argc, argv, arg), arg);
                if (attempts == 0)
                {
                    throw std::runtime_error("--retries must be at least 1");
                }
                config.settings.max_attempts = static_cast<std::uint32_t>(attempts);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--name")
            {
                config.name = require_value(index, argc, argv, arg);
            }
            else if (arg == "--content-type")
            {
                config.content_type = require_value(index, argc, argv, arg);
            }
            else if (arg == "--part-size")
            {
                config.part_size = parse_unsigned(require_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--concurrency")
            {
                const auto value = parse_unsigned(require_value(index, argc, argv, arg), arg);
                if (value == 0)
                {
                    throw std::runtime_error("--concurrency must be a positive integer");
                }
                config.concurrency = static_cast<std::size_t>(value);
            }
            else if (arg == "--range")
            {
                config.byte_range = parse_range_argument(require_value(index, argc, argv, arg));
            }
            else if (arg == "--temp-dir")
            {
                config.temp_directory = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--in-place")
            {
                config.range_in_place = true;
            }
            else if (arg == "--mirror-path")
            {
                config.mirror_remote_path = true;
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (!command)
            {
                command = arg;
                config.command = parse_command(arg);
            }
            else
            {
                config.positional.push_back(arg);
            }
        }

        if (!command)
        {
            throw std::runtime_error("Missing command\n" + usage());
        }

        const std::size_t expected = config.command == CommandKind::Stat ? 1 : 2;
        if (config.positional.size() != expected)
        {
            throw std::runtime_error("Wrong number of arguments for " + *command + "\n" + usage());
        }
        if (config.command == CommandKind::Upload && config.service.upload_container.empty())
        {
            throw std::runtime_error("upload requires --container");
        }
        if (config.command != CommandKind::Download && (config.byte_range || config.temp_directory))
        {
            throw std::runtime_error("--range and --temp-dir only apply to download");
        }
        if (config.range_in_place && !config.byte_range)
        {
            throw std::runtime_error("--in-place needs --range");
        }

        return config;
    }

} // namespace chunkdrive::client
