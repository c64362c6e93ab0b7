#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

#include "chunkdrive/client/config.hpp"
#include "chunkdrive/client/http_client.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/transfer_client.hpp"
#include "chunkdrive/version.hpp"

namespace
{

    using namespace chunkdrive::client;

    void print_progress(const char *verb, std::uint64_t done, std::uint64_t total)
    {
        std::cout << "\r" << verb << " " << done << " / " << total << " bytes" << std::flush;
    }

    void print_remote_file(const chunkdrive::protocol::RemoteFile &file)
    {
        std::cout << "Id:           " << file.id << "\n"
                  << "Name:         " << file.name << "\n"
                  << "Path:         " << file.path << "\n"
                  << "Size:         " << file.size << "\n"
                  << "ContentType:  " << file.content_type << "\n"
                  << "UploadStatus: " << chunkdrive::protocol::to_string(file.upload_status) << "\n"
                  << "Digest:       " << file.content_digest.value_or("-") << std::endl;
    }

    int report(const TransferResult &result)
    {
        std::cout << std::endl;
        if (!result.ok())
        {
            std::cerr << "ERROR: job " << result.job_id << ": " << chunkdrive::describe(result.error) << std::endl;
            return 1;
        }
        if (result.remote_file)
        {
            std::cout << "OK: uploaded " << result.size << " bytes as file " << result.remote_file->id << std::endl;
        }
        else if (result.local_path)
        {
            std::cout << "OK: downloaded " << result.size << " bytes to " << result.local_path->string() << std::endl;
        }
        std::cout << "Digest: " << result.checksum << std::endl;
        return 0;
    }

    int run(const ClientConfig &config)
    {
        Logger logger(config.log_path);
        logger.log("job", "chunkdrive client ", chunkdrive::version(), " against ", config.service.host, ":",
                   config.service.port);

        BeastHttpClient http(config.service);
        TransferClient client(http, config.service, config.settings, logger);

        switch (config.command)
        {
        case CommandKind::Stat:
        {
            chunkdrive::protocol::RemoteFile file;
            chunkdrive::TransferError error;
            if (!client.stat(config.positional[0], file, error))
            {
                std::cerr << "ERROR: " << chunkdrive::describe(error) << std::endl;
                return 1;
            }
            print_remote_file(file);
            return 0;
        }
        case CommandKind::Upload:
        {
            UploadRequest request{
                .local_path = config.positional[0],
                .remote_directory = config.positional[1],
                .file_name = config.name.value_or(""),
                .content_type = config.content_type.value_or("application/octet-stream"),
                .part_size = config.part_size,
                .concurrency = config.concurrency,
            };
            return report(client.upload(request, [](std::uint64_t done, std::uint64_t total)
                                        { print_progress("Uploaded", done, total); }));
        }
        case CommandKind::Download:
        {
            DownloadRequest request{
                .file_id = config.positional[0],
                .local_directory = config.positional[1],
                .byte_range = config.byte_range,
                .standalone_range = !config.range_in_place,
                .part_size = config.part_size,
                .concurrency = config.concurrency,
                .local_name = config.name,
                .create_remote_dirs = config.mirror_remote_path,
                .temp_directory = config.temp_directory,
            };
            return report(client.download(request, [](std::uint64_t done, std::uint64_t total)
                                          { print_progress("Downloaded", done, total); }));
        }
        }
        return 1;
    }

} // namespace

int main(int argc, char *argv[])
{
    chunkdrive::client::ClientConfig config;
    try
    {
        config = chunkdrive::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ChunkDrive client " << chunkdrive::version() << "\n"
                  << "ERROR: " << ex.what() << std::endl;
        return 1;
    }

    try
    {
        return run(config);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
