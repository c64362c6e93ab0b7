#include "chunkdrive/client/reassembler.hpp"

#include <fstream>
#include <utility>

namespace chunkdrive::client
{

    Reassembler::Reassembler(Options options, Logger logger)
        : options_(std::move(options)), logger_(std::move(logger))
    {
        working_path_ = options_.destination;
        working_path_ += ".part";
        if (options_.temp_directory)
        {
            temp_root_ = *options_.temp_directory;
        }
        else
        {
            temp_root_ = options_.destination.parent_path();
        }
        written_.assign(options_.part_count, false);
        offsets_.assign(options_.part_count, 0);
    }

    Reassembler::~Reassembler()
    {
        if (!committed_)
        {
            discard();
        }
    }

    std::filesystem::path Reassembler::temp_part_path(std::uint32_t index) const
    {
        return temp_root_ / (options_.tag + "." + options_.destination.filename().string() + ".part" +
                             std::to_string(index));
    }

    bool Reassembler::prepare(TransferError &error)
    {
        std::error_code ec;
        const auto parent = options_.destination.parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                error = make_error(ErrorCode::IO, "Cannot create " + parent.string() + ": " + ec.message());
                return false;
            }
        }

        if (options_.strategy == ReassemblyStrategy::TempParts)
        {
            std::filesystem::create_directories(temp_root_, ec);
            if (ec)
            {
                error = make_error(ErrorCode::IO, "Cannot create temp directory " + temp_root_.string() + ": " +
                                                      ec.message());
                return false;
            }
        }
        else
        {
            {
                std::ofstream create(working_path_, std::ios::binary | std::ios::trunc);
                if (!create.is_open())
                {
                    error = make_error(ErrorCode::IO, "Cannot create " + working_path_.string());
                    return false;
                }
            }
            std::filesystem::resize_file(working_path_, options_.total_length, ec);
            if (ec)
            {
                error = make_error(ErrorCode::IO, "Cannot size " + working_path_.string() + ": " + ec.message());
                return false;
            }
        }

        prepared_ = true;
        logger_.log("reassemble", "prepared ", working_path_.string(), " length=", options_.total_length,
                    " strategy=", options_.strategy == ReassemblyStrategy::TempParts ? "temp_parts" : "positioned");
        return true;
    }

    bool Reassembler::write_chunk(std::uint32_t index, std::uint64_t offset, std::span<const std::byte> bytes,
                                  TransferError &error)
    {
        if (!prepared_)
        {
            error = make_error(ErrorCode::IO, "Reassembler used before prepare()", index);
            return false;
        }
        if (index == 0 || index > written_.size() || offset < options_.base_offset ||
            offset - options_.base_offset + bytes.size() > options_.total_length)
        {
            error = make_error(ErrorCode::IO, "Chunk at offset " + std::to_string(offset) + " lies outside the file",
                               index);
            return false;
        }
        {
            std::lock_guard lock(mutex_);
            if (written_[index - 1])
            {
                error = make_error(ErrorCode::IO, "Part written twice", index);
                return false;
            }
            written_[index - 1] = true;
            offsets_[index - 1] = offset - options_.base_offset;
        }

        const auto relative = offset - options_.base_offset;
        bool ok = false;
        if (options_.strategy == ReassemblyStrategy::TempParts)
        {
            std::ofstream out(temp_part_path(index), std::ios::binary | std::ios::trunc);
            if (out.is_open())
            {
                out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
                out.flush();
                ok = static_cast<bool>(out);
            }
        }
        else
        {
            std::fstream out(working_path_, std::ios::binary | std::ios::in | std::ios::out);
            if (out.is_open())
            {
                out.seekp(static_cast<std::streamoff>(relative));
                out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
                out.flush();
                ok = static_cast<bool>(out);
            }
        }

        if (!ok)
        {
            std::lock_guard lock(mutex_);
            written_[index - 1] = false;
            error = make_error(ErrorCode::IO, "Failed to write " + std::to_string(bytes.size()) + " bytes", index);
            return false;
        }
        return true;
    }

    bool Reassembler::concatenate_parts(TransferError &error)
    {
        std::ofstream out(working_path_, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            error = make_error(ErrorCode::IO, "Cannot create " + working_path_.string());
            return false;
        }
        for (std::uint32_t index = 1; index <= written_.size(); ++index)
        {
            const auto part_path = temp_part_path(index);
            std::ifstream in(part_path, std::ios::binary);
            if (!in.is_open())
            {
                error = make_error(ErrorCode::IO, "Missing temp part " + part_path.string(), index);
                return false;
            }
            out.seekp(static_cast<std::streamoff>(offsets_[index - 1]));
            if (in.peek() != std::ifstream::traits_type::eof())
            {
                out << in.rdbuf();
            }
            if (!out)
            {
                error = make_error(ErrorCode::IO, "Failed to append temp part", index);
                return false;
            }
            in.close();
            std::error_code ec;
            std::filesystem::remove(part_path, ec);
        }
        out.close();
        if (!out)
        {
            error = make_error(ErrorCode::IO, "Failed to flush " + working_path_.string());
            return false;
        }
        // Bytes ahead of the first part are a hole when the range keeps its remote offsets.
        std::error_code ec;
        std::filesystem::resize_file(working_path_, options_.total_length, ec);
        if (ec)
        {
            error = make_error(ErrorCode::IO, "Cannot size " + working_path_.string() + ": " + ec.message());
            return false;
        }
        return true;
    }

    bool Reassembler::assemble(TransferError &error)
    {
        if (assembled_)
        {
            return true;
        }
        {
            std::lock_guard lock(mutex_);
            for (std::size_t i = 0; i < written_.size(); ++i)
            {
                if (!written_[i])
                {
                    error = make_error(ErrorCode::IO, "Part never written", static_cast<std::uint32_t>(i + 1));
                    return false;
                }
            }
        }

        if (options_.strategy == ReassemblyStrategy::TempParts && !concatenate_parts(error))
        {
            return false;
        }

        std::error_code ec;
        const auto size = std::filesystem::file_size(working_path_, ec);
        if (ec || size != options_.total_length)
        {
            error = make_error(ErrorCode::IO, "Assembled file has " + std::to_string(ec ? 0 : size) +
                                                  " bytes, expected " + std::to_string(options_.total_length));
            return false;
        }
        assembled_ = true;
        return true;
    }

    bool Reassembler::commit(LocalFile &file, TransferError &error)
    {
        if (committed_)
        {
            file = LocalFile{.path = options_.destination, .size = options_.total_length};
            return true;
        }
        if (!assembled_)
        {
            error = make_error(ErrorCode::IO, "commit() before assemble()");
            return false;
        }
        std::error_code ec;
        std::filesystem::rename(working_path_, options_.destination, ec);
        if (ec)
        {
            error = make_error(ErrorCode::IO, "Cannot move " + working_path_.string() + " into place: " + ec.message());
            return false;
        }
        committed_ = true;
        file = LocalFile{.path = options_.destination, .size = options_.total_length};
        logger_.log("reassemble", "committed ", options_.destination.string());
        return true;
    }

    bool Reassembler::finalize(LocalFile &file, TransferError &error)
    {
        return assemble(error) && commit(file, error);
    }

    void Reassembler::discard()
    {
        std::error_code ec;
        std::filesystem::remove(working_path_, ec);
        if (options_.strategy == ReassemblyStrategy::TempParts)
        {
            for (std::uint32_t index = 1; index <= written_.size(); ++index)
            {
                std::filesystem::remove(temp_part_path(index), ec);
            }
        }
    }

} // namespace chunkdrive::client
