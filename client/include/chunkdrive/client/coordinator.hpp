#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "chunkdrive/client/config.hpp"
#include "chunkdrive/client/file_service.hpp"
#include "chunkdrive/client/logger.hpp"
#include "chunkdrive/client/part_worker.hpp"
#include "chunkdrive/client/transfer_types.hpp"

namespace chunkdrive::client
{

    // Runs one job to a terminal state.
    //
    // Parts are posted in ascending order onto a thread pool sized by the job's concurrency.
    // The first failure cancels every other part; the coordinator waits for dispatched work to
    // wind down and reports that failure as the job's cause.
    class TransferCoordinator
    {
    public:
        TransferCoordinator(FileService &service, TransferSettings settings, Logger logger);

        TransferResult run(const TransferJob &job, std::vector<Part> parts, ProgressCallback progress = {});

    private:
        using PartTask = std::function<bool(PartWorker &, Part &, TransferError &)>;

        struct Outcome
        {
            TransferError cause;
            std::vector<TransferError> failures;
        };

        bool dispatch(const TransferJob &job, std::vector<Part> &parts, const PartTask &task, Outcome &outcome);

        TransferResult run_upload(const TransferJob &job, std::vector<Part> &parts);
        TransferResult run_single_upload(const TransferJob &job, std::vector<Part> &parts);
        TransferResult run_download(const TransferJob &job, std::vector<Part> &parts);

        TransferResult fail(const TransferJob &job, std::vector<Part> &parts, Outcome outcome);
        void record_progress(const TransferJob &job, std::uint64_t bytes);

        FileService &service_;
        TransferSettings settings_;
        Logger logger_;
        std::atomic<std::uint64_t> bytes_done_{0};
        std::mutex progress_mutex_;
        ProgressCallback progress_callback_;
    };

} // namespace chunkdrive::client
