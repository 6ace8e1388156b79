#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "Types.hpp"

namespace TestHooks {

struct TransferItemInfo {
    std::string operation_id;
    TransferPhase phase;
    std::string source_path;
    std::size_t files_done = 0;
    std::size_t files_total = 0;
};

/// Called by the transfer worker after each file has been handled.
using TransferItemProbe = std::function<void(const TransferItemInfo& info)>;
void set_transfer_item_probe(TransferItemProbe probe);
void reset_transfer_item_probe();

/// Called by the transfer worker after each chunk of a large file is written.
using CopyChunkProbe = std::function<void(const std::string& operation_id, std::uintmax_t bytes_written)>;
void set_copy_chunk_probe(CopyChunkProbe probe);
void reset_copy_chunk_probe();

/// Called by the scan worker for each visited entry, before it is counted.
using ScanEntryProbe = std::function<void(const std::string& operation_id, const std::string& path)>;
void set_scan_entry_probe(ScanEntryProbe probe);
void reset_scan_entry_probe();

} // namespace TestHooks
