/**
 * Ultima Assets - Entry reader interface
 *
 * Common contract of the container reader and the legacy flat-file reader:
 * look up an integer entry index, get back decoded bytes.
 */

#pragma once

#include "ultima/result.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace ultima {

/**
 * Sentinel offset marking a slot without backing data.
 */
constexpr uint32_t INVALID_OFFSET = 0xFFFFFFFF;

class EntryReader {
public:
    /**
     * Visitor for for_each_entry(); return false to stop.
     */
    using EntryVisitor = std::function<bool(uint32_t index)>;

    virtual ~EntryReader() = default;

    /**
     * Read and decode one entry.
     * InvalidIndex when the index is outside the table, EntryNotFound when
     * the slot exists but has no data, ReaderClosed after close().
     */
    virtual Result<std::vector<uint8_t>> read(uint32_t index) = 0;

    /**
     * Per-entry extra word (image dimensions, sound ids and the like).
     */
    virtual Result<uint64_t> extra(uint32_t index) = 0;

    /**
     * Valid indices, re-scanned on every call. Empty once closed.
     */
    virtual std::vector<uint32_t> entries() const = 0;

    /**
     * Lazily visit valid indices in table order.
     */
    virtual void for_each_entry(const EntryVisitor& visitor) const = 0;

    /**
     * Release the backing file. Idempotent.
     */
    virtual void close() = 0;

    virtual bool is_closed() const = 0;
};

} // namespace ultima
