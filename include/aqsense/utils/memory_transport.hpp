// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../access/transport.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"

namespace aqsense::utils {

/**
 * @brief In-memory register file satisfying RegisterTransport
 *
 * Each register address holds a block of bytes. A read longer than the
 * block at its start address continues into the blocks at the following
 * addresses, the way devices auto-increment the register pointer on burst
 * reads. Reading an address with no block is reported as a NACK.
 *
 * Writes replace the block at their address. Writes with an empty payload
 * only move the register pointer and are recorded as commands.
 *
 * Used by tests and examples to stand in for a real bus.
 */
class MemoryTransport {
public:
    /// One recorded write transaction
    struct WriteRecord {
        register_address_t reg;
        Bytes payload;
    };

    MemoryTransport() = default;

    /// Preload a register block
    void set_register(register_address_t reg, Bytes bytes) { blocks_[reg] = std::move(bytes); }

    /// Current contents of a register block, if present
    std::optional<Bytes> get_register(register_address_t reg) const {
        auto it = blocks_.find(reg);
        if (it == blocks_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void clear_register(register_address_t reg) { blocks_.erase(reg); }

    /// Make the next `count` transactions fail with TransportError
    void fail_next(size_t count) noexcept { pending_failures_ = count; }

    /**
     * Burst read starting at `reg`
     * @throws TransportError on an injected failure or a missing register
     */
    Bytes read_bytes(register_address_t reg, size_t length) {
        consume_failure("read", reg);
        pointer_ = reg;
        ++read_count_;
        return burst(reg, length);
    }

    /**
     * Read from the current register pointer without rewriting it
     * @throws TransportError if no pointer has been set
     */
    Bytes read_current(size_t length) {
        if (!pointer_) {
            throw TransportError("read without a register pointer");
        }
        consume_failure("read", *pointer_);
        ++read_count_;
        return burst(*pointer_, length);
    }

    /**
     * Write `payload` at `reg`
     * @throws TransportError on an injected failure
     */
    void write_bytes(register_address_t reg, std::span<const uint8_t> payload) {
        consume_failure("write", reg);
        pointer_ = reg;
        ++write_count_;
        writes_.push_back(WriteRecord{reg, Bytes(payload.begin(), payload.end())});
        if (payload.empty()) {
            commands_.push_back(reg);
            return;
        }
        blocks_[reg] = Bytes(payload.begin(), payload.end());
    }

    size_t read_count() const noexcept { return read_count_; }
    size_t write_count() const noexcept { return write_count_; }

    /// Every write in order, commands included
    const std::vector<WriteRecord>& writes() const noexcept { return writes_; }

    /// Registers addressed by pointer-only writes, in order
    const std::vector<register_address_t>& commands() const noexcept { return commands_; }

    void reset_counters() noexcept {
        read_count_ = 0;
        write_count_ = 0;
        writes_.clear();
        commands_.clear();
    }

private:
    void consume_failure(const char* operation, register_address_t reg) {
        if (pending_failures_ == 0) {
            return;
        }
        --pending_failures_;
        throw TransportError(std::string(operation) + " of register " + std::to_string(reg) +
                             " was not acknowledged");
    }

    Bytes burst(register_address_t reg, size_t length) const {
        Bytes out;
        out.reserve(length);
        register_address_t next = reg;
        while (out.size() < length) {
            auto it = blocks_.find(next);
            if (it == blocks_.end()) {
                throw TransportError("register " + std::to_string(next) + " did not acknowledge");
            }
            const size_t take = std::min(length - out.size(), it->second.size());
            out.insert(out.end(), it->second.begin(),
                       it->second.begin() + static_cast<std::ptrdiff_t>(take));
            if (it->second.empty()) {
                break;
            }
            ++next;
        }
        return out;
    }

    std::map<register_address_t, Bytes> blocks_;
    std::optional<register_address_t> pointer_;
    std::vector<WriteRecord> writes_;
    std::vector<register_address_t> commands_;
    size_t read_count_ = 0;
    size_t write_count_ = 0;
    size_t pending_failures_ = 0;
};

static_assert(RegisterTransport<MemoryTransport>);
static_assert(PointerReadTransport<MemoryTransport>);

} // namespace aqsense::utils
