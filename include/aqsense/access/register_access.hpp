// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

#include "../codec/device.hpp"
#include "../codec/register.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../core/value.hpp"
#include "transport.hpp"

namespace aqsense {

/// Cache state of one register accessor
enum class CacheState : uint8_t {
    uninitialized, // No values known; next read goes to the device
    cached         // Holds the values from the last read or optimistic write
};

constexpr const char* cache_state_string(CacheState state) noexcept {
    return state == CacheState::cached ? "cached" : "uninitialized";
}

/**
 * @brief Read/write facade over one register of one physical device
 *
 * Owns the register's value cache. The cache moves Uninitialized -> Cached
 * on the first successful read, is replaced wholesale on every later read,
 * and drops back to Uninitialized through invalidate(), which retry policies
 * call once a transport failure is confirmed.
 *
 * Non-volatile registers are read from the device once; later reads return
 * the cache unless ignore_cache is set.
 *
 * Derived classes provide typed, validated write signatures on top of
 * write_fields(). This class is not thread safe.
 *
 * @tparam Transport Caller-owned transport shared with the rest of the device
 */
template <RegisterTransport Transport>
class RegisterAccess {
public:
    /// @throws ConfigError if the device has no register named `register_name`
    RegisterAccess(Transport& transport, const Device& device, std::string_view register_name)
        : transport_(&transport),
          device_(&device),
          reg_(&device.reg(register_name)) {}

    /**
     * Read the register
     *
     * @param ignore_cache Go to the device even for a cached non-volatile register
     * @return Decoded values of every field
     * @throws TransportError, CodecError (cache left untouched)
     */
    const FieldValues& read(bool ignore_cache = false) {
        if (reg_->non_volatile() && cache_ && !ignore_cache) {
            return *cache_;
        }
        const Bytes raw = transport_->read_bytes(reg_->address(), device_->read_length(*reg_));
        return update_from_raw(raw);
    }

    /**
     * Decode and cache a register image obtained outside read()
     *
     * For devices whose results must be fetched with a transaction read()
     * cannot express (deferred reads after a conversion delay).
     *
     * @throws TransportError on a short image, CodecError (cache left untouched)
     */
    const FieldValues& update_from_raw(std::span<const uint8_t> raw) {
        if (raw.size() != device_->read_length(*reg_)) {
            throw TransportError("register '" + reg_->name() + "' image has " +
                                 std::to_string(raw.size()) + " of " +
                                 std::to_string(device_->read_length(*reg_)) + " byte(s)");
        }
        cache_ = reg_->raw_bytes_to_field_values(raw);
        return *cache_;
    }

    /// Last known values; empty while uninitialized
    const FieldValues& values() const noexcept {
        static const FieldValues empty;
        return cache_ ? *cache_ : empty;
    }

    /// Last known value of one field, if any
    std::optional<FieldValue> value(std::string_view field) const {
        if (!cache_) {
            return std::nullopt;
        }
        auto it = cache_->find(field);
        if (it == cache_->end()) {
            return std::nullopt;
        }
        return it->second;
    }

    CacheState state() const noexcept {
        return cache_ ? CacheState::cached : CacheState::uninitialized;
    }

    /// Forget every cached value (Cached -> Uninitialized)
    void invalidate() noexcept { cache_.reset(); }

    const Register& reg() const noexcept { return *reg_; }
    const Device& device() const noexcept { return *device_; }

protected:
    /**
     * Encode and write field values
     *
     * Everything is encoded before the transport is touched, so a bad value
     * never produces a partial write.
     *
     * @param values Fields to write
     * @param optimistic Update the cache with the written values on success
     */
    void write_fields(const FieldValues& values, bool optimistic) {
        const Bytes payload = reg_->field_values_to_raw_bytes(values);
        transport_->write_bytes(reg_->address(), payload);
        if (!optimistic) {
            return;
        }
        if (cache_) {
            for (const auto& [name, value] : values) {
                cache_->insert_or_assign(name, value);
            }
        } else if (values.size() == reg_->fields().size()) {
            cache_ = values;
        }
    }

    Transport& transport() noexcept { return *transport_; }

private:
    Transport* transport_;
    const Device* device_;
    const Register* reg_;
    std::optional<FieldValues> cache_;
};

/// Accessor for registers the host may only read
template <RegisterTransport Transport>
class ReadOnlyRegister : public RegisterAccess<Transport> {
public:
    using RegisterAccess<Transport>::RegisterAccess;

    /// @throws UnsupportedOperation always
    [[noreturn]] void write() const {
        throw UnsupportedOperation("register '" + this->reg().name() + "' is read only");
    }
};

/**
 * @brief Accessor for registers the host may only write (resets, triggers)
 *
 * Carries no value cache.
 */
template <RegisterTransport Transport>
class WriteOnlyRegister {
public:
    /// @throws ConfigError if the device has no register named `register_name`
    WriteOnlyRegister(Transport& transport, const Device& device, std::string_view register_name)
        : transport_(&transport),
          reg_(&device.reg(register_name)) {}

    /// @throws UnsupportedOperation always
    [[noreturn]] void read() const {
        throw UnsupportedOperation("register '" + reg_->name() + "' is write only");
    }

    const Register& reg() const noexcept { return *reg_; }

protected:
    void write_fields(const FieldValues& values) {
        const Bytes payload = reg_->field_values_to_raw_bytes(values);
        transport_->write_bytes(reg_->address(), payload);
    }

private:
    Transport* transport_;
    const Register* reg_;
};

} // namespace aqsense
