/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <array>
#include <chrono>
#include <verichain/common/bytes.hpp>
#include <verichain/crypto/sodium.hpp>
#include "record-id.hpp"

namespace verichain::ledger {
    static constexpr uint16_t max_counter = 0x0FFF;
    // a fresh millisecond starts the counter in the lower half to leave room for bursts
    static constexpr uint16_t counter_seed_mask = 0x07FF;

    bool valid_record_id(const std::string_view id) noexcept
    {
        if (id.size() != 36)
            return false;
        for (size_t i = 0; i < id.size(); ++i) {
            const char c = id[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-')
                    return false;
            } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
                return false;
            }
        }
        return id[14] == '7';
    }

    record_id_parts_t parse_record_id(const std::string_view id)
    {
        if (!valid_record_id(id)) [[unlikely]]
            throw error(fmt::format("an invalid record id: '{}'", id));
        record_id_parts_t res {};
        for (const auto pos: { 0, 1, 2, 3, 4, 5, 6, 7, 9, 10, 11, 12 })
            res.unix_ms = (res.unix_ms << 4) | uint_from_hex(id[pos]);
        for (const auto pos: { 15, 16, 17 })
            res.counter = static_cast<uint16_t>((res.counter << 4) | uint_from_hex(id[pos]));
        return res;
    }

    static record_id_t format_record_id(const uint64_t unix_ms, const uint16_t counter)
    {
        std::array<uint8_t, 16> b {};
        crypto::sodium::random_bytes(b);
        for (size_t i = 0; i < 6; ++i)
            b[i] = static_cast<uint8_t>(unix_ms >> (40 - i * 8));
        b[6] = static_cast<uint8_t>(0x70 | ((counter >> 8) & 0x0F));
        b[7] = static_cast<uint8_t>(counter & 0xFF);
        b[8] = static_cast<uint8_t>(0x80 | (b[8] & 0x3F));
        const auto hex = to_hex(buffer { b.data(), b.size() });
        return fmt::format("{}-{}-{}-{}-{}", hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4), hex.substr(16, 4), hex.substr(20));
    }

    record_id_t record_id_generator_t::_next_locked(const record_id_parts_t &floor)
    {
        const auto now_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        if (floor.unix_ms > _last_ms || (floor.unix_ms == _last_ms && floor.counter > _counter)) {
            _last_ms = floor.unix_ms;
            _counter = floor.counter;
        }
        if (now_ms > _last_ms) {
            _last_ms = now_ms;
            std::array<uint8_t, 2> rnd {};
            crypto::sodium::random_bytes(rnd);
            _counter = static_cast<uint16_t>((rnd[0] << 8 | rnd[1]) & counter_seed_mask);
        } else if (_counter < max_counter) {
            ++_counter;
        } else {
            // the counter is exhausted: borrow the next millisecond
            ++_last_ms;
            _counter = 0;
        }
        return format_record_id(_last_ms, _counter);
    }

    record_id_t record_id_generator_t::next()
    {
        std::scoped_lock lk { _mutex };
        return _next_locked({});
    }

    record_id_t record_id_generator_t::next_after(const std::string_view prev)
    {
        const auto floor = parse_record_id(prev);
        std::scoped_lock lk { _mutex };
        return _next_locked(floor);
    }
}
