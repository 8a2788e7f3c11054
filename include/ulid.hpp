#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include <string>

// Ledger row ids: 26-char Crockford Base32 ULIDs, lexically sortable by
// creation time.
class ULID {
public:
    static std::string get_id() { return get_id(std::chrono::system_clock::now()); }

    static std::string get_id(std::chrono::system_clock::time_point at) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
        uint64_t timestamp = static_cast<uint64_t>(ms) & 0xFFFFFFFFFFFFULL; // 48 bits

        static thread_local std::mt19937_64 gen{std::random_device{}()};
        uint64_t rand_hi = gen() & 0xFFFFFFFFFFULL; // 40 bits
        uint64_t rand_lo = gen() & 0xFFFFFFFFFFULL; // 40 bits

        static const char* CROCKFORD = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
        std::string id(26, '0');
        // 10 chars of time, 2 x 8 chars of randomness
        for (int i = 9; i >= 0; --i) { id[i] = CROCKFORD[timestamp & 0x1F]; timestamp >>= 5; }
        for (int i = 17; i >= 10; --i) { id[i] = CROCKFORD[rand_hi & 0x1F]; rand_hi >>= 5; }
        for (int i = 25; i >= 18; --i) { id[i] = CROCKFORD[rand_lo & 0x1F]; rand_lo >>= 5; }
        return id;
    }
};
