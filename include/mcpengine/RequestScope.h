//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestScope.h
// Purpose: Per-request memory scopes: resettable arenas, a shared pool of them, and an RAII lease.
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <vector>

namespace mcpengine {

//==========================================================================================================
// RequestArena
// Purpose: Monotonic memory resource for one request/response cycle. Deallocation is a no-op; reset()
//          returns everything at once and keeps the arena reusable.
//==========================================================================================================
class RequestArena : public std::pmr::memory_resource {
public:
    explicit RequestArena(std::size_t initialSize = 4096);

    void reset();

    std::size_t bytesAllocated() const { return allocated; }

private:
    void* do_allocate(std::size_t bytes, std::size_t alignment) override;
    void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) override;
    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override;

    std::pmr::monotonic_buffer_resource arena;
    std::size_t allocated{0};
};

// Pool counters, taken under the pool lock.
struct MemoryStats {
    std::uint64_t acquisitions{0};
    std::uint64_t releases{0};
    std::size_t poolSize{0};
    std::size_t availableArenas{0};
    std::size_t inUse{0};
    std::size_t peakInUse{0};
    std::size_t peakRequestBytes{0};
};

//==========================================================================================================
// ArenaPool
// Purpose: Thread-safe pool of RequestArena objects shared by all connections. acquire() grows the
//          pool when every arena is leased; release() resets the arena and makes it available again.
//==========================================================================================================
class ArenaPool {
public:
    explicit ArenaPool(std::size_t initialSize = 4, std::size_t arenaBytes = 4096);

    ArenaPool(const ArenaPool&) = delete;
    ArenaPool& operator=(const ArenaPool&) = delete;

    RequestArena* acquire();

    // Returns false (and logs) when the arena does not belong to this pool.
    bool release(RequestArena* arena);

    MemoryStats stats() const;

private:
    mutable std::mutex mutex;
    std::vector<std::unique_ptr<RequestArena>> arenas;
    std::vector<RequestArena*> available;
    std::size_t arenaBytes;
    MemoryStats counters;
};

//==========================================================================================================
// ScopedArena
// Purpose: RAII lease of one arena from a pool; the arena goes back to the pool whatever way the
//          request ends.
//==========================================================================================================
class ScopedArena {
public:
    explicit ScopedArena(ArenaPool& pool);
    ~ScopedArena();

    ScopedArena(const ScopedArena&) = delete;
    ScopedArena& operator=(const ScopedArena&) = delete;

    std::pmr::memory_resource* resource() { return arena; }
    RequestArena& get() { return *arena; }

private:
    ArenaPool& pool;
    RequestArena* arena;
};

} // namespace mcpengine
