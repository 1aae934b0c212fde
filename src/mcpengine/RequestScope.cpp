//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestScope.cpp
// Purpose: Request arenas and the arena pool
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "mcpengine/RequestScope.h"

namespace mcpengine {

RequestArena::RequestArena(std::size_t initialSize)
    : arena(initialSize, std::pmr::new_delete_resource()) {}

void RequestArena::reset() {
    arena.release();
    allocated = 0;
}

void* RequestArena::do_allocate(std::size_t bytes, std::size_t alignment) {
    void* p = arena.allocate(bytes, alignment);
    allocated += bytes;
    return p;
}

void RequestArena::do_deallocate(void*, std::size_t, std::size_t) {
    // Released in bulk by reset()
}

bool RequestArena::do_is_equal(const std::pmr::memory_resource& other) const noexcept {
    return this == &other;
}

////////////////////////////////////////// ArenaPool /////////////////////////////////////////////////

ArenaPool::ArenaPool(std::size_t initialSize, std::size_t bytes) : arenaBytes(bytes) {
    for (std::size_t i = 0; i < initialSize; ++i) {
        arenas.push_back(std::make_unique<RequestArena>(arenaBytes));
        available.push_back(arenas.back().get());
    }
    counters.poolSize = arenas.size();
    counters.availableArenas = available.size();
}

RequestArena* ArenaPool::acquire() {
    std::lock_guard<std::mutex> lock(mutex);
    RequestArena* arena = nullptr;
    if (!available.empty()) {
        arena = available.back();
        available.pop_back();
    } else {
        arenas.push_back(std::make_unique<RequestArena>(arenaBytes));
        arena = arenas.back().get();
        LOG_DEBUG("Arena pool grew to {}", arenas.size());
    }
    ++counters.acquisitions;
    counters.inUse = arenas.size() - available.size();
    counters.peakInUse = std::max(counters.peakInUse, counters.inUse);
    counters.poolSize = arenas.size();
    counters.availableArenas = available.size();
    return arena;
}

bool ArenaPool::release(RequestArena* arena) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = std::find_if(arenas.begin(), arenas.end(),
                           [arena](const std::unique_ptr<RequestArena>& a){ return a.get() == arena; });
    if (it == arenas.end() || std::find(available.begin(), available.end(), arena) != available.end()) {
        LOG_ERROR("Attempted to release an arena that is not leased from this pool");
        return false;
    }
    counters.peakRequestBytes = std::max(counters.peakRequestBytes, arena->bytesAllocated());
    arena->reset();
    available.push_back(arena);
    ++counters.releases;
    counters.inUse = arenas.size() - available.size();
    counters.availableArenas = available.size();
    return true;
}

MemoryStats ArenaPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex);
    return counters;
}

////////////////////////////////////////// ScopedArena ///////////////////////////////////////////////

ScopedArena::ScopedArena(ArenaPool& p) : pool(p), arena(p.acquire()) {}

ScopedArena::~ScopedArena() {
    if (!pool.release(arena)) {
        LOG_ERROR("Failed to return request arena to its pool");
    }
}

} // namespace mcpengine
