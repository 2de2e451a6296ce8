//
//  dsf_chunks.cpp
//  DsdSlicer
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "dsf_chunks.hpp"

// -----------------------------------------------------------------------------
// Factory.
// -----------------------------------------------------------------------------
ChunkPtr Chunk::create(const char t[4]) { return std::make_unique<Chunk>(t); }

// -----------------------------------------------------------------------------
// Compute chunk size.
// -----------------------------------------------------------------------------
void Chunk::fix_size() { chunk_size = kChunkHeaderSize + payload.size(); }

// -----------------------------------------------------------------------------
// Return chunk size.
// -----------------------------------------------------------------------------
uint64_t Chunk::size() const { return chunk_size; }

// -----------------------------------------------------------------------------
// Serialize chunk.
// -----------------------------------------------------------------------------
void Chunk::write(std::vector<uint8_t> &out) const {
    write_chunk_header(out, id, chunk_size);
    out.insert(out.end(), payload.begin(), payload.end());
}

void write_chunk_header(std::vector<uint8_t> &out, uint32_t id, uint64_t size) {
    write_fourcc(out, id);
    write_u64le(out, size);
}
