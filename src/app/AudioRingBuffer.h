#pragma once

#include <QByteArray>

#include "Queue.h"

/*! Bounded chunk queue between the real-time capture callback and the
 *  frame accumulator.
 *
 *  push() never blocks. When the queue is full the oldest chunk is dropped
 *  and counted as an overflow.
 */
class AudioRingBuffer : public Queue<QByteArray>
{
public:
    using Chunk = QByteArray;

    static constexpr size_t default_max_chunks = 256;

    explicit AudioRingBuffer(size_t maxChunks = default_max_chunks)
        : Queue<QByteArray>{maxChunks ? maxChunks : 1} {}

    size_t overflows() const noexcept { return dropped(); }
};
