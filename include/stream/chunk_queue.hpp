#ifndef CHUNK_QUEUE_HPP
#define CHUNK_QUEUE_HPP

#include "audio/chunk_decoder.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

class CancellationToken;

enum class NextResult { Chunk, EndOfStream, Cancelled };

// Inbound side of a pipeline: an ordered sequence of chunks that ends or gets cancelled.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual NextResult next(AudioChunk& chunk, const CancellationToken& cancel) = 0;
};

// Thread-safe FIFO between a producer (socket, microphone, file) and the pipeline thread.
// push() never blocks; close() marks end of stream once the queued chunks are consumed.
class ChunkQueue : public ChunkSource {
public:
    explicit ChunkQueue(std::chrono::milliseconds pollInterval = std::chrono::milliseconds(20))
        : pollInterval_(pollInterval) {}

    // Returns false once the queue is closed.
    bool push(AudioChunk chunk);
    void close();

    NextResult next(AudioChunk& chunk, const CancellationToken& cancel) override;

    size_t size() const;
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AudioChunk> queue_;
    bool closed_ = false;
    std::chrono::milliseconds pollInterval_;
};

#endif
