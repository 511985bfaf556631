#include "stream/chunk_queue.hpp"

#include "stream/cancellation.hpp"

#include <utility>

bool ChunkQueue::push(AudioChunk chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        queue_.push_back(std::move(chunk));
    }
    cv_.notify_one();
    return true;
}

void ChunkQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

size_t ChunkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool ChunkQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

NextResult ChunkQueue::next(AudioChunk& chunk, const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (cancel.isCancelled()) return NextResult::Cancelled;
        if (!queue_.empty()) {
            chunk = std::move(queue_.front());
            queue_.pop_front();
            return NextResult::Chunk;
        }
        if (closed_) return NextResult::EndOfStream;

        // Bounded wait so a cancel from another thread is seen without a notify.
        cv_.wait_for(lock, pollInterval_);
    }
}
