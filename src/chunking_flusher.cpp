#include "chunking_flusher.h"
#include "logger.h"
#include "utils.h"

namespace lingo {

// ============================================================================
// FullReplyBuffer
// ============================================================================

void FullReplyBuffer::append(const TextChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    text_ += chunk.source.empty() ? chunk.text : chunk.source;
    chunks_++;
}

std::string FullReplyBuffer::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return utils::trim_copy(text_);
}

size_t FullReplyBuffer::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
}

// ============================================================================
// ChunkingFlusher
// ============================================================================

ChunkingFlusher::ChunkingFlusher(const ChunkerConfig& config, FullReplyBuffer& reply, ClockFn clock)
    : config_(config)
    , reply_(reply)
    , clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); }))
    , words_(0) {
    last_flush_ = clock_();
}

std::optional<TextChunk> ChunkingFlusher::push(const std::string& fragment) {
    pending_ += fragment;
    words_ += utils::count_word_breaks(fragment);

    if (utils::ends_with_sentence_punct(fragment)) {
        return flush(true);
    }
    if (words_ >= config_.max_words || ms_between(last_flush_, clock_()) > config_.max_interval_ms) {
        return flush(false);
    }
    return std::nullopt;
}

std::optional<TextChunk> ChunkingFlusher::finish() {
    if (pending_.empty()) {
        return std::nullopt;
    }
    return flush(true);
}

std::optional<TextChunk> ChunkingFlusher::flush(bool final) {
    TextChunk chunk;
    chunk.source = std::move(pending_);
    chunk.text = utils::trim_copy(chunk.source);
    chunk.is_sentence_final = final;

    pending_.clear();
    words_ = 0;
    last_flush_ = clock_();

    if (chunk.text.empty()) {
        return std::nullopt;
    }
    reply_.append(chunk);
    return chunk;
}

} // namespace lingo
