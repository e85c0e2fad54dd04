#pragma once

#include "common.h"
#include "config.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lingo {

/**
 * @brief Span of reply text handed to the synthesizer as one unit
 */
struct TextChunk {
    std::string text;                ///< Trimmed text to speak
    bool is_sentence_final = false;  ///< Ends at . ? or !, or is the last chunk of the reply
    std::string source;              ///< Untrimmed fragments the chunk was cut from
};

/**
 * @brief Every chunk of one turn, in order; committed to the display after playback
 *
 * Thread-safe: appended by the flusher thread, read by the control thread.
 */
class FullReplyBuffer {
public:
    void append(const TextChunk& chunk);

    /// Full reply with outer whitespace trimmed
    std::string text() const;

    size_t chunk_count() const;

private:
    mutable std::mutex mutex_;
    std::string text_;
    size_t chunks_ = 0;
};

/**
 * @brief Cuts a token-fragment stream into speakable chunks
 *
 * A fragment ending in sentence punctuation flushes a final chunk. Otherwise
 * a non-final chunk is flushed once max_words word breaks have accumulated or
 * more than max_interval_ms has passed since the last flush, so long
 * unpunctuated replies still start speaking. finish() flushes the remainder
 * as final. Every produced chunk is appended to the reply buffer.
 *
 * Output depends only on the fragments and the clock readings, so the same
 * input and timing always produce the same chunks.
 */
class ChunkingFlusher {
public:
    using ClockFn = std::function<TimePoint()>;

    ChunkingFlusher(const ChunkerConfig& config, FullReplyBuffer& reply, ClockFn clock = ClockFn());

    /// Feed one fragment; returns the chunk it completed, if any
    std::optional<TextChunk> push(const std::string& fragment);

    /// End of stream; returns the final chunk if text is still pending
    std::optional<TextChunk> finish();

private:
    std::optional<TextChunk> flush(bool final);

    ChunkerConfig config_;
    FullReplyBuffer& reply_;
    ClockFn clock_;
    std::string pending_;
    int words_;
    TimePoint last_flush_;
};

} // namespace lingo
