/**
 * Completion race with scripted backends.
 * Asserts:
 * - The first candidate to produce a fragment wins; only its fragments are yielded, in order.
 * - Losing candidates are cancelled and never forward anything.
 * - With no first token before the watchdog timeout the backup joins and can win.
 * - Early failure of both primaries starts the backup without waiting for the timeout.
 * - Quota/auth failures turn into one advisory fragment; other total failures set BackendError.
 * - Disallowed symbols are stripped and replayed fragments are dropped.
 *
 * No network required.
 */

#include "completion_backend.h"
#include "config.h"
#include "errors.h"
#include "hedged_completion_client.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace lingo;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

// Sleeps in short steps; false if cancelled meanwhile
static bool wait_unless_cancelled(int ms, const std::atomic<bool>& cancel) {
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < until) {
        if (cancel) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return !cancel;
}

class ScriptedBackend : public ICompletionBackend {
public:
    ScriptedBackend(std::string name, int first_ms, std::vector<std::string> tokens,
                    int gap_ms = 5, Error failure = Error())
        : name_(std::move(name)), first_ms_(first_ms), tokens_(std::move(tokens)),
          gap_ms_(gap_ms), failure_(std::move(failure)) {}

    std::string name() const override { return name_; }

    VoidResult stream(const ConversationTurn& turn, const FragmentCallback& on_fragment,
                      const std::atomic<bool>& cancel) override {
        calls++;
        last_user = turn.user_message.content;
        if (!wait_unless_cancelled(first_ms_, cancel)) {
            saw_cancel = true;
            return VoidResult();
        }
        if (failure_) {
            return failure_;
        }
        for (size_t i = 0; i < tokens_.size(); ++i) {
            if (cancel) {
                saw_cancel = true;
                return VoidResult();
            }
            if (!on_fragment(tokens_[i])) {
                rejected++;
                return VoidResult();
            }
            emitted++;
            if (i + 1 < tokens_.size() && !wait_unless_cancelled(gap_ms_, cancel)) {
                saw_cancel = true;
                return VoidResult();
            }
        }
        return VoidResult();
    }

    std::atomic<int> calls{0};
    std::atomic<int> emitted{0};
    std::atomic<int> rejected{0};
    std::atomic<bool> saw_cancel{false};
    std::string last_user;

private:
    std::string name_;
    int first_ms_;
    std::vector<std::string> tokens_;
    int gap_ms_;
    Error failure_;
};

static std::string drain(FragmentStream& stream, std::vector<std::string>* pieces = nullptr) {
    std::string text;
    std::string fragment;
    while (stream.next(fragment)) {
        text += fragment;
        if (pieces) pieces->push_back(fragment);
    }
    return text;
}

static CompletionConfig test_config(int timeout_ms) {
    CompletionConfig cfg;
    cfg.first_token_timeout_ms = timeout_ms;
    return cfg;
}

static ConversationTurn hello_turn() {
    return ConversationTurn::build("system", {}, "hello", 4);
}

static int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

int main() {
    // --- ReplayFilter ---
    ReplayFilter filter(1024, 8);
    ASSERT(filter.accept("Hello world, "));
    ASSERT(filter.accept("how are you?"));
    ASSERT(!filter.accept("Hello world, "));    // verbatim replay
    ASSERT(filter.accept("the"));               // short fragments always pass
    ASSERT(filter.accept("the"));
    ASSERT(filter.dropped() == 1);
    ReplayFilter disabled(0, 8);
    ASSERT(disabled.accept("Hello world, "));
    ASSERT(disabled.accept("Hello world, "));
    ReplayFilter small(16, 4);
    ASSERT(small.accept("abcdefgh"));
    ASSERT(small.accept("0123456789abcdef"));   // pushes "abcdefgh" out of the window
    ASSERT(small.accept("abcdefgh"));
    ASSERT(small.dropped() == 0);

    // --- Fastest candidate wins: A at 50 ms, B at 200 ms ---
    {
        auto a = std::make_shared<ScriptedBackend>("A", 50, std::vector<std::string>{"Hello", " there", ", friend."});
        auto b = std::make_shared<ScriptedBackend>("B", 200, std::vector<std::string>{"Wrong", " answer"});
        auto c = std::make_shared<ScriptedBackend>("C", 0, std::vector<std::string>{"Backup"});
        HedgedCompletionClient client({a, b, c}, test_config(6000), [] { return std::string("Test"); });

        auto stream = client.stream(hello_turn());
        std::vector<std::string> pieces;
        std::string text = drain(*stream, &pieces);
        ASSERT(text == "Hello there, friend.");
        ASSERT(pieces.size() == 3);
        ASSERT(stream->winner().has_value() && *stream->winner() == 0);
        ASSERT(stream->candidates_started() == 2);
        ASSERT(stream->was_cancelled(1));
        ASSERT(!stream->error());
        ASSERT(stream->first_token_ms() >= 40);
        stream.reset();
        ASSERT(b->emitted == 0);
        ASSERT(b->saw_cancel);
        ASSERT(c->calls == 0);
        ASSERT(a->last_user == "hello");
    }

    // --- Watchdog: no first token before the timeout, backup wins ---
    {
        auto a = std::make_shared<ScriptedBackend>("A", 3000, std::vector<std::string>{"late A"});
        auto b = std::make_shared<ScriptedBackend>("B", 3000, std::vector<std::string>{"late B"});
        auto c = std::make_shared<ScriptedBackend>("C", 10, std::vector<std::string>{"Backup", " reply."});
        HedgedCompletionClient client({a, b, c}, test_config(100), [] { return std::string("Test"); });

        auto start = std::chrono::steady_clock::now();
        auto stream = client.stream(hello_turn());
        std::string text = drain(*stream);
        ASSERT(text == "Backup reply.");
        ASSERT(stream->winner().has_value() && *stream->winner() == 2);
        ASSERT(stream->candidates_started() == 3);
        ASSERT(stream->was_cancelled(0));
        ASSERT(stream->was_cancelled(1));
        stream.reset();
        ASSERT(elapsed_ms(start) < 2000);
        ASSERT(a->emitted == 0 && b->emitted == 0);
    }

    // --- A primary can still win after the backup joins ---
    {
        auto a = std::make_shared<ScriptedBackend>("A", 150, std::vector<std::string>{"Primary."});
        auto b = std::make_shared<ScriptedBackend>("B", 3000, std::vector<std::string>{"late B"});
        auto c = std::make_shared<ScriptedBackend>("C", 2000, std::vector<std::string>{"slow backup"});
        HedgedCompletionClient client({a, b, c}, test_config(50), [] { return std::string("Test"); });

        auto stream = client.stream(hello_turn());
        ASSERT(drain(*stream) == "Primary.");
        ASSERT(stream->candidates_started() == 3);
        ASSERT(stream->winner().has_value() && *stream->winner() == 0);
        ASSERT(stream->was_cancelled(2));
    }

    // --- Both primaries fail early: backup starts before the timeout ---
    {
        auto a = std::make_shared<ScriptedBackend>("A", 5, std::vector<std::string>{},
                                                   5, make_backend_error("A: HTTP 500"));
        auto b = std::make_shared<ScriptedBackend>("B", 5, std::vector<std::string>{},
                                                   5, make_backend_error("B: connection reset"));
        auto c = std::make_shared<ScriptedBackend>("C", 5, std::vector<std::string>{"Saved."});
        HedgedCompletionClient client({a, b, c}, test_config(5000), [] { return std::string("Test"); });

        auto start = std::chrono::steady_clock::now();
        auto stream = client.stream(hello_turn());
        ASSERT(drain(*stream) == "Saved.");
        ASSERT(elapsed_ms(start) < 2000);
        ASSERT(stream->winner().has_value() && *stream->winner() == 2);
        ASSERT(!stream->error());
    }

    // --- One primary fails, the other wins ---
    {
        auto a = std::make_shared<ScriptedBackend>("A", 5, std::vector<std::string>{},
                                                   5, make_backend_error("A: HTTP 502"));
        auto b = std::make_shared<ScriptedBackend>("B", 60, std::vector<std::string>{"Fine."});
        HedgedCompletionClient client({a, b}, test_config(5000), [] { return std::string("Test"); });
        auto stream = client.stream(hello_turn());
        ASSERT(drain(*stream) == "Fine.");
        ASSERT(!stream->error());
        ASSERT(stream->winner().has_value() && *stream->winner() == 1);
    }

    // --- Quota failure: single advisory naming the active profile ---
    {
        auto a = std::make_shared<ScriptedBackend>("A", 5, std::vector<std::string>{},
                                                   5, make_quota_error("A: HTTP 429 Too Many Requests"));
        auto b = std::make_shared<ScriptedBackend>("B", 5, std::vector<std::string>{},
                                                   5, make_backend_error("B: HTTP 500"));
        HedgedCompletionClient client({a, b}, test_config(5000), [] { return std::string("School account"); });
        auto stream = client.stream(hello_turn());
        std::vector<std::string> pieces;
        drain(*stream, &pieces);
        ASSERT(pieces.size() == 1);
        if (!pieces.empty()) {
            ASSERT(pieces[0] == quota_advisory_text("School account"));
            ASSERT(pieces[0].find("School account") != std::string::npos);
        }
        ASSERT(!stream->error());
        ASSERT(!stream->winner().has_value());
    }

    // --- Total non-quota failure surfaces BackendError ---
    {
        auto a = std::make_shared<ScriptedBackend>("A", 5, std::vector<std::string>{},
                                                   5, make_backend_error("A: HTTP 500"));
        auto b = std::make_shared<ScriptedBackend>("B", 5, std::vector<std::string>{},
                                                   5, make_backend_error("B: timeout"));
        HedgedCompletionClient client({a, b}, test_config(5000), [] { return std::string("Test"); });
        auto stream = client.stream(hello_turn());
        std::string fragment;
        ASSERT(!stream->next(fragment));
        ASSERT(stream->error().type == ErrorType::BackendError);
        ASSERT(stream->error().message.find("A: HTTP 500") != std::string::npos);
    }

    // --- No backends ---
    {
        HedgedCompletionClient client({}, test_config(5000), [] { return std::string("Test"); });
        auto stream = client.stream(hello_turn());
        std::string fragment;
        ASSERT(!stream->next(fragment));
        ASSERT(stream->error().type == ErrorType::BackendError);
    }

    // --- Emoji and markdown asterisks are stripped ---
    {
        auto a = std::make_shared<ScriptedBackend>("A", 5, std::vector<std::string>{
            "Hi \xF0\x9F\x98\x80", " **there**", "\xE2\x9C\xA8"});
        auto b = std::make_shared<ScriptedBackend>("B", 500, std::vector<std::string>{"late"});
        HedgedCompletionClient client({a, b}, test_config(5000), [] { return std::string("Test"); });
        auto stream = client.stream(hello_turn());
        std::vector<std::string> pieces;
        std::string text = drain(*stream, &pieces);
        ASSERT(text == "Hi  there");
        ASSERT(pieces.size() == 2);  // the sparkle-only fragment becomes empty and is not forwarded
    }

    // --- A replayed fragment from the winner is dropped ---
    {
        auto a = std::make_shared<ScriptedBackend>("A", 5, std::vector<std::string>{
            "The capital is ", "Paris.", "The capital is ", " Really."});
        auto b = std::make_shared<ScriptedBackend>("B", 500, std::vector<std::string>{"late"});
        HedgedCompletionClient client({a, b}, test_config(5000), [] { return std::string("Test"); });
        auto stream = client.stream(hello_turn());
        ASSERT(drain(*stream) == "The capital is Paris. Really.");
    }

    // --- Destroying the stream stops the winner ---
    {
        std::vector<std::string> endless(200, "word ");
        auto a = std::make_shared<ScriptedBackend>("A", 5, endless, 20);
        auto b = std::make_shared<ScriptedBackend>("B", 3000, std::vector<std::string>{"late"});
        HedgedCompletionClient client({a, b}, test_config(5000), [] { return std::string("Test"); });
        auto stream = client.stream(hello_turn());
        std::string fragment;
        ASSERT(stream->next(fragment));
        ASSERT(stream->next(fragment));
        auto start = std::chrono::steady_clock::now();
        stream.reset();
        ASSERT(elapsed_ms(start) < 1000);
        ASSERT(a->emitted < 200);
        ASSERT(a->saw_cancel || a->rejected > 0);
    }

    // --- cancel() unblocks a waiting consumer ---
    {
        auto a = std::make_shared<ScriptedBackend>("A", 3000, std::vector<std::string>{"late"});
        auto b = std::make_shared<ScriptedBackend>("B", 3000, std::vector<std::string>{"late"});
        HedgedCompletionClient client({a, b}, test_config(5000), [] { return std::string("Test"); });
        auto stream = client.stream(hello_turn());
        FragmentStream* raw = stream.get();
        std::thread canceller([raw] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            raw->cancel();
        });
        auto start = std::chrono::steady_clock::now();
        std::string fragment;
        ASSERT(!stream->next(fragment));
        ASSERT(elapsed_ms(start) < 1000);
        canceller.join();
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All hedged client tests passed.\n";
    return 0;
}
