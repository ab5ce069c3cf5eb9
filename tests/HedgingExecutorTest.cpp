// =================================================================
// tests/HedgingExecutorTest.cpp
// =================================================================
// Unit tests for HedgingExecutor and the CallExecutor composition.

#include "Rethink/HedgingExecutor.hpp"
#include "Rethink/CallExecutor.hpp"
#include "Rethink/Logger.hpp"
#include <iostream>
#include <cassert>
#include <thread>
#include <atomic>
#include <chrono>

using namespace Rethink;

class HedgingExecutorTest {
private:
    // Provider whose first call is slow and fails, later calls answer at once
    class SlowFirstProvider : public GenerationProvider {
    public:
        std::string generate(const std::string& prompt, const GenerationParams&,
                             const CancellationToken&) override {
            if (++m_calls == 1) {
                std::this_thread::sleep_for(std::chrono::milliseconds(300));
                throw GenerationError(ErrorKind::TRANSIENT, "slow primary gave up");
            }
            return "fast answer to " + prompt;
        }

        std::string getEndpointId() const override { return "slow-first"; }

        int getCallCount() const { return m_calls.load(); }

    private:
        std::atomic<int> m_calls{0};
    };

    HedgeConfig makeConfig(long long delay_ms, size_t max_hedges) {
        HedgeConfig config;
        config.hedge_delay = std::chrono::milliseconds(delay_ms);
        config.max_hedges = max_hedges;
        return config;
    }

    void waitForAbandoned(HedgingExecutor& executor) {
        for (int i = 0; i < 200 && executor.getPendingAbandoned() > 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

public:
    void testPrimaryWinsWithoutHedge() {
        std::cout << "Testing a fast primary issues no hedge..." << std::endl;

        HedgingExecutor executor;
        std::atomic<int> calls{0};
        HedgedAttempt attempt = [&calls](const CancellationToken&) -> std::string {
            calls++;
            return "primary";
        };

        HedgeResult result = executor.executeHedged(attempt, makeConfig(500, 2), CancellationToken());
        assert(result.text == "primary");
        assert(result.winning_attempt == 0 && "Primary should win");
        assert(result.attempts_launched == 1 && "No hedge for a fast primary");
        assert(calls.load() == 1);

        HedgeStatistics stats = executor.getStatistics();
        assert(stats.primary_wins == 1);
        assert(stats.hedges_launched == 0);

        std::cout << "✓ Primary win test passed" << std::endl;
    }

    void testHedgeWinsAndLoserIsCancelled() {
        std::cout << "Testing a slow primary is hedged and cancelled..." << std::endl;

        HedgingExecutor executor;
        std::atomic<int> invocation{0};
        std::atomic<bool> primary_cancelled{false};

        HedgedAttempt attempt = [&invocation, &primary_cancelled](const CancellationToken& token) -> std::string {
            if (invocation++ == 0) {
                token.waitFor(std::chrono::seconds(5));
                primary_cancelled = token.isCancelled();
                throw CancelledError();
            }
            return "hedge";
        };

        auto start = std::chrono::steady_clock::now();
        HedgeResult result = executor.executeHedged(attempt, makeConfig(50, 1), CancellationToken());
        auto elapsed = std::chrono::steady_clock::now() - start;

        assert(result.text == "hedge" && "Hedge result should be returned");
        assert(result.winning_attempt == 1);
        assert(result.attempts_launched == 2 && "Exactly one hedge issued");
        assert(elapsed < std::chrono::seconds(2) && "Caller does not wait for the loser");

        waitForAbandoned(executor);
        assert(primary_cancelled.load() && "Losing primary observes cancellation");

        HedgeStatistics stats = executor.getStatistics();
        assert(stats.hedge_wins == 1);
        assert(stats.hedges_launched == 1);
        assert(stats.cancelled_attempts == 1);

        std::cout << "✓ Hedge win test passed" << std::endl;
    }

    void testHedgeLimit() {
        std::cout << "Testing max_hedges bounds duplicate attempts..." << std::endl;

        HedgingExecutor executor;
        std::atomic<int> calls{0};
        HedgedAttempt attempt = [&calls](const CancellationToken& token) -> std::string {
            int n = calls++;
            if (n < 3) {
                token.waitFor(std::chrono::milliseconds(400));
                throw CancelledError();
            }
            return "never";
        };

        bool threw = false;
        try {
            executor.executeHedged(attempt, makeConfig(20, 2), CancellationToken(),
                                   std::chrono::steady_clock::now() + std::chrono::milliseconds(200));
        } catch (const GenerationError& e) {
            threw = true;
            assert(e.isTimeout() && "Deadline surfaces as a timeout");
        }
        assert(threw);
        waitForAbandoned(executor);
        assert(calls.load() == 3 && "Primary plus two hedges at most");

        std::cout << "✓ Hedge limit test passed" << std::endl;
    }

    void testAllAttemptsFail() {
        std::cout << "Testing a batch with no success surfaces the last failure..." << std::endl;

        HedgingExecutor executor;
        std::atomic<int> calls{0};
        HedgedAttempt attempt = [&calls](const CancellationToken&) -> std::string {
            if (calls++ == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(150));
                throw GenerationError(ErrorKind::RATE_LIMITED, "primary failed last");
            }
            throw GenerationError(ErrorKind::TRANSIENT, "hedge failed first");
        };

        bool threw = false;
        try {
            executor.executeHedged(attempt, makeConfig(20, 1), CancellationToken());
        } catch (const GenerationError& e) {
            threw = true;
            assert(std::string(e.what()) == "primary failed last" && "Last failure by completion time");
            assert(e.kind() == ErrorKind::RATE_LIMITED);
        }
        assert(threw);
        assert(executor.getStatistics().failed_batches == 1);

        std::cout << "✓ All-fail test passed" << std::endl;
    }

    void testImmediateFailureNeedsNoHedge() {
        std::cout << "Testing a batch fails as soon as every launched attempt failed..." << std::endl;

        HedgingExecutor executor;
        HedgedAttempt attempt = [](const CancellationToken&) -> std::string {
            throw GenerationError(ErrorKind::INVALID_REQUEST, "bad prompt");
        };

        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try {
            executor.executeHedged(attempt, makeConfig(1000, 1), CancellationToken());
        } catch (const GenerationError& e) {
            threw = true;
            assert(e.kind() == ErrorKind::INVALID_REQUEST);
        }
        assert(threw);
        assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(900) &&
               "Batch does not wait for the hedge timer");
        assert(executor.getStatistics().hedges_launched == 0);

        std::cout << "✓ Immediate failure test passed" << std::endl;
    }

    void testCallerCancellation() {
        std::cout << "Testing caller cancellation stops every attempt..." << std::endl;

        HedgingExecutor executor;
        HedgedAttempt attempt = [](const CancellationToken& token) -> std::string {
            token.waitFor(std::chrono::seconds(5));
            throw CancelledError();
        };

        CancellationToken token;
        std::thread canceller([token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            token.cancel();
        });

        auto start = std::chrono::steady_clock::now();
        bool cancelled = false;
        try {
            executor.executeHedged(attempt, makeConfig(20, 1), token);
        } catch (const CancelledError&) {
            cancelled = true;
        }
        canceller.join();

        assert(cancelled && "Caller cancellation surfaces as CancelledError");
        assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
        waitForAbandoned(executor);
        assert(executor.getPendingAbandoned() == 0 && "Cancelled attempts wind down");

        std::cout << "✓ Caller cancellation test passed" << std::endl;
    }

    void testLoserDoesNotTouchBreaker() {
        std::cout << "Testing a cancelled loser records nothing on the breaker..." << std::endl;

        CircuitBreakerRegistry registry;
        auto provider = std::make_shared<SlowFirstProvider>();
        GenerationParams params;

        CallOptions options;
        options.retry_policy.max_attempts = 1;
        options.hedge_config = makeConfig(30, 1);
        options.enable_hedging = true;

        {
            CallExecutor executor(registry);
            CallOutcome outcome = executor.call(provider, "ping", params, options, CancellationToken());

            assert(outcome.text == "fast answer to ping" && "Hedge answer returned");
            assert(outcome.winning_attempt == 1);
            assert(outcome.attempts_launched == 2);
            assert(outcome.endpoint_id == "slow-first");
        }
        // Executor destruction joins the slow loser

        assert(provider->getCallCount() == 2);
        BreakerSnapshot snapshot = registry.getBreaker("slow-first")->getSnapshot();
        assert(snapshot.total_successes == 1 && "Only the winner is recorded");
        assert(snapshot.total_failures == 0 && "Cancelled loser is not a failure");

        std::cout << "✓ Loser breaker test passed" << std::endl;
    }

    void testHedgingDisabled() {
        std::cout << "Testing disabled hedging issues a single attempt..." << std::endl;

        CircuitBreakerRegistry registry;
        CallExecutor executor(registry);
        auto provider = std::make_shared<SlowFirstProvider>();

        CallOptions options;
        options.retry_policy.max_attempts = 2;
        options.retry_policy.base_delay = std::chrono::milliseconds(1);
        options.retry_policy.jitter_fraction = 0.0;
        options.hedge_config = makeConfig(10, 3);
        options.enable_hedging = false;

        CallOutcome outcome = executor.call(provider, "ping", GenerationParams(), options, CancellationToken());
        assert(outcome.attempts_launched == 1 && "No hedge when disabled");
        assert(outcome.text == "fast answer to ping" && "Retry recovered the call");
        assert(executor.getRetryStatistics().retries == 1);

        std::cout << "✓ Hedging disabled test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running HedgingExecutor Tests..." << std::endl;
        std::cout << "================================" << std::endl;

        testPrimaryWinsWithoutHedge();
        testHedgeWinsAndLoserIsCancelled();
        testHedgeLimit();
        testAllAttemptsFail();
        testImmediateFailureNeedsNoHedge();
        testCallerCancellation();
        testLoserDoesNotTouchBreaker();
        testHedgingDisabled();

        std::cout << std::endl << "All HedgingExecutor tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setFileLogging(false);
    Logger::getInstance().setConsoleLogging(false);

    try {
        HedgingExecutorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
