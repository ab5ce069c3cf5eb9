// =================================================================
// tests/CacheCoordinatorTest.cpp
// =================================================================
// Unit tests for the cache backends and the single-flight coordinator.

#include "Rethink/CacheCoordinator.hpp"
#include "Rethink/ResilienceErrors.hpp"
#include "Rethink/Logger.hpp"
#include <iostream>
#include <cassert>
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace Rethink;

class CacheCoordinatorTest {
private:
    // Backend whose every operation fails with a CacheError
    class BrokenBackend : public CacheBackend {
    public:
        std::optional<CacheLookup> get(const std::string&) override {
            throw CacheError("backend unreachable");
        }
        void set(const std::string&, const std::string&, std::chrono::milliseconds) override {
            throw CacheError("backend unreachable");
        }
        void remove(const std::string&) override {
            throw CacheError("backend unreachable");
        }
        void clear() override {}
        size_t size() const override { return 0; }
        std::string getName() const override { return "broken"; }
    };

    std::string m_temp_dir;

    std::unique_ptr<MemoryCacheBackend> makeMemory(size_t max_entries, size_t max_bytes = 0) {
        MemoryCacheConfig config;
        config.max_entries = max_entries;
        config.max_bytes = max_bytes;
        return std::make_unique<MemoryCacheBackend>(config);
    }

    std::string freshDirectory(const std::string& name) {
        fs::path path = fs::path(m_temp_dir) / name;
        fs::remove_all(path);
        return path.string();
    }

public:
    CacheCoordinatorTest() {
        m_temp_dir = (fs::temp_directory_path() / "rethink_cache_test").string();
        fs::remove_all(m_temp_dir);
        fs::create_directories(m_temp_dir);
    }

    ~CacheCoordinatorTest() {
        std::error_code ec;
        fs::remove_all(m_temp_dir, ec);
    }

    void testLruEvictionAtCapacity() {
        std::cout << "Testing LRU eviction at capacity..." << std::endl;

        CacheCoordinator cache(makeMemory(2));
        CancellationToken token;
        auto constant = [](const std::string& value) {
            return [value](const CancellationToken&) { return value; };
        };

        cache.getOrCompute("A", constant("value-a"), token);
        cache.getOrCompute("B", constant("value-b"), token);
        cache.getOrCompute("C", constant("value-c"), token);

        auto& memory = static_cast<MemoryCacheBackend&>(cache.getBackend());
        assert(!memory.contains("A") && "Least recently used entry evicted");
        assert(memory.contains("B") && memory.contains("C"));
        assert(memory.size() == 2);

        CacheResult result = cache.getOrCompute("B", constant("recomputed"), token);
        assert(result.cache_hit && result.value == "value-b" && "B served from cache");

        result = cache.getOrCompute("A", constant("value-a2"), token);
        assert(result.computed && result.value == "value-a2" && "Evicted A is recomputed");
        assert(cache.getStatistics().evictions == 2);

        std::cout << "✓ LRU eviction test passed" << std::endl;
    }

    void testRecencyProtectsEntries() {
        std::cout << "Testing a read refreshes recency..." << std::endl;

        auto memory = makeMemory(2);
        memory->set("A", "1", std::chrono::minutes(1));
        memory->set("B", "2", std::chrono::minutes(1));
        assert(memory->get("A").has_value());
        memory->set("C", "3", std::chrono::minutes(1));

        assert(memory->contains("A") && "Recently read entry survives");
        assert(!memory->contains("B") && "Stale entry evicted");

        std::cout << "✓ Recency test passed" << std::endl;
    }

    void testByteBudget() {
        std::cout << "Testing the byte budget..." << std::endl;

        auto memory = makeMemory(0, 20);
        memory->set("k1", "aaaaaaaa", std::chrono::minutes(1));
        memory->set("k2", "bbbbbbbb", std::chrono::minutes(1));
        assert(memory->getByteSize() == 20);

        memory->set("k3", "cccccccc", std::chrono::minutes(1));
        assert(!memory->contains("k1") && "Oldest entry evicted by byte budget");
        assert(memory->getByteSize() <= 20);

        memory->set("k2", "b", std::chrono::minutes(1));
        assert(memory->get("k2")->value == "b" && "Set replaces existing values");
        assert(memory->getByteSize() == 13);

        std::cout << "✓ Byte budget test passed" << std::endl;
    }

    void testTtlExpiry() {
        std::cout << "Testing TTL expiry..." << std::endl;

        CacheCoordinator cache(makeMemory(10));
        CancellationToken token;
        std::atomic<int> computations{0};
        ComputeFunction compute = [&computations](const CancellationToken&) {
            return "value-" + std::to_string(++computations);
        };

        cache.getOrCompute("key", compute, token, std::chrono::milliseconds(30));
        assert(cache.getOrCompute("key", compute, token).cache_hit && "Fresh entry is a hit");

        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        CacheResult result = cache.getOrCompute("key", compute, token);
        assert(result.computed && "Expired entry is a miss");
        assert(result.value == "value-2");

        std::cout << "✓ TTL test passed" << std::endl;
    }

    void testSingleFlight() {
        std::cout << "Testing concurrent callers compute once..." << std::endl;

        CacheCoordinator cache(makeMemory(10));
        std::atomic<int> computations{0};
        ComputeFunction slow = [&computations](const CancellationToken&) {
            computations++;
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            return std::string("shared-value");
        };

        std::vector<std::thread> threads;
        std::vector<CacheResult> results(8);
        for (size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&cache, &slow, &results, i]() {
                results[i] = cache.getOrCompute("same-key", slow, CancellationToken());
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        assert(computations.load() == 1 && "Exactly one computation for concurrent callers");
        size_t computed = 0;
        for (const auto& result : results) {
            assert(result.value == "shared-value" && "Every caller sees the same value");
            if (result.computed) {
                computed++;
            }
        }
        assert(computed == 1 && "Exactly one caller is the leader");
        assert(cache.getInFlightCount() == 0 && "In-flight registry is cleaned up");

        std::cout << "✓ Single-flight test passed" << std::endl;
    }

    void testFailureSharedButNotCached() {
        std::cout << "Testing failures reach followers and are not cached..." << std::endl;

        CacheCoordinator cache(makeMemory(10));
        std::atomic<int> computations{0};
        ComputeFunction failing = [&computations](const CancellationToken&) -> std::string {
            computations++;
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            throw GenerationError(ErrorKind::TRANSIENT, "upstream 503");
        };

        std::atomic<int> failures{0};
        auto caller = [&]() {
            try {
                cache.getOrCompute("flaky", failing, CancellationToken());
            } catch (const GenerationError& e) {
                assert(e.kind() == ErrorKind::TRANSIENT);
                failures++;
            }
        };

        std::thread leader(caller);
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        std::thread follower(caller);
        leader.join();
        follower.join();

        assert(failures.load() == 2 && "Leader and follower both see the failure");
        assert(computations.load() == 1 && "Follower did not recompute");
        assert(cache.getStatistics().compute_failures == 1);

        CacheResult result = cache.getOrCompute("flaky",
            [](const CancellationToken&) { return std::string("healthy"); }, CancellationToken());
        assert(result.computed && result.value == "healthy" && "Failure was not cached");

        std::cout << "✓ Failure propagation test passed" << std::endl;
    }

    void testCancelledLeaderHandsOver() {
        std::cout << "Testing a follower takes over from a cancelled leader..." << std::endl;

        CacheCoordinator cache(makeMemory(10));
        CancellationToken leader_token;

        std::atomic<bool> leader_cancelled{false};
        std::thread leader([&]() {
            try {
                cache.getOrCompute("handover", [](const CancellationToken& token) -> std::string {
                    token.waitFor(std::chrono::seconds(5));
                    throw CancelledError();
                }, leader_token);
            } catch (const CancelledError&) {
                leader_cancelled = true;
            }
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        std::thread canceller([leader_token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            leader_token.cancel();
        });

        CacheResult result = cache.getOrCompute("handover",
            [](const CancellationToken&) { return std::string("follower-value"); }, CancellationToken());

        leader.join();
        canceller.join();

        assert(leader_cancelled.load() && "Leader observes its own cancellation");
        assert(result.computed && result.value == "follower-value" && "Follower recomputes as new leader");
        assert(cache.getStatistics().compute_failures == 0 && "Cancellation is not a compute failure");

        std::cout << "✓ Leader handover test passed" << std::endl;
    }

    void testCancelledFollower() {
        std::cout << "Testing a cancelled follower stops waiting..." << std::endl;

        CacheCoordinator cache(makeMemory(10));
        std::thread leader([&cache]() {
            cache.getOrCompute("slow", [](const CancellationToken&) {
                std::this_thread::sleep_for(std::chrono::milliseconds(300));
                return std::string("late");
            }, CancellationToken());
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        CancellationToken follower_token;
        std::thread canceller([follower_token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            follower_token.cancel();
        });

        bool cancelled = false;
        try {
            cache.getOrCompute("slow", [](const CancellationToken&) { return std::string("unused"); },
                               follower_token);
        } catch (const CancelledError&) {
            cancelled = true;
        }
        canceller.join();
        leader.join();

        assert(cancelled && "Follower cancellation surfaces as CancelledError");
        assert(cache.getOrCompute("slow", [](const CancellationToken&) { return std::string("x"); },
                                  CancellationToken()).value == "late" && "Leader still stored its value");

        std::cout << "✓ Follower cancellation test passed" << std::endl;
    }

    void testPinnedEntriesSurviveEviction() {
        std::cout << "Testing pinned entries are not evicted..." << std::endl;

        auto memory = makeMemory(1);
        memory->set("A", "1", std::chrono::minutes(1));
        memory->pin("A");
        memory->set("B", "2", std::chrono::minutes(1));

        assert(memory->contains("A") && "Pinned entry kept");
        assert(memory->contains("B") && "Newly written entry kept");
        assert(memory->size() == 2 && "Temporarily over budget");

        memory->unpin("A");
        memory->set("C", "3", std::chrono::minutes(1));
        assert(!memory->contains("A") && "Unpinned entry evictable again");
        assert(memory->contains("C"));
        assert(memory->size() == 1);

        std::cout << "✓ Pinning test passed" << std::endl;
    }

    void testBackendErrorsAreMisses() {
        std::cout << "Testing backend errors degrade to misses..." << std::endl;

        CacheCoordinator cache(std::make_unique<BrokenBackend>());
        CacheResult result = cache.getOrCompute("key",
            [](const CancellationToken&) { return std::string("computed"); }, CancellationToken());

        assert(result.computed && result.value == "computed" && "Computation still runs");
        assert(cache.getStatistics().backend_errors == 3 && "Two lookups and one store failed");

        cache.remove("key");
        assert(cache.getStatistics().backend_errors == 4);

        std::cout << "✓ Backend error test passed" << std::endl;
    }

    void testDiskPersistence() {
        std::cout << "Testing the disk backend persists across instances..." << std::endl;

        std::string directory = freshDirectory("disk");
        {
            DiskCacheBackend disk(directory);
            disk.set("prompt-key", "persisted answer", std::chrono::minutes(5));
            assert(disk.size() == 1);
        }

        DiskCacheBackend reopened(directory);
        auto hit = reopened.get("prompt-key");
        assert(hit.has_value() && hit->value == "persisted answer" && "Entry survives a restart");
        assert(hit->remaining_ttl.count() > 0);
        assert(!reopened.get("other-key").has_value());

        reopened.set("short", "gone soon", std::chrono::milliseconds(20));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(!reopened.get("short").has_value() && "Expired file is a miss");
        assert(!fs::exists(reopened.pathForKey("short")) && "Expired file removed");

        reopened.remove("prompt-key");
        assert(reopened.size() == 0);

        std::cout << "✓ Disk persistence test passed" << std::endl;
    }

    void testDiskCapacity() {
        std::cout << "Testing the disk entry limit..." << std::endl;

        DiskCacheBackend disk(freshDirectory("disk-capacity"), 2);
        disk.set("one", "1", std::chrono::minutes(5));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        disk.set("two", "2", std::chrono::minutes(5));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        disk.set("three", "3", std::chrono::minutes(5));

        assert(disk.size() == 2 && "Disk backend respects max_entries");
        assert(disk.getEvictionCount() == 1);

        std::cout << "✓ Disk capacity test passed" << std::endl;
    }

    void testCorruptDiskEntry() {
        std::cout << "Testing a corrupt disk entry raises CacheError..." << std::endl;

        std::string directory = freshDirectory("disk-corrupt");
        auto disk = std::make_unique<DiskCacheBackend>(directory);
        {
            std::ofstream out(disk->pathForKey("broken"));
            out << "{ not json";
        }

        bool threw = false;
        try {
            disk->get("broken");
        } catch (const CacheError&) {
            threw = true;
        }
        assert(threw && "Unparseable entry raises CacheError");

        // Valid JSON with the wrong shape
        for (const std::string& content : {std::string("[]"), std::string("{\"key\":5}"), std::string("42")}) {
            {
                std::ofstream out(disk->pathForKey("misshapen"));
                out << content;
            }
            threw = false;
            try {
                disk->get("misshapen");
            } catch (const CacheError&) {
                threw = true;
            }
            assert(threw && "Misshapen entry raises CacheError");
        }

        CacheCoordinator cache(std::move(disk));
        CacheResult misshapen = cache.getOrCompute("misshapen",
            [](const CancellationToken&) { return std::string("rebuilt"); }, CancellationToken());
        assert(misshapen.computed && misshapen.value == "rebuilt" && "Misshapen entry is a miss");

        CacheResult result = cache.getOrCompute("broken",
            [](const CancellationToken&) { return std::string("repaired"); }, CancellationToken());
        assert(result.computed && result.value == "repaired" && "Coordinator treats it as a miss");
        assert(cache.getOrCompute("broken",
            [](const CancellationToken&) { return std::string("again"); }, CancellationToken()).cache_hit &&
            "Store overwrote the corrupt entry");

        std::cout << "✓ Corrupt entry test passed" << std::endl;
    }

    void testLayeredPromotion() {
        std::cout << "Testing the layered backend promotes disk hits..." << std::endl;

        std::string directory = freshDirectory("layered");
        {
            DiskCacheBackend disk(directory);
            disk.set("warm", "from disk", std::chrono::minutes(5));
        }

        LayeredCacheBackend layered(makeMemory(10), std::make_unique<DiskCacheBackend>(directory));
        assert(!layered.getMemory().contains("warm") && "Memory starts cold");

        auto hit = layered.get("warm");
        assert(hit.has_value() && hit->value == "from disk");
        assert(layered.getMemory().contains("warm") && "Disk hit promoted into memory");

        layered.set("fresh", "both layers", std::chrono::minutes(5));
        assert(layered.getMemory().contains("fresh"));
        assert(layered.getDisk().get("fresh").has_value() && "Writes reach the disk layer");

        bool threw = false;
        try {
            LayeredCacheBackend invalid(nullptr, std::make_unique<DiskCacheBackend>(directory));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Missing layer rejected");

        std::cout << "✓ Layered promotion test passed" << std::endl;
    }

    void testMakeKey() {
        std::cout << "Testing cache key derivation..." << std::endl;

        GenerationParams params;
        params.seed = 3;
        params.extra["top_k"] = "40";
        params.extra["top_p"] = "0.9";

        std::string key = CacheCoordinator::makeKey("model-a", "prompt", params, "history");
        assert(key == CacheCoordinator::makeKey("model-a", "prompt", params, "history") && "Key is stable");
        assert(!key.empty());

        GenerationParams reseeded = params;
        reseeded.seed = 4;
        assert(key != CacheCoordinator::makeKey("model-a", "prompt", reseeded, "history") && "Seed is part of the key");
        assert(key != CacheCoordinator::makeKey("model-b", "prompt", params, "history") && "Endpoint is part of the key");
        assert(key != CacheCoordinator::makeKey("model-a", "prompt", params, "other") && "Context is part of the key");

        GenerationParams reordered;
        reordered.seed = 3;
        reordered.extra["top_p"] = "0.9";
        reordered.extra["top_k"] = "40";
        assert(key == CacheCoordinator::makeKey("model-a", "prompt", reordered, "history") &&
               "Option insertion order does not matter");

        bool threw = false;
        try {
            CacheCoordinator invalid(nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Null backend rejected");

        std::cout << "✓ Key derivation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CacheCoordinator Tests..." << std::endl;
        std::cout << "=================================" << std::endl;

        testLruEvictionAtCapacity();
        testRecencyProtectsEntries();
        testByteBudget();
        testTtlExpiry();
        testSingleFlight();
        testFailureSharedButNotCached();
        testCancelledLeaderHandsOver();
        testCancelledFollower();
        testPinnedEntriesSurviveEviction();
        testBackendErrorsAreMisses();
        testDiskPersistence();
        testDiskCapacity();
        testCorruptDiskEntry();
        testLayeredPromotion();
        testMakeKey();

        std::cout << std::endl << "All CacheCoordinator tests passed!" << std::endl;
    }
};

int main() {
    Logger::getInstance().setFileLogging(false);
    Logger::getInstance().setConsoleLogging(false);

    try {
        CacheCoordinatorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
