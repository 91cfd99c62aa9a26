#include <catch2/catch_test_macros.hpp>
#include <meridian/endpoint_store.h>
#include <meridian/exceptions.h>
#include "test_support.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/resource.h>
#include <thread>
#include <unistd.h>

using namespace meridian;
using namespace meridian::testing;

namespace {

    // Lowers RLIMIT_FSIZE so writes past @p bytes fail with EFBIG instead of raising SIGXFSZ
    class FileSizeLimit {
    public:
        explicit FileSizeLimit(rlim_t bytes) {
            ::getrlimit(RLIMIT_FSIZE, &saved_);
            previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
            rlimit limit{bytes, saved_.rlim_max};
            ::setrlimit(RLIMIT_FSIZE, &limit);
        }
        ~FileSizeLimit() {
            ::setrlimit(RLIMIT_FSIZE, &saved_);
            std::signal(SIGXFSZ, previous_handler_);
        }
        FileSizeLimit(const FileSizeLimit&) = delete;
        FileSizeLimit& operator=(const FileSizeLimit&) = delete;

    private:
        rlimit saved_{};
        void (*previous_handler_)(int) = SIG_DFL;
    };

    // Holds the store's exclusive lock the way another process would
    class ForeignLock {
    public:
        explicit ForeignLock(const std::filesystem::path& lock_path)
            : fd_(::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)) {
            REQUIRE(fd_ >= 0);
            REQUIRE(::flock(fd_, LOCK_EX) == 0);
        }
        ~ForeignLock() { release(); }
        ForeignLock(const ForeignLock&) = delete;
        ForeignLock& operator=(const ForeignLock&) = delete;

        void release() {
            if (fd_ < 0) return;
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
            fd_ = -1;
        }

    private:
        int fd_;
    };

    EndpointSnapshot many_regions(int count) {
        EndpointSnapshot records;
        for (int i = 0; i < count; ++i) {
            records.push_back({"region-" + std::to_string(i), i == 0, 0, std::nullopt});
        }
        return records;
    }

} // namespace

TEST_CASE("Endpoint: Parsing", "[endpoint]") {
    SECTION("Valid records") {
        auto records = parse_endpoints(R"([
            {"region": "us-east-1", "primary": true, "next_available_time": 0, "region_profile_prefix": "us"},
            {"region": "eu-west-1", "primary": false, "next_available_time": 1700000000.0}
        ])");

        REQUIRE(records.size() == 2);
        CHECK(records[0].region == "us-east-1");
        CHECK(records[0].primary);
        CHECK(records[0].region_profile_prefix == std::optional<std::string>("us"));
        CHECK(records[1].next_available_time == 1700000000);
        CHECK_FALSE(records[1].region_profile_prefix.has_value());
    }

    SECTION("Malformed input") {
        CHECK_THROWS_AS(parse_endpoints("{oops"), ConfigLoadFailed);
        CHECK_THROWS_AS(parse_endpoints(R"({"region": "us-east-1"})"), ConfigLoadFailed);
        CHECK_THROWS_AS(parse_endpoints(R"([{"region": "us-east-1", "primary": true}])"), ConfigLoadFailed);
        CHECK_THROWS_AS(parse_endpoints(R"([{"region": "", "primary": true, "next_available_time": 0}])"),
                        ConfigLoadFailed);
        CHECK_THROWS_AS(parse_endpoints(R"([
            {"region": "us-east-1", "primary": true, "next_available_time": 0},
            {"region": "us-east-1", "primary": false, "next_available_time": 0}
        ])"), ConfigLoadFailed);
    }

    SECTION("Empty array is a valid, empty snapshot") {
        CHECK(parse_endpoints("[]").empty());
    }

    SECTION("Lookup") {
        auto records = parse_endpoints(R"([{"region": "us-east-1", "primary": true, "next_available_time": 0}])");
        CHECK(find_endpoint(records, "us-east-1") != nullptr);
        CHECK(find_endpoint(records, "us-west-2") == nullptr);
    }
}

TEST_CASE("EndpointStore: Persist and load", "[store]") {
    TempFile file{"meridian_store"};
    EndpointStore store(file.path());

    EndpointSnapshot records{
        {"us-east-1", true, 0, std::string("us")},
        {"eu-west-1", false, 1700000600, std::nullopt}
    };

    SECTION("Round trip") {
        REQUIRE(store.persist(records));
        CHECK(store.load() == records);
    }

    SECTION("Shorter content fully replaces longer content") {
        REQUIRE(store.persist(records));
        REQUIRE(store.persist(EndpointSnapshot{records[0]}));
        auto loaded = store.load();
        REQUIRE(loaded.size() == 1);
        CHECK(loaded[0] == records[0]);
    }

    SECTION("Empty payload is rejected") {
        REQUIRE(store.persist(records));
        CHECK_FALSE(store.persist({}));
        CHECK(store.load() == records);
    }

    SECTION("Missing and malformed files") {
        CHECK_THROWS_AS(store.load(), ConfigLoadFailed);
        file.write("[{\"region\": ");
        CHECK_THROWS_AS(store.load(), ConfigLoadFailed);
    }
}

TEST_CASE("EndpointStore: Read-modify-write", "[store]") {
    TempFile file{"meridian_update"};
    EndpointStore store(file.path());

    EndpointSnapshot records{
        {"us-east-1", true, 0, std::nullopt},
        {"eu-west-1", false, 0, std::nullopt}
    };
    REQUIRE(store.persist(records));

    SECTION("Transform sees the current file") {
        bool ok = store.update([](const EndpointSnapshot& current) -> std::optional<EndpointSnapshot> {
            EndpointSnapshot next = current;
            next[1].next_available_time = 42;
            return next;
        });
        REQUIRE(ok);
        CHECK(store.load()[1].next_available_time == 42);
    }

    SECTION("Nothing to write") {
        bool ok = store.update([](const EndpointSnapshot&) -> std::optional<EndpointSnapshot> {
            return std::nullopt;
        });
        CHECK_FALSE(ok);
        CHECK(store.load() == records);
    }

    SECTION("Unreadable file falls back to the given snapshot") {
        file.write("garbage");
        bool ok = store.update([](const EndpointSnapshot& current) -> std::optional<EndpointSnapshot> {
            return current;
        }, records);
        REQUIRE(ok);
        CHECK(store.load() == records);
    }
}

TEST_CASE("EndpointStore: Failed writes keep the previous file", "[store]") {
    TempFile file{"meridian_atomic"};
    EndpointStore store(file.path());

    EndpointSnapshot records{{"us-east-1", true, 0, std::nullopt}};
    REQUIRE(store.persist(records));
    const std::string before = file.read();

    SECTION("Write cut short by the file size limit") {
        bool ok = true;
        {
            FileSizeLimit limit(static_cast<rlim_t>(before.size()));
            ok = store.persist(many_regions(50));
        }
        CHECK_FALSE(ok);
        CHECK(file.read() == before);
        CHECK(store.load() == records);
        CHECK_FALSE(std::filesystem::exists(file.path().string() + ".tmp"));
    }

    SECTION("Update whose write cannot start") {
        std::filesystem::create_directory(file.path().string() + ".tmp");
        bool ok = store.update([](const EndpointSnapshot&) -> std::optional<EndpointSnapshot> {
            return many_regions(3);
        });
        std::filesystem::remove(file.path().string() + ".tmp");

        CHECK_FALSE(ok);
        CHECK(store.load() == records);
    }
}

TEST_CASE("EndpointStore: Exclusive lock discipline", "[store]") {
    using namespace std::chrono_literals;

    TempFile file{"meridian_locking"};
    EndpointStore store(file.path());

    EndpointSnapshot records{{"us-east-1", true, 0, std::nullopt}};
    REQUIRE(store.persist(records));
    const std::string before = file.read();

    SECTION("Writers wait for the holder") {
        std::atomic<bool> done{false};
        bool ok = false;
        {
            ForeignLock held(store.lock_path());
            std::thread writer([&] {
                ok = store.persist(many_regions(2));
                done = true;
            });

            std::this_thread::sleep_for(200ms);
            CHECK_FALSE(done);
            CHECK(file.read() == before);

            held.release();
            writer.join();
        }
        CHECK(ok);
        CHECK(store.load() == many_regions(2));
    }

    SECTION("Readers never see a write in progress") {
        std::atomic<bool> done{false};
        EndpointSnapshot seen;
        {
            ForeignLock held(store.lock_path());
            std::thread reader([&] {
                seen = store.load();
                done = true;
            });

            std::this_thread::sleep_for(200ms);
            CHECK_FALSE(done);
            // A half-finished write, then the finished one, all under the held lock
            file.write("[{\"region\": \"us-");
            std::this_thread::sleep_for(50ms);
            CHECK_FALSE(done);
            file.write(serialize_endpoints(many_regions(3)));

            held.release();
            reader.join();
        }
        CHECK(seen == many_regions(3));
    }

    SECTION("Concurrent updates do not lose each other's changes") {
        constexpr int kRounds = 20;
        auto bump = [&](size_t index) {
            for (int i = 0; i < kRounds; ++i) {
                store.update([index](const EndpointSnapshot& current) -> std::optional<EndpointSnapshot> {
                    EndpointSnapshot next = current;
                    next[index].next_available_time += 1;
                    return next;
                });
            }
        };

        REQUIRE(store.persist(many_regions(2)));
        std::thread first(bump, 0);
        std::thread second(bump, 1);
        first.join();
        second.join();

        auto loaded = store.load();
        REQUIRE(loaded.size() == 2);
        CHECK(loaded[0].next_available_time == kRounds);
        CHECK(loaded[1].next_available_time == kRounds);
    }
}
