#include <doctest/doctest.h>
#include <ocx/file_lock.hpp>

#include "../test_helpers.hpp"

using namespace ocx;
using ocx_test::TempDir;

TEST_CASE("FileLock creates missing parent directories") {
    TempDir dir;
    std::string path = dir.file(".ocx/operation.lock");

    auto lock = FileLock::try_acquire(path);
    REQUIRE(lock.isOk());
    CHECK(lock.value()->path() == path);
    CHECK(ocx::is_regular_file(path));
}

TEST_CASE("a held FileLock makes a second acquisition fail with ConcurrentOperation") {
    TempDir dir;
    std::string path = dir.file("operation.lock");

    auto first = FileLock::try_acquire(path);
    REQUIRE(first.isOk());

    auto second = FileLock::try_acquire(path);
    REQUIRE(second.isErr());
    CHECK(second.error().code() == ErrorCode::CONCURRENT_OPERATION);
    CHECK(second.error().message().find(path) != std::string::npos);
}

TEST_CASE("releasing a FileLock lets the next holder in") {
    TempDir dir;
    std::string path = dir.file("operation.lock");

    {
        auto first = FileLock::try_acquire(path);
        REQUIRE(first.isOk());
    }

    auto again = FileLock::try_acquire(path);
    CHECK(again.isOk());
}

TEST_CASE("locks on different files are independent") {
    TempDir dir;
    auto a = FileLock::try_acquire(dir.file("a.lock"));
    auto b = FileLock::try_acquire(dir.file("b.lock"));
    CHECK(a.isOk());
    CHECK(b.isOk());
}
