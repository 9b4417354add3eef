#include <catch2/catch_test_macros.hpp>
#include <quiver/storage/blob_store.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>

using namespace quiver;
using namespace quiver::storage;

namespace {

struct TempDir {
    std::filesystem::path path;
    TempDir() {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("quiver_blob_" + std::to_string(rd()) + "_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

auto bytes(std::string_view s) -> std::vector<std::uint8_t> { return {s.begin(), s.end()}; }

void exercise_store(BlobStore& store) {
    REQUIRE(store.read("missing").error().code == core::error_code::not_found);

    REQUIRE(store.write("header", bytes("h1")).has_value());
    REQUIRE(store.write("vec/0000000000000002", bytes("two")).has_value());
    REQUIRE(store.write("vec/0000000000000001", bytes("one")).has_value());
    REQUIRE(store.write("graph", bytes("g")).has_value());

    REQUIRE(store.read("header").value() == bytes("h1"));
    REQUIRE(store.write("header", bytes("h2")).has_value());
    REQUIRE(store.read("header").value() == bytes("h2"));

    auto vecs = store.list("vec/");
    REQUIRE(vecs.has_value());
    REQUIRE(*vecs == std::vector<std::string>{"vec/0000000000000001", "vec/0000000000000002"});
    REQUIRE(store.list("").value().size() == 4);

    REQUIRE(store.remove("vec/0000000000000001").has_value());
    REQUIRE(store.remove("vec/0000000000000001").has_value());
    REQUIRE(store.read("vec/0000000000000001").error().code == core::error_code::not_found);
    REQUIRE(store.list("vec/").value().size() == 1);
}

} // namespace

TEST_CASE("memory blob store basics", "[storage][blob]") {
    MemoryBlobStore store;
    exercise_store(store);
}

TEST_CASE("file blob store basics", "[storage][blob]") {
    TempDir dir;
    auto store = FileBlobStore::open(dir.path);
    REQUIRE(store.has_value());
    exercise_store(**store);
}

TEST_CASE("file blob store survives reopening", "[storage][blob]") {
    TempDir dir;
    {
        auto store = FileBlobStore::open(dir.path).value();
        REQUIRE(store->write("vec/00000000000000aa", bytes("persisted")).has_value());
    }
    auto store = FileBlobStore::open(dir.path).value();
    REQUIRE(store->read("vec/00000000000000aa").value() == bytes("persisted"));
}

TEST_CASE("file blob store ignores interrupted writes", "[storage][blob]") {
    TempDir dir;
    auto store = FileBlobStore::open(dir.path).value();
    REQUIRE(store->write("vec/0000000000000001", bytes("ok")).has_value());
    {
        std::ofstream stray(dir.path / "vec" / "0000000000000002.tmp", std::ios::binary);
        stray << "partial";
    }
    REQUIRE(store->list("vec/").value() == std::vector<std::string>{"vec/0000000000000001"});
}

TEST_CASE("file blob store rejects unsafe keys", "[storage][blob]") {
    TempDir dir;
    auto store = FileBlobStore::open(dir.path).value();
    REQUIRE(store->write("", bytes("x")).error().code == core::error_code::precondition_failed);
    REQUIRE(store->write("/etc/passwd", bytes("x")).error().code == core::error_code::precondition_failed);
    REQUIRE(store->write("../escape", bytes("x")).error().code == core::error_code::precondition_failed);
    REQUIRE(store->read("a.tmp").error().code == core::error_code::precondition_failed);
}
