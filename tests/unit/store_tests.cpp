#include <doctest/doctest.h>
#include <hatch/store.hpp>

#include "../test_support.hpp"

using namespace hatch;
using hatch_test::TempDir;
using hatch_test::read_text;
using hatch_test::write_text;

// ============================================================================
// Key Paths
// ============================================================================

TEST_CASE("split_key_path ignores edge separators and rejects empty segments") {
    auto segments = split_key_path("\\Software\\Classes\\");
    REQUIRE(segments);
    CHECK(segments->size() == 2);
    CHECK((*segments)[1] == "Classes");

    CHECK_FALSE(split_key_path("").has_value());
    CHECK_FALSE(split_key_path("\\\\").has_value());
    CHECK_FALSE(split_key_path("A\\\\B").has_value());
}

TEST_CASE("key paths compare case-insensitively") {
    CHECK(key_path_equal("Software\\Classes\\.TXT", "software\\classes\\.txt\\"));
    CHECK_FALSE(key_path_equal("Software\\Classes", "Software\\Class"));
    CHECK(name_equal("AppX.txt", "APPX.TXT"));
}

TEST_CASE("key_path_within respects segment boundaries") {
    CHECK(key_path_within("C\\AppX.txt\\DefaultIcon", "C\\AppX.txt"));
    CHECK(key_path_within("C\\AppX.txt", "c\\appx.txt"));
    CHECK_FALSE(key_path_within("C\\AppX.txt2", "C\\AppX.txt"));
    CHECK_FALSE(key_path_within("C", "C\\AppX.txt"));
}

// ============================================================================
// MemoryStore
// ============================================================================

TEST_CASE("setValue creates the key and its ancestors") {
    MemoryStore store;
    REQUIRE(store.setValue("Software\\Classes\\AppX.txt", "", "Text Document").isOk());

    CHECK(store.keyExists("Software").value());
    CHECK(store.keyExists("Software\\Classes").value());
    CHECK(store.keyCount() == 3);

    auto value = store.get("software\\classes\\appx.txt", "");
    REQUIRE(value.isOk());
    REQUIRE(value.value());
    CHECK(*value.value() == "Text Document");
}

TEST_CASE("get distinguishes missing values from empty ones") {
    MemoryStore store;
    REQUIRE(store.setValue("C\\.txt\\OpenWithProgids", "AppX.txt", "").isOk());

    auto present = store.get("C\\.txt\\OpenWithProgids", "appx.txt");
    REQUIRE(present.isOk());
    REQUIRE(present.value());
    CHECK(present.value()->empty());

    auto absent = store.get("C\\.txt\\OpenWithProgids", "Other.txt");
    REQUIRE(absent.isOk());
    CHECK_FALSE(absent.value());

    auto no_key = store.get("C\\.doc", "");
    REQUIRE(no_key.isOk());
    CHECK_FALSE(no_key.value());
}

TEST_CASE("value names keep their first spelling") {
    MemoryStore store;
    REQUIRE(store.setValue("Key", "InstallDir", "a").isOk());
    REQUIRE(store.setValue("KEY", "installdir", "b").isOk());

    auto values = store.listValues("key");
    REQUIRE(values.isOk());
    REQUIRE(values.value().size() == 1);
    CHECK(values.value()[0].name == "InstallDir");
    CHECK(values.value()[0].data == "b");
}

TEST_CASE("deleteValue leaves sibling values and the key") {
    MemoryStore store;
    REQUIRE(store.setValue("C\\.txt\\OpenWithProgids", "Other.txt", "").isOk());
    REQUIRE(store.setValue("C\\.txt\\OpenWithProgids", "AppX.txt", "").isOk());

    REQUIRE(store.deleteValue("C\\.txt\\OpenWithProgids", "AppX.txt").isOk());
    CHECK(store.keyExists("C\\.txt\\OpenWithProgids").value());
    CHECK(store.get("C\\.txt\\OpenWithProgids", "Other.txt").value());
    CHECK_FALSE(store.get("C\\.txt\\OpenWithProgids", "AppX.txt").value());

    CHECK(store.deleteValue("C\\.txt\\OpenWithProgids", "AppX.txt").isOk());
    CHECK(store.deleteValue("C\\missing", "x").isOk());
}

TEST_CASE("deleteKeyTree removes the subtree only") {
    MemoryStore store;
    REQUIRE(store.setValue("C\\AppX.txt", "", "Text Document").isOk());
    REQUIRE(store.setValue("C\\AppX.txt\\shell\\open\\command", "", "cmd").isOk());
    REQUIRE(store.setValue("C\\AppX.txt2", "", "neighbour").isOk());

    REQUIRE(store.deleteKeyTree("c\\appx.txt").isOk());
    CHECK_FALSE(store.keyExists("C\\AppX.txt").value());
    CHECK_FALSE(store.keyExists("C\\AppX.txt\\shell\\open\\command").value());
    CHECK(store.keyExists("C\\AppX.txt2").value());
    CHECK(store.keyExists("C").value());

    CHECK(store.deleteKeyTree("C\\AppX.txt").isOk());
}

TEST_CASE("listSubkeys returns immediate children with their spelling") {
    MemoryStore store;
    REQUIRE(store.setValue("C\\AppX.txt\\DefaultIcon", "", "i").isOk());
    REQUIRE(store.setValue("C\\AppX.txt\\shell\\open\\command", "", "c").isOk());

    auto children = store.listSubkeys("c\\appx.txt");
    REQUIRE(children.isOk());
    REQUIRE(children.value().size() == 2);
    CHECK(children.value()[0] == "DefaultIcon");
    CHECK(children.value()[1] == "shell");
}

TEST_CASE("invalid key paths are configuration errors") {
    MemoryStore store;
    auto set = store.setValue("A\\\\B", "", "x");
    REQUIRE(set.isErr());
    CHECK(set.error().code() == ErrorCode::CONFIGURATION_ERROR);
    CHECK(store.get("", "").isErr());
    CHECK(store.keyExists("\\").isErr());
    CHECK(store.deleteKeyTree("").isErr());
}

// ============================================================================
// FileStore
// ============================================================================

TEST_CASE("FileStore starts empty and persists every mutation") {
    TempDir dir;
    std::string path = dir.sub("state/store.json");

    {
        auto opened = FileStore::open(path);
        REQUIRE(opened.isOk());
        auto& store = opened.value();
        CHECK(store.keyCount() == 0);
        REQUIRE(store.setValue("Software\\Example\\AppX", "InstallDir", "/opt/AppX").isOk());
    }

    CHECK(read_text(path).find(STORE_SCHEMA) != std::string::npos);

    auto reopened = FileStore::open(path);
    REQUIRE(reopened.isOk());
    auto value = reopened.value().get("software\\example\\appx", "installdir");
    REQUIRE(value.isOk());
    REQUIRE(value.value());
    CHECK(*value.value() == "/opt/AppX");
    CHECK(reopened.value().keyExists("Software\\Example").value());
}

TEST_CASE("FileStore fills in missing ancestors of hand written documents") {
    TempDir dir;
    write_text(dir.sub("store.json"), R"({
        "$schema": "hatch.store.v1",
        "keys": [
            { "path": "Software\\Classes\\.txt\\OpenWithProgids",
              "values": [{ "name": "Other.txt", "data": "" }] }
        ]
    })");

    auto opened = FileStore::open(dir.sub("store.json"));
    REQUIRE(opened.isOk());
    CHECK(opened.value().keyExists("Software\\Classes\\.txt").value());
    auto subkeys = opened.value().listSubkeys("Software\\Classes");
    REQUIRE(subkeys.isOk());
    REQUIRE(subkeys.value().size() == 1);
    CHECK(subkeys.value()[0] == ".txt");
}

TEST_CASE("FileStore rejects malformed documents") {
    TempDir dir;
    write_text(dir.sub("bad.json"), "{ not json");
    auto bad = FileStore::open(dir.sub("bad.json"));
    REQUIRE(bad.isErr());
    CHECK(bad.error().code() == ErrorCode::IO_ERROR);

    write_text(dir.sub("other.json"), R"({"$schema": "something.else"})");
    CHECK(FileStore::open(dir.sub("other.json")).isErr());
}

TEST_CASE("FileStore reverts a mutation it cannot persist") {
    TempDir dir;
    // The store's parent is a regular file, so nothing can be written
    write_text(dir.sub("blocker"), "x");
    auto opened = FileStore::open(dir.sub("blocker/store.json"));
    REQUIRE(opened.isOk());
    auto& store = opened.value();

    auto set = store.setValue("A\\B", "", "x");
    REQUIRE(set.isErr());
    CHECK(set.error().code() == ErrorCode::IO_ERROR);
    CHECK_FALSE(store.keyExists("A").value());
    CHECK(store.keyCount() == 0);
}

TEST_CASE("FileStore reverts a mutation it cannot encode") {
    TempDir dir;
    auto opened = FileStore::open(dir.sub("store.json"));
    REQUIRE(opened.isOk());
    auto& store = opened.value();
    REQUIRE(store.setValue("A", "kept", "1").isOk());

    auto set = store.setValue("A\\B", "", std::string("/opt/\xff"));
    REQUIRE(set.isErr());
    CHECK(set.error().code() == ErrorCode::IO_ERROR);
    CHECK_FALSE(store.keyExists("A\\B").value());
    CHECK(store.get("A", "kept").value() == std::optional<std::string>("1"));

    auto reopened = FileStore::open(dir.sub("store.json"));
    REQUIRE(reopened.isOk());
    CHECK(reopened.value().keyCount() == 1);
}
