#include <gtest/gtest.h>
#include <core/resource.hpp>

static ResourceList make_host_resources() {
    return ResourceList({
        {"arch", "hl", "lx-amd64"},
        {"num_proc", "hl", "8"},
        {"mem_total", "hl", "62.8G"},
        {"swap_total", "hl", "4.0G"},
        {"virtual_total", "hl", "66.8G"},
        {"load_short", "hl", "0.05"},
        {"load_medium", "hl", "0.10"},
        {"load_long", "hl", "1.50"},
        {"mem_free", "hl", "60.1G"},
        {"swap_free", "hl", "512M"},
        {"virtual_free", "hl", "64.0G"},
        {"mem_used", "hl", "2.7G"},
        {"swap_used", "hl", "0.000M"},
    });
}

// ── Lookup ──────────────────────────────────────────────────

TEST(ResourceList, FindReturnsFirstMatch) {
    ResourceList r({{"slots", "qc", "4"}, {"slots", "qf", "8"}});
    auto found = r.find("slots");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value.type, "qc");
    EXPECT_EQ(found.value.value, "4");
}

TEST(ResourceList, MissingKeyIsNotFound) {
    auto r = make_host_resources();
    auto found = r.find("gpu");
    EXPECT_TRUE(found.is_err());
    EXPECT_EQ(found.kind, ErrorKind::NotFound);
}

TEST(ResourceList, EmptyList) {
    ResourceList r;
    EXPECT_EQ(r.num_processors().kind, ErrorKind::NotFound);
    EXPECT_EQ(r.free_memory().kind, ErrorKind::NotFound);
    EXPECT_EQ(r.load("short").kind, ErrorKind::NotFound);
}

// ── Typed accessors ─────────────────────────────────────────

TEST(ResourceList, NumProcessors) {
    ResourceList r({{"num_proc", "hl", "8"}});
    auto n = r.num_processors();
    ASSERT_TRUE(n.is_ok());
    EXPECT_EQ(n.value, 8);
}

TEST(ResourceList, NumProcessorsNotInteger) {
    ResourceList r({{"num_proc", "hl", "8.5"}});
    auto n = r.num_processors();
    EXPECT_TRUE(n.is_err());
    EXPECT_EQ(n.kind, ErrorKind::Parse);
}

TEST(ResourceList, NumProcessorsOutOfRange) {
    ResourceList r({{"num_proc", "hl", "4294967296"}});
    EXPECT_EQ(r.num_processors().kind, ErrorKind::Parse);
}

TEST(ResourceList, LoadWindows) {
    auto r = make_host_resources();
    EXPECT_DOUBLE_EQ(r.load("short").value, 0.05);
    EXPECT_DOUBLE_EQ(r.load("medium").value, 0.10);
    EXPECT_DOUBLE_EQ(r.load("long").value, 1.50);
    EXPECT_EQ(r.load("hourly").kind, ErrorKind::NotFound);
}

TEST(ResourceList, LoadNotNumeric) {
    ResourceList r({{"load_short", "hl", "n/a"}});
    auto load = r.load("short");
    EXPECT_TRUE(load.is_err());
    EXPECT_EQ(load.kind, ErrorKind::Parse);
}

TEST(ResourceList, LoadNonFiniteRejected) {
    ResourceList r({{"load_short", "hl", "nan"},
                    {"load_medium", "hl", "inf"},
                    {"load_long", "hl", "-infinity"}});
    EXPECT_EQ(r.load("short").kind, ErrorKind::Parse);
    EXPECT_EQ(r.load("medium").kind, ErrorKind::Parse);
    EXPECT_EQ(r.load("long").kind, ErrorKind::Parse);
}

TEST(ResourceList, StorageOverflowRejected) {
    ResourceList r({{"mem_total", "hl", "9300000000T"}});
    EXPECT_EQ(r.total_memory().kind, ErrorKind::Parse);
}

TEST(ResourceList, StorageAccessors) {
    auto r = make_host_resources();
    EXPECT_EQ(r.total_memory().value.bytes, 62800000000LL);
    EXPECT_EQ(r.free_memory().value.bytes, 60100000000LL);
    EXPECT_EQ(r.memory_used().value.bytes, 2700000000LL);
    EXPECT_EQ(r.total_swap().value.bytes, 4000000000LL);
    EXPECT_EQ(r.free_swap().value.bytes, 512000000LL);
    EXPECT_EQ(r.swap_used().value.bytes, 0);
    EXPECT_EQ(r.total_virtual().value.bytes, 66800000000LL);
    EXPECT_EQ(r.free_virtual_memory().value.bytes, 64000000000LL);
    EXPECT_EQ(r.free_swap().value.scale, "M");
}

TEST(ResourceList, StorageCoercionFailureIsDistinct) {
    ResourceList r({{"mem_free", "hl", "lots"}, {"swap_free", "hl", "12K"}});
    EXPECT_EQ(r.free_memory().kind, ErrorKind::Parse);
    EXPECT_EQ(r.free_swap().kind, ErrorKind::UnsupportedUnit);
    EXPECT_EQ(r.total_memory().kind, ErrorKind::NotFound);
}

TEST(ResourceList, GenericAccessors) {
    ResourceList r({{"slots", "qc", "16"}, {"np_load_avg", "hl", "0.25"}});
    EXPECT_EQ(r.get_integer("slots").value, 16);
    EXPECT_DOUBLE_EQ(r.get_float("np_load_avg").value, 0.25);
    EXPECT_EQ(r.get_integer("np_load_avg").kind, ErrorKind::Parse);
}
