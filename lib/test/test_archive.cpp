#include "BinaryPack.hpp"
#include <gtest/gtest.h>

#include <array>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace tally;

// Helper function to serialize using Archive
template<typename T>
std::string archivePack(const T& value) {
    std::ostringstream oss;
    OutputArchive ar(oss);
    ar & value;
    return oss.str();
}

// Helper function to deserialize using Archive
template<typename T>
bool archiveUnpack(const std::string& data, T& value) {
    std::istringstream iss(data);
    InputArchive ar(iss);
    ar & value;
    return !ar.failed();
}

struct TestStruct {
    int32_t id{ 0 };
    std::string name;
    uint128 amount{ 0 };

    template <typename Archive>
    void serialize(Archive& ar) {
        ar & id & name & amount;
    }

    bool operator==(const TestStruct& other) const {
        return id == other.id && name == other.name && amount == other.amount;
    }
};

struct NestedStruct {
    TestStruct inner;
    std::optional<std::array<uint8_t, 4>> tag;
    std::vector<TestStruct> items;

    template <typename Archive>
    void serialize(Archive& ar) {
        ar & inner & tag & items;
    }
};

TEST(ArchiveTest, IntegersAreBigEndian) {
    EXPECT_EQ(archivePack(uint16_t(0x0102)), std::string("\x01\x02", 2));
    EXPECT_EQ(archivePack(uint32_t(0x01020304)), std::string("\x01\x02\x03\x04", 4));
    EXPECT_EQ(archivePack(uint64_t(1)), std::string("\x00\x00\x00\x00\x00\x00\x00\x01", 8));
    EXPECT_EQ(archivePack(int32_t(-1)), std::string("\xff\xff\xff\xff", 4));
}

TEST(ArchiveTest, FundamentalTypes) {
    {
        bool original = true;
        std::string data = archivePack(original);
        EXPECT_EQ(data.size(), 1u);
        bool deserialized = false;
        ASSERT_TRUE(archiveUnpack(data, deserialized));
        EXPECT_EQ(original, deserialized);
    }
    {
        int64_t original = -1234567890123LL;
        int64_t deserialized = 0;
        ASSERT_TRUE(archiveUnpack(archivePack(original), deserialized));
        EXPECT_EQ(original, deserialized);
    }
    {
        uint64_t original = 0xFFFFFFFFFFFFFFFFULL;
        uint64_t deserialized = 0;
        ASSERT_TRUE(archiveUnpack(archivePack(original), deserialized));
        EXPECT_EQ(original, deserialized);
    }
}

TEST(ArchiveTest, Uint128HighWordFirst) {
    uint128 value = (static_cast<uint128>(1) << 64) | 2;
    std::string data = archivePack(value);
    ASSERT_EQ(data.size(), 16u);
    EXPECT_EQ(data, std::string("\x00\x00\x00\x00\x00\x00\x00\x01"
                                "\x00\x00\x00\x00\x00\x00\x00\x02", 16));

    uint128 max = ~static_cast<uint128>(0);
    uint128 deserialized = 0;
    ASSERT_TRUE(archiveUnpack(archivePack(max), deserialized));
    EXPECT_TRUE(deserialized == max);
}

TEST(ArchiveTest, Strings) {
    std::string original("hello\0world", 11);
    std::string data = archivePack(original);
    EXPECT_EQ(data.size(), 8u + original.size());

    std::string deserialized;
    ASSERT_TRUE(archiveUnpack(data, deserialized));
    EXPECT_EQ(original, deserialized);

    std::string empty;
    ASSERT_TRUE(archiveUnpack(archivePack(std::string()), empty));
    EXPECT_TRUE(empty.empty());
}

TEST(ArchiveTest, Vectors) {
    std::vector<uint32_t> original = {1, 2, 3, 0xFFFFFFFF};
    std::vector<uint32_t> deserialized;
    ASSERT_TRUE(archiveUnpack(archivePack(original), deserialized));
    EXPECT_EQ(original, deserialized);
}

TEST(ArchiveTest, ByteArraysHaveNoPrefix) {
    std::array<uint8_t, 4> original = {0xde, 0xad, 0xbe, 0xef};
    std::string data = archivePack(original);
    EXPECT_EQ(data, std::string("\xde\xad\xbe\xef", 4));

    std::array<uint8_t, 4> deserialized{};
    ASSERT_TRUE(archiveUnpack(data, deserialized));
    EXPECT_EQ(original, deserialized);
}

TEST(ArchiveTest, Optionals) {
    std::optional<uint32_t> none;
    EXPECT_EQ(archivePack(none), std::string("\x00", 1));

    std::optional<uint32_t> some = 7;
    EXPECT_EQ(archivePack(some), std::string("\x01\x00\x00\x00\x07", 5));

    std::optional<uint32_t> deserialized = 99;
    ASSERT_TRUE(archiveUnpack(archivePack(none), deserialized));
    EXPECT_FALSE(deserialized.has_value());

    ASSERT_TRUE(archiveUnpack(archivePack(some), deserialized));
    ASSERT_TRUE(deserialized.has_value());
    EXPECT_EQ(*deserialized, 7u);
}

TEST(ArchiveTest, CustomStructs) {
    NestedStruct original;
    original.inner = {42, "inner", 1000};
    original.tag = std::array<uint8_t, 4>{1, 2, 3, 4};
    original.items.push_back({1, "a", 1});
    original.items.push_back({2, "b", ~static_cast<uint128>(0)});

    NestedStruct deserialized;
    ASSERT_TRUE(archiveUnpack(archivePack(original), deserialized));
    EXPECT_TRUE(deserialized.inner == original.inner);
    EXPECT_EQ(deserialized.tag, original.tag);
    ASSERT_EQ(deserialized.items.size(), 2u);
    EXPECT_TRUE(deserialized.items[0] == original.items[0]);
    EXPECT_TRUE(deserialized.items[1] == original.items[1]);
}

TEST(ArchiveTest, NonCanonicalBoolIsRejected) {
    bool value = false;
    EXPECT_FALSE(archiveUnpack(std::string("\x02", 1), value));

    std::optional<uint8_t> opt;
    EXPECT_FALSE(archiveUnpack(std::string("\x05\x01", 2), opt));
}

TEST(ArchiveTest, InvalidDeserialization) {
    // Truncated integer
    {
        uint32_t value = 0;
        EXPECT_FALSE(archiveUnpack(std::string("\x01\x02", 2), value));
    }
    // Length prefix larger than the remaining input
    {
        std::string data = archivePack(uint64_t(1000)) + "short";
        std::string value;
        EXPECT_FALSE(archiveUnpack(data, value));
    }
    {
        std::string data = archivePack(uint64_t(0xFFFFFFFFFFFFFFFFULL));
        std::vector<uint8_t> value;
        EXPECT_FALSE(archiveUnpack(data, value));
    }
    // Empty input
    {
        TestStruct value;
        EXPECT_FALSE(archiveUnpack(std::string(), value));
    }
}

TEST(ArchiveTest, FailureIsSticky) {
    std::string data = std::string("\x02", 1) + archivePack(uint32_t(5));
    std::istringstream iss(data);
    InputArchive ar(iss);

    bool flag = false;
    uint32_t number = 0;
    ar & flag & number;
    EXPECT_TRUE(ar.failed());
    EXPECT_EQ(number, 0u);
}

TEST(ArchiveTest, BinaryPackUnpack) {
    TestStruct original{7, "packed", 123456789};
    std::string packed = utl::binaryPack(original);

    auto result = utl::binaryUnpack<TestStruct>(packed);
    ASSERT_TRUE(result.isOk()) << result.error().message;
    EXPECT_TRUE(result.value() == original);
}

TEST(ArchiveTest, BinaryUnpackRejectsTrailingBytes) {
    std::string packed = utl::binaryPack(uint32_t(1)) + "x";
    auto result = utl::binaryUnpack<uint32_t>(packed);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, 2);
}

TEST(ArchiveTest, BinaryUnpackRejectsTruncation) {
    std::string packed = utl::binaryPack(TestStruct{1, "abc", 2});
    packed.pop_back();
    auto result = utl::binaryUnpack<TestStruct>(packed);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, 1);
}
