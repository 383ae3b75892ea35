#include <msgdec/decode/decoder.h>
#include <msgdec/decode/field_map.h>
#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Endpoint {
    std::string host;
    int port = 0;
    bool secure = false;
};

struct Unrelated {
    double weight = 0.0;
};

}  // namespace

template <>
struct msgdec::decode::RecordTraits<Endpoint> {
    static void describe(msgdec::decode::FieldMapBuilder<Endpoint>& fields) {
        fields.field("host", &Endpoint::host)
              .field("port", &Endpoint::port)
              .field("tls", &Endpoint::secure);
    }
};

template <>
struct msgdec::decode::RecordTraits<Unrelated> {
    static void describe(msgdec::decode::FieldMapBuilder<Unrelated>& fields) {
        fields.field("weight", &Unrelated::weight);
    }
};

using msgdec::decode::FieldMap;
using msgdec::decode::FieldRegistry;

// ------------------------------------------------------------------
// 1. Detection
// ------------------------------------------------------------------

TEST(FieldMapTest, RecordDetection) {
    EXPECT_TRUE(msgdec::decode::is_record_v<Endpoint>);
    EXPECT_FALSE(msgdec::decode::is_record_v<int>);
    EXPECT_FALSE(msgdec::decode::is_record_v<std::string>);
}

// ------------------------------------------------------------------
// 2. Lookup
// ------------------------------------------------------------------

TEST(FieldMapTest, WireNamesResolveToFieldSlots) {
    FieldRegistry registry;
    const FieldMap& fields = registry.get<Endpoint>();
    EXPECT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields.names(), (std::vector<std::string>{"host", "port", "tls"}));

    Endpoint endpoint;
    const auto* port = fields.find("port");
    ASSERT_NE(port, nullptr);
    msgdec::decode::Destination slot = port->locate(&endpoint);
    EXPECT_EQ(slot.get<int>(), &endpoint.port);
    EXPECT_EQ(slot.get<std::string>(), nullptr);

    const auto* tls = fields.find("tls");
    ASSERT_NE(tls, nullptr);
    EXPECT_EQ(tls->locate(&endpoint).get<bool>(), &endpoint.secure);
}

TEST(FieldMapTest, UnknownNameIsAbsent) {
    FieldRegistry registry;
    const FieldMap& fields = registry.get<Endpoint>();
    EXPECT_EQ(fields.find("secure"), nullptr);
    EXPECT_EQ(fields.find(""), nullptr);
}

// ------------------------------------------------------------------
// 3. Caching
// ------------------------------------------------------------------

TEST(FieldRegistryTest, BuiltOncePerType) {
    FieldRegistry registry;
    const FieldMap& a = registry.get<Endpoint>();
    const FieldMap& b = registry.get<Endpoint>();
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(registry.size(), 1u);

    registry.get<Unrelated>();
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.build_count(), 2u);
}

TEST(FieldRegistryTest, GlobalIsASingleton) {
    EXPECT_EQ(&FieldRegistry::global(), &FieldRegistry::global());
}

TEST(FieldRegistryTest, ConcurrentFirstUseInstallsOneMap) {
    FieldRegistry registry;
    constexpr int kThreads = 8;
    std::atomic<bool> go{false};
    std::vector<const FieldMap*> seen(kThreads, nullptr);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int round = 0; round < 100; ++round) {
                seen[i] = &registry.get<Endpoint>();
            }
        });
    }
    go.store(true);
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 1; i < kThreads; ++i) {
        EXPECT_EQ(seen[i], seen[0]);
    }
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.build_count(), 1u);
}
