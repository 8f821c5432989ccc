#include "core/meeting/errors.hpp"
#include "core/meeting/identifier_allocator.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <set>
#include <vector>

using namespace meetcoord::core;
using namespace meetcoord::common;

namespace {

MeetingData MakeMeeting(const std::string& id) {
    MeetingData data;
    data.meeting_id = id;
    data.title = "Existing";
    data.host_user_id = "host";
    data.created_by = "host";
    return data;
}

// 按顺序返回预设候选
IdentifierAllocator::Generator Sequence(std::vector<std::string> candidates) {
    auto index = std::make_shared<std::size_t>(0);
    return [candidates, index](std::size_t) {
        const auto& value = candidates[*index % candidates.size()];
        ++*index;
        return value;
    };
}

} // namespace

TEST(IdentifierAllocatorTest, RandomCandidateUsesLowercaseAlphanumerics) {
    for (int i = 0; i < 50; ++i) {
        auto candidate = IdentifierAllocator::RandomCandidate(12);
        ASSERT_EQ(candidate.size(), 12u);
        for (char c : candidate) {
            EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(c)) || std::islower(static_cast<unsigned char>(c)))
                << candidate;
        }
    }
}

TEST(IdentifierAllocatorTest, AllocatesUniqueIds) {
    auto store = std::make_shared<InMemoryMeetingStore>();
    IdentifierAllocator allocator(store);
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = allocator.Allocate();
        ASSERT_TRUE(id.IsOk()) << id.GetStatus().Message();
        EXPECT_EQ(id.Value().size(), 12u);
        ASSERT_TRUE(store->CreateMeeting(MakeMeeting(id.Value())).IsOk());
        EXPECT_TRUE(seen.insert(id.Value()).second);
    }
}

TEST(IdentifierAllocatorTest, SkipsCollidingCandidates) {
    auto store = std::make_shared<InMemoryMeetingStore>();
    ASSERT_TRUE(store->CreateMeeting(MakeMeeting("taken1")).IsOk());
    ASSERT_TRUE(store->CreateMeeting(MakeMeeting("taken2")).IsOk());

    IdentifierAllocator allocator(store, 6, 5, Sequence({"taken1", "TAKEN2", "fresh1"}));
    auto id = allocator.Allocate();
    ASSERT_TRUE(id.IsOk()) << id.GetStatus().Message();
    EXPECT_EQ(id.Value(), "fresh1");
}

TEST(IdentifierAllocatorTest, ExhaustsAfterMaxAttempts) {
    auto store = std::make_shared<InMemoryMeetingStore>();
    ASSERT_TRUE(store->CreateMeeting(MakeMeeting("always")).IsOk());

    IdentifierAllocator allocator(store, 6, 3, Sequence({"always"}));
    auto id = allocator.Allocate();
    ASSERT_FALSE(id.IsOk());
    EXPECT_EQ(id.GetStatus().Code(), StatusCode::kAborted);
    EXPECT_EQ(MapStatus(id.GetStatus()), MeetingErrorCode::kAllocationExhausted);
}

TEST(IdentifierAllocatorTest, NormalizeTrimsAndLowercases) {
    EXPECT_EQ(IdentifierAllocator::Normalize("  AbC123\t\n"), "abc123");
    EXPECT_EQ(IdentifierAllocator::Normalize("   "), "");
    EXPECT_EQ(IdentifierAllocator::Normalize("room42"), "room42");
}
