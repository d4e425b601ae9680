#include <atomic>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/request_id.hpp"
#include "core/errors/broker_errors.hpp"
#include "protocol/request.hpp"
#include "store/request_store.hpp"

namespace {

using pokeme::core::config::Limits;
using pokeme::core::config::is_valid_request_id;
using pokeme::core::errors::ErrorCategory;
using pokeme::core::errors::get_error;
using pokeme::core::errors::get_value;
using pokeme::core::errors::is_error;
using pokeme::protocol::NewRequest;
using pokeme::protocol::Request;
using pokeme::protocol::RequestStatus;
using pokeme::protocol::RequestType;
using pokeme::protocol::Timestamp;
using pokeme::store::RequestStore;

// Hand-advanced clock so eviction can be tested without sleeping.
class ManualClock {
public:
    ManualClock() : now_(std::chrono::system_clock::now()) {}

    Timestamp now() const { return now_; }
    void advance(std::chrono::seconds by) { now_ += by; }

private:
    Timestamp now_;
};

NewRequest question(const std::string& text) {
    NewRequest req;
    req.question = text;
    return req;
}

Request create_ok(RequestStore& store, const NewRequest& req) {
    auto created = store.create(req);
    if (is_error(created)) {
        ADD_FAILURE() << "create failed: " << get_error(created).message;
        return Request{};
    }
    return get_value(created);
}

TEST(RequestStoreTest, CreateReturnsPendingRequest) {
    RequestStore store;
    const Request req = create_ok(store, question("What colour?"));

    EXPECT_EQ(req.question, "What colour?");
    EXPECT_EQ(req.status, RequestStatus::Pending);
    EXPECT_EQ(req.request_type, RequestType::Question);
    EXPECT_FALSE(req.answer.has_value());
    EXPECT_FALSE(req.answered_at.has_value());
    EXPECT_TRUE(is_valid_request_id(req.id)) << req.id;
}

TEST(RequestStoreTest, OptionalFieldsAreKept) {
    RequestStore store;
    NewRequest input = question("q");
    input.context = "ctx";
    input.agent = "bot-1";
    input.task = "fixing bugs";

    const Request req = create_ok(store, input);
    EXPECT_EQ(req.context.value_or(""), "ctx");
    EXPECT_EQ(req.agent.value_or(""), "bot-1");
    EXPECT_EQ(req.task.value_or(""), "fixing bugs");
}

TEST(RequestStoreTest, OptionalFieldsDefaultToAbsent) {
    RequestStore store;
    const Request req = create_ok(store, question("q"));
    EXPECT_FALSE(req.context.has_value());
    EXPECT_FALSE(req.agent.has_value());
    EXPECT_FALSE(req.task.has_value());
    EXPECT_FALSE(req.command.has_value());
}

TEST(RequestStoreTest, IdsAreUniqueAcrossManyCreates) {
    Limits limits;
    limits.max_pending = 1000;
    RequestStore store(limits);

    std::set<std::string> ids;
    for (int i = 0; i < 500; ++i) {
        ids.insert(create_ok(store, question("q" + std::to_string(i))).id);
    }
    EXPECT_EQ(ids.size(), 500u);
}

TEST(RequestStoreTest, PermissionWithoutCommandIsRejected) {
    RequestStore store;
    NewRequest input = question("do something");
    input.request_type = RequestType::Permission;

    auto created = store.create(input);
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(created).code, "missing_command");
    EXPECT_NE(get_error(created).message.find("command"), std::string::npos);
    EXPECT_EQ(store.size(), 0u);
}

TEST(RequestStoreTest, PermissionKeepsCommand) {
    RequestStore store;
    NewRequest input = question("Delete temp files?");
    input.request_type = RequestType::Permission;
    input.command = "rm -rf /tmp/*";

    const Request req = create_ok(store, input);
    EXPECT_EQ(req.request_type, RequestType::Permission);
    EXPECT_EQ(req.command.value_or(""), "rm -rf /tmp/*");
}

TEST(RequestStoreTest, GetReturnsStoredRequest) {
    RequestStore store;
    const Request req = create_ok(store, question("hello"));

    const auto got = store.get(req.id);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->id, req.id);
    EXPECT_EQ(got->question, "hello");
}

TEST(RequestStoreTest, GetMissingReturnsNothing) {
    RequestStore store;
    EXPECT_FALSE(store.get("aabbccddeeff").has_value());
}

TEST(RequestStoreTest, GetRejectsMalformedIds) {
    RequestStore store;
    create_ok(store, question("hello"));

    EXPECT_FALSE(store.get("abc").has_value());
    EXPECT_FALSE(store.get("ZZZZZZZZZZZZ").has_value());
    EXPECT_FALSE(store.get("../../etc/pas").has_value());
    EXPECT_FALSE(store.get("../../etc/pa").has_value());
}

TEST(RequestStoreTest, AnswerMarksRequestAnswered) {
    RequestStore store;
    const Request req = create_ok(store, question("pick a number"));

    EXPECT_TRUE(store.answer(req.id, "42"));

    const auto got = store.get(req.id);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->status, RequestStatus::Answered);
    EXPECT_EQ(got->answer.value_or(""), "42");
    EXPECT_TRUE(got->answered_at.has_value());
}

TEST(RequestStoreTest, AnswerUnknownIdReturnsFalse) {
    RequestStore store;
    EXPECT_FALSE(store.answer("aabbccddeeff", "nope"));
}

TEST(RequestStoreTest, SecondAnswerIsRejectedAndFirstIsKept) {
    RequestStore store;
    const Request req = create_ok(store, question("q"));

    EXPECT_TRUE(store.answer(req.id, "first"));
    EXPECT_FALSE(store.answer(req.id, "second"));
    EXPECT_EQ(store.get(req.id)->answer.value_or(""), "first");
}

TEST(RequestStoreTest, AnswerRejectsMalformedIds) {
    RequestStore store;
    EXPECT_FALSE(store.answer("not-valid!!!", "x"));
    EXPECT_FALSE(store.answer("../../etc/pa", "x"));
}

TEST(RequestStoreTest, PendingStartsEmpty) {
    RequestStore store;
    EXPECT_TRUE(store.pending().empty());
    EXPECT_FALSE(store.has_pending());
}

TEST(RequestStoreTest, PendingListsOnlyUnanswered) {
    RequestStore store;
    const Request r1 = create_ok(store, question("q1"));
    const Request r2 = create_ok(store, question("q2"));
    ASSERT_TRUE(store.answer(r1.id, "a1"));

    const auto pending = store.pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, r2.id);
    EXPECT_TRUE(store.has_pending());
}

TEST(RequestStoreTest, HasPendingTurnsFalseWhenAllAnswered) {
    RequestStore store;
    const Request req = create_ok(store, question("q"));
    EXPECT_TRUE(store.has_pending());
    ASSERT_TRUE(store.answer(req.id, "done"));
    EXPECT_FALSE(store.has_pending());
}

TEST(RequestStoreTest, LongFieldsAreTruncated) {
    RequestStore store;
    NewRequest input = question(std::string(5000, 'x'));
    input.context = std::string(6000, 'c');
    input.agent = std::string(500, 'a');
    input.task = std::string(500, 't');

    const Request req = create_ok(store, input);
    EXPECT_EQ(req.question.size(), 2000u);
    EXPECT_EQ(req.context->size(), 5000u);
    EXPECT_EQ(req.agent->size(), 100u);
    EXPECT_EQ(req.task->size(), 200u);
}

TEST(RequestStoreTest, LongAnswerIsTruncated) {
    RequestStore store;
    const Request req = create_ok(store, question("q"));
    ASSERT_TRUE(store.answer(req.id, std::string(20000, 'z')));
    EXPECT_EQ(store.get(req.id)->answer->size(), 10000u);
}

TEST(RequestStoreTest, RejectsWhenPendingCapacityReached) {
    RequestStore store;
    for (int i = 0; i < 100; ++i) {
        create_ok(store, question("q" + std::to_string(i)));
    }

    auto rejected = store.create(question("one too many"));
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).category, ErrorCategory::Backpressure);
    EXPECT_EQ(get_error(rejected).code, "capacity_reached");
    EXPECT_EQ(store.pending().size(), 100u);
}

TEST(RequestStoreTest, AnsweringFreesExactlyOneSlot) {
    Limits limits;
    limits.max_pending = 3;
    RequestStore store(limits);

    const Request first = create_ok(store, question("a"));
    create_ok(store, question("b"));
    create_ok(store, question("c"));
    ASSERT_TRUE(is_error(store.create(question("d"))));

    ASSERT_TRUE(store.answer(first.id, "done"));
    EXPECT_FALSE(is_error(store.create(question("d"))));
    EXPECT_TRUE(is_error(store.create(question("e"))));
}

TEST(RequestStoreTest, EvictsAnsweredRequestsPastRetention) {
    ManualClock clock;
    RequestStore store(Limits{}, [&clock] { return clock.now(); });

    const Request req = create_ok(store, question("old"));
    ASSERT_TRUE(store.answer(req.id, "done"));

    clock.advance(std::chrono::seconds(310));
    create_ok(store, question("trigger sweep"));

    EXPECT_FALSE(store.get(req.id).has_value());
    EXPECT_EQ(store.size(), 1u);
}

TEST(RequestStoreTest, IdsStayUniqueAcrossEvictions) {
    ManualClock clock;
    RequestStore store(Limits{}, [&clock] { return clock.now(); });

    std::set<std::string> seen;
    for (int round = 0; round < 50; ++round) {
        for (int i = 0; i < 10; ++i) {
            const Request req = create_ok(store, question("q"));
            EXPECT_TRUE(seen.insert(req.id).second) << "reused id " << req.id;
            ASSERT_TRUE(store.answer(req.id, "a"));
        }
        clock.advance(std::chrono::seconds(310));
    }
    EXPECT_EQ(seen.size(), 500u);
    EXPECT_LE(store.size(), 10u);
}

TEST(RequestStoreTest, KeepsRecentlyAnsweredRequests) {
    ManualClock clock;
    RequestStore store(Limits{}, [&clock] { return clock.now(); });

    const Request req = create_ok(store, question("recent"));
    ASSERT_TRUE(store.answer(req.id, "done"));

    clock.advance(std::chrono::seconds(5));
    create_ok(store, question("trigger sweep"));

    const auto got = store.get(req.id);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->answer.value_or(""), "done");
}

TEST(RequestStoreTest, NeverEvictsPendingRequests) {
    ManualClock clock;
    RequestStore store(Limits{}, [&clock] { return clock.now(); });

    const Request req = create_ok(store, question("waiting forever"));
    clock.advance(std::chrono::hours(24));
    create_ok(store, question("trigger sweep"));

    const auto got = store.get(req.id);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->status, RequestStatus::Pending);
}

TEST(RequestStoreTest, ConcurrentAnswersHaveExactlyOneWinner) {
    RequestStore store;
    const Request req = create_ok(store, question("race"));

    constexpr int kThreads = 16;
    std::atomic<int> winners{0};
    std::atomic_bool go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&store, &req, &winners, &go, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (store.answer(req.id, "answer-" + std::to_string(i))) {
                ++winners;
            }
        });
    }
    go = true;
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(store.get(req.id)->status, RequestStatus::Answered);
}

TEST(RequestStoreTest, ConcurrentCreatesRespectCapacity) {
    Limits limits;
    limits.max_pending = 50;
    RequestStore store(limits);

    constexpr int kThreads = 8;
    constexpr int kPerThread = 20;
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, &accepted] {
            for (int i = 0; i < kPerThread; ++i) {
                NewRequest req;
                req.question = "concurrent";
                if (!is_error(store.create(req))) {
                    ++accepted;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(accepted.load(), 50);
    EXPECT_EQ(store.pending().size(), 50u);
}

}  // namespace
